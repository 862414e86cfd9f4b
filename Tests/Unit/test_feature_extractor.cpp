#include <QtTest/QtTest>
#include "core/ranking/feature_extractor.h"
#include "core/ranking/scoring_engine.h"

class TestFeatureExtractor : public QObject {
    Q_OBJECT

private:
    const QDate m_today{2026, 3, 1};

    st::TripCandidate makeTrip() const
    {
        st::TripCandidate trip;
        trip.tripId = 1;
        trip.themeTagIds = {10, 20};
        trip.difficultyLevel = 3;
        trip.durationDays = 10;
        trip.price = 2000.0;
        trip.countryId = 44;
        trip.countryName = QStringLiteral("Peru");
        trip.continent = st::Continent::SouthAmerica;
        trip.status = st::TripStatus::Available;
        trip.departureDate = m_today.addDays(90);
        trip.tripTypeId = 1;
        return trip;
    }

    st::FeatureVector extract(const st::TripCandidate& trip, const st::SearchPreferences& prefs) const
    {
        st::FeatureExtractor extractor;
        auto features = extractor.extract(trip, prefs, m_today, st::kFeatureSchemaVersion);
        return features.value_or(st::FeatureVector{});
    }

private slots:
    void testBaseScoreAlwaysOne()
    {
        const auto features = extract(makeTrip(), st::SearchPreferences{});
        QCOMPARE(features.value(st::FeatureKey::BaseScore), 1.0);
        QCOMPARE(features.value(st::FeatureKey::ThemeMatchLevel), 0.0);
        QCOMPARE(features.value(st::FeatureKey::ThemeMiss), 0.0);
        QCOMPARE(features.value(st::FeatureKey::GeoMatchLevel), 0.0);
    }

    void testThemeLevels()
    {
        st::SearchPreferences prefs;
        prefs.themeIds = {10, 20, 30};
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::ThemeMatchLevel), 2.0);

        prefs.themeIds = {20, 30};
        auto features = extract(makeTrip(), prefs);
        QCOMPARE(features.value(st::FeatureKey::ThemeMatchLevel), 1.0);
        QCOMPARE(features.value(st::FeatureKey::ThemeMiss), 0.0);

        prefs.themeIds = {99};
        features = extract(makeTrip(), prefs);
        QCOMPARE(features.value(st::FeatureKey::ThemeMatchLevel), 0.0);
        QCOMPARE(features.value(st::FeatureKey::ThemeMiss), 1.0);
    }

    void testDifficultyLevels()
    {
        st::SearchPreferences prefs;
        prefs.difficulty = 3;
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::DifficultyMatchLevel), 2.0);
        prefs.difficulty = 4;
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::DifficultyMatchLevel), 1.0);
        prefs.difficulty = 5;
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::DifficultyMatchLevel), 0.0);
    }

    void testDurationLevels()
    {
        st::SearchPreferences prefs;
        prefs.minDurationDays = 7;
        prefs.maxDurationDays = 14;
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::DurationMatchLevel), 2.0);

        auto trip = makeTrip();
        trip.durationDays = 17;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::DurationMatchLevel), 1.0);
        trip.durationDays = 30;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::DurationMatchLevel), 0.0);

        trip.privateGroup = true;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::DurationMatchLevel), 2.0);
    }

    void testBudgetLevels()
    {
        st::SearchPreferences prefs;
        prefs.budget = 2000.0;
        auto trip = makeTrip();
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::BudgetMatchLevel), 3.0);
        trip.price = 2150.0;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::BudgetMatchLevel), 2.0);
        trip.price = 2350.0;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::BudgetMatchLevel), 1.0);
        trip.price = 2600.0;
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::BudgetMatchLevel), 0.0);
    }

    void testStatusAndDepartingSoon()
    {
        auto trip = makeTrip();
        trip.status = st::TripStatus::LastPlaces;
        trip.departureDate = m_today.addDays(10);
        auto features = extract(trip, st::SearchPreferences{});
        QCOMPARE(features.value(st::FeatureKey::StatusLevel), 2.0);
        QCOMPARE(features.value(st::FeatureKey::DepartingSoon), 1.0);

        trip.privateGroup = true;
        QCOMPARE(extract(trip, st::SearchPreferences{}).value(st::FeatureKey::DepartingSoon), 0.0);

        trip.privateGroup = false;
        trip.departureDate = m_today.addDays(-1);
        QCOMPARE(extract(trip, st::SearchPreferences{}).value(st::FeatureKey::DepartingSoon), 0.0);
    }

    void testGeoLevels()
    {
        st::SearchPreferences prefs;
        prefs.continents = {st::Continent::SouthAmerica};
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::GeoMatchLevel), 1.0);

        prefs.countryIds = {44};
        QCOMPARE(extract(makeTrip(), prefs).value(st::FeatureKey::GeoMatchLevel), 2.0);
    }

    void testAntarcticaCountsAsCountryMatch()
    {
        auto trip = makeTrip();
        trip.continent = st::Continent::Antarctica;
        trip.countryName = QStringLiteral("ANTARCTICA");
        trip.countryId = 1;

        st::SearchPreferences prefs;
        prefs.continents = {st::Continent::Antarctica};
        QCOMPARE(extract(trip, prefs).value(st::FeatureKey::GeoMatchLevel), 2.0);
    }

    void testSchemaMismatchRejected()
    {
        st::FeatureExtractor extractor;
        st::Error error;
        auto features = extractor.extract(makeTrip(), st::SearchPreferences{}, m_today,
                                          st::kFeatureSchemaVersion + 1, &error);
        QVERIFY(!features.has_value());
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);
    }

    void testUpperBoundNeverBelowScore()
    {
        st::FeatureExtractor extractor;
        const st::WeightVector weights = st::WeightVector::defaults();

        st::SearchPreferences prefs;
        prefs.themeIds = {10, 99};
        prefs.difficulty = 1;
        prefs.minDurationDays = 20;
        prefs.budget = 1500.0;
        prefs.continents = {st::Continent::SouthAmerica};

        for (int status = 0; status < 3; ++status) {
            auto trip = makeTrip();
            trip.status = static_cast<st::TripStatus>(status);
            trip.departureDate = m_today.addDays(status * 20);

            auto features = extractor.extract(trip, prefs, m_today, weights.schemaVersion());
            QVERIFY(features.has_value());
            const auto score = st::ScoringEngine::score(*features, weights);
            QVERIFY(score.has_value());
            QVERIFY(extractor.scoreUpperBound(trip, prefs, m_today, weights) >= *score);
        }
    }

    void testUpperBoundRoundsLikeScore()
    {
        // Non-dyadic weights where a different summation order rounds the
        // total one ulp low.
        const st::FeatureArray values = {0.0, -0.9, 0.3, 0.6, 0.3, -0.1, 0.5, -0.7, -0.6};
        const st::WeightVector weights(values, 4, QDateTime::currentDateTimeUtc(),
                                       QStringLiteral("training"));

        st::SearchPreferences prefs;
        prefs.themeIds = {99};
        prefs.difficulty = 3;
        prefs.minDurationDays = 8;
        prefs.maxDurationDays = 12;
        prefs.budget = 1000.0;

        auto trip = makeTrip();
        trip.departureDate = m_today.addDays(5);

        st::FeatureExtractor extractor;
        auto features = extractor.extract(trip, prefs, m_today, weights.schemaVersion());
        QVERIFY(features.has_value());
        const st::FeatureArray expected = {1.0, 0.0, 1.0, 2.0, 2.0, 0.0, 0.0, 1.0, 0.0};
        QVERIFY(features->values == expected);

        const auto score = st::ScoringEngine::score(*features, weights);
        QVERIFY(score.has_value());
        const double bound = extractor.scoreUpperBound(trip, prefs, m_today, weights);
        QVERIFY2(bound >= *score, qPrintable(QStringLiteral("bound %1 < score %2")
                                                 .arg(bound, 0, 'g', 17)
                                                 .arg(*score, 0, 'g', 17)));
    }

    void testExtractionIsDeterministic()
    {
        st::SearchPreferences prefs;
        prefs.themeIds = {10};
        prefs.budget = 2100.0;
        QVERIFY(extract(makeTrip(), prefs) == extract(makeTrip(), prefs));
    }
};

QTEST_MAIN(TestFeatureExtractor)
#include "test_feature_extractor.moc"
