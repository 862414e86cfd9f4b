#include <QtTest/QtTest>
#include "core/ranking/scoring_engine.h"

class TestScoringEngine : public QObject {
    Q_OBJECT

private:
    st::WeightVector weights(int schemaVersion = st::kFeatureSchemaVersion) const
    {
        st::FeatureArray values{};
        values[st::featureIndex(st::FeatureKey::BaseScore)] = 10.0;
        values[st::featureIndex(st::FeatureKey::GeoMatchLevel)] = 4.0;
        values[st::featureIndex(st::FeatureKey::ThemeMiss)] = -3.0;
        return st::WeightVector(values, 5, QDateTime::currentDateTimeUtc(),
                                QStringLiteral("test"), schemaVersion);
    }

private slots:
    void testDotProduct()
    {
        st::FeatureVector features;
        features.set(st::FeatureKey::BaseScore, 1.0);
        features.set(st::FeatureKey::GeoMatchLevel, 2.0);
        features.set(st::FeatureKey::ThemeMiss, 1.0);

        const auto score = st::ScoringEngine::score(features, weights());
        QVERIFY(score.has_value());
        QCOMPARE(*score, 15.0);
    }

    void testContributionsSumToScore()
    {
        st::FeatureVector features;
        features.set(st::FeatureKey::BaseScore, 1.0);
        features.set(st::FeatureKey::GeoMatchLevel, 1.0);

        const auto parts = st::ScoringEngine::contributions(features, weights());
        QVERIFY(parts.has_value());
        QCOMPARE((*parts)[st::featureIndex(st::FeatureKey::BaseScore)], 10.0);
        QCOMPARE((*parts)[st::featureIndex(st::FeatureKey::GeoMatchLevel)], 4.0);

        double sum = 0.0;
        for (double part : *parts) {
            sum += part;
        }
        QCOMPARE(sum, st::ScoringEngine::score(features, weights()).value_or(-1.0));
    }

    void testZeroFeaturesScoreZero()
    {
        st::FeatureVector features;
        QCOMPARE(st::ScoringEngine::score(features, weights()).value_or(-1.0), 0.0);
    }

    void testSchemaMismatch()
    {
        st::FeatureVector features;
        features.set(st::FeatureKey::BaseScore, 1.0);

        st::Error error;
        QVERIFY(!st::ScoringEngine::score(features, weights(st::kFeatureSchemaVersion + 1), &error));
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);

        error = st::Error{};
        QVERIFY(!st::ScoringEngine::contributions(features, weights(st::kFeatureSchemaVersion + 1),
                                                  &error));
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);
    }

    void testDefaultWeightsRoundTripThroughJson()
    {
        const st::WeightVector defaults = st::WeightVector::defaults();
        QCOMPARE(defaults.version(), uint64_t(1));
        QCOMPARE(defaults.weight(st::FeatureKey::BaseScore), 30.0);

        auto decoded = st::WeightVector::fromWeightsJson(defaults.weightsToJson(), 1,
                                                         defaults.createdAt(), defaults.source());
        QVERIFY(decoded.has_value());
        QVERIFY(decoded->values() == defaults.values());
    }

    void testWeightsJsonRejectsUnknownKey()
    {
        QJsonObject json = st::WeightVector::defaults().weightsToJson();
        QJsonObject inner = json.value(QStringLiteral("weights")).toObject();
        inner.remove(QStringLiteral("geo_match_level"));
        inner.insert(QStringLiteral("popularity"), 1.0);
        json.insert(QStringLiteral("weights"), inner);

        st::Error error;
        QVERIFY(!st::WeightVector::fromWeightsJson(json, 2, QDateTime::currentDateTimeUtc(),
                                                   QString(), &error));
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);
    }

    void testFeatureJsonRequiresFullKeySet()
    {
        st::FeatureVector features;
        features.set(st::FeatureKey::StatusLevel, 2.0);

        QJsonObject json = st::featureVectorToJson(features);
        auto decoded = st::featureVectorFromJson(json, st::kFeatureSchemaVersion);
        QVERIFY(decoded.has_value());
        QVERIFY(*decoded == features);

        json.remove(QStringLiteral("status_level"));
        st::Error error;
        QVERIFY(!st::featureVectorFromJson(json, st::kFeatureSchemaVersion, &error));
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);
    }
};

QTEST_MAIN(TestScoringEngine)
#include "test_scoring_engine.moc"
