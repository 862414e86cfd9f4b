#include <QtTest/QtTest>
#include "services/ranker/inventory_source.h"
#include "services/ranker/ranking_service.h"

#include <QJsonArray>
#include <QTemporaryDir>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

class TestRankingService : public QObject {
    Q_OBJECT

private:
    const QDate m_today{2026, 3, 1};
    const QDateTime m_now = QDateTime::fromString(QStringLiteral("2026-03-01T12:00:00Z"), Qt::ISODate);

    st::TripCandidate makeTrip(int64_t id, int countryId, st::Continent continent,
                               int durationDays, double price) const
    {
        st::TripCandidate trip;
        trip.tripId = id;
        trip.countryId = countryId;
        trip.countryName = QStringLiteral("Country %1").arg(countryId);
        trip.continent = continent;
        trip.durationDays = durationDays;
        trip.price = price;
        trip.difficultyLevel = 2;
        trip.themeTagIds = {static_cast<int>(id % 5)};
        trip.departureDate = m_today.addDays(static_cast<int>(10 + id * 7));
        trip.tripTypeId = 1;
        return trip;
    }

    std::vector<st::TripCandidate> catalogue() const
    {
        std::vector<st::TripCandidate> trips;
        for (int64_t id = 1; id <= 60; ++id) {
            const bool japan = id % 4 == 0;
            trips.push_back(makeTrip(id, japan ? 81 : 34,
                                     japan ? st::Continent::Asia : st::Continent::Europe,
                                     7 + static_cast<int>(id % 10), 3000.0 + 250.0 * (id % 17)));
        }
        return trips;
    }

    QJsonObject rawPreferences() const
    {
        QJsonObject raw;
        raw[QStringLiteral("selected_countries")] = QJsonArray{81};
        raw[QStringLiteral("selected_continents")] = QJsonArray{QStringLiteral("Europe")};
        raw[QStringLiteral("preferred_theme_ids")] = QJsonArray{1, 2};
        raw[QStringLiteral("min_duration")] = 8;
        raw[QStringLiteral("max_duration")] = 12;
        raw[QStringLiteral("budget")] = QStringLiteral("5000");
        return raw;
    }

    st::RankOptions options(std::size_t k) const
    {
        st::RankOptions opts;
        opts.k = k;
        opts.referenceDate = m_today;
        return opts;
    }

    st::EngineSettings settings() const
    {
        st::EngineSettings s;
        s.serving.workerCount = 3;
        s.training.minExamples = 20;
        s.training.epochs = 60;
        s.training.learningRate = 0.3;
        s.training.windowDays = 7;
        return s;
    }

    void logSessions(st::SqliteExampleLog* log, int count) const
    {
        for (int i = 0; i < count; ++i) {
            for (bool clicked : {true, false}) {
                st::TrainingExample ex;
                ex.sessionId = QStringLiteral("session-%1").arg(i);
                ex.tripId = clicked ? 4 : 5;
                ex.position = clicked ? 0 : 1;
                ex.clicked = clicked;
                ex.timestamp = m_now.addSecs(-3600 - i);
                ex.features.set(st::FeatureKey::BaseScore, 1.0);
                ex.features.set(clicked ? st::FeatureKey::GeoMatchLevel : st::FeatureKey::ThemeMiss,
                                clicked ? 2.0 : 1.0);
                QVERIFY(log->appendExample(ex));
            }
        }
    }

private slots:
    void testRankReturnsOrderedTopK()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());
        QCOMPARE(service.activeWeightVersion(), uint64_t(1));

        st::Error error;
        auto results = service.rank(rawPreferences(), catalogue(), options(10), &error);
        QVERIFY2(results.has_value(), qPrintable(st::errorToString(error)));
        QCOMPARE(results->size(), size_t(10));
        for (std::size_t i = 0; i < results->size(); ++i) {
            QCOMPARE(results->at(i).weightVersion, uint64_t(1));
            if (i > 0) {
                QVERIFY(st::ranksBefore(results->at(i - 1), results->at(i)));
            }
        }

        const QJsonArray json = st::RankingService::resultsToJson(*results);
        QCOMPARE(json.size(), qsizetype(10));
        QCOMPARE(json.at(0).toObject().value(QStringLiteral("tripId")).toInteger(),
                 static_cast<qint64>(results->front().trip.tripId));
    }

    void testInvalidPreferencesRejected()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        QJsonObject raw;
        raw[QStringLiteral("min_duration")] = 20;
        raw[QStringLiteral("max_duration")] = 5;
        st::Error error;
        QVERIFY(!service.rank(raw, catalogue(), options(5), &error).has_value());
        QCOMPARE(error.kind, st::ErrorKind::InvalidPreferences);
    }

    void testMinScoreDropsWeakResults()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        auto all = service.rank(rawPreferences(), catalogue(), options(60));
        QVERIFY(all.has_value());
        const double threshold = all->front().score;

        auto opts = options(60);
        opts.minScore = threshold;
        auto filtered = service.rank(rawPreferences(), catalogue(), opts);
        QVERIFY(filtered.has_value());
        QVERIFY(!filtered->empty());
        QVERIFY(filtered->size() < all->size());
        for (const auto& scored : *filtered) {
            QVERIFY(scored.score >= threshold);
        }
    }

    void testPublishAndRollbackChangeServedVersion()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        auto first = service.rank(rawPreferences(), catalogue(), options(5));
        QVERIFY(first.has_value());

        st::FeatureArray values = st::WeightVector::defaults().values();
        values[st::featureIndex(st::FeatureKey::BaseScore)] = 50.0;
        const st::WeightVector candidate(values, 0, m_now, QStringLiteral("manual"));
        QCOMPARE(service.weightStore().publish(candidate).value_or(0), uint64_t(2));

        auto second = service.rank(rawPreferences(), catalogue(), options(5));
        QVERIFY(second.has_value());
        QCOMPARE(second->front().weightVersion, uint64_t(2));
        QCOMPARE(second->front().score, first->front().score + 20.0);

        QVERIFY(service.rollback(1));
        QCOMPARE(service.activeWeightVersion(), uint64_t(1));
        auto third = service.rank(rawPreferences(), catalogue(), options(5));
        QVERIFY(third.has_value());
        QCOMPARE(third->front().weightVersion, uint64_t(1));
        QCOMPARE(third->front().score, first->front().score);

        st::Error error;
        QVERIFY(!service.rollback(42, &error));
        QCOMPARE(error.kind, st::ErrorKind::UnknownVersion);
    }

    void testRepeatedRequestHitsCaches()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        QVERIFY(service.rank(rawPreferences(), catalogue(), options(5)).has_value());
        QVERIFY(service.rank(rawPreferences(), catalogue(), options(5)).has_value());

        QVERIFY(service.cache().preferenceStats().hits >= 1);
        QVERIFY(service.cache().scoreStats().hits >= 1);
    }

    void testCacheOutageDoesNotFailRanking()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());
        auto expected = service.rank(rawPreferences(), catalogue(), options(8));
        QVERIFY(expected.has_value());

        service.cache().setAvailable(false);
        auto actual = service.rank(rawPreferences(), catalogue(), options(8));
        QVERIFY(actual.has_value());
        QCOMPARE(actual->size(), expected->size());
        for (std::size_t i = 0; i < expected->size(); ++i) {
            QCOMPARE(actual->at(i).trip.tripId, expected->at(i).trip.tripId);
        }
        QVERIFY(service.cache().scoreStats().fallthroughs > 0);
    }

    void testRankFromInventoryAppliesHardFilters()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        QJsonArray tripsJson;
        for (const auto& trip : catalogue()) {
            tripsJson.append(st::tripCandidateToJson(trip));
        }
        auto past = makeTrip(500, 81, st::Continent::Asia, 10, 3000.0);
        past.departureDate = m_today.addDays(-3);
        tripsJson.append(st::tripCandidateToJson(past));
        auto pricey = makeTrip(501, 81, st::Continent::Asia, 10, 9000.0);
        tripsJson.append(st::tripCandidateToJson(pricey));
        auto elsewhere = makeTrip(502, 55, st::Continent::SouthAmerica, 10, 3000.0);
        tripsJson.append(st::tripCandidateToJson(elsewhere));

        st::Error error;
        auto inventory = st::JsonInventorySource::fromJson(tripsJson, m_today, {}, &error);
        QVERIFY2(inventory.has_value(), qPrintable(st::errorToString(error)));

        auto results = service.rankFromInventory(rawPreferences(), *inventory, options(100), &error);
        QVERIFY2(results.has_value(), qPrintable(st::errorToString(error)));
        QVERIFY(!results->empty());
        for (const auto& scored : *results) {
            QVERIFY(scored.trip.tripId < 500);
            QVERIFY(scored.trip.price <= 5000.0 * 1.3);
            QVERIFY(!scored.relaxed);
        }
    }

    void testShortPrimaryListIsToppedUpFromRelaxedPass()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        // Two exact matches in Japan, the rest only match once relaxed.
        std::vector<st::TripCandidate> trips;
        trips.push_back(makeTrip(1, 81, st::Continent::Asia, 10, 3000.0));
        trips.push_back(makeTrip(2, 81, st::Continent::Asia, 10, 3000.0));
        auto korea = makeTrip(3, 82, st::Continent::Asia, 10, 3000.0);
        trips.push_back(korea);
        auto otherType = makeTrip(4, 81, st::Continent::Asia, 10, 3000.0);
        otherType.tripTypeId = 2;
        trips.push_back(otherType);
        auto stretched = makeTrip(5, 81, st::Continent::Asia, 10, 7000.0);
        trips.push_back(stretched);
        auto tooDear = makeTrip(6, 81, st::Continent::Asia, 10, 8000.0);
        trips.push_back(tooDear);
        auto peru = makeTrip(7, 51, st::Continent::SouthAmerica, 10, 3000.0);
        trips.push_back(peru);
        auto full = makeTrip(8, 82, st::Continent::Asia, 10, 3000.0);
        full.status = st::TripStatus::Full;
        trips.push_back(full);

        st::JsonInventorySource inventory(trips, m_today, service.settings().filters);

        QJsonObject raw;
        raw[QStringLiteral("selected_countries")] = QJsonArray{81};
        raw[QStringLiteral("preferred_type_id")] = 1;
        raw[QStringLiteral("budget")] = 5000;

        st::Error error;
        auto results = service.rankFromInventory(raw, inventory, options(10), &error);
        QVERIFY2(results.has_value(), qPrintable(st::errorToString(error)));

        std::vector<int64_t> ids;
        for (const auto& scored : *results) {
            ids.push_back(scored.trip.tripId);
        }
        QCOMPARE(ids.size(), size_t(5));
        QVERIFY(!results->at(0).relaxed);
        QVERIFY(!results->at(1).relaxed);
        for (std::size_t i = 2; i < results->size(); ++i) {
            const st::ScoredTrip& scored = results->at(i);
            QVERIFY(scored.relaxed);
            QVERIFY(scored.score < results->at(1).score);
            if (i > 2) {
                QVERIFY(st::ranksBefore(results->at(i - 1), scored));
            }
            if (scored.trip.tripId == 4) {
                QCOMPARE(scored.penalty, -25.0);
            } else {
                QCOMPARE(scored.penalty, -15.0);
            }
        }
        QVERIFY(std::find(ids.begin(), ids.end(), 6) == ids.end());
        QVERIFY(std::find(ids.begin(), ids.end(), 7) == ids.end());
        QVERIFY(std::find(ids.begin(), ids.end(), 8) == ids.end());

        const QJsonObject json = results->back().toJson();
        QVERIFY(json.value(QStringLiteral("relaxed")).toBool());
    }

    void testRelaxedPassCanBeDisabled()
    {
        st::EngineSettings s = settings();
        s.filters.relaxedEnabled = false;
        st::RankingService service(s);
        QVERIFY(service.initialize());

        std::vector<st::TripCandidate> trips{makeTrip(1, 81, st::Continent::Asia, 10, 3000.0),
                                             makeTrip(3, 82, st::Continent::Asia, 10, 3000.0)};
        st::JsonInventorySource inventory(trips, m_today, s.filters);

        QJsonObject raw;
        raw[QStringLiteral("selected_countries")] = QJsonArray{81};
        auto results = service.rankFromInventory(raw, inventory, options(10));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), size_t(1));
        QCOMPARE(results->front().trip.tripId, int64_t(1));
    }

    void testTrainingPromotesAndSchedules()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        const st::WeightVector zero(st::FeatureArray{}, 0, m_now, QStringLiteral("test"));
        QCOMPARE(service.weightStore().publish(zero).value_or(0), uint64_t(2));
        logSessions(service.exampleLog(), 150);

        st::Error error;
        auto report = service.triggerTraining(m_now, &error);
        QVERIFY2(report.has_value(), qPrintable(st::errorToString(error)));
        QVERIFY(report->promoted);
        QCOMPARE(report->deployedVersion.value_or(0), uint64_t(3));
        QCOMPARE(service.activeWeightVersion(), uint64_t(3));

        auto ranked = service.rank(rawPreferences(), catalogue(), options(3));
        QVERIFY(ranked.has_value());
        QCOMPARE(ranked->front().weightVersion, uint64_t(3));

        std::optional<st::TrainingReport> scheduled;
        QVERIFY(service.maybeRunScheduledTraining(m_now.addSecs(60), &scheduled));
        QVERIFY(scheduled.has_value());
        QVERIFY(!service.maybeRunScheduledTraining(m_now.addSecs(3600)));
        QVERIFY(service.maybeRunScheduledTraining(m_now.addDays(2)));

        const QJsonObject health = service.healthSnapshot();
        QCOMPARE(health.value(QStringLiteral("training")).toObject()
                     .value(QStringLiteral("state")).toString(), QStringLiteral("idle"));
        QVERIFY(health.value(QStringLiteral("rankRequests")).toInteger() >= 1);
    }

    void testScheduleStaysDueWhenRunIsAlreadyInFlight()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());

        // A scheduled check landing while a manual run is collecting is
        // rejected and must not count as the scheduled run.
        std::atomic<bool> nestedRan{true};
        service.trainingPipeline()->setStateObserver([&](st::TrainingState state) {
            if (state != st::TrainingState::Collecting) {
                return;
            }
            std::thread scheduler([&] { nestedRan = service.maybeRunScheduledTraining(m_now); });
            scheduler.join();
        });

        st::Error error;
        QVERIFY2(service.triggerTraining(m_now, &error).has_value(),
                 qPrintable(st::errorToString(error)));
        service.trainingPipeline()->setStateObserver({});
        QVERIFY(!nestedRan.load());

        QVERIFY(service.maybeRunScheduledTraining(m_now.addSecs(60)));
        QVERIFY(!service.maybeRunScheduledTraining(m_now.addSecs(120)));
    }

    void testRankingDuringPublishesStaysConsistent()
    {
        st::RankingService service(settings());
        QVERIFY(service.initialize());
        const auto pool = catalogue();

        std::atomic<bool> stop{false};
        std::atomic<int> mixed{0};
        std::thread ranker([&]() {
            while (!stop.load()) {
                auto results = service.rank(rawPreferences(), pool, options(10));
                if (!results) {
                    ++mixed;
                    continue;
                }
                for (const auto& scored : *results) {
                    if (scored.weightVersion != results->front().weightVersion) {
                        ++mixed;
                    }
                }
            }
        });

        for (int i = 0; i < 50; ++i) {
            st::FeatureArray values = st::WeightVector::defaults().values();
            values[st::featureIndex(st::FeatureKey::GeoMatchLevel)] = 1.0 + i;
            const st::WeightVector candidate(values, 0, m_now, QStringLiteral("manual"));
            QVERIFY(service.weightStore().publish(candidate).has_value());
        }
        stop.store(true);
        ranker.join();

        QCOMPARE(mixed.load(), 0);
        QCOMPARE(service.activeWeightVersion(), uint64_t(51));
    }

    void testWeightsPersistAcrossRestart()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto s = settings();
        s.store.databasePath = dir.filePath(QStringLiteral("ranker.db"));

        {
            st::RankingService service(s);
            QVERIFY(service.initialize());
            const st::WeightVector zero(st::FeatureArray{}, 0, m_now, QStringLiteral("test"));
            QVERIFY(service.weightStore().publish(zero).has_value());
            QVERIFY(service.weightStore().publish(st::WeightVector::defaults()).has_value());
            QVERIFY(service.rollback(2));
        }

        st::RankingService reopened(s);
        QVERIFY(reopened.initialize());
        QCOMPARE(reopened.activeWeightVersion(), uint64_t(2));
        QCOMPARE(reopened.weightHistory(10).size(), size_t(3));
    }
};

QTEST_MAIN(TestRankingService)
#include "test_ranking_service.moc"
