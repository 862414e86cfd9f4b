#include <QtTest/QtTest>
#include "core/cache/cache_layer.h"
#include "core/ranking/candidate_selector.h"
#include "core/ranking/scoring_worker_pool.h"
#include "core/ranking/top_k_heap.h"

#include <QRandomGenerator>

#include <atomic>

class TestCandidateSelector : public QObject {
    Q_OBJECT

private:
    const QDate m_today{2026, 3, 1};

    static constexpr int kJapan = 81;
    static constexpr int kChile = 56;

    st::TripCandidate makeTrip(int64_t id, int countryId, int durationDays, double price) const
    {
        st::TripCandidate trip;
        trip.tripId = id;
        trip.countryId = countryId;
        trip.countryName = countryId == kJapan ? QStringLiteral("Japan") : QStringLiteral("Chile");
        trip.continent = countryId == kJapan ? st::Continent::Asia : st::Continent::SouthAmerica;
        trip.durationDays = durationDays;
        trip.price = price;
        trip.difficultyLevel = 2;
        trip.departureDate = m_today.addDays(120);
        trip.tripTypeId = 1;
        return trip;
    }

    // base 12, duration 8.75 per level, budget 3 per level, geo 15 per level.
    st::WeightVector scenarioWeights() const
    {
        st::FeatureArray values{};
        values[st::featureIndex(st::FeatureKey::BaseScore)] = 12.0;
        values[st::featureIndex(st::FeatureKey::DurationMatchLevel)] = 8.75;
        values[st::featureIndex(st::FeatureKey::BudgetMatchLevel)] = 3.0;
        values[st::featureIndex(st::FeatureKey::GeoMatchLevel)] = 15.0;
        return st::WeightVector(values, 3, QDateTime::currentDateTimeUtc(), QStringLiteral("test"));
    }

    st::SearchPreferences japanPreferences() const
    {
        st::SearchPreferences prefs;
        prefs.countryIds = {kJapan};
        prefs.minDurationDays = 10;
        prefs.maxDurationDays = 14;
        prefs.budget = 12000.0;
        return prefs;
    }

    std::vector<st::TripCandidate> largePool(int count) const
    {
        std::vector<st::TripCandidate> pool;
        for (int i = 0; i < count; ++i) {
            auto trip = makeTrip(1000 - i, (i % 3 == 0) ? kJapan : kChile, 6 + (i % 11),
                                 8000.0 + 300.0 * (i % 23));
            trip.status = static_cast<st::TripStatus>(i % 3);
            trip.departureDate = m_today.addDays(i % 60);
            pool.push_back(trip);
        }
        return pool;
    }

    st::SelectionOptions options(std::size_t k) const
    {
        st::SelectionOptions opts;
        opts.k = k;
        opts.referenceDate = m_today;
        return opts;
    }

private slots:
    void testConcreteScenarioTieBreaksOnTripId()
    {
        // 42.0: Japan, duration and budget miss. 38.5 (x2): duration and
        // budget fit, other country. 12.0: nothing fits.
        std::vector<st::TripCandidate> pool = {
            makeTrip(9, kChile, 12, 10000.0),
            makeTrip(2, kChile, 30, 20000.0),
            makeTrip(7, kChile, 12, 10000.0),
            makeTrip(11, kJapan, 30, 20000.0),
        };

        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor);
        st::Error error;
        auto results = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(2),
                                           &error);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), size_t(2));
        QCOMPARE(results->at(0).score, 42.0);
        QCOMPARE(results->at(0).trip.tripId, int64_t(11));
        QCOMPARE(results->at(1).score, 38.5);
        QCOMPARE(results->at(1).trip.tripId, int64_t(7));
        QCOMPARE(results->at(1).weightVersion, uint64_t(3));
    }

    void testFullRankingOrder()
    {
        std::vector<st::TripCandidate> pool = {
            makeTrip(9, kChile, 12, 10000.0),
            makeTrip(2, kChile, 30, 20000.0),
            makeTrip(7, kChile, 12, 10000.0),
            makeTrip(11, kJapan, 30, 20000.0),
        };

        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor);
        auto results = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(10));
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), size_t(4));
        QCOMPARE(results->at(0).trip.tripId, int64_t(11));
        QCOMPARE(results->at(1).trip.tripId, int64_t(7));
        QCOMPARE(results->at(2).trip.tripId, int64_t(9));
        QCOMPARE(results->at(3).trip.tripId, int64_t(2));
        QCOMPARE(results->at(3).score, 12.0);
    }

    void testEmptyPoolAndZeroK()
    {
        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor);

        auto empty = selector.selectTopK({}, japanPreferences(), scenarioWeights(), options(5));
        QVERIFY(empty.has_value());
        QVERIFY(empty->empty());

        std::vector<st::TripCandidate> pool = {makeTrip(1, kJapan, 12, 100.0)};
        auto none = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(0));
        QVERIFY(none.has_value());
        QVERIFY(none->empty());
    }

    void testTopKHeapKeepsBest()
    {
        st::TopKHeap heap(2);
        for (int64_t id : {5, 3, 8, 1}) {
            st::ScoredTrip scored;
            scored.trip.tripId = id;
            scored.score = id == 8 ? 10.0 : 5.0;
            heap.offer(scored);
        }
        const auto sorted = heap.takeSorted();
        QCOMPARE(sorted.size(), size_t(2));
        QCOMPARE(sorted[0].trip.tripId, int64_t(8));
        QCOMPARE(sorted[1].trip.tripId, int64_t(1));
        QVERIFY(heap.empty());
    }

    void testParallelMatchesSequential()
    {
        const auto pool = largePool(1000);
        const auto weights = st::WeightVector::defaults();
        st::SearchPreferences prefs = japanPreferences();
        prefs.continents = {st::Continent::SouthAmerica};

        st::FeatureExtractor extractor;
        st::CandidateSelector sequential(extractor);
        st::ScoringWorkerPool workers(4);
        st::CandidateSelector parallel(extractor, &workers);

        auto expected = sequential.selectTopK(pool, prefs, weights, options(25));
        QVERIFY(expected.has_value());
        for (int run = 0; run < 5; ++run) {
            auto actual = parallel.selectTopK(pool, prefs, weights, options(25));
            QVERIFY(actual.has_value());
            QCOMPARE(actual->size(), expected->size());
            for (std::size_t i = 0; i < expected->size(); ++i) {
                QCOMPARE(actual->at(i).trip.tripId, expected->at(i).trip.tripId);
                QCOMPARE(actual->at(i).score, expected->at(i).score);
            }
        }
        workers.shutdown();
    }

    void testPrefilterDoesNotChangeResult()
    {
        std::vector<st::TripCandidate> pool;
        auto strong = makeTrip(1, kJapan, 12, 9000.0);
        strong.status = st::TripStatus::LastPlaces;
        pool.push_back(strong);
        strong.tripId = 2;
        pool.push_back(strong);
        for (int i = 0; i < 100; ++i) {
            pool.push_back(makeTrip(100 + i, kChile, 40, 50000.0));
        }

        st::SearchPreferences prefs;
        prefs.countryIds = {kJapan};
        const auto weights = st::WeightVector::defaults();

        st::FeatureExtractor extractor;
        st::CandidateSelector withFilter(extractor, nullptr, nullptr, true);
        st::CandidateSelector withoutFilter(extractor, nullptr, nullptr, false);

        st::SelectionStats filteredStats;
        st::SelectionStats plainStats;
        auto filtered = withFilter.selectTopK(pool, prefs, weights, options(2), nullptr, &filteredStats);
        auto plain = withoutFilter.selectTopK(pool, prefs, weights, options(2), nullptr, &plainStats);
        QVERIFY(filtered && plain);
        QCOMPARE(filtered->size(), plain->size());
        for (std::size_t i = 0; i < plain->size(); ++i) {
            QCOMPARE(filtered->at(i).trip.tripId, plain->at(i).trip.tripId);
            QCOMPARE(filtered->at(i).score, plain->at(i).score);
        }
        QCOMPARE(filteredStats.prefiltered, size_t(100));
        QCOMPARE(plainStats.prefiltered, size_t(0));
        QCOMPARE(plainStats.scored, pool.size());
    }

    void testPrefilterKeepsTieBreakWithLearnedWeights()
    {
        const st::FeatureArray values = {0.0, -0.9, 0.3, 0.6, 0.3, -0.1, 0.5, -0.7, -0.6};
        const st::WeightVector weights(values, 4, QDateTime::currentDateTimeUtc(),
                                       QStringLiteral("training"));

        st::SearchPreferences prefs;
        prefs.themeIds = {99};
        prefs.difficulty = 2;
        prefs.minDurationDays = 10;
        prefs.maxDurationDays = 14;
        prefs.budget = 1000.0;

        auto trip = makeTrip(9, kChile, 12, 10000.0);
        trip.departureDate = m_today.addDays(5);
        std::vector<st::TripCandidate> pool = {trip};
        trip.tripId = 7;
        pool.push_back(trip);

        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor, nullptr, nullptr, true);
        st::SelectionStats stats;
        auto results = selector.selectTopK(pool, prefs, weights, options(1), nullptr, &stats);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), size_t(1));
        QCOMPARE(results->front().trip.tripId, int64_t(7));
        QCOMPARE(stats.prefiltered, size_t(0));
    }

    void testPrefilterMatchesPlainSelectionForRandomWeights()
    {
        QRandomGenerator rng(20260301);
        st::FeatureExtractor extractor;
        st::CandidateSelector withFilter(extractor, nullptr, nullptr, true);
        st::CandidateSelector withoutFilter(extractor, nullptr, nullptr, false);

        st::SearchPreferences prefs;
        prefs.countryIds = {kJapan};
        prefs.continents = {st::Continent::SouthAmerica};
        prefs.themeIds = {3, 5};
        prefs.difficulty = 2;
        prefs.minDurationDays = 8;
        prefs.maxDurationDays = 12;
        prefs.budget = 9000.0;

        for (int round = 0; round < 50; ++round) {
            st::FeatureArray values{};
            for (double& w : values) {
                w = (static_cast<int>(rng.bounded(401)) - 200) / 10.0;
            }
            values[st::featureIndex(st::FeatureKey::BaseScore)] = rng.bounded(200) / 10.0;
            const st::WeightVector weights(values, 9, QDateTime::currentDateTimeUtc(),
                                           QStringLiteral("training"));

            // Every profile appears twice, with the higher id first.
            std::vector<st::TripCandidate> pool;
            for (int i = 0; i < 40; ++i) {
                auto trip = makeTrip(1000 + i, (i % 2) ? kJapan : kChile, 4 + (i % 13),
                                     7000.0 + 700.0 * (i % 7));
                trip.themeTagIds = {static_cast<int>(i % 6)};
                trip.difficultyLevel = 1 + (i % 4);
                trip.status = static_cast<st::TripStatus>(i % 3);
                trip.departureDate = m_today.addDays(10 * (i % 5));
                pool.push_back(trip);
                trip.tripId = 100 + i;
                pool.push_back(trip);
            }

            for (std::size_t k : {std::size_t(1), std::size_t(3), std::size_t(7)}) {
                auto filtered = withFilter.selectTopK(pool, prefs, weights, options(k));
                auto plain = withoutFilter.selectTopK(pool, prefs, weights, options(k));
                QVERIFY(filtered && plain);
                QCOMPARE(filtered->size(), plain->size());
                for (std::size_t i = 0; i < plain->size(); ++i) {
                    QCOMPARE(filtered->at(i).trip.tripId, plain->at(i).trip.tripId);
                    QCOMPARE(filtered->at(i).score, plain->at(i).score);
                }
            }
        }
    }

    void testCancelledSelectionFails()
    {
        std::atomic<bool> cancelled{true};
        auto opts = options(5);
        opts.cancelled = &cancelled;

        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor);
        st::Error error;
        auto results = selector.selectTopK(largePool(50), japanPreferences(), scenarioWeights(), opts,
                                           &error);
        QVERIFY(!results.has_value());
        QCOMPARE(error.kind, st::ErrorKind::Cancelled);
    }

    void testSchemaMismatchFailsWholeRequest()
    {
        const st::WeightVector foreign(scenarioWeights().values(), 4, QDateTime::currentDateTimeUtc(),
                                       QStringLiteral("test"), st::kFeatureSchemaVersion + 1);
        st::FeatureExtractor extractor;
        st::CandidateSelector selector(extractor);
        st::Error error;
        auto results = selector.selectTopK(largePool(10), japanPreferences(), foreign, options(5),
                                           &error);
        QVERIFY(!results.has_value());
        QCOMPARE(error.kind, st::ErrorKind::SchemaMismatch);
    }

    void testSecondRequestServedFromCache()
    {
        const auto pool = largePool(40);
        st::FeatureExtractor extractor;
        st::CacheLayer cache;
        st::CandidateSelector selector(extractor, nullptr, &cache, false);

        st::SelectionStats first;
        st::SelectionStats second;
        auto a = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(10), nullptr,
                                     &first);
        auto b = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(10), nullptr,
                                     &second);
        QVERIFY(a && b);
        QCOMPARE(first.scored, pool.size());
        QCOMPARE(second.cacheHits, pool.size());
        QCOMPARE(second.scored, size_t(0));
        for (std::size_t i = 0; i < a->size(); ++i) {
            QCOMPARE(a->at(i).trip.tripId, b->at(i).trip.tripId);
        }
    }

    void testUnavailableCacheFallsThrough()
    {
        const auto pool = largePool(20);
        st::FeatureExtractor extractor;
        st::CacheLayer cache;
        cache.setAvailable(false);
        st::CandidateSelector selector(extractor, nullptr, &cache, false);

        st::SelectionStats stats;
        auto results = selector.selectTopK(pool, japanPreferences(), scenarioWeights(), options(5),
                                           nullptr, &stats);
        QVERIFY(results.has_value());
        QCOMPARE(results->size(), size_t(5));
        QCOMPARE(stats.cacheFallthroughs, pool.size());
        QCOMPARE(stats.scored, pool.size());
        QCOMPARE(cache.scoreStats().currentSize, 0);
    }
};

QTEST_MAIN(TestCandidateSelector)
#include "test_candidate_selector.moc"
