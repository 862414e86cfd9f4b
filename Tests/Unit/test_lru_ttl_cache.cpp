#include <QtTest/QtTest>
#include "core/cache/lru_ttl_cache.h"

#include <QString>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {

using Cache = st::LruTtlCache<int, QString>;

// Manually advanced steady clock.
struct FakeClock {
    std::shared_ptr<Cache::Clock::time_point> now =
        std::make_shared<Cache::Clock::time_point>(Cache::Clock::time_point{});

    Cache::ClockFn fn() const
    {
        auto shared = now;
        return [shared]() { return *shared; };
    }

    void advance(std::chrono::seconds by) { *now += by; }
};

} // namespace

class TestLruTtlCache : public QObject {
    Q_OBJECT

private slots:
    void testHitReturnsStoredValue()
    {
        Cache cache;
        cache.put(1, QStringLiteral("one"));

        auto result = cache.get(1);
        QVERIFY(result.has_value());
        QCOMPARE(*result, QStringLiteral("one"));
        QCOMPARE(cache.stats().hits, uint64_t(1));
    }

    void testMissReturnsNullopt()
    {
        Cache cache;
        QVERIFY(!cache.get(42).has_value());
        QCOMPARE(cache.stats().misses, uint64_t(1));
    }

    void testEntryExpiresAtTtl()
    {
        FakeClock clock;
        st::LruTtlCacheConfig config;
        config.ttlSeconds = 10;
        Cache cache(config, clock.fn());

        cache.put(1, QStringLiteral("one"));
        clock.advance(std::chrono::seconds(9));
        QVERIFY(cache.get(1).has_value());

        clock.advance(std::chrono::seconds(1));
        QVERIFY(!cache.get(1).has_value());

        const auto stats = cache.stats();
        QCOMPARE(stats.expirations, uint64_t(1));
        QCOMPARE(stats.currentSize, 0);
    }

    void testLruEviction()
    {
        st::LruTtlCacheConfig config;
        config.maxEntries = 3;
        config.ttlSeconds = 60;
        Cache cache(config);

        cache.put(1, QStringLiteral("a"));
        cache.put(2, QStringLiteral("b"));
        cache.put(3, QStringLiteral("c"));

        // Touch 1 so 2 becomes least recently used.
        QVERIFY(cache.get(1).has_value());
        cache.put(4, QStringLiteral("d"));

        QVERIFY(cache.get(1).has_value());
        QVERIFY(!cache.get(2).has_value());
        QVERIFY(cache.get(3).has_value());
        QVERIFY(cache.get(4).has_value());
        QCOMPARE(cache.stats().evictions, uint64_t(1));
        QCOMPARE(cache.stats().currentSize, 3);
    }

    void testPutReplacesAndRefreshesAge()
    {
        FakeClock clock;
        st::LruTtlCacheConfig config;
        config.ttlSeconds = 10;
        Cache cache(config, clock.fn());

        cache.put(1, QStringLiteral("old"));
        clock.advance(std::chrono::seconds(8));
        cache.put(1, QStringLiteral("new"));
        clock.advance(std::chrono::seconds(8));

        auto result = cache.get(1);
        QVERIFY(result.has_value());
        QCOMPARE(*result, QStringLiteral("new"));
        QCOMPARE(cache.stats().currentSize, 1);
    }

    void testGetIfRejectsStaleEntry()
    {
        Cache cache;
        cache.put(1, QStringLiteral("v1"));

        auto rejected = cache.getIf(1, [](const QString& value) {
            return value == QStringLiteral("v2");
        });
        QVERIFY(!rejected.has_value());
        QVERIFY(!cache.get(1).has_value());
    }

    void testClearAndFallthroughCounter()
    {
        Cache cache;
        cache.put(1, QStringLiteral("a"));
        cache.recordFallthrough();
        cache.recordFallthrough();
        cache.clear();

        const auto stats = cache.stats();
        QCOMPARE(stats.currentSize, 0);
        QCOMPARE(stats.fallthroughs, uint64_t(2));
    }

    void testConcurrentAccess()
    {
        st::LruTtlCacheConfig config;
        config.maxEntries = 64;
        Cache cache(config);

        std::atomic<int> mismatches{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, &mismatches, t]() {
                for (int i = 0; i < 500; ++i) {
                    const int key = (t * 500 + i) % 100;
                    cache.put(key, QString::number(key));
                    auto value = cache.get(key);
                    if (value && value->toInt() != key) {
                        ++mismatches;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        QCOMPARE(mismatches.load(), 0);
        QVERIFY(cache.stats().currentSize <= 64);
    }
};

QTEST_MAIN(TestLruTtlCache)
#include "test_lru_ttl_cache.moc"
