#include "core/cache/cache_layer.h"
#include "core/shared/logging.h"

namespace st {

namespace {

LruTtlCacheConfig configFor(int maxEntries, int ttlSeconds)
{
    LruTtlCacheConfig config;
    config.maxEntries = maxEntries;
    config.ttlSeconds = ttlSeconds;
    return config;
}

QJsonObject statsToJson(const CacheStats& stats)
{
    QJsonObject json;
    json.insert(QStringLiteral("hits"), static_cast<qint64>(stats.hits));
    json.insert(QStringLiteral("misses"), static_cast<qint64>(stats.misses));
    json.insert(QStringLiteral("evictions"), static_cast<qint64>(stats.evictions));
    json.insert(QStringLiteral("expirations"), static_cast<qint64>(stats.expirations));
    json.insert(QStringLiteral("fallthroughs"), static_cast<qint64>(stats.fallthroughs));
    json.insert(QStringLiteral("size"), stats.currentSize);
    return json;
}

} // namespace

CacheLayer::CacheLayer(const CacheSettings& settings, ClockFn clock)
    : m_preferences(configFor(settings.preferenceCacheMaxEntries, settings.preferenceCacheTtlSeconds),
                    clock)
    , m_scores(configFor(settings.scoreCacheMaxEntries, settings.scoreCacheTtlSeconds), clock)
{
}

std::optional<SearchPreferences> CacheLayer::lookupPreferences(const QString& rawFingerprint,
                                                               Error* errorOut)
{
    if (!isAvailable()) {
        m_preferences.recordFallthrough();
        fail(errorOut, ErrorKind::CacheUnavailable, QStringLiteral("preference cache unavailable"));
        return std::nullopt;
    }
    return m_preferences.get(rawFingerprint);
}

void CacheLayer::storePreferences(const QString& rawFingerprint, const SearchPreferences& prefs)
{
    if (!isAvailable()) {
        return;
    }
    m_preferences.put(rawFingerprint, prefs);
}

std::optional<ScoredTrip> CacheLayer::lookupScore(const TripCandidate& trip,
                                                  const QString& preferenceFingerprint,
                                                  uint64_t weightVersion,
                                                  const QDate& referenceDate,
                                                  Error* errorOut)
{
    if (!isAvailable()) {
        m_scores.recordFallthrough();
        fail(errorOut, ErrorKind::CacheUnavailable, QStringLiteral("score cache unavailable"));
        return std::nullopt;
    }

    const ScoreCacheKey key{trip.tripId, preferenceFingerprint, weightVersion};
    auto cached = m_scores.getIf(key, [&trip, &referenceDate](const CachedScore& entry) {
        return entry.referenceDate == referenceDate && entry.scored.trip == trip;
    });
    if (!cached) {
        return std::nullopt;
    }
    return cached->scored;
}

void CacheLayer::storeScore(const QString& preferenceFingerprint,
                            const QDate& referenceDate,
                            const ScoredTrip& scored)
{
    if (!isAvailable()) {
        return;
    }
    const ScoreCacheKey key{scored.trip.tripId, preferenceFingerprint, scored.weightVersion};
    m_scores.put(key, CachedScore{scored, referenceDate});
}

void CacheLayer::setAvailable(bool available)
{
    const bool previous = m_available.exchange(available);
    if (previous == available) {
        return;
    }
    if (available) {
        LOG_INFO(stCache, "Cache backend available again");
    } else {
        LOG_WARN(stCache, "Cache backend unavailable, scoring directly");
    }
}

void CacheLayer::clear()
{
    m_preferences.clear();
    m_scores.clear();
}

QJsonObject CacheLayer::statsJson() const
{
    QJsonObject json;
    json.insert(QStringLiteral("available"), isAvailable());
    json.insert(QStringLiteral("preferences"), statsToJson(preferenceStats()));
    json.insert(QStringLiteral("scores"), statsToJson(scoreStats()));
    return json;
}

} // namespace st
