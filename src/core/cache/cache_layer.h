#pragma once

#include "core/cache/lru_ttl_cache.h"
#include "core/ranking/scored_trip.h"
#include "core/shared/errors.h"
#include "core/shared/search_preferences.h"
#include "core/shared/settings.h"

#include <QDate>
#include <QHash>
#include <QJsonObject>
#include <QString>

#include <atomic>
#include <cstdint>
#include <optional>

namespace st {

struct ScoreCacheKey {
    int64_t tripId = 0;
    QString preferenceFingerprint;
    uint64_t weightVersion = 0;

    bool operator==(const ScoreCacheKey& other) const
    {
        return tripId == other.tripId
            && weightVersion == other.weightVersion
            && preferenceFingerprint == other.preferenceFingerprint;
    }
};

struct ScoreCacheKeyHash {
    size_t operator()(const ScoreCacheKey& key) const
    {
        size_t seed = qHash(key.preferenceFingerprint);
        seed ^= std::hash<int64_t>()(key.tripId) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= std::hash<uint64_t>()(key.weightVersion) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

struct QStringKeyHash {
    size_t operator()(const QString& s) const { return qHash(s); }
};

// The two serving caches. Including the weight version in the score key means
// a publish or rollback can never serve a score from superseded weights.
// Caching is optional: while unavailable every call falls through.
class CacheLayer {
public:
    using ClockFn = LruTtlCache<QString, SearchPreferences, QStringKeyHash>::ClockFn;

    explicit CacheLayer(const CacheSettings& settings = {}, ClockFn clock = ClockFn());

    // Keyed by PreferenceNormalizer::rawFingerprint().
    std::optional<SearchPreferences> lookupPreferences(const QString& rawFingerprint,
                                                       Error* errorOut = nullptr);
    void storePreferences(const QString& rawFingerprint, const SearchPreferences& prefs);

    // A hit computed for a different trip snapshot or reference date is a miss.
    std::optional<ScoredTrip> lookupScore(const TripCandidate& trip,
                                          const QString& preferenceFingerprint,
                                          uint64_t weightVersion,
                                          const QDate& referenceDate,
                                          Error* errorOut = nullptr);
    void storeScore(const QString& preferenceFingerprint,
                    const QDate& referenceDate,
                    const ScoredTrip& scored);

    void setAvailable(bool available);
    bool isAvailable() const { return m_available.load(); }

    void clear();

    CacheStats preferenceStats() const { return m_preferences.stats(); }
    CacheStats scoreStats() const { return m_scores.stats(); }
    QJsonObject statsJson() const;

private:
    struct CachedScore {
        ScoredTrip scored;
        QDate referenceDate;
    };

    LruTtlCache<QString, SearchPreferences, QStringKeyHash> m_preferences;
    LruTtlCache<ScoreCacheKey, CachedScore, ScoreCacheKeyHash> m_scores;
    std::atomic<bool> m_available{true};
};

} // namespace st
