#pragma once

#include "core/ranking/feature_extractor.h"
#include "core/ranking/scored_trip.h"
#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"
#include "core/shared/search_preferences.h"
#include "core/shared/trip_candidate.h"

#include <QDate>

#include <atomic>
#include <cstddef>
#include <optional>
#include <vector>

namespace st {

class CacheLayer;
class ScoringWorkerPool;

struct SelectionOptions {
    std::size_t k = 30;
    QDate referenceDate;                          // "today" for departing-soon
    const std::atomic<bool>* cancelled = nullptr; // polled between candidates
};

struct SelectionStats {
    std::size_t candidates = 0;
    std::size_t scored = 0;       // full extraction + scoring
    std::size_t cacheHits = 0;
    std::size_t prefiltered = 0;  // skipped by the upper-bound check
    std::size_t cacheFallthroughs = 0;
};

// Scores a candidate pool and keeps the best k. Work is split into
// contiguous chunks, each with its own bounded heap; chunk heaps are merged
// in chunk order, and the (score DESC, tripId ASC) order makes the result
// independent of worker scheduling.
class CandidateSelector {
public:
    explicit CandidateSelector(const FeatureExtractor& extractor,
                               ScoringWorkerPool* pool = nullptr,
                               CacheLayer* cache = nullptr,
                               bool prefilterEnabled = true);

    std::optional<std::vector<ScoredTrip>> selectTopK(const std::vector<TripCandidate>& candidates,
                                                      const SearchPreferences& prefs,
                                                      const WeightVector& weights,
                                                      const SelectionOptions& options,
                                                      Error* errorOut = nullptr,
                                                      SelectionStats* statsOut = nullptr) const;

    // Extract + score one candidate without touching the cache.
    std::optional<ScoredTrip> scoreOne(const TripCandidate& trip,
                                       const SearchPreferences& prefs,
                                       const WeightVector& weights,
                                       const QDate& referenceDate,
                                       Error* errorOut = nullptr) const;

    void setPrefilterEnabled(bool enabled) { m_prefilterEnabled = enabled; }
    bool prefilterEnabled() const { return m_prefilterEnabled; }

private:
    static constexpr std::size_t kMinChunkSize = 64;

    const FeatureExtractor& m_extractor;
    ScoringWorkerPool* m_pool = nullptr;
    CacheLayer* m_cache = nullptr;
    bool m_prefilterEnabled = true;
};

} // namespace st
