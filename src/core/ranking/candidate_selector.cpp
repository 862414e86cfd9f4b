#include "core/ranking/candidate_selector.h"
#include "core/cache/cache_layer.h"
#include "core/ranking/scoring_engine.h"
#include "core/ranking/scoring_worker_pool.h"
#include "core/ranking/top_k_heap.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace st {

namespace {

struct ChunkResult {
    explicit ChunkResult(std::size_t k)
        : heap(k)
    {
    }

    TopKHeap heap;
    SelectionStats stats;
    std::optional<Error> error;
};

bool isCancelled(const std::atomic<bool>* flag)
{
    return flag && flag->load(std::memory_order_relaxed);
}

} // namespace

CandidateSelector::CandidateSelector(const FeatureExtractor& extractor,
                                     ScoringWorkerPool* pool,
                                     CacheLayer* cache,
                                     bool prefilterEnabled)
    : m_extractor(extractor)
    , m_pool(pool)
    , m_cache(cache)
    , m_prefilterEnabled(prefilterEnabled)
{
}

std::optional<ScoredTrip> CandidateSelector::scoreOne(const TripCandidate& trip,
                                                      const SearchPreferences& prefs,
                                                      const WeightVector& weights,
                                                      const QDate& referenceDate,
                                                      Error* errorOut) const
{
    auto features = m_extractor.extract(trip, prefs, referenceDate, weights.schemaVersion(), errorOut);
    if (!features) {
        return std::nullopt;
    }
    auto parts = ScoringEngine::contributions(*features, weights, errorOut);
    if (!parts) {
        return std::nullopt;
    }
    auto score = ScoringEngine::score(*features, weights, errorOut);
    if (!score) {
        return std::nullopt;
    }

    ScoredTrip scored;
    scored.trip = trip;
    scored.features = *features;
    scored.score = *score;
    scored.weightVersion = weights.version();
    scored.contributions = *parts;
    return scored;
}

std::optional<std::vector<ScoredTrip>> CandidateSelector::selectTopK(
    const std::vector<TripCandidate>& candidates,
    const SearchPreferences& prefs,
    const WeightVector& weights,
    const SelectionOptions& options,
    Error* errorOut,
    SelectionStats* statsOut) const
{
    if (m_extractor.schemaVersion() != weights.schemaVersion()) {
        fail(errorOut, ErrorKind::SchemaMismatch,
             QStringLiteral("extractor schema %1, weight schema %2 (weights v%3)")
                 .arg(m_extractor.schemaVersion())
                 .arg(weights.schemaVersion())
                 .arg(weights.version()));
        return std::nullopt;
    }

    const std::size_t k = std::min(options.k, candidates.size());
    const QString fingerprint = m_cache ? prefs.fingerprint() : QString();

    std::size_t chunkCount = 1;
    if (m_pool && m_pool->workerCount() > 1) {
        const std::size_t byWork = (candidates.size() + kMinChunkSize - 1) / kMinChunkSize;
        chunkCount = std::max<std::size_t>(
            1, std::min(byWork, static_cast<std::size_t>(m_pool->workerCount())));
    }
    const std::size_t chunkSize = chunkCount > 0
        ? (candidates.size() + chunkCount - 1) / chunkCount
        : candidates.size();

    std::vector<ChunkResult> chunks;
    chunks.reserve(chunkCount);
    for (std::size_t i = 0; i < chunkCount; ++i) {
        chunks.emplace_back(k);
    }

    auto processChunk = [&](std::size_t chunkIndex) {
        ChunkResult& result = chunks[chunkIndex];
        const std::size_t begin = chunkIndex * chunkSize;
        const std::size_t end = std::min(candidates.size(), begin + chunkSize);

        for (std::size_t i = begin; i < end; ++i) {
            if (isCancelled(options.cancelled)) {
                return;
            }
            const TripCandidate& trip = candidates[i];
            ++result.stats.candidates;

            if (m_prefilterEnabled && result.heap.full()) {
                const double bound = m_extractor.scoreUpperBound(trip, prefs, options.referenceDate,
                                                                 weights);
                if (result.heap.rejectsBound(bound)) {
                    ++result.stats.prefiltered;
                    continue;
                }
            }

            std::optional<ScoredTrip> scored;
            if (m_cache) {
                Error cacheError;
                scored = m_cache->lookupScore(trip, fingerprint, weights.version(),
                                              options.referenceDate, &cacheError);
                if (scored) {
                    ++result.stats.cacheHits;
                } else if (!m_cache->isAvailable()) {
                    ++result.stats.cacheFallthroughs;
                }
            }

            if (!scored) {
                Error error;
                scored = scoreOne(trip, prefs, weights, options.referenceDate, &error);
                if (!scored) {
                    result.error = error;
                    return;
                }
                ++result.stats.scored;
                if (m_cache) {
                    m_cache->storeScore(fingerprint, options.referenceDate, *scored);
                }
            }

            result.heap.offer(std::move(*scored));
        }
    };

    if (m_pool && chunkCount > 1) {
        m_pool->run(chunkCount, processChunk);
    } else {
        for (std::size_t i = 0; i < chunkCount; ++i) {
            processChunk(i);
        }
    }

    SelectionStats total;
    for (const ChunkResult& chunk : chunks) {
        total.candidates += chunk.stats.candidates;
        total.scored += chunk.stats.scored;
        total.cacheHits += chunk.stats.cacheHits;
        total.prefiltered += chunk.stats.prefiltered;
        total.cacheFallthroughs += chunk.stats.cacheFallthroughs;
    }
    if (statsOut) {
        *statsOut = total;
    }

    if (isCancelled(options.cancelled)) {
        LOG_DEBUG(stRanking, "Selection cancelled after %zu of %zu candidates",
                  total.candidates, candidates.size());
        fail(errorOut, ErrorKind::Cancelled, QStringLiteral("selection cancelled"));
        return std::nullopt;
    }

    for (const ChunkResult& chunk : chunks) {
        if (chunk.error) {
            if (errorOut) {
                *errorOut = *chunk.error;
            }
            return std::nullopt;
        }
    }

    TopKHeap merged(k);
    for (ChunkResult& chunk : chunks) {
        for (ScoredTrip& item : chunk.heap.takeSorted()) {
            merged.offer(std::move(item));
        }
    }

    LOG_DEBUG(stRanking, "Selected %zu of %zu (scored=%zu cached=%zu prefiltered=%zu)",
              merged.size(), candidates.size(), total.scored, total.cacheHits, total.prefiltered);
    return merged.takeSorted();
}

} // namespace st
