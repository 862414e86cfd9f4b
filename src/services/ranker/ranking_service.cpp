#include "services/ranker/ranking_service.h"
#include "core/query/preference_normalizer.h"
#include "core/ranking/top_k_heap.h"
#include "core/shared/logging.h"
#include "services/ranker/inventory_source.h"

#include <algorithm>

namespace st {

RankingService::RankingService(EngineSettings settings)
    : m_settings(std::move(settings))
    , m_weights(std::make_unique<WeightStore>())
    , m_extractor(m_settings.extraction)
    , m_cache(m_settings.cache)
    , m_pool(std::make_unique<ScoringWorkerPool>(m_settings.serving.workerCount))
    , m_selector(std::make_unique<CandidateSelector>(m_extractor, m_pool.get(), &m_cache,
                                                     m_settings.serving.prefilterEnabled))
{
}

RankingService::~RankingService()
{
    m_pool->shutdown();
}

bool RankingService::initialize(Error* errorOut)
{
    const QString dbPath = m_settings.store.databasePath.isEmpty()
        ? QStringLiteral(":memory:")
        : m_settings.store.databasePath;

    m_database = SqliteDatabase::open(dbPath, errorOut);
    if (!m_database) {
        return false;
    }

    auto history = std::make_unique<WeightHistoryStore>(m_database->handle());
    auto weights = std::make_unique<WeightStore>(history.get());
    if (!weights->initialize(errorOut)) {
        LOG_ERROR(stCore, "Failed to load weight history from %s", qUtf8Printable(dbPath));
        return false;
    }

    m_history = std::move(history);
    m_weights = std::move(weights);
    m_exampleLog = std::make_unique<SqliteExampleLog>(m_database->handle());
    m_pipeline = std::make_unique<TrainingPipeline>(*m_exampleLog, *m_weights, m_settings.training);

    LOG_INFO(stCore, "Ranking service ready (weights v%llu, %d workers)",
             static_cast<unsigned long long>(m_weights->activeVersion()), m_pool->workerCount());
    return true;
}

std::optional<SearchPreferences> RankingService::normalizePreferences(const QJsonObject& rawPreferences,
                                                                      Error* errorOut)
{
    const QString fingerprint = PreferenceNormalizer::rawFingerprint(rawPreferences);
    if (auto cached = m_cache.lookupPreferences(fingerprint)) {
        return cached;
    }

    auto prefs = PreferenceNormalizer::normalize(rawPreferences, errorOut);
    if (prefs) {
        m_cache.storePreferences(fingerprint, *prefs);
    }
    return prefs;
}

std::optional<std::vector<ScoredTrip>> RankingService::rank(const QJsonObject& rawPreferences,
                                                            const std::vector<TripCandidate>& pool,
                                                            const RankOptions& options,
                                                            Error* errorOut)
{
    auto prefs = normalizePreferences(rawPreferences, errorOut);
    if (!prefs) {
        ++m_rankFailures;
        return std::nullopt;
    }
    return rank(*prefs, pool, options, errorOut);
}

std::optional<double> RankingService::effectiveMinScore(const RankOptions& options) const
{
    return options.minScore ? options.minScore : m_settings.serving.minScore;
}

std::size_t RankingService::effectiveTopK(const RankOptions& options) const
{
    return options.k.value_or(static_cast<std::size_t>(m_settings.serving.defaultTopK));
}

std::optional<std::vector<ScoredTrip>> RankingService::scoreWith(const SearchPreferences& prefs,
                                                                 const std::vector<TripCandidate>& pool,
                                                                 const RankOptions& options,
                                                                 std::size_t k,
                                                                 const WeightVector& weights,
                                                                 Error* errorOut)
{
    SelectionOptions selection;
    selection.k = k;
    selection.referenceDate = options.referenceDate.isValid() ? options.referenceDate
                                                              : QDate::currentDate();
    selection.cancelled = options.cancelled;

    SelectionStats stats;
    return m_selector->selectTopK(pool, prefs, weights, selection, errorOut, &stats);
}

std::optional<std::vector<ScoredTrip>> RankingService::rank(const SearchPreferences& prefs,
                                                            const std::vector<TripCandidate>& pool,
                                                            const RankOptions& options,
                                                            Error* errorOut)
{
    ++m_rankCount;

    // One snapshot per request: every candidate is scored under the same
    // version even if a publish lands mid-request.
    const WeightStore::Snapshot weights = m_weights->getActive();

    auto results = scoreWith(prefs, pool, options, effectiveTopK(options), *weights, errorOut);
    if (!results) {
        ++m_rankFailures;
        return std::nullopt;
    }

    if (const std::optional<double> minScore = effectiveMinScore(options)) {
        results->erase(std::remove_if(results->begin(), results->end(),
                                      [&minScore](const ScoredTrip& scored) {
                                          return scored.score < *minScore;
                                      }),
                       results->end());
    }

    LOG_DEBUG(stRanking, "Ranked %d of %d candidates with weights v%llu",
              static_cast<int>(results->size()), static_cast<int>(pool.size()),
              static_cast<unsigned long long>(weights->version()));
    return results;
}

std::optional<std::vector<ScoredTrip>> RankingService::rankFromInventory(const QJsonObject& rawPreferences,
                                                                         InventorySource& inventory,
                                                                         const RankOptions& options,
                                                                         Error* errorOut)
{
    auto prefs = normalizePreferences(rawPreferences, errorOut);
    if (!prefs) {
        ++m_rankFailures;
        return std::nullopt;
    }

    std::vector<TripCandidate> pool;
    if (!inventory.fetchCandidates(*prefs, &pool, errorOut)) {
        ++m_rankFailures;
        return std::nullopt;
    }

    ++m_rankCount;
    const WeightStore::Snapshot weights = m_weights->getActive();
    const std::size_t k = effectiveTopK(options);
    const std::optional<double> minScore = effectiveMinScore(options);

    auto results = scoreWith(*prefs, pool, options, k, *weights, errorOut);
    if (!results) {
        ++m_rankFailures;
        return std::nullopt;
    }
    if (minScore) {
        results->erase(std::remove_if(results->begin(), results->end(),
                                      [&minScore](const ScoredTrip& scored) {
                                          return scored.score < *minScore;
                                      }),
                       results->end());
    }

    const FilterSettings& filters = m_settings.filters;
    if (!filters.relaxedEnabled || results->size() >= k
        || results->size() > static_cast<std::size_t>(filters.minResultsThreshold)) {
        return results;
    }

    std::vector<int64_t> seen;
    seen.reserve(pool.size());
    for (const TripCandidate& trip : pool) {
        seen.push_back(trip.tripId);
    }

    std::vector<TripCandidate> relaxedPool;
    if (!inventory.fetchRelaxedCandidates(*prefs, seen, &relaxedPool, errorOut)) {
        ++m_rankFailures;
        return std::nullopt;
    }
    if (relaxedPool.empty()) {
        return results;
    }

    // Penalties sit outside the learned model, so every relaxed trip is
    // scored before the heap picks the survivors.
    auto relaxed = scoreWith(*prefs, relaxedPool, options, relaxedPool.size(), *weights, errorOut);
    if (!relaxed) {
        ++m_rankFailures;
        return std::nullopt;
    }

    TopKHeap heap(k - results->size());
    for (ScoredTrip& scored : *relaxed) {
        scored.relaxed = true;
        scored.penalty = filters.relaxedPenalty;
        if (prefs->tripTypeId && scored.trip.tripTypeId != *prefs->tripTypeId) {
            scored.penalty += filters.relaxedTripTypePenalty;
        }
        scored.score += scored.penalty;
        if (minScore && scored.score < *minScore) {
            continue;
        }
        heap.offer(std::move(scored));
    }

    std::vector<ScoredTrip> extra = heap.takeSorted();
    LOG_DEBUG(stRanking, "Relaxed pass added %d of %d trips to %d primary results",
              static_cast<int>(extra.size()), static_cast<int>(relaxedPool.size()),
              static_cast<int>(results->size()));
    for (ScoredTrip& scored : extra) {
        results->push_back(std::move(scored));
    }
    return results;
}

QJsonArray RankingService::resultsToJson(const std::vector<ScoredTrip>& results)
{
    QJsonArray array;
    for (const ScoredTrip& scored : results) {
        array.append(scored.toJson());
    }
    return array;
}

uint64_t RankingService::activeWeightVersion() const
{
    return m_weights->activeVersion();
}

std::optional<TrainingReport> RankingService::triggerTraining(const QDateTime& now, Error* errorOut)
{
    if (!m_pipeline) {
        fail(errorOut, ErrorKind::Persistence, QStringLiteral("service not initialized"));
        return std::nullopt;
    }
    return m_pipeline->runOnce(now, errorOut);
}

bool RankingService::maybeRunScheduledTraining(const QDateTime& now,
                                               std::optional<TrainingReport>* reportOut)
{
    {
        std::lock_guard<std::mutex> lock(m_scheduleMutex);
        if (m_lastScheduledRun.isValid()
            && m_lastScheduledRun.secsTo(now)
                < static_cast<qint64>(m_settings.training.scheduleIntervalHours) * 3600) {
            return false;
        }
    }

    // A run rejected because another one is in flight leaves the schedule due.
    Error error;
    auto report = triggerTraining(now, &error);
    if (!report && error.kind == ErrorKind::TrainingInProgress) {
        LOG_INFO(stLearning, "Scheduled training skipped: %s", qUtf8Printable(errorToString(error)));
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_scheduleMutex);
        m_lastScheduledRun = now;
    }

    Error pruneError;
    if (pruneHistory(now, &pruneError) < 0) {
        LOG_WARN(stStore, "Weight history prune failed: %s", qUtf8Printable(errorToString(pruneError)));
    }

    if (reportOut) {
        *reportOut = std::move(report);
    }
    return true;
}

bool RankingService::rollback(uint64_t version, Error* errorOut)
{
    return m_weights->rollback(version, errorOut);
}

std::vector<WeightStore::Snapshot> RankingService::weightHistory(std::size_t limit) const
{
    return m_weights->history(limit);
}

int RankingService::pruneHistory(const QDateTime& now, Error* errorOut)
{
    return m_weights->pruneHistory(now, m_settings.store.historyRetentionDays, errorOut);
}

QJsonObject RankingService::healthSnapshot() const
{
    QJsonObject health;
    health[QStringLiteral("activeWeightVersion")] = static_cast<qint64>(m_weights->activeVersion());
    health[QStringLiteral("latestWeightVersion")] = static_cast<qint64>(m_weights->latestVersion());
    health[QStringLiteral("featureSchemaVersion")] = m_extractor.schemaVersion();
    health[QStringLiteral("workers")] = m_pool->workerCount();
    health[QStringLiteral("rankRequests")] = static_cast<qint64>(m_rankCount.load());
    health[QStringLiteral("rankFailures")] = static_cast<qint64>(m_rankFailures.load());
    health[QStringLiteral("cache")] = m_cache.statsJson();
    health[QStringLiteral("persistent")] = m_database.has_value();

    QJsonObject training;
    if (m_pipeline) {
        training[QStringLiteral("state")] = trainingStateToString(m_pipeline->state());
        if (const auto report = m_pipeline->lastReport()) {
            training[QStringLiteral("lastReport")] = report->toJson();
        }
    } else {
        training[QStringLiteral("state")] = QStringLiteral("unavailable");
    }
    health[QStringLiteral("training")] = training;
    return health;
}

} // namespace st
