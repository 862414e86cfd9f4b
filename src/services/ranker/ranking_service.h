#pragma once

#include "core/cache/cache_layer.h"
#include "core/learning/example_log.h"
#include "core/learning/training_pipeline.h"
#include "core/ranking/candidate_selector.h"
#include "core/ranking/feature_extractor.h"
#include "core/ranking/scored_trip.h"
#include "core/ranking/scoring_worker_pool.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/store/sqlite_database.h"
#include "core/store/weight_history_store.h"
#include "core/store/weight_store.h"

#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace st {

class InventorySource;

struct RankOptions {
    std::optional<std::size_t> k;          // defaults to serving.defaultTopK
    std::optional<double> minScore;        // defaults to serving.minScore
    QDate referenceDate;                   // defaults to today
    const std::atomic<bool>* cancelled = nullptr;
};

// Serving API plus the administrative surface. Ranking never blocks on
// training: the two share only the WeightStore's active pointer.
class RankingService {
public:
    explicit RankingService(EngineSettings settings = {});
    ~RankingService();

    RankingService(const RankingService&) = delete;
    RankingService& operator=(const RankingService&) = delete;

    // Opens store.databasePath (in-memory when empty), loads or seeds the
    // weight history and wires the training pipeline to the impression log.
    bool initialize(Error* errorOut = nullptr);

    // ── Serving ──
    std::optional<SearchPreferences> normalizePreferences(const QJsonObject& rawPreferences,
                                                          Error* errorOut = nullptr);
    std::optional<std::vector<ScoredTrip>> rank(const QJsonObject& rawPreferences,
                                                const std::vector<TripCandidate>& pool,
                                                const RankOptions& options = {},
                                                Error* errorOut = nullptr);
    std::optional<std::vector<ScoredTrip>> rank(const SearchPreferences& prefs,
                                                const std::vector<TripCandidate>& pool,
                                                const RankOptions& options = {},
                                                Error* errorOut = nullptr);
    // Fetches the primary pool and, when it yields minResultsThreshold or
    // fewer results, tops the list up from the relaxed pass. Relaxed trips
    // follow all primary ones and carry their penalty in the score.
    std::optional<std::vector<ScoredTrip>> rankFromInventory(const QJsonObject& rawPreferences,
                                                             InventorySource& inventory,
                                                             const RankOptions& options = {},
                                                             Error* errorOut = nullptr);

    static QJsonArray resultsToJson(const std::vector<ScoredTrip>& results);

    // ── Administration ──
    uint64_t activeWeightVersion() const;
    std::optional<TrainingReport> triggerTraining(const QDateTime& now = QDateTime::currentDateTimeUtc(),
                                                  Error* errorOut = nullptr);
    // Runs a training cycle when scheduleIntervalHours have passed since the
    // last scheduled run. Returns true if a cycle ran.
    bool maybeRunScheduledTraining(const QDateTime& now,
                                   std::optional<TrainingReport>* reportOut = nullptr);
    bool rollback(uint64_t version, Error* errorOut = nullptr);
    std::vector<WeightStore::Snapshot> weightHistory(std::size_t limit) const;
    int pruneHistory(const QDateTime& now, Error* errorOut = nullptr);
    QJsonObject healthSnapshot() const;

    const EngineSettings& settings() const { return m_settings; }
    CacheLayer& cache() { return m_cache; }
    WeightStore& weightStore() { return *m_weights; }
    // Null until initialize() succeeds.
    SqliteExampleLog* exampleLog() { return m_exampleLog.get(); }
    TrainingPipeline* trainingPipeline() { return m_pipeline.get(); }

private:
    std::optional<std::vector<ScoredTrip>> scoreWith(const SearchPreferences& prefs,
                                                     const std::vector<TripCandidate>& pool,
                                                     const RankOptions& options,
                                                     std::size_t k,
                                                     const WeightVector& weights,
                                                     Error* errorOut);
    std::optional<double> effectiveMinScore(const RankOptions& options) const;
    std::size_t effectiveTopK(const RankOptions& options) const;

    EngineSettings m_settings;

    std::optional<SqliteDatabase> m_database;
    std::unique_ptr<WeightHistoryStore> m_history;
    std::unique_ptr<WeightStore> m_weights;
    std::unique_ptr<SqliteExampleLog> m_exampleLog;
    std::unique_ptr<TrainingPipeline> m_pipeline;

    FeatureExtractor m_extractor;
    CacheLayer m_cache;
    std::unique_ptr<ScoringWorkerPool> m_pool;
    std::unique_ptr<CandidateSelector> m_selector;

    std::mutex m_scheduleMutex;
    QDateTime m_lastScheduledRun;

    std::atomic<uint64_t> m_rankCount{0};
    std::atomic<uint64_t> m_rankFailures{0};
};

} // namespace st
