#pragma once

#include "core/learning/example_log.h"
#include "core/learning/training_types.h"
#include "core/ranking/feature_schema.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace st {

class WeightStore;

enum class TrainingState {
    Idle,
    Collecting,
    Training,
    Validating,
    Deploying,
    Discarding,
};

QString trainingStateToString(TrainingState state);

struct EpochMetrics {
    int epoch = 0;
    double trainLoss = 0.0;
    double validationLoss = 0.0;
};

struct TrainingReport {
    QDateTime startedAt;
    QDateTime finishedAt;
    std::vector<TrainingState> trace;  // every state entered, in order
    TrainingState outcome = TrainingState::Discarding;
    bool promoted = false;
    std::optional<ErrorKind> failureKind;  // unset when the promotion guard discards
    QString failureReason;

    int collected = 0;
    int rejected = 0;
    int trainCount = 0;
    int validationCount = 0;
    std::vector<EpochMetrics> epochs;

    double activeLoss = 0.0;
    double candidateLoss = 0.0;
    double activeAuc = 0.5;
    double candidateAuc = 0.5;

    uint64_t activeVersionBefore = 0;
    std::optional<uint64_t> deployedVersion;
    std::optional<FeatureArray> candidateWeights;

    QJsonObject toJson() const;
};

// Collect -> train -> validate -> deploy or discard. At most one run at a
// time; a second caller gets TrainingInProgress instead of waiting. Given the
// same examples and the same active weights a run produces the same
// candidate: the split is a hash of the session id and descent is full-batch
// in log order.
class TrainingPipeline {
public:
    TrainingPipeline(TrainingExampleSource& source,
                     WeightStore& store,
                     TrainingSettings settings = {});

    // Runs one cycle over the trailing window ending at now. Returns the
    // report for every completed cycle, including discarded ones; fails only
    // with TrainingInProgress.
    std::optional<TrainingReport> runOnce(const QDateTime& now, Error* errorOut = nullptr);

    TrainingState state() const { return m_state.load(); }
    bool isRunning() const { return state() != TrainingState::Idle; }
    std::optional<TrainingReport> lastReport() const;

    const TrainingSettings& settings() const { return m_settings; }

    // Called on the running thread after every state change. Set before
    // runOnce(), not while a run is in progress.
    using StateObserver = std::function<void(TrainingState)>;
    void setStateObserver(StateObserver observer) { m_observer = std::move(observer); }

    // Stable bucket in [0, 1) from SHA-256 of the session id.
    static double sessionBucket(const QString& sessionId);
    static bool inValidationPartition(const QString& sessionId, double validationFraction);

    // Empty reasonOut means valid.
    static bool isValidExample(const TrainingExample& example,
                               const QDateTime& windowStart,
                               const QDateTime& windowEnd,
                               double maxDwellSeconds,
                               int schemaVersion,
                               QString* reasonOut = nullptr);

private:
    void enter(TrainingState next, TrainingReport* report);
    // No kind means the promotion guard rejected the candidate.
    void discard(TrainingReport* report, std::optional<ErrorKind> kind, const QString& reason);
    void finish(TrainingReport* report);

    TrainingExampleSource& m_source;
    WeightStore& m_store;
    TrainingSettings m_settings;
    StateObserver m_observer;

    std::mutex m_runMutex;  // run lock, only ever try_lock'ed
    std::atomic<TrainingState> m_state{TrainingState::Idle};

    mutable std::mutex m_reportMutex;
    std::optional<TrainingReport> m_lastReport;
};

} // namespace st
