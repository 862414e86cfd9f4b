#include "core/learning/training_pipeline.h"
#include "core/learning/weight_optimizer.h"
#include "core/shared/logging.h"
#include "core/store/weight_store.h"

#include <QCryptographicHash>
#include <QJsonArray>

#include <cmath>

namespace st {

QString trainingStateToString(TrainingState state)
{
    switch (state) {
    case TrainingState::Idle:       return QStringLiteral("idle");
    case TrainingState::Collecting: return QStringLiteral("collecting");
    case TrainingState::Training:   return QStringLiteral("training");
    case TrainingState::Validating: return QStringLiteral("validating");
    case TrainingState::Deploying:  return QStringLiteral("deploying");
    case TrainingState::Discarding: return QStringLiteral("discarding");
    }
    return QStringLiteral("idle");
}

QJsonObject TrainingReport::toJson() const
{
    QJsonArray traceJson;
    for (TrainingState state : trace) {
        traceJson.append(trainingStateToString(state));
    }

    QJsonArray epochJson;
    for (const EpochMetrics& metrics : epochs) {
        QJsonObject row;
        row[QStringLiteral("epoch")] = metrics.epoch;
        row[QStringLiteral("trainLoss")] = metrics.trainLoss;
        row[QStringLiteral("validationLoss")] = metrics.validationLoss;
        epochJson.append(row);
    }

    QJsonObject json;
    json[QStringLiteral("startedAt")] = startedAt.toString(Qt::ISODateWithMs);
    json[QStringLiteral("finishedAt")] = finishedAt.toString(Qt::ISODateWithMs);
    json[QStringLiteral("trace")] = traceJson;
    json[QStringLiteral("outcome")] = trainingStateToString(outcome);
    json[QStringLiteral("promoted")] = promoted;
    if (failureKind) {
        json[QStringLiteral("failureKind")] = errorKindToString(*failureKind);
        json[QStringLiteral("failureReason")] = failureReason;
    }
    json[QStringLiteral("collected")] = collected;
    json[QStringLiteral("rejected")] = rejected;
    json[QStringLiteral("trainCount")] = trainCount;
    json[QStringLiteral("validationCount")] = validationCount;
    json[QStringLiteral("epochs")] = epochJson;
    json[QStringLiteral("activeLoss")] = activeLoss;
    json[QStringLiteral("candidateLoss")] = candidateLoss;
    json[QStringLiteral("activeAuc")] = activeAuc;
    json[QStringLiteral("candidateAuc")] = candidateAuc;
    json[QStringLiteral("activeVersionBefore")] = static_cast<qint64>(activeVersionBefore);
    if (deployedVersion) {
        json[QStringLiteral("deployedVersion")] = static_cast<qint64>(*deployedVersion);
    }
    return json;
}

TrainingPipeline::TrainingPipeline(TrainingExampleSource& source,
                                   WeightStore& store,
                                   TrainingSettings settings)
    : m_source(source)
    , m_store(store)
    , m_settings(settings)
{
}

double TrainingPipeline::sessionBucket(const QString& sessionId)
{
    const QByteArray digest =
        QCryptographicHash::hash(sessionId.toUtf8(), QCryptographicHash::Sha256);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(digest.at(i));
    }
    // Top 53 bits give an exactly representable fraction.
    return static_cast<double>(value >> 11) / static_cast<double>(uint64_t(1) << 53);
}

bool TrainingPipeline::inValidationPartition(const QString& sessionId, double validationFraction)
{
    return sessionBucket(sessionId) < validationFraction;
}

bool TrainingPipeline::isValidExample(const TrainingExample& example,
                                      const QDateTime& windowStart,
                                      const QDateTime& windowEnd,
                                      double maxDwellSeconds,
                                      int schemaVersion,
                                      QString* reasonOut)
{
    auto reject = [reasonOut](const char* reason) {
        if (reasonOut) {
            *reasonOut = QString::fromLatin1(reason);
        }
        return false;
    };

    if (example.sessionId.trimmed().isEmpty()) {
        return reject("missing_session");
    }
    if (example.position < 0) {
        return reject("negative_position");
    }
    if (!example.timestamp.isValid()
        || example.timestamp < windowStart
        || example.timestamp >= windowEnd) {
        return reject("outside_window");
    }
    if (example.dwellSeconds
        && (!std::isfinite(*example.dwellSeconds)
            || *example.dwellSeconds < 0.0
            || *example.dwellSeconds > maxDwellSeconds)) {
        return reject("implausible_dwell");
    }
    if (example.botFlagged) {
        return reject("bot_session");
    }
    if (example.features.schemaVersion != schemaVersion) {
        return reject("schema_version");
    }
    for (double value : example.features.values) {
        if (!std::isfinite(value)) {
            return reject("non_finite_feature");
        }
    }

    if (reasonOut) {
        reasonOut->clear();
    }
    return true;
}

void TrainingPipeline::enter(TrainingState next, TrainingReport* report)
{
    m_state.store(next);
    report->trace.push_back(next);
    LOG_DEBUG(stLearning, "Training -> %s", qUtf8Printable(trainingStateToString(next)));
    if (m_observer) {
        m_observer(next);
    }
}

void TrainingPipeline::discard(TrainingReport* report,
                               std::optional<ErrorKind> kind,
                               const QString& reason)
{
    enter(TrainingState::Discarding, report);
    report->outcome = TrainingState::Discarding;
    report->promoted = false;
    report->failureKind = kind;
    report->failureReason = reason;
    LOG_INFO(stLearning, "Training discarded (%s): %s",
             kind ? qUtf8Printable(errorKindToString(*kind)) : "promotion_guard",
             qUtf8Printable(reason));
}

void TrainingPipeline::finish(TrainingReport* report)
{
    report->finishedAt = QDateTime::currentDateTimeUtc();
    report->trace.push_back(TrainingState::Idle);
    {
        std::lock_guard<std::mutex> lock(m_reportMutex);
        m_lastReport = *report;
    }
    m_state.store(TrainingState::Idle);
}

std::optional<TrainingReport> TrainingPipeline::lastReport() const
{
    std::lock_guard<std::mutex> lock(m_reportMutex);
    return m_lastReport;
}

std::optional<TrainingReport> TrainingPipeline::runOnce(const QDateTime& now, Error* errorOut)
{
    std::unique_lock<std::mutex> runLock(m_runMutex, std::try_to_lock);
    if (!runLock.owns_lock()) {
        LOG_INFO(stLearning, "Training requested while a run is in progress");
        fail(errorOut, ErrorKind::TrainingInProgress, QStringLiteral("training run in progress"));
        return std::nullopt;
    }

    TrainingReport report;
    report.startedAt = QDateTime::currentDateTimeUtc();
    report.trace.push_back(TrainingState::Idle);

    const WeightStore::Snapshot active = m_store.getActive();
    report.activeVersionBefore = active->version();

    // Collecting
    enter(TrainingState::Collecting, &report);
    const QDateTime windowEnd = now;
    const QDateTime windowStart = now.addDays(-m_settings.windowDays);

    ExampleWindow window;
    Error fetchError;
    if (!m_source.fetchWindow(windowStart, windowEnd, &window, &fetchError)) {
        discard(&report, fetchError.kind, fetchError.message);
        finish(&report);
        return report;
    }

    report.collected = static_cast<int>(window.examples.size()) + window.malformedRows;
    report.rejected = window.malformedRows;

    TrainingBatch trainSet;
    TrainingBatch validationSet;
    for (TrainingExample& example : window.examples) {
        if (!isValidExample(example, windowStart, windowEnd, m_settings.maxDwellSeconds,
                            active->schemaVersion())) {
            ++report.rejected;
            continue;
        }
        if (inValidationPartition(example.sessionId, m_settings.validationFraction)) {
            validationSet.push_back(std::move(example));
        } else {
            trainSet.push_back(std::move(example));
        }
    }
    report.trainCount = static_cast<int>(trainSet.size());
    report.validationCount = static_cast<int>(validationSet.size());

    const int usable = report.trainCount + report.validationCount;
    if (usable < m_settings.minExamples || trainSet.empty() || validationSet.empty()) {
        discard(&report, ErrorKind::InsufficientTrainingData,
                QStringLiteral("%1 usable examples (train %2, validation %3), need %4")
                    .arg(usable)
                    .arg(report.trainCount)
                    .arg(report.validationCount)
                    .arg(m_settings.minExamples));
        finish(&report);
        return report;
    }

    // Training
    enter(TrainingState::Training, &report);
    FeatureArray candidate = active->values();
    for (int epoch = 1; epoch <= m_settings.epochs; ++epoch) {
        const WeightOptimizer::Gradient gradient = WeightOptimizer::computeGradient(candidate, trainSet);
        Error updateError;
        auto updated = WeightOptimizer::applyUpdate(candidate, gradient, m_settings.learningRate,
                                                    &updateError);
        if (!updated) {
            discard(&report, updateError.kind,
                    QStringLiteral("epoch %1: %2").arg(epoch).arg(updateError.message));
            finish(&report);
            return report;
        }
        candidate = *updated;

        EpochMetrics metrics;
        metrics.epoch = epoch;
        metrics.trainLoss = WeightOptimizer::loss(candidate, trainSet);
        metrics.validationLoss = WeightOptimizer::loss(candidate, validationSet);
        report.epochs.push_back(metrics);
    }
    report.candidateWeights = candidate;

    // Validating
    enter(TrainingState::Validating, &report);
    report.activeLoss = WeightOptimizer::loss(*active, validationSet);
    report.candidateLoss = WeightOptimizer::loss(candidate, validationSet);
    report.activeAuc = WeightOptimizer::auc(active->values(), validationSet);
    report.candidateAuc = WeightOptimizer::auc(candidate, validationSet);

    LOG_INFO(stLearning, "Validation loss active=%.6f candidate=%.6f auc active=%.4f candidate=%.4f",
             report.activeLoss, report.candidateLoss, report.activeAuc, report.candidateAuc);

    if (!std::isfinite(report.candidateLoss)) {
        discard(&report, ErrorKind::Divergence, QStringLiteral("candidate validation loss is not finite"));
        finish(&report);
        return report;
    }
    if (report.candidateLoss > report.activeLoss + m_settings.promotionTolerance) {
        discard(&report, std::nullopt,
                QStringLiteral("validation loss regressed: candidate %1 > active %2 + tolerance %3")
                    .arg(report.candidateLoss, 0, 'g', 10)
                    .arg(report.activeLoss, 0, 'g', 10)
                    .arg(m_settings.promotionTolerance));
        finish(&report);
        return report;
    }

    // Deploying
    enter(TrainingState::Deploying, &report);
    Error publishError;
    const WeightVector candidateVector(candidate, 0, now, QStringLiteral("training"),
                                       active->schemaVersion());
    // A rollback or publish made since the run started wins over this candidate.
    const auto version = m_store.publishIfActive(report.activeVersionBefore, candidateVector,
                                                 report.candidateLoss, now, &publishError);
    if (!version) {
        discard(&report, publishError.kind, publishError.message);
        finish(&report);
        return report;
    }

    report.outcome = TrainingState::Deploying;
    report.promoted = true;
    report.deployedVersion = *version;
    LOG_INFO(stLearning, "Deployed weights v%llu (was v%llu)",
             static_cast<unsigned long long>(*version),
             static_cast<unsigned long long>(report.activeVersionBefore));
    finish(&report);
    return report;
}

} // namespace st
