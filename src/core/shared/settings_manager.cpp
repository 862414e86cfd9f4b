#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>
#include <cmath>

namespace st {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback, int lo, int hi)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble()) {
        return fallback;
    }
    return std::clamp(value.toInt(fallback), lo, hi);
}

double readDouble(const QJsonObject& json, const char* key, double fallback, double lo, double hi)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (!value.isDouble() || !std::isfinite(value.toDouble())) {
        return fallback;
    }
    return std::clamp(value.toDouble(), lo, hi);
}

} // namespace

std::optional<EngineSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(stCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(stCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const EngineSettings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(stCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(stCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(stCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }
    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/smarttrip/ranker.json");
}

QJsonObject SettingsManager::toJson(const EngineSettings& settings)
{
    QJsonObject serving;
    serving.insert(QStringLiteral("workerCount"), settings.serving.workerCount);
    serving.insert(QStringLiteral("defaultTopK"), settings.serving.defaultTopK);
    if (settings.serving.minScore) {
        serving.insert(QStringLiteral("minScore"), *settings.serving.minScore);
    }
    serving.insert(QStringLiteral("prefilterEnabled"), settings.serving.prefilterEnabled);

    QJsonObject cache;
    cache.insert(QStringLiteral("preferenceCacheMaxEntries"), settings.cache.preferenceCacheMaxEntries);
    cache.insert(QStringLiteral("preferenceCacheTtlSeconds"), settings.cache.preferenceCacheTtlSeconds);
    cache.insert(QStringLiteral("scoreCacheMaxEntries"), settings.cache.scoreCacheMaxEntries);
    cache.insert(QStringLiteral("scoreCacheTtlSeconds"), settings.cache.scoreCacheTtlSeconds);

    QJsonObject extraction;
    extraction.insert(QStringLiteral("themeFullMatchThreshold"), settings.extraction.themeFullMatchThreshold);
    extraction.insert(QStringLiteral("difficultyTolerance"), settings.extraction.difficultyTolerance);
    extraction.insert(QStringLiteral("durationGoodDays"), settings.extraction.durationGoodDays);
    extraction.insert(QStringLiteral("departingSoonDays"), settings.extraction.departingSoonDays);
    extraction.insert(QStringLiteral("budgetGoodRatio"), settings.extraction.budgetGoodRatio);
    extraction.insert(QStringLiteral("budgetAcceptableRatio"), settings.extraction.budgetAcceptableRatio);

    QJsonObject filters;
    filters.insert(QStringLiteral("difficultyTolerance"), settings.filters.difficultyTolerance);
    filters.insert(QStringLiteral("budgetMaxMultiplier"), settings.filters.budgetMaxMultiplier);
    filters.insert(QStringLiteral("durationHardFilterDays"), settings.filters.durationHardFilterDays);
    filters.insert(QStringLiteral("maxYearsAhead"), settings.filters.maxYearsAhead);
    filters.insert(QStringLiteral("relaxedEnabled"), settings.filters.relaxedEnabled);
    filters.insert(QStringLiteral("minResultsThreshold"), settings.filters.minResultsThreshold);
    filters.insert(QStringLiteral("relaxedDifficultyTolerance"), settings.filters.relaxedDifficultyTolerance);
    filters.insert(QStringLiteral("relaxedBudgetMultiplier"), settings.filters.relaxedBudgetMultiplier);
    filters.insert(QStringLiteral("relaxedDateMonths"), settings.filters.relaxedDateMonths);
    filters.insert(QStringLiteral("relaxedPenalty"), settings.filters.relaxedPenalty);
    filters.insert(QStringLiteral("relaxedTripTypePenalty"), settings.filters.relaxedTripTypePenalty);

    QJsonObject training;
    training.insert(QStringLiteral("windowDays"), settings.training.windowDays);
    training.insert(QStringLiteral("validationFraction"), settings.training.validationFraction);
    training.insert(QStringLiteral("epochs"), settings.training.epochs);
    training.insert(QStringLiteral("learningRate"), settings.training.learningRate);
    training.insert(QStringLiteral("minExamples"), settings.training.minExamples);
    training.insert(QStringLiteral("promotionTolerance"), settings.training.promotionTolerance);
    training.insert(QStringLiteral("maxDwellSeconds"), settings.training.maxDwellSeconds);
    training.insert(QStringLiteral("scheduleIntervalHours"), settings.training.scheduleIntervalHours);

    QJsonObject store;
    store.insert(QStringLiteral("databasePath"), settings.store.databasePath);
    store.insert(QStringLiteral("historyRetentionDays"), settings.store.historyRetentionDays);

    QJsonObject json;
    json.insert(QStringLiteral("serving"), serving);
    json.insert(QStringLiteral("cache"), cache);
    json.insert(QStringLiteral("extraction"), extraction);
    json.insert(QStringLiteral("filters"), filters);
    json.insert(QStringLiteral("training"), training);
    json.insert(QStringLiteral("store"), store);
    return json;
}

EngineSettings SettingsManager::fromJson(const QJsonObject& json)
{
    EngineSettings settings;

    const QJsonObject serving = json.value(QStringLiteral("serving")).toObject();
    settings.serving.workerCount = readInt(serving, "workerCount", settings.serving.workerCount, 1, 64);
    settings.serving.defaultTopK = readInt(serving, "defaultTopK", settings.serving.defaultTopK, 1, 10000);
    if (serving.value(QStringLiteral("minScore")).isDouble()) {
        settings.serving.minScore = serving.value(QStringLiteral("minScore")).toDouble();
    }
    settings.serving.prefilterEnabled = serving.value(QStringLiteral("prefilterEnabled"))
                                            .toBool(settings.serving.prefilterEnabled);

    const QJsonObject cache = json.value(QStringLiteral("cache")).toObject();
    settings.cache.preferenceCacheMaxEntries = readInt(
        cache, "preferenceCacheMaxEntries", settings.cache.preferenceCacheMaxEntries, 1, 1000000);
    settings.cache.preferenceCacheTtlSeconds = readInt(
        cache, "preferenceCacheTtlSeconds", settings.cache.preferenceCacheTtlSeconds, 1, 7 * 86400);
    settings.cache.scoreCacheMaxEntries = readInt(
        cache, "scoreCacheMaxEntries", settings.cache.scoreCacheMaxEntries, 1, 10000000);
    settings.cache.scoreCacheTtlSeconds = readInt(
        cache, "scoreCacheTtlSeconds", settings.cache.scoreCacheTtlSeconds, 1, 86400);

    const QJsonObject extraction = json.value(QStringLiteral("extraction")).toObject();
    settings.extraction.themeFullMatchThreshold = readInt(
        extraction, "themeFullMatchThreshold", settings.extraction.themeFullMatchThreshold, 1, 16);
    settings.extraction.difficultyTolerance = readInt(
        extraction, "difficultyTolerance", settings.extraction.difficultyTolerance, 0, 4);
    settings.extraction.durationGoodDays = readInt(
        extraction, "durationGoodDays", settings.extraction.durationGoodDays, 0, 365);
    settings.extraction.departingSoonDays = readInt(
        extraction, "departingSoonDays", settings.extraction.departingSoonDays, 0, 365);
    settings.extraction.budgetGoodRatio = readDouble(
        extraction, "budgetGoodRatio", settings.extraction.budgetGoodRatio, 1.0, 10.0);
    settings.extraction.budgetAcceptableRatio = readDouble(
        extraction, "budgetAcceptableRatio", settings.extraction.budgetAcceptableRatio,
        settings.extraction.budgetGoodRatio, 10.0);

    const QJsonObject filters = json.value(QStringLiteral("filters")).toObject();
    settings.filters.difficultyTolerance = readInt(
        filters, "difficultyTolerance", settings.filters.difficultyTolerance, 0, 4);
    settings.filters.budgetMaxMultiplier = readDouble(
        filters, "budgetMaxMultiplier", settings.filters.budgetMaxMultiplier, 1.0, 10.0);
    settings.filters.durationHardFilterDays = readInt(
        filters, "durationHardFilterDays", settings.filters.durationHardFilterDays, 0, 365);
    settings.filters.maxYearsAhead = readInt(filters, "maxYearsAhead", settings.filters.maxYearsAhead, 0, 10);
    settings.filters.relaxedEnabled = filters.value(QStringLiteral("relaxedEnabled"))
                                          .toBool(settings.filters.relaxedEnabled);
    settings.filters.minResultsThreshold = readInt(
        filters, "minResultsThreshold", settings.filters.minResultsThreshold, 0, 10000);
    settings.filters.relaxedDifficultyTolerance = readInt(
        filters, "relaxedDifficultyTolerance", settings.filters.relaxedDifficultyTolerance, 0, 4);
    settings.filters.relaxedBudgetMultiplier = readDouble(
        filters, "relaxedBudgetMultiplier", settings.filters.relaxedBudgetMultiplier,
        settings.filters.budgetMaxMultiplier, 10.0);
    settings.filters.relaxedDateMonths = readInt(
        filters, "relaxedDateMonths", settings.filters.relaxedDateMonths, 0, 12);
    settings.filters.relaxedPenalty = readDouble(
        filters, "relaxedPenalty", settings.filters.relaxedPenalty, -1000.0, 0.0);
    settings.filters.relaxedTripTypePenalty = readDouble(
        filters, "relaxedTripTypePenalty", settings.filters.relaxedTripTypePenalty, -1000.0, 0.0);

    const QJsonObject training = json.value(QStringLiteral("training")).toObject();
    settings.training.windowDays = readInt(training, "windowDays", settings.training.windowDays, 1, 3650);
    settings.training.validationFraction = readDouble(
        training, "validationFraction", settings.training.validationFraction, 0.01, 0.99);
    settings.training.epochs = readInt(training, "epochs", settings.training.epochs, 1, 100000);
    settings.training.learningRate = readDouble(
        training, "learningRate", settings.training.learningRate, 1e-6, 10.0);
    settings.training.minExamples = readInt(
        training, "minExamples", settings.training.minExamples, 1, 100000000);
    settings.training.promotionTolerance = readDouble(
        training, "promotionTolerance", settings.training.promotionTolerance, 0.0, 10.0);
    settings.training.maxDwellSeconds = readDouble(
        training, "maxDwellSeconds", settings.training.maxDwellSeconds, 1.0, 7.0 * 86400.0);
    settings.training.scheduleIntervalHours = readInt(
        training, "scheduleIntervalHours", settings.training.scheduleIntervalHours, 1, 24 * 365);

    const QJsonObject store = json.value(QStringLiteral("store")).toObject();
    settings.store.databasePath = store.value(QStringLiteral("databasePath"))
                                      .toString(settings.store.databasePath);
    settings.store.historyRetentionDays = readInt(
        store, "historyRetentionDays", settings.store.historyRetentionDays, 1, 36500);

    return settings;
}

} // namespace st
