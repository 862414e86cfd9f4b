#include "core/query/preference_normalizer.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>
#include <cmath>

namespace st {

namespace {

constexpr int kMinDifficulty = 1;
constexpr int kMaxDifficulty = 5;

bool isUnset(const QJsonValue& value)
{
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (value.isString()) {
        const QString text = value.toString().trimmed();
        return text.isEmpty() || text.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0;
    }
    return false;
}

std::optional<double> toNumber(const QJsonValue& value)
{
    if (value.isDouble()) {
        return value.toDouble();
    }
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<int> toInteger(const QJsonValue& value)
{
    const auto number = toNumber(value);
    if (!number || !std::isfinite(*number) || std::floor(*number) != *number
        || std::abs(*number) > 1e9) {
        return std::nullopt;
    }
    return static_cast<int>(*number);
}

bool readOptionalInt(const QJsonObject& raw, const char* key, std::optional<int>* out,
                     Error* errorOut)
{
    const QJsonValue value = raw.value(QLatin1String(key));
    if (isUnset(value)) {
        out->reset();
        return true;
    }
    const auto parsed = toInteger(value);
    if (!parsed) {
        return fail(errorOut, ErrorKind::InvalidPreferences,
                    QStringLiteral("%1 must be an integer").arg(QLatin1String(key)));
    }
    *out = *parsed;
    return true;
}

bool readIdSet(const QJsonObject& raw, const char* key, std::vector<int>* out, Error* errorOut)
{
    out->clear();
    const QJsonValue value = raw.value(QLatin1String(key));
    if (isUnset(value)) {
        return true;
    }
    if (!value.isArray()) {
        return fail(errorOut, ErrorKind::InvalidPreferences,
                    QStringLiteral("%1 must be an array of ids").arg(QLatin1String(key)));
    }
    for (const QJsonValue& item : value.toArray()) {
        const auto id = toInteger(item);
        if (!id) {
            return fail(errorOut, ErrorKind::InvalidPreferences,
                        QStringLiteral("%1 contains a non-integer id").arg(QLatin1String(key)));
        }
        out->push_back(*id);
    }
    std::sort(out->begin(), out->end());
    out->erase(std::unique(out->begin(), out->end()), out->end());
    return true;
}

bool readContinents(const QJsonObject& raw, std::vector<Continent>* out, Error* errorOut)
{
    out->clear();
    const QJsonValue value = raw.value(QStringLiteral("selected_continents"));
    if (isUnset(value)) {
        return true;
    }
    if (!value.isArray()) {
        return fail(errorOut, ErrorKind::InvalidPreferences,
                    QStringLiteral("selected_continents must be an array"));
    }
    for (const QJsonValue& item : value.toArray()) {
        const auto continent = continentFromString(item.toString());
        if (!continent) {
            return fail(errorOut, ErrorKind::InvalidPreferences,
                        QStringLiteral("unknown continent '%1'").arg(item.toString()));
        }
        out->push_back(*continent);
    }
    std::sort(out->begin(), out->end());
    out->erase(std::unique(out->begin(), out->end()), out->end());
    return true;
}

} // namespace

std::optional<SearchPreferences> PreferenceNormalizer::normalize(const QJsonObject& raw,
                                                                 Error* errorOut)
{
    SearchPreferences prefs;

    if (!readIdSet(raw, "selected_countries", &prefs.countryIds, errorOut)
        || !readContinents(raw, &prefs.continents, errorOut)
        || !readIdSet(raw, "preferred_theme_ids", &prefs.themeIds, errorOut)
        || !readOptionalInt(raw, "preferred_type_id", &prefs.tripTypeId, errorOut)
        || !readOptionalInt(raw, "min_duration", &prefs.minDurationDays, errorOut)
        || !readOptionalInt(raw, "max_duration", &prefs.maxDurationDays, errorOut)
        || !readOptionalInt(raw, "difficulty", &prefs.difficulty, errorOut)
        || !readOptionalInt(raw, "year", &prefs.year, errorOut)
        || !readOptionalInt(raw, "month", &prefs.month, errorOut)) {
        LOG_DEBUG(stCore, "Rejected preference payload: malformed field");
        return std::nullopt;
    }

    const QJsonValue budgetValue = raw.value(QStringLiteral("budget"));
    if (!isUnset(budgetValue)) {
        const auto budget = toNumber(budgetValue);
        if (!budget || !std::isfinite(*budget) || *budget < 0.0) {
            fail(errorOut, ErrorKind::InvalidPreferences,
                 QStringLiteral("budget must be a non-negative number"));
            return std::nullopt;
        }
        if (*budget > 0.0) {
            prefs.budget = *budget;
        }
    }

    if ((prefs.minDurationDays && *prefs.minDurationDays < 0)
        || (prefs.maxDurationDays && *prefs.maxDurationDays < 0)) {
        fail(errorOut, ErrorKind::InvalidPreferences, QStringLiteral("durations must be non-negative"));
        return std::nullopt;
    }
    if (prefs.minDurationDays && prefs.maxDurationDays
        && *prefs.minDurationDays > *prefs.maxDurationDays) {
        fail(errorOut, ErrorKind::InvalidPreferences,
             QStringLiteral("min_duration %1 exceeds max_duration %2")
                 .arg(*prefs.minDurationDays)
                 .arg(*prefs.maxDurationDays));
        return std::nullopt;
    }
    if (prefs.difficulty && (*prefs.difficulty < kMinDifficulty || *prefs.difficulty > kMaxDifficulty)) {
        fail(errorOut, ErrorKind::InvalidPreferences,
             QStringLiteral("difficulty must be between %1 and %2").arg(kMinDifficulty).arg(kMaxDifficulty));
        return std::nullopt;
    }
    if (prefs.month && (*prefs.month < 1 || *prefs.month > 12)) {
        fail(errorOut, ErrorKind::InvalidPreferences, QStringLiteral("month must be between 1 and 12"));
        return std::nullopt;
    }
    if (prefs.month && !prefs.year) {
        fail(errorOut, ErrorKind::InvalidPreferences, QStringLiteral("month requires a year"));
        return std::nullopt;
    }

    return prefs;
}

QString PreferenceNormalizer::rawFingerprint(const QJsonObject& raw)
{
    const QByteArray bytes = QJsonDocument(raw).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(QCryptographicHash::hash(bytes, QCryptographicHash::Sha256).toHex());
}

} // namespace st
