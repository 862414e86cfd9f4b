#include "core/ranking/feature_schema.h"

namespace st {

static_assert(kAllFeatureKeys.size() == kFeatureCount, "feature key list out of sync");
static_assert(featureIndex(FeatureKey::GeoMatchLevel) == kFeatureCount - 1,
              "FeatureKey must be dense and end with GeoMatchLevel");

QString featureKeyToString(FeatureKey key)
{
    switch (key) {
    case FeatureKey::BaseScore:            return QStringLiteral("base_score");
    case FeatureKey::ThemeMatchLevel:      return QStringLiteral("theme_match_level");
    case FeatureKey::ThemeMiss:            return QStringLiteral("theme_miss");
    case FeatureKey::DifficultyMatchLevel: return QStringLiteral("difficulty_match_level");
    case FeatureKey::DurationMatchLevel:   return QStringLiteral("duration_match_level");
    case FeatureKey::BudgetMatchLevel:     return QStringLiteral("budget_match_level");
    case FeatureKey::StatusLevel:          return QStringLiteral("status_level");
    case FeatureKey::DepartingSoon:        return QStringLiteral("departing_soon");
    case FeatureKey::GeoMatchLevel:        return QStringLiteral("geo_match_level");
    }
    return QString();
}

std::optional<FeatureKey> featureKeyFromString(const QString& str)
{
    for (FeatureKey key : kAllFeatureKeys) {
        if (featureKeyToString(key) == str) {
            return key;
        }
    }
    return std::nullopt;
}

FeatureRange featureRange(FeatureKey key)
{
    switch (key) {
    case FeatureKey::BaseScore:            return {1.0, 1.0};
    case FeatureKey::ThemeMatchLevel:      return {0.0, 2.0};
    case FeatureKey::ThemeMiss:            return {0.0, 1.0};
    case FeatureKey::DifficultyMatchLevel: return {0.0, 2.0};
    case FeatureKey::DurationMatchLevel:   return {0.0, 2.0};
    case FeatureKey::BudgetMatchLevel:     return {0.0, 3.0};
    case FeatureKey::StatusLevel:          return {0.0, 2.0};
    case FeatureKey::DepartingSoon:        return {0.0, 1.0};
    case FeatureKey::GeoMatchLevel:        return {0.0, 2.0};
    }
    return {0.0, 0.0};
}

QJsonObject featureVectorToJson(const FeatureVector& features)
{
    QJsonObject json;
    for (FeatureKey key : kAllFeatureKeys) {
        json.insert(featureKeyToString(key), features.value(key));
    }
    return json;
}

std::optional<FeatureVector> featureVectorFromJson(const QJsonObject& json,
                                                   int schemaVersion,
                                                   Error* errorOut)
{
    if (json.size() != static_cast<int>(kFeatureCount)) {
        fail(errorOut, ErrorKind::SchemaMismatch,
             QStringLiteral("expected %1 features, found %2")
                 .arg(static_cast<int>(kFeatureCount))
                 .arg(json.size()));
        return std::nullopt;
    }

    FeatureVector features;
    features.schemaVersion = schemaVersion;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        const auto key = featureKeyFromString(it.key());
        if (!key || !it.value().isDouble()) {
            fail(errorOut, ErrorKind::SchemaMismatch,
                 QStringLiteral("bad feature entry '%1'").arg(it.key()));
            return std::nullopt;
        }
        features.set(*key, it.value().toDouble());
    }
    return features;
}

} // namespace st
