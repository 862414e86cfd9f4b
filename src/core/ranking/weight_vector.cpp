#include "core/ranking/weight_vector.h"

#include <cmath>

namespace st {

WeightVector::WeightVector(const FeatureArray& values,
                           uint64_t version,
                           QDateTime createdAt,
                           QString source,
                           int schemaVersion)
    : m_values(values)
    , m_version(version)
    , m_createdAt(std::move(createdAt))
    , m_source(std::move(source))
    , m_schemaVersion(schemaVersion)
{
}

WeightVector WeightVector::defaults(QDateTime createdAt)
{
    FeatureArray values{};
    values[featureIndex(FeatureKey::BaseScore)] = 30.0;
    values[featureIndex(FeatureKey::ThemeMatchLevel)] = 12.5;
    values[featureIndex(FeatureKey::ThemeMiss)] = -15.0;
    values[featureIndex(FeatureKey::DifficultyMatchLevel)] = 7.5;
    values[featureIndex(FeatureKey::DurationMatchLevel)] = 6.0;
    values[featureIndex(FeatureKey::BudgetMatchLevel)] = 4.0;
    values[featureIndex(FeatureKey::StatusLevel)] = 7.5;
    values[featureIndex(FeatureKey::DepartingSoon)] = 7.0;
    values[featureIndex(FeatureKey::GeoMatchLevel)] = 7.5;
    return WeightVector(values, 1, std::move(createdAt), QStringLiteral("defaults"));
}

bool WeightVector::allFinite() const
{
    for (double value : m_values) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return true;
}

WeightVector WeightVector::withVersion(uint64_t version, const QDateTime& createdAt) const
{
    return WeightVector(m_values, version, createdAt, m_source, m_schemaVersion);
}

QJsonObject WeightVector::weightsToJson() const
{
    QJsonObject weights;
    for (FeatureKey key : kAllFeatureKeys) {
        weights.insert(featureKeyToString(key), weight(key));
    }

    QJsonObject json;
    json.insert(QStringLiteral("schemaVersion"), m_schemaVersion);
    json.insert(QStringLiteral("weights"), weights);
    return json;
}

std::optional<WeightVector> WeightVector::fromWeightsJson(const QJsonObject& json,
                                                          uint64_t version,
                                                          const QDateTime& createdAt,
                                                          const QString& source,
                                                          Error* errorOut)
{
    const int schemaVersion = json.value(QStringLiteral("schemaVersion")).toInt(-1);
    if (schemaVersion != kFeatureSchemaVersion) {
        fail(errorOut, ErrorKind::SchemaMismatch,
             QStringLiteral("weights schema %1, extractor schema %2")
                 .arg(schemaVersion)
                 .arg(kFeatureSchemaVersion));
        return std::nullopt;
    }

    const QJsonObject weights = json.value(QStringLiteral("weights")).toObject();
    if (weights.size() != static_cast<int>(kFeatureCount)) {
        fail(errorOut, ErrorKind::SchemaMismatch,
             QStringLiteral("expected %1 weights, found %2").arg(static_cast<int>(kFeatureCount)).arg(weights.size()));
        return std::nullopt;
    }

    FeatureArray values{};
    for (auto it = weights.constBegin(); it != weights.constEnd(); ++it) {
        const auto key = featureKeyFromString(it.key());
        if (!key) {
            fail(errorOut, ErrorKind::SchemaMismatch, QStringLiteral("unknown feature key '%1'").arg(it.key()));
            return std::nullopt;
        }
        if (!it.value().isDouble()) {
            fail(errorOut, ErrorKind::SchemaMismatch,
                 QStringLiteral("weight '%1' is not a number").arg(it.key()));
            return std::nullopt;
        }
        values[featureIndex(*key)] = it.value().toDouble();
    }

    return WeightVector(values, version, createdAt, source, schemaVersion);
}

} // namespace st
