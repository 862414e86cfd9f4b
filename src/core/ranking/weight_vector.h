#pragma once

#include "core/ranking/feature_schema.h"
#include "core/shared/errors.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace st {

// Versioned linear weights over the FeatureKey set. Immutable: a new
// version is a new object, shared between readers as shared_ptr<const>.
class WeightVector {
public:
    WeightVector() = default;
    WeightVector(const FeatureArray& values,
                 uint64_t version,
                 QDateTime createdAt,
                 QString source = QString(),
                 int schemaVersion = kFeatureSchemaVersion);

    // Cold-start weights matching the catalogue point table.
    static WeightVector defaults(QDateTime createdAt = QDateTime::currentDateTimeUtc());

    double weight(FeatureKey key) const { return m_values[featureIndex(key)]; }
    const FeatureArray& values() const { return m_values; }
    uint64_t version() const { return m_version; }
    const QDateTime& createdAt() const { return m_createdAt; }
    const QString& source() const { return m_source; }
    int schemaVersion() const { return m_schemaVersion; }
    bool allFinite() const;

    // Same weights under a new identity; used when publishing a candidate.
    WeightVector withVersion(uint64_t version, const QDateTime& createdAt) const;

    // {"schemaVersion":1,"weights":{"base_score":30,...}}; version metadata is
    // stored next to it by the history store.
    QJsonObject weightsToJson() const;

    // Every FeatureKey must be present exactly once and no other key may
    // appear; anything else is SchemaMismatch.
    static std::optional<WeightVector> fromWeightsJson(const QJsonObject& json,
                                                       uint64_t version,
                                                       const QDateTime& createdAt,
                                                       const QString& source,
                                                       Error* errorOut = nullptr);

private:
    FeatureArray m_values{};
    uint64_t m_version = 0;
    QDateTime m_createdAt;
    QString m_source;
    int m_schemaVersion = kFeatureSchemaVersion;
};

} // namespace st
