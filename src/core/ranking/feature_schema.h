#pragma once

#include "core/shared/errors.h"

#include <QJsonObject>
#include <QString>

#include <array>
#include <cstddef>
#include <optional>

namespace st {

// Bumped whenever FeatureKey gains, loses or redefines a key. Extractor and
// persisted weights must agree on it.
constexpr int kFeatureSchemaVersion = 1;

// Closed feature set. Categorical matches are small integer levels.
enum class FeatureKey {
    BaseScore,             // constant 1
    ThemeMatchLevel,       // 0 none, 1 partial, 2 full
    ThemeMiss,             // 1 when themes were requested and none match
    DifficultyMatchLevel,  // 0 none, 1 within tolerance, 2 exact
    DurationMatchLevel,    // 0 none, 1 near range, 2 inside range
    BudgetMatchLevel,      // 0 over, 1 <= 120%, 2 <= 110%, 3 within budget
    StatusLevel,           // 0 available, 1 guaranteed, 2 last places
    DepartingSoon,         // 1 when departing within the soon window
    GeoMatchLevel,         // 0 none, 1 continent, 2 country
};

constexpr std::size_t kFeatureCount = 9;

using FeatureArray = std::array<double, kFeatureCount>;

constexpr std::array<FeatureKey, kFeatureCount> kAllFeatureKeys = {
    FeatureKey::BaseScore,
    FeatureKey::ThemeMatchLevel,
    FeatureKey::ThemeMiss,
    FeatureKey::DifficultyMatchLevel,
    FeatureKey::DurationMatchLevel,
    FeatureKey::BudgetMatchLevel,
    FeatureKey::StatusLevel,
    FeatureKey::DepartingSoon,
    FeatureKey::GeoMatchLevel,
};

constexpr std::size_t featureIndex(FeatureKey key)
{
    return static_cast<std::size_t>(key);
}

QString featureKeyToString(FeatureKey key);
std::optional<FeatureKey> featureKeyFromString(const QString& str);

// Inclusive value range a feature can take, used by the selection pre-filter.
struct FeatureRange {
    double lo = 0.0;
    double hi = 0.0;
};
FeatureRange featureRange(FeatureKey key);

struct FeatureVector {
    int schemaVersion = kFeatureSchemaVersion;
    FeatureArray values{};

    double value(FeatureKey key) const { return values[featureIndex(key)]; }
    void set(FeatureKey key, double v) { values[featureIndex(key)] = v; }

    bool operator==(const FeatureVector& other) const
    {
        return schemaVersion == other.schemaVersion && values == other.values;
    }
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }
};

// {"base_score":1,...}. Decoding requires exactly the FeatureKey set.
QJsonObject featureVectorToJson(const FeatureVector& features);
std::optional<FeatureVector> featureVectorFromJson(const QJsonObject& json,
                                                   int schemaVersion,
                                                   Error* errorOut = nullptr);

} // namespace st
