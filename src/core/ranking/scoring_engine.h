#pragma once

#include "core/ranking/feature_schema.h"
#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"

#include <optional>

namespace st {

// Linear scoring: dot(features, weights) over the fixed key set. Stateless,
// safe to call concurrently against the same immutable WeightVector.
class ScoringEngine {
public:
    static std::optional<double> score(const FeatureVector& features,
                                       const WeightVector& weights,
                                       Error* errorOut = nullptr);

    // weight * value per key, in FeatureKey order. Sums to score().
    static std::optional<FeatureArray> contributions(const FeatureVector& features,
                                                     const WeightVector& weights,
                                                     Error* errorOut = nullptr);

    static bool checkSchema(const FeatureVector& features,
                            const WeightVector& weights,
                            Error* errorOut = nullptr);
};

} // namespace st
