#include "core/ranking/scoring_engine.h"
#include "core/shared/logging.h"

namespace st {

bool ScoringEngine::checkSchema(const FeatureVector& features,
                                const WeightVector& weights,
                                Error* errorOut)
{
    if (features.schemaVersion == weights.schemaVersion()) {
        return true;
    }
    LOG_WARN(stRanking, "Feature schema %d does not match weight schema %d (weights v%llu)",
             features.schemaVersion, weights.schemaVersion(),
             static_cast<unsigned long long>(weights.version()));
    return fail(errorOut, ErrorKind::SchemaMismatch,
                QStringLiteral("feature schema %1, weight schema %2")
                    .arg(features.schemaVersion)
                    .arg(weights.schemaVersion()));
}

std::optional<double> ScoringEngine::score(const FeatureVector& features,
                                           const WeightVector& weights,
                                           Error* errorOut)
{
    if (!checkSchema(features, weights, errorOut)) {
        return std::nullopt;
    }

    // Fixed summation order keeps scores bit-identical across calls.
    double total = 0.0;
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        total += features.values[i] * weights.values()[i];
    }
    return total;
}

std::optional<FeatureArray> ScoringEngine::contributions(const FeatureVector& features,
                                                         const WeightVector& weights,
                                                         Error* errorOut)
{
    if (!checkSchema(features, weights, errorOut)) {
        return std::nullopt;
    }

    FeatureArray parts{};
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        parts[i] = features.values[i] * weights.values()[i];
    }
    return parts;
}

} // namespace st
