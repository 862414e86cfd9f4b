#include "core/learning/weight_optimizer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace st {

double WeightOptimizer::sigmoid(double x)
{
    if (x >= 0.0) {
        const double z = std::exp(-x);
        return 1.0 / (1.0 + z);
    }
    const double z = std::exp(x);
    return z / (1.0 + z);
}

double WeightOptimizer::softplus(double z)
{
    return std::max(z, 0.0) + std::log1p(std::exp(-std::abs(z)));
}

double WeightOptimizer::dot(const FeatureArray& weights, const FeatureVector& features)
{
    double acc = 0.0;
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        acc += weights[i] * features.values[i];
    }
    return acc;
}

WeightOptimizer::Gradient WeightOptimizer::computeGradient(const FeatureArray& weights,
                                                           const TrainingBatch& batch)
{
    Gradient gradient;
    if (batch.empty()) {
        return gradient;
    }

    double lossSum = 0.0;
    for (const TrainingExample& ex : batch) {
        const double z = dot(weights, ex.features);
        const double y = ex.label();
        const double pw = ex.positionWeight();
        const double err = (sigmoid(z) - y) * pw;
        for (std::size_t i = 0; i < kFeatureCount; ++i) {
            gradient.values[i] += err * ex.features.values[i];
        }
        lossSum += pw * (softplus(z) - y * z);
    }

    const double n = static_cast<double>(batch.size());
    for (double& g : gradient.values) {
        g /= n;
    }
    gradient.loss = lossSum / n;
    gradient.examples = static_cast<int>(batch.size());
    return gradient;
}

WeightOptimizer::Gradient WeightOptimizer::computeGradient(const WeightVector& weights,
                                                           const TrainingBatch& batch)
{
    return computeGradient(weights.values(), batch);
}

std::optional<FeatureArray> WeightOptimizer::applyUpdate(const FeatureArray& weights,
                                                         const Gradient& gradient,
                                                         double learningRate,
                                                         Error* errorOut)
{
    FeatureArray updated{};
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        updated[i] = weights[i] - learningRate * gradient.values[i];
        if (!std::isfinite(updated[i])) {
            LOG_WARN(stLearning, "Update diverged on %s (lr=%g)",
                     qUtf8Printable(featureKeyToString(kAllFeatureKeys[i])), learningRate);
            fail(errorOut, ErrorKind::Divergence,
                 QStringLiteral("non-finite weight for %1").arg(featureKeyToString(kAllFeatureKeys[i])));
            return std::nullopt;
        }
    }

    double& base = updated[featureIndex(FeatureKey::BaseScore)];
    base = std::max(0.0, base);
    return updated;
}

double WeightOptimizer::loss(const FeatureArray& weights, const TrainingBatch& batch)
{
    if (batch.empty()) {
        return 0.0;
    }
    double lossSum = 0.0;
    for (const TrainingExample& ex : batch) {
        const double z = dot(weights, ex.features);
        lossSum += ex.positionWeight() * (softplus(z) - ex.label() * z);
    }
    return lossSum / static_cast<double>(batch.size());
}

double WeightOptimizer::loss(const WeightVector& weights, const TrainingBatch& batch)
{
    return loss(weights.values(), batch);
}

double WeightOptimizer::auc(const FeatureArray& weights, const TrainingBatch& batch)
{
    std::vector<std::pair<double, bool>> scored;
    scored.reserve(batch.size());
    int positives = 0;
    for (const TrainingExample& ex : batch) {
        scored.emplace_back(dot(weights, ex.features), ex.clicked);
        positives += ex.clicked ? 1 : 0;
    }
    const int negatives = static_cast<int>(batch.size()) - positives;
    if (positives == 0 || negatives == 0) {
        return 0.5;
    }

    std::sort(scored.begin(), scored.end(),
              [](const std::pair<double, bool>& a, const std::pair<double, bool>& b) {
                  return a.first < b.first;
              });

    // Mann-Whitney: sum of positive ranks, tied groups share the mean rank.
    double positiveRankSum = 0.0;
    std::size_t i = 0;
    while (i < scored.size()) {
        std::size_t j = i;
        int groupPositives = 0;
        while (j < scored.size() && scored[j].first == scored[i].first) {
            groupPositives += scored[j].second ? 1 : 0;
            ++j;
        }
        const double meanRank = (static_cast<double>(i + 1) + static_cast<double>(j)) / 2.0;
        positiveRankSum += meanRank * groupPositives;
        i = j;
    }

    const double p = static_cast<double>(positives);
    const double q = static_cast<double>(negatives);
    return (positiveRankSum - p * (p + 1.0) / 2.0) / (p * q);
}

} // namespace st
