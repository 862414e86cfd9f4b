#pragma once

#include "core/learning/training_types.h"
#include "core/ranking/weight_vector.h"
#include "core/shared/errors.h"

#include <optional>

namespace st {

// Gradient-descent primitive for the click model
//   p = sigmoid(dot(weights, features))
// with binary cross-entropy weighted by 1 / (1 + position).
class WeightOptimizer {
public:
    struct Gradient {
        FeatureArray values{};
        double loss = 0.0;      // weighted loss at the input weights
        int examples = 0;
    };

    // Mean over the batch of (p - y) * positionWeight * x per key, which is
    // the derivative of loss(). An empty batch yields the zero gradient.
    static Gradient computeGradient(const FeatureArray& weights, const TrainingBatch& batch);
    static Gradient computeGradient(const WeightVector& weights, const TrainingBatch& batch);

    // w - learningRate * g, then BaseScore is clamped to >= 0. Fails with
    // Divergence if any resulting weight is not finite.
    static std::optional<FeatureArray> applyUpdate(const FeatureArray& weights,
                                                   const Gradient& gradient,
                                                   double learningRate,
                                                   Error* errorOut = nullptr);

    // Mean position-weighted cross-entropy. 0 for an empty batch.
    static double loss(const FeatureArray& weights, const TrainingBatch& batch);
    static double loss(const WeightVector& weights, const TrainingBatch& batch);

    // ROC AUC of dot(weights, features) against the click labels, ties
    // counted half. 0.5 when either class is absent.
    static double auc(const FeatureArray& weights, const TrainingBatch& batch);

    static double sigmoid(double x);

private:
    static double dot(const FeatureArray& weights, const FeatureVector& features);
    // log(1 + exp(z)) without overflow.
    static double softplus(double z);
};

} // namespace st
