#pragma once

#include <string>
#include <vector>

enum class LossFunction { MSE, CROSS_ENTROPY };

struct LossResult {
    double loss = 0.0;
    std::vector<double> gradient; // dLoss/dPrediction
};

namespace Loss {

constexpr double kProbabilityEpsilon = 1e-15;

/**
 * @brief Categorical cross-entropy.
 * Predictions are clamped to [eps, 1-eps] for the log only; the gradient is
 * predicted - target on the raw values, which equals dLoss/dz only when the
 * predictions come from a softmax output layer.
 * @throws Axon::ShapeException when sizes differ.
 */
LossResult crossEntropy(const std::vector<double>& predicted, const std::vector<double>& target);

/**
 * @brief Mean squared error, gradient 2 * (predicted - target).
 * @throws Axon::ShapeException when sizes differ.
 */
LossResult meanSquaredError(const std::vector<double>& predicted, const std::vector<double>& target);

LossResult compute(LossFunction loss, const std::vector<double>& predicted, const std::vector<double>& target);

const char* name(LossFunction loss) noexcept;

// @throws Axon::ConfigurationException for anything but "mse" or "cross_entropy".
LossFunction fromName(const std::string& lossName);

} // namespace Loss
