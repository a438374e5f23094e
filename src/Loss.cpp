#include "Loss.h"

#include "AxonExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
void requireMatchingTarget(const std::vector<double>& predicted, const std::vector<double>& target) {
    if (predicted.size() != target.size()) {
        throw Axon::ShapeException("Target dimensions do not match prediction (" +
                                   std::to_string(target.size()) + " vs " +
                                   std::to_string(predicted.size()) + ")");
    }
}
} // namespace

namespace Loss {

LossResult crossEntropy(const std::vector<double>& predicted, const std::vector<double>& target) {
    requireMatchingTarget(predicted, target);

    LossResult result;
    result.gradient.resize(predicted.size());
    for (size_t i = 0; i < predicted.size(); ++i) {
        const double p = std::clamp(predicted[i], kProbabilityEpsilon, 1.0 - kProbabilityEpsilon);
        result.loss -= target[i] * std::log(p);
        result.gradient[i] = predicted[i] - target[i];
    }
    return result;
}

LossResult meanSquaredError(const std::vector<double>& predicted, const std::vector<double>& target) {
    requireMatchingTarget(predicted, target);

    LossResult result;
    result.gradient.resize(predicted.size());
    if (predicted.empty()) return result;

    for (size_t i = 0; i < predicted.size(); ++i) {
        const double diff = predicted[i] - target[i];
        result.loss += diff * diff;
        result.gradient[i] = 2.0 * diff;
    }
    result.loss /= static_cast<double>(predicted.size());
    return result;
}

LossResult compute(LossFunction loss, const std::vector<double>& predicted, const std::vector<double>& target) {
    return loss == LossFunction::MSE ? meanSquaredError(predicted, target) : crossEntropy(predicted, target);
}

const char* name(LossFunction loss) noexcept {
    return loss == LossFunction::MSE ? "mse" : "cross_entropy";
}

LossFunction fromName(const std::string& lossName) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(lossName));
    if (lowered == "mse") return LossFunction::MSE;
    if (lowered == "cross_entropy" || lowered == "crossentropy" || lowered == "ce") return LossFunction::CROSS_ENTROPY;
    throw Axon::ConfigurationException("Unknown loss function: " + lossName + " (expected mse|cross_entropy)");
}

} // namespace Loss
