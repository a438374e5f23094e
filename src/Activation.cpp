#include "Activation.h"

#include "AxonExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>

namespace {
double stableSigmoid(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    const double e = std::exp(x);
    return e / (1.0 + e);
}
} // namespace

Activation::Activation(NeuralActivation kind)
    : m_kind(kind), m_alpha(defaultAlpha(kind)) {}

Activation::Activation(NeuralActivation kind, double alpha)
    : m_kind(kind), m_alpha(alpha) {
    if (!hasAlpha()) {
        m_alpha = 0.0;
        return;
    }
    // derivative() reads the slope off the output sign, which only holds for alpha >= 0.
    if (!std::isfinite(alpha) || alpha < 0.0) {
        throw Axon::ConfigurationException(tag() + " alpha must be a finite non-negative number");
    }
}

double Activation::defaultAlpha(NeuralActivation kind) noexcept {
    switch (kind) {
        case NeuralActivation::LEAKY_RELU: return 0.01;
        case NeuralActivation::ELU: return 1.0;
        default: return 0.0;
    }
}

Activation Activation::fromTag(const std::string& tag) {
    const std::string name = CommonUtils::toLower(CommonUtils::trim(tag));
    if (name == "sigmoid") return sigmoid();
    if (name == "relu") return relu();
    if (name == "leaky_relu" || name == "leakyrelu") return leakyRelu();
    if (name == "tanh") return tanh();
    if (name == "linear") return linear();
    if (name == "elu") return elu();
    if (name == "swish") return swish();
    if (name == "softmax") return softmax();
    throw Axon::SerializationException("Unknown activation: " + tag);
}

Activation Activation::fromTag(const std::string& tag, double alpha) {
    const Activation base = fromTag(tag);
    return Activation(base.kind(), alpha);
}

std::string Activation::tag() const {
    switch (m_kind) {
        case NeuralActivation::SIGMOID: return "sigmoid";
        case NeuralActivation::RELU: return "relu";
        case NeuralActivation::LEAKY_RELU: return "leaky_relu";
        case NeuralActivation::TANH: return "tanh";
        case NeuralActivation::LINEAR: return "linear";
        case NeuralActivation::ELU: return "elu";
        case NeuralActivation::SWISH: return "swish";
        case NeuralActivation::SOFTMAX: return "softmax";
    }
    return "unknown";
}

double Activation::activate(double x) const {
    switch (m_kind) {
        case NeuralActivation::SIGMOID: return stableSigmoid(x);
        case NeuralActivation::RELU: return x > 0.0 ? x : 0.0;
        case NeuralActivation::LEAKY_RELU: return x > 0.0 ? x : m_alpha * x;
        case NeuralActivation::TANH: return std::tanh(x);
        case NeuralActivation::LINEAR: return x;
        case NeuralActivation::ELU: return x > 0.0 ? x : m_alpha * std::expm1(x);
        case NeuralActivation::SWISH: return x * stableSigmoid(x);
        case NeuralActivation::SOFTMAX: return x; // never applied elementwise
    }
    return x;
}

double Activation::derivative(double output, double preActivation) const {
    switch (m_kind) {
        case NeuralActivation::SIGMOID: return output * (1.0 - output);
        case NeuralActivation::RELU: return output > 0.0 ? 1.0 : 0.0;
        case NeuralActivation::LEAKY_RELU: return output > 0.0 ? 1.0 : m_alpha;
        case NeuralActivation::TANH: return 1.0 - output * output;
        case NeuralActivation::LINEAR: return 1.0;
        // y = a(e^z - 1) for z <= 0, so dy/dz = a*e^z = y + a
        case NeuralActivation::ELU: return output > 0.0 ? 1.0 : output + m_alpha;
        case NeuralActivation::SWISH: {
            const double s = stableSigmoid(preActivation);
            return s + output * (1.0 - s);
        }
        case NeuralActivation::SOFTMAX: return 1.0;
    }
    return 1.0;
}

std::vector<double> Activation::activateVector(const std::vector<double>& z) const {
    std::vector<double> out(z.size());
    if (z.empty()) return out;

    if (!isVectorWide()) {
        for (size_t i = 0; i < z.size(); ++i) out[i] = activate(z[i]);
        return out;
    }

    const double maxVal = *std::max_element(z.begin(), z.end());
    double expSum = 0.0;
    for (size_t i = 0; i < z.size(); ++i) {
        out[i] = std::exp(z[i] - maxVal);
        expSum += out[i];
    }
    for (double& v : out) v /= expSum;
    return out;
}
