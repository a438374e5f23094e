#pragma once

#include <string>
#include <vector>

enum class NeuralActivation { SIGMOID, RELU, LEAKY_RELU, TANH, LINEAR, ELU, SWISH, SOFTMAX };

/**
 * Closed set of activation functions.
 *
 * Derivatives are expressed in terms of the activation's own output y = f(z),
 * because DenseLayer::backward evaluates them on its cached outputs. SWISH is
 * the one exception: its slope is not a function of y alone, so it also reads
 * the cached pre-activation z. Any activation added here must follow the same
 * convention or backprop silently produces wrong gradients.
 *
 * SOFTMAX is vector-wide: activate()/derivative() are identity placeholders and
 * callers must route through activateVector() when isVectorWide() is true.
 */
class Activation {
public:
    Activation() = default;
    explicit Activation(NeuralActivation kind);
    // @throws Axon::ConfigurationException for a negative or non-finite alpha on LEAKY_RELU/ELU.
    Activation(NeuralActivation kind, double alpha);

    static Activation sigmoid() { return Activation(NeuralActivation::SIGMOID); }
    static Activation relu() { return Activation(NeuralActivation::RELU); }
    static Activation leakyRelu(double alpha = 0.01) { return Activation(NeuralActivation::LEAKY_RELU, alpha); }
    static Activation tanh() { return Activation(NeuralActivation::TANH); }
    static Activation linear() { return Activation(NeuralActivation::LINEAR); }
    static Activation elu(double alpha = 1.0) { return Activation(NeuralActivation::ELU, alpha); }
    static Activation swish() { return Activation(NeuralActivation::SWISH); }
    static Activation softmax() { return Activation(NeuralActivation::SOFTMAX); }

    /**
     * @brief Resolves a persisted tag ("relu", "softmax", ...), case-insensitive.
     * @throws Axon::SerializationException for an unrecognized tag.
     */
    static Activation fromTag(const std::string& tag);
    static Activation fromTag(const std::string& tag, double alpha);

    static double defaultAlpha(NeuralActivation kind) noexcept;

    NeuralActivation kind() const noexcept { return m_kind; }
    double alpha() const noexcept { return m_alpha; }
    bool isVectorWide() const noexcept { return m_kind == NeuralActivation::SOFTMAX; }
    bool hasAlpha() const noexcept {
        return m_kind == NeuralActivation::LEAKY_RELU || m_kind == NeuralActivation::ELU;
    }
    std::string tag() const;

    double activate(double x) const;

    /**
     * @brief Slope of the activation at the point that produced `output`.
     * @param output y = activate(z) as cached by the layer.
     * @param preActivation z; only SWISH reads it.
     */
    double derivative(double output, double preActivation) const;

    // Softmax over the whole vector for SOFTMAX, elementwise activate() otherwise.
    std::vector<double> activateVector(const std::vector<double>& z) const;

    bool operator==(const Activation& other) const noexcept {
        return m_kind == other.m_kind && m_alpha == other.m_alpha;
    }
    bool operator!=(const Activation& other) const noexcept { return !(*this == other); }

private:
    NeuralActivation m_kind = NeuralActivation::RELU;
    double m_alpha = 0.0;
};
