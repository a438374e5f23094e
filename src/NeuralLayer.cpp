#include "NeuralLayer.h"

#include "AxonExceptions.h"

#include <algorithm>
#include <string>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kInitWeightRange = 0.1;
}

DenseLayer::DenseLayer(size_t size, size_t prevSize, Activation activation, std::mt19937& rng)
    : m_size(size), m_prevSize(prevSize), m_activation(activation) {
    m_biases.assign(m_size, 0.0);

    std::uniform_real_distribution<double> weightDis(-kInitWeightRange, kInitWeightRange);
    m_weights.resize(m_size * m_prevSize, 0.0);
    for (double& w : m_weights) {
        w = weightDis(rng);
    }
}

DenseLayer::DenseLayer(size_t size, size_t prevSize, Activation activation,
                       std::vector<double> weights, std::vector<double> biases)
    : m_size(size),
      m_prevSize(prevSize),
      m_weights(std::move(weights)),
      m_biases(std::move(biases)),
      m_activation(activation) {
    if (m_weights.size() != m_size * m_prevSize) {
        throw Axon::ShapeException("Layer weight count " + std::to_string(m_weights.size()) +
                                   " does not match " + std::to_string(m_size) + "x" + std::to_string(m_prevSize));
    }
    if (m_biases.size() != m_size) {
        throw Axon::ShapeException("Layer bias count " + std::to_string(m_biases.size()) +
                                   " does not match output width " + std::to_string(m_size));
    }
}

const std::vector<double>& DenseLayer::forward(const std::vector<double>& input) {
    if (input.size() != m_prevSize) {
        throw Axon::ShapeException("Layer expects " + std::to_string(m_prevSize) + " inputs, got " +
                                   std::to_string(input.size()));
    }

    m_inputs = input;
    m_activationInputs.assign(m_size, 0.0);

    #ifdef USE_OPENMP
    #pragma omp parallel for if(m_size * m_prevSize > 4096)
    #endif
    for (size_t n = 0; n < m_size; ++n) {
        double sum = m_biases[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            sum += m_weights[weightOffset + pn] * m_inputs[pn];
        }
        m_activationInputs[n] = sum;
    }

    if (m_activation.isVectorWide()) {
        m_outputs = m_activation.activateVector(m_activationInputs);
    } else {
        m_outputs.resize(m_size);
        for (size_t n = 0; n < m_size; ++n) {
            m_outputs[n] = m_activation.activate(m_activationInputs[n]);
        }
    }
    return m_outputs;
}

std::vector<double> DenseLayer::backward(const std::vector<double>& errorGrad, double learningRate) {
    if (m_outputs.size() != m_size || m_inputs.size() != m_prevSize) {
        throw Axon::NeuralNetException("backward called before forward");
    }
    if (errorGrad.size() != m_size) {
        throw Axon::ShapeException("Layer expects " + std::to_string(m_size) + " error gradients, got " +
                                   std::to_string(errorGrad.size()));
    }

    m_deltas.resize(m_size);
    if (m_activation.isVectorWide()) {
        // Softmax paired with cross-entropy: errorGrad already is dLoss/dz.
        std::copy(errorGrad.begin(), errorGrad.end(), m_deltas.begin());
    } else {
        for (size_t n = 0; n < m_size; ++n) {
            m_deltas[n] = errorGrad[n] * m_activation.derivative(m_outputs[n], m_activationInputs[n]);
        }
    }

    std::vector<double> prevError(m_prevSize, 0.0);
    for (size_t n = 0; n < m_size; ++n) {
        const double delta = m_deltas[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            prevError[pn] += delta * m_weights[weightOffset + pn];
        }
    }

    if (learningRate > 0.0) {
        for (size_t n = 0; n < m_size; ++n) {
            const double delta = m_deltas[n];
            const size_t weightOffset = n * m_prevSize;
            for (size_t pn = 0; pn < m_prevSize; ++pn) {
                m_weights[weightOffset + pn] -= learningRate * (delta * m_inputs[pn]);
            }
            m_biases[n] -= learningRate * delta;
        }
    }

    return prevError;
}

void DenseLayer::accumulateGradients(std::vector<double>& gradWeightAccum, std::vector<double>& gradBiasAccum) const {
    if (gradWeightAccum.size() != m_weights.size() || gradBiasAccum.size() != m_biases.size()) {
        throw Axon::ShapeException("Gradient accumulators do not match layer parameters");
    }
    if (m_deltas.size() != m_size) {
        throw Axon::NeuralNetException("accumulateGradients called before backward");
    }

    for (size_t n = 0; n < m_size; ++n) {
        const double delta = m_deltas[n];
        const size_t weightOffset = n * m_prevSize;
        for (size_t pn = 0; pn < m_prevSize; ++pn) {
            gradWeightAccum[weightOffset + pn] += delta * m_inputs[pn];
        }
        gradBiasAccum[n] += delta;
    }
}

void DenseLayer::updateParametersAccumulated(double learningRate,
                                             const std::vector<double>& gradWeightAccum,
                                             const std::vector<double>& gradBiasAccum,
                                             size_t batchSize) {
    if (gradWeightAccum.size() != m_weights.size() || gradBiasAccum.size() != m_biases.size()) {
        throw Axon::ShapeException("Gradient accumulators do not match layer parameters");
    }
    if (batchSize == 0) return;

    const double scale = static_cast<double>(batchSize);
    for (size_t i = 0; i < m_weights.size(); ++i) {
        m_weights[i] -= learningRate * (gradWeightAccum[i] / scale);
    }
    for (size_t n = 0; n < m_size; ++n) {
        m_biases[n] -= learningRate * (gradBiasAccum[n] / scale);
    }
}
