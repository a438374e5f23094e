#pragma once

#include "Activation.h"

#include <cstdint>
#include <random>
#include <vector>

class DenseLayer {
public:
    DenseLayer() = default;

    /**
     * @brief Fully connected layer mapping prevSize inputs to size outputs.
     * Weights are drawn uniform in [-0.1, 0.1) from `rng`, biases start at 0.
     */
    DenseLayer(size_t size, size_t prevSize, Activation activation, std::mt19937& rng);

    /**
     * @brief Rebuilds a layer from persisted parameters.
     * @pre weights is row-major [size x prevSize].
     * @throws Axon::ShapeException when weights/biases disagree with the shape.
     */
    DenseLayer(size_t size, size_t prevSize, Activation activation,
               std::vector<double> weights, std::vector<double> biases);

    size_t size() const noexcept { return m_size; }
    size_t prevSize() const noexcept { return m_prevSize; }

    const Activation& activation() const noexcept { return m_activation; }

    std::vector<double>& weights() noexcept { return m_weights; }
    const std::vector<double>& weights() const noexcept { return m_weights; }
    double weight(size_t row, size_t col) const { return m_weights[row * m_prevSize + col]; }

    std::vector<double>& biases() noexcept { return m_biases; }
    const std::vector<double>& biases() const noexcept { return m_biases; }

    // Scratch state from the most recent forward/backward.
    const std::vector<double>& inputs() const noexcept { return m_inputs; }
    const std::vector<double>& activationInputs() const noexcept { return m_activationInputs; }
    const std::vector<double>& outputs() const noexcept { return m_outputs; }
    const std::vector<double>& deltas() const noexcept { return m_deltas; }

    /**
     * @throws Axon::ShapeException when input.size() != prevSize().
     */
    const std::vector<double>& forward(const std::vector<double>& input);

    /**
     * @brief Backpropagates dLoss/dOutput through this layer.
     * Parameters are updated in place only when learningRate > 0; a rate of 0
     * leaves deltas() populated for external accumulation.
     * @return dLoss/dInput computed with the pre-update weights.
     * @throws Axon::ShapeException when errorGrad.size() != size().
     * @throws Axon::NeuralNetException when forward() has not run.
     */
    std::vector<double> backward(const std::vector<double>& errorGrad, double learningRate);

    void accumulateGradients(std::vector<double>& gradWeightAccum, std::vector<double>& gradBiasAccum) const;

    void updateParametersAccumulated(double learningRate,
                                     const std::vector<double>& gradWeightAccum,
                                     const std::vector<double>& gradBiasAccum,
                                     size_t batchSize);

private:
    size_t m_size = 0;
    size_t m_prevSize = 0;
    std::vector<double> m_weights;
    std::vector<double> m_biases;

    std::vector<double> m_inputs;
    std::vector<double> m_activationInputs;
    std::vector<double> m_outputs;
    std::vector<double> m_deltas;

    Activation m_activation;
};
