#include "NeuralNet.h"

#include "AxonExceptions.h"
#include "VectorUtils.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <utility>

namespace {
constexpr double kRelativeErrorFloor = 1e-8;

void validateTopology(const std::vector<size_t>& topology, size_t activationCount) {
    if (topology.size() < 2) {
        throw Axon::NeuralNetException("Topology must include at least input and output layers");
    }
    if (activationCount != topology.size() - 1) {
        throw Axon::NeuralNetException("Number of activations (" + std::to_string(activationCount) +
                                       ") must be one less than number of layer sizes (" +
                                       std::to_string(topology.size()) + ")");
    }

    size_t totalNodes = 0;
    size_t totalParams = 0;
    for (size_t i = 0; i < topology.size(); ++i) {
        if (topology[i] == 0) {
            throw Axon::NeuralNetException("Layer size cannot be zero");
        }
        totalNodes += topology[i];
        if (i > 0) {
            totalParams += topology[i - 1] * topology[i] + topology[i];
        }
    }
    if (totalNodes > NeuralNet::kMaxTopologyNodes) {
        throw Axon::NeuralNetException("Topology node count exceeds hard safety limit");
    }
    if (totalParams > NeuralNet::kMaxTrainableParams) {
        throw Axon::NeuralNetException("Topology parameter count exceeds hard safety limit");
    }
}
} // namespace

NeuralNet::NeuralNet(std::vector<size_t> topologyConfig, std::vector<Activation> activations, std::mt19937& initRng)
    : m_topology(std::move(topologyConfig)) {
    buildLayers(activations, initRng);
}

NeuralNet::NeuralNet(std::vector<size_t> topologyConfig, std::vector<Activation> activations, uint32_t seed)
    : m_topology(std::move(topologyConfig)) {
    std::mt19937 initRng(seed);
    buildLayers(activations, initRng);
}

NeuralNet::NeuralNet(std::vector<DenseLayer> layers)
    : m_layers(std::move(layers)) {
    if (m_layers.empty()) {
        throw Axon::NeuralNetException("Network has no layers");
    }
    m_topology.push_back(m_layers.front().prevSize());
    for (size_t l = 0; l < m_layers.size(); ++l) {
        if (m_layers[l].prevSize() != m_topology.back()) {
            throw Axon::NeuralNetException("Layer " + std::to_string(l) + " expects " +
                                           std::to_string(m_layers[l].prevSize()) + " inputs but previous layer emits " +
                                           std::to_string(m_topology.back()));
        }
        m_topology.push_back(m_layers[l].size());
    }
    validateTopology(m_topology, m_layers.size());
}

void NeuralNet::buildLayers(const std::vector<Activation>& activations, std::mt19937& initRng) {
    validateTopology(m_topology, activations.size());

    m_layers.reserve(m_topology.size() - 1);
    for (size_t l = 0; l + 1 < m_topology.size(); ++l) {
        m_layers.emplace_back(m_topology[l + 1], m_topology[l], activations[l], initRng);
    }
    rng.seed(initRng());
}

void NeuralNet::setSeed(uint32_t seed) {
    rng.seed(seed);
}

std::vector<double> NeuralNet::forward(const std::vector<double>& input) {
    const std::vector<double>* current = &input;
    for (auto& layer : m_layers) {
        current = &layer.forward(*current);
    }
    return *current;
}

double NeuralNet::computeLoss(const std::vector<double>& output, const std::vector<double>& target) const {
    return Loss::compute(m_loss, output, target).loss;
}

void NeuralNet::backpropagate(const std::vector<double>& errorGrad, double learningRate) {
    std::vector<double> grad = errorGrad;
    for (size_t l = m_layers.size(); l-- > 0;) {
        grad = m_layers[l].backward(grad, learningRate);
    }
}

double NeuralNet::train(const std::vector<double>& input, const std::vector<double>& target, double learningRate) {
    const std::vector<double> output = forward(input);
    const LossResult result = Loss::compute(m_loss, output, target);
    backpropagate(result.gradient, learningRate);
    return result.loss;
}

void NeuralNet::ensureBatchWorkspace() {
    if (m_gradWAccumWorkspace.size() != m_layers.size()) {
        m_gradWAccumWorkspace.resize(m_layers.size());
        m_gradBAccumWorkspace.resize(m_layers.size());
    }
    for (size_t l = 0; l < m_layers.size(); ++l) {
        m_gradWAccumWorkspace[l].assign(m_layers[l].weights().size(), 0.0);
        m_gradBAccumWorkspace[l].assign(m_layers[l].biases().size(), 0.0);
    }
}

double NeuralNet::trainBatch(const std::vector<std::vector<double>>& inputs,
                             const std::vector<std::vector<double>>& targets,
                             double learningRate) {
    if (inputs.size() != targets.size()) {
        throw Axon::ShapeException("Batch has " + std::to_string(inputs.size()) + " inputs but " +
                                   std::to_string(targets.size()) + " targets");
    }
    const size_t batchSize = inputs.size();
    if (batchSize == 0) return 0.0;

    ensureBatchWorkspace();

    double lossSum = 0.0;
    for (size_t idx = 0; idx < batchSize; ++idx) {
        const std::vector<double> output = forward(inputs[idx]);
        const LossResult result = Loss::compute(m_loss, output, targets[idx]);
        lossSum += result.loss;

        backpropagate(result.gradient, 0.0);
        for (size_t l = 0; l < m_layers.size(); ++l) {
            m_layers[l].accumulateGradients(m_gradWAccumWorkspace[l], m_gradBAccumWorkspace[l]);
        }
    }

    for (size_t l = 0; l < m_layers.size(); ++l) {
        m_layers[l].updateParametersAccumulated(learningRate, m_gradWAccumWorkspace[l], m_gradBAccumWorkspace[l], batchSize);
    }

    return lossSum / static_cast<double>(batchSize);
}

void NeuralNet::fit(const std::vector<std::vector<double>>& inputs,
                    const std::vector<std::vector<double>>& targets,
                    const TrainingOptions& options) {
    if (inputs.size() != targets.size()) {
        throw Axon::ShapeException("Dataset has " + std::to_string(inputs.size()) + " inputs but " +
                                   std::to_string(targets.size()) + " targets");
    }
    if (inputs.empty()) {
        throw Axon::NeuralNetException("Cannot fit on an empty dataset");
    }
    if (options.batchSize == 0) {
        throw Axon::NeuralNetException("Batch size must be positive");
    }

    std::vector<size_t> indices(inputs.size());
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<std::vector<double>> batchX;
    std::vector<std::vector<double>> batchY;
    batchX.reserve(options.batchSize);
    batchY.reserve(options.batchSize);

    for (size_t epoch = 0; epoch < options.epochs; ++epoch) {
        if (options.verbose && (epoch % std::max<size_t>(1, options.epochs / 10) == 0)) {
            std::cout << "\r[Axon] Training network: ["
                      << (epoch * 100 / std::max<size_t>(1, options.epochs)) << "%] " << std::flush;
        }

        if (options.shuffle) {
            std::shuffle(indices.begin(), indices.end(), rng);
        }

        double epochLoss = 0.0;
        for (size_t start = 0; start < indices.size(); start += options.batchSize) {
            const size_t end = std::min(indices.size(), start + options.batchSize);
            batchX.clear();
            batchY.clear();
            for (size_t i = start; i < end; ++i) {
                batchX.push_back(inputs[indices[i]]);
                batchY.push_back(targets[indices[i]]);
            }
            epochLoss += trainBatch(batchX, batchY, options.learningRate) * static_cast<double>(end - start);
        }
        trainLossHistory.push_back(epochLoss / static_cast<double>(indices.size()));
    }

    if (options.verbose) {
        std::cout << "\r[Axon] Training network: [100%] Complete. Final loss: "
                  << (trainLossHistory.empty() ? 0.0 : trainLossHistory.back()) << std::endl;
    }
}

double NeuralNet::evaluate(const std::vector<std::vector<double>>& inputs,
                           const std::vector<std::vector<double>>& targets) {
    std::vector<std::vector<double>> predictions;
    predictions.reserve(inputs.size());
    for (const auto& input : inputs) {
        predictions.push_back(predict(input));
    }
    return VectorUtils::accuracy(predictions, targets);
}

double NeuralNet::gradientCheck(const std::vector<double>& input, const std::vector<double>& target, double epsilon) {
    if (epsilon <= 0.0) {
        throw Axon::NeuralNetException("Gradient check epsilon must be positive");
    }

    ensureBatchWorkspace();
    const std::vector<double> output = forward(input);
    const LossResult result = Loss::compute(m_loss, output, target);
    backpropagate(result.gradient, 0.0);
    for (size_t l = 0; l < m_layers.size(); ++l) {
        m_layers[l].accumulateGradients(m_gradWAccumWorkspace[l], m_gradBAccumWorkspace[l]);
    }

    auto lossAt = [&]() { return computeLoss(forward(input), target); };
    auto relativeError = [](double analytic, double numeric) {
        const double scale = std::max(kRelativeErrorFloor, std::abs(analytic) + std::abs(numeric));
        return std::abs(analytic - numeric) / scale;
    };

    double maxError = 0.0;
    for (size_t l = 0; l < m_layers.size(); ++l) {
        auto compareParams = [&](std::vector<double>& params, const std::vector<double>& analytic) {
            for (size_t k = 0; k < params.size(); ++k) {
                const double saved = params[k];
                params[k] = saved + epsilon;
                const double plus = lossAt();
                params[k] = saved - epsilon;
                const double minus = lossAt();
                params[k] = saved;
                const double numeric = (plus - minus) / (2.0 * epsilon);
                maxError = std::max(maxError, relativeError(analytic[k], numeric));
            }
        };
        compareParams(m_layers[l].weights(), m_gradWAccumWorkspace[l]);
        compareParams(m_layers[l].biases(), m_gradBAccumWorkspace[l]);
    }
    return maxError;
}

bool NeuralNet::hasNonFinite() const {
    for (const auto& layer : m_layers) {
        if (!VectorUtils::allFinite(layer.weights()) || !VectorUtils::allFinite(layer.biases())) {
            return true;
        }
    }
    return false;
}

std::string NeuralNet::describe() const {
    std::ostringstream out;
    out << "NeuralNet [";
    for (size_t i = 0; i < m_topology.size(); ++i) {
        if (i > 0) out << " -> ";
        out << m_topology[i];
    }
    out << "] loss=" << Loss::name(m_loss) << "\n";

    out << std::setprecision(6);
    for (size_t l = 0; l < m_layers.size(); ++l) {
        const DenseLayer& layer = m_layers[l];
        out << "Layer " << l << " (" << layer.prevSize() << " -> " << layer.size()
            << ", " << layer.activation().tag() << ") weights:\n";
        for (size_t n = 0; n < layer.size(); ++n) {
            out << "  [";
            for (size_t pn = 0; pn < layer.prevSize(); ++pn) {
                if (pn > 0) out << ", ";
                out << layer.weight(n, pn);
            }
            out << "]\n";
        }
        out << "  biases: [";
        for (size_t n = 0; n < layer.size(); ++n) {
            if (n > 0) out << ", ";
            out << layer.biases()[n];
        }
        out << "]\n";
    }
    return out.str();
}
