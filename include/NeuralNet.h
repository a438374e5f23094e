#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "Activation.h"
#include "Loss.h"
#include "NeuralLayer.h"

// Dense feed-forward network trained with plain SGD.
// Not thread-safe: one owner per instance, callers serialize access.
class NeuralNet {
public:
    struct TrainingOptions {
        size_t epochs = 1000;
        double learningRate = 0.1;
        size_t batchSize = 32;
        bool shuffle = true;
        bool verbose = false;
    };

    // Hard safety limits on network size, also enforced by the model loaders before allocation.
    static constexpr size_t kMaxTopologyNodes = 65536;
    static constexpr size_t kMaxTrainableParams = 100000000;

    /**
     * @brief Builds len(topology)-1 layers, layer i mapping topology[i] -> topology[i+1].
     * @param rng seeded generator used for weight initialization and fit() shuffling seed.
     * @throws Axon::NeuralNetException on an invalid topology or activation count.
     */
    NeuralNet(std::vector<size_t> topology, std::vector<Activation> activations, std::mt19937& rng);
    NeuralNet(std::vector<size_t> topology, std::vector<Activation> activations, uint32_t seed = 1337);

    /**
     * @brief Assembles a network from already-built layers (model loading).
     * @throws Axon::NeuralNetException when layers are empty or do not chain.
     */
    explicit NeuralNet(std::vector<DenseLayer> layers);

    const std::vector<DenseLayer>& layers() const noexcept { return m_layers; }
    std::vector<DenseLayer>& layers() noexcept { return m_layers; }
    const std::vector<size_t>& topology() const noexcept { return m_topology; }
    size_t inputSize() const noexcept { return m_topology.front(); }
    size_t outputSize() const noexcept { return m_topology.back(); }

    LossFunction lossFunction() const noexcept { return m_loss; }
    void setLossFunction(LossFunction loss) noexcept { m_loss = loss; }
    void setSeed(uint32_t seed);

    std::vector<double> forward(const std::vector<double>& input);
    std::vector<double> predict(const std::vector<double>& input) { return forward(input); }

    // Single-example SGD step. Returns the loss before the update.
    double train(const std::vector<double>& input, const std::vector<double>& target, double learningRate);

    /**
     * @brief One averaged SGD step over the batch.
     * A batch of one produces the same parameters as train() bit for bit.
     * @return mean loss over the batch (0 for an empty batch).
     * @throws Axon::ShapeException when inputs and targets differ in count.
     */
    double trainBatch(const std::vector<std::vector<double>>& inputs,
                      const std::vector<std::vector<double>>& targets,
                      double learningRate);

    // Epoch loop over (optionally shuffled) mini-batches of trainBatch().
    void fit(const std::vector<std::vector<double>>& inputs,
             const std::vector<std::vector<double>>& targets,
             const TrainingOptions& options);

    double evaluate(const std::vector<std::vector<double>>& inputs,
                    const std::vector<std::vector<double>>& targets);

    double computeLoss(const std::vector<double>& output, const std::vector<double>& target) const;

    /**
     * @brief Compares backprop gradients with central finite differences.
     * Parameters are left unchanged.
     * @return maximum relative error over every weight and bias.
     */
    double gradientCheck(const std::vector<double>& input, const std::vector<double>& target, double epsilon = 1e-5);

    bool hasNonFinite() const;
    std::string describe() const;

    const std::vector<double>& getTrainLossHistory() const noexcept { return trainLossHistory; }

private:
    void buildLayers(const std::vector<Activation>& activations, std::mt19937& initRng);
    void backpropagate(const std::vector<double>& errorGrad, double learningRate);
    void ensureBatchWorkspace();

    std::vector<DenseLayer> m_layers;
    std::vector<size_t> m_topology;
    LossFunction m_loss = LossFunction::CROSS_ENTROPY;
    std::vector<double> trainLossHistory;
    std::vector<std::vector<double>> m_gradWAccumWorkspace;
    std::vector<std::vector<double>> m_gradBAccumWorkspace;

    // Drives fit() shuffling; seeded from the construction generator.
    std::mt19937 rng;
};
