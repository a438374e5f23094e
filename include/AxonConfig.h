#pragma once

#include "Activation.h"
#include "Loss.h"
#include "ModelSerializer.h"
#include "NeuralNet.h"

#include <cstdint>
#include <string>
#include <vector>

struct AxonConfig {
    std::string command = "help"; // train|predict|serve|help
    std::string configPath;

    std::vector<size_t> topology = {2, 4, 2};
    std::vector<std::string> activations = {"relu", "softmax"};
    std::string loss = "cross_entropy";   // cross_entropy|mse
    size_t epochs = 1000;
    double learningRate = 0.1;
    size_t batchSize = 4;
    uint32_t seed = 1337;

    std::string dataPath;
    size_t targetColumns = 1;
    char delimiter = ',';

    std::string modelPath;
    std::string format = "json";          // json|binary
    std::vector<double> input;

    std::string registryPath;
    std::string host = "0.0.0.0";
    int port = 8080;
    size_t threads = 8;

    bool verbose = false;

    /**
     * @brief `axon <command> [--flag value ...]`.
     * `--config` is read first; explicit flags then override file values.
     * @throws Axon::ConfigurationException on unknown flags, bad values, or a failed validate().
     */
    static AxonConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Applies `key: value` / `key = value` lines on top of `base`.
     * Keys are flag names without dashes; '-' and '_' are interchangeable.
     * Does not validate, so command-line overrides can still follow.
     */
    static AxonConfig fromFile(const std::string& configPath, const AxonConfig& base);
    static AxonConfig fromFile(const std::string& configPath);

    // Sets one option by its flag name (without leading dashes).
    void set(const std::string& key, const std::string& value);

    void validate() const;

    std::vector<Activation> buildActivations() const;
    LossFunction lossFunction() const { return Loss::fromName(loss); }
    ModelFormat modelFormat() const { return ModelSerializer::formatFromName(format); }
    NeuralNet::TrainingOptions trainingOptions() const;

    static std::string usage();
};

inline AxonConfig AxonConfig::fromFile(const std::string& configPath) {
    return fromFile(configPath, AxonConfig{});
}
