#include "AxonConfig.h"
#include "AxonExceptions.h"
#include "CSVUtils.h"
#include "ModelSerializer.h"
#include "NeuralNet.h"
#include "PredictionService.h"
#include "VectorUtils.h"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {
void printVector(const std::vector<double>& values) {
    std::cout << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << values[i];
    }
    std::cout << "]";
}

// XOR with one-hot targets: class 1 when exactly one input is set.
CSVUtils::NumericDataset builtInXorDataset() {
    CSVUtils::NumericDataset dataset;
    dataset.header = {"x0", "x1", "is_false", "is_true"};
    dataset.features = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};
    dataset.targets = {{1, 0}, {0, 1}, {0, 1}, {1, 0}};
    return dataset;
}

int runTrain(const AxonConfig& config) {
    CSVUtils::NumericDataset dataset;
    if (config.dataPath.empty()) {
        std::cout << "[Axon] No --data given, training on the built-in XOR dataset.\n";
        dataset = builtInXorDataset();
    } else {
        dataset = CSVUtils::loadNumericDataset(config.dataPath, config.delimiter, config.targetColumns);
        std::cout << "[Axon] Loaded " << dataset.rows() << " rows from " << config.dataPath << "\n";
    }

    NeuralNet net(config.topology, config.buildActivations(), config.seed);
    net.setLossFunction(config.lossFunction());
    if (dataset.features.front().size() != net.inputSize() || dataset.targets.front().size() != net.outputSize()) {
        throw Axon::ShapeException("Dataset has " + std::to_string(dataset.features.front().size()) + " features and " +
                                   std::to_string(dataset.targets.front().size()) + " targets but topology expects " +
                                   std::to_string(net.inputSize()) + " -> " + std::to_string(net.outputSize()));
    }

    std::cout << "[Axon] Network: " << config.topology.size() << " layer sizes, loss="
              << Loss::name(net.lossFunction()) << ", epochs=" << config.epochs
              << ", lr=" << config.learningRate << ", batch=" << config.batchSize << "\n";
    net.fit(dataset.features, dataset.targets, config.trainingOptions());

    if (net.hasNonFinite()) {
        std::cerr << "[Axon Error] Training diverged: parameters contain NaN or infinity.\n";
        return 1;
    }

    const auto& history = net.getTrainLossHistory();
    std::cout << "[Axon] Final training loss: " << std::setprecision(6)
              << (history.empty() ? 0.0 : history.back()) << "\n";
    std::cout << "[Axon] Training accuracy: " << std::fixed << std::setprecision(2)
              << net.evaluate(dataset.features, dataset.targets) * 100.0 << "%\n"
              << std::defaultfloat;

    if (config.verbose) {
        std::cout << net.describe();
    }

    if (!config.modelPath.empty()) {
        ModelSerializer::save(net, config.modelPath, config.modelFormat());
        std::cout << "[Axon] Model saved to " << config.modelPath << " (" << config.format << ")\n";
    }
    return 0;
}

int runPredict(const AxonConfig& config) {
    NeuralNet net = ModelSerializer::load(config.modelPath, config.modelFormat());
    const std::vector<double> output = net.predict(config.input);

    std::cout << "[Axon] Prediction: ";
    printVector(output);
    std::cout << "\n[Axon] Class: " << VectorUtils::argMax(output) << "\n";
    return 0;
}

int runServe(const AxonConfig& config) {
    ModelRegistry registry;
    if (!config.registryPath.empty()) {
        registry.loadFromFile(config.registryPath);
    } else {
        ModelMetadata metadata;
        metadata.modelId = "default";
        metadata.modelPath = config.modelPath;
        metadata.format = config.modelFormat();
        registry.registerModel(metadata, ModelSerializer::load(config.modelPath, metadata.format));
    }

    RequestMonitor monitor;
    PredictionService service(registry, monitor);

    PredictionService::Config serviceConfig;
    serviceConfig.host = config.host;
    serviceConfig.port = config.port;
    serviceConfig.threadCount = config.threads;
    return service.start(serviceConfig);
}
} // namespace

int main(int argc, char* argv[]) {
    AxonConfig config;
    try {
        config = AxonConfig::fromArgs(argc, argv);
    } catch (const Axon::AxonException& e) {
        std::cerr << "[Axon Error] " << e.what() << "\n";
        std::cerr << AxonConfig::usage();
        return 1;
    }

    try {
        if (config.command == "train") return runTrain(config);
        if (config.command == "predict") return runPredict(config);
        if (config.command == "serve") return runServe(config);
    } catch (const Axon::AxonException& e) {
        std::cerr << "[Axon Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Axon Exception] " << e.what() << "\n";
        return 1;
    }

    std::cout << AxonConfig::usage();
    return 0;
}
