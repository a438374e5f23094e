#pragma once

#include "ModelSerializer.h"
#include "NeuralNet.h"

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct ModelMetadata {
    std::string modelId;
    std::string modelPath;
    ModelFormat format = ModelFormat::JSON;
    std::string trainingTimestamp;
    double accuracy = std::numeric_limits<double>::quiet_NaN();
    std::unordered_map<std::string, std::string> hyperparameters;
};

// forward() writes into per-layer buffers, so a served network is not
// reentrant: hold inferenceMutex around every predict().
struct ServedModel {
    ModelMetadata metadata;
    NeuralNet net;
    mutable std::mutex inferenceMutex;

    ServedModel(ModelMetadata metadataValue, NeuralNet netValue);
};

class ModelRegistry {
public:
    /**
     * @brief Replaces the registry with the models listed in a JSON file:
     * {"models": [{"model_id": "...", "model_path": "...", "format": "json|binary",
     *              "training_timestamp": "...", "metrics": {"accuracy": x},
     *              "hyperparameters": {...}}]}
     * Relative model paths are taken from the registry file's directory.
     * Nothing changes unless every entry loads.
     * @throws Axon::ConfigurationException on a malformed, empty or duplicate entry.
     */
    void loadFromFile(const std::string& registryPath);

    // @throws Axon::ConfigurationException on an empty or duplicate id.
    void registerModel(ModelMetadata metadata, NeuralNet net);

    // nullptr when the id is unknown.
    std::shared_ptr<ServedModel> find(const std::string& modelId) const;
    // First registered id, or "" when empty.
    std::string defaultModelId() const;
    std::vector<ModelMetadata> listModels() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<ServedModel>> models;
    std::vector<std::string> order;
};

enum class Endpoint { PREDICT, BATCH_PREDICT };

struct ServiceStats {
    uint64_t totalRequests = 0;
    uint64_t predictRequests = 0;
    uint64_t batchRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t predictedRows = 0;
    double averageLatencyMs = 0.0;
    double maxLatencyMs = 0.0;
    // classCounts[k]: rows whose argmax output was k.
    std::vector<uint64_t> classCounts;
};

class RequestMonitor {
public:
    void recordSuccess(Endpoint endpoint, double latencyMs, const std::vector<int>& predictedClasses);
    void recordError(Endpoint endpoint, double latencyMs);
    ServiceStats snapshot() const;

private:
    void countRequest(Endpoint endpoint, double latencyMs);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> predictRequests{0};
    std::atomic<uint64_t> batchRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> predictedRows{0};
    std::atomic<uint64_t> latencyMicrosSum{0};
    std::atomic<uint64_t> latencyMicrosMax{0};

    mutable std::mutex classMutex;
    std::vector<uint64_t> classCounts;
};

class PredictionService {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        size_t threadCount = 8;
    };

    struct Response {
        int status = 200;
        std::string payload;
    };

    PredictionService(ModelRegistry& registry, RequestMonitor& monitor);

    // {"model_id"?: "...", "features": [..]}. Any failure answers 400 with {"error": ...}.
    Response handlePredict(const std::string& body);
    // {"model_id"?: "...", "instances": [[..], ..]}.
    Response handleBatchPredict(const std::string& body);
    Response handleHealth() const;

    // Serves POST /predict, POST /batch_predict and GET /health until stopped.
    // Returns 1 if the socket cannot be bound.
    int start(const Config& config);

private:
    ModelRegistry& registry;
    RequestMonitor& monitor;
    bool logRequests = false;
};
