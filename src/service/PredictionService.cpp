#include "PredictionService.h"

#include "AxonExceptions.h"
#include "JsonValue.h"
#include "VectorUtils.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

const char* endpointPath(Endpoint endpoint) {
    return endpoint == Endpoint::PREDICT ? "/predict" : "/batch_predict";
}

double millisecondsSince(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

uint64_t latencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<uint64_t>(std::llround(latencyMs * 1000.0));
}

const std::string* optionalString(const JsonValue& object, const std::string& key) {
    const JsonValue* node = object.find(key);
    return (node != nullptr && node->isString()) ? &node->stringValue : nullptr;
}

const std::string& requiredString(const JsonValue& object, const std::string& key) {
    const std::string* value = optionalString(object, key);
    if (value == nullptr) {
        throw Axon::ConfigurationException("Registry entry needs a string '" + key + "'");
    }
    return *value;
}

ModelMetadata readRegistryEntry(const JsonValue& entry) {
    if (!entry.isObject()) {
        throw Axon::ConfigurationException("Registry 'models' entries must be objects");
    }

    ModelMetadata metadata;
    metadata.modelId = requiredString(entry, "model_id");
    metadata.modelPath = requiredString(entry, "model_path");
    if (metadata.modelId.empty()) {
        throw Axon::ConfigurationException("Registry entry has an empty model_id");
    }
    if (const std::string* format = optionalString(entry, "format")) {
        metadata.format = ModelSerializer::formatFromName(*format);
    }
    if (const std::string* timestamp = optionalString(entry, "training_timestamp")) {
        metadata.trainingTimestamp = *timestamp;
    }

    const JsonValue* metrics = entry.find("metrics");
    const JsonValue* accuracy = metrics != nullptr ? metrics->find("accuracy") : nullptr;
    if (accuracy != nullptr && accuracy->isNumber()) {
        metadata.accuracy = accuracy->numberValue;
    }

    if (const JsonValue* hyper = entry.find("hyperparameters"); hyper != nullptr && hyper->isObject()) {
        for (const auto& kv : hyper->objectValue) {
            metadata.hyperparameters[kv.first] = kv.second.isString() ? kv.second.stringValue : kv.second.dump();
        }
    }
    return metadata;
}

JsonValue parseRequest(const std::string& body) {
    JsonValue request = parseJsonText(body);
    if (!request.isObject()) {
        throw Axon::ConfigurationException("Request body must be a JSON object");
    }
    return request;
}

std::shared_ptr<ServedModel> selectModel(const JsonValue& request, const ModelRegistry& registry) {
    std::string modelId;
    if (const std::string* requested = optionalString(request, "model_id")) {
        modelId = *requested;
    }
    if (modelId.empty()) modelId = registry.defaultModelId();
    if (modelId.empty()) {
        throw Axon::ConfigurationException("No models are registered");
    }

    std::shared_ptr<ServedModel> model = registry.find(modelId);
    if (!model) {
        throw Axon::ConfigurationException("Unknown model_id: " + modelId);
    }
    return model;
}

const JsonValue& requiredField(const JsonValue& request, const std::string& key) {
    const JsonValue* node = request.find(key);
    if (node == nullptr) {
        throw Axon::ConfigurationException("Request requires '" + key + "'");
    }
    return *node;
}

JsonValue statsJson(const ServiceStats& stats) {
    JsonValue out = JsonValue::object();
    out.set("total_requests", JsonValue::number(static_cast<double>(stats.totalRequests)));
    out.set("error_requests", JsonValue::number(static_cast<double>(stats.errorRequests)));
    out.set("avg_latency_ms", JsonValue::number(stats.averageLatencyMs));
    return out;
}

PredictionService::Response errorResponse(const std::string& message, double latencyMs) {
    JsonValue out = JsonValue::object();
    out.set("error", JsonValue::string(message));
    out.set("latency_ms", JsonValue::number(latencyMs));
    return {400, out.dump()};
}

void logRequestLine(Endpoint endpoint, double latencyMs, const ServiceStats& stats) {
    std::ostringstream line;
    line << "[AxonService][Monitor] endpoint=" << endpointPath(endpoint)
         << " latency_ms=" << latencyMs
         << " requests=" << stats.totalRequests
         << " errors=" << stats.errorRequests
         << " rows=" << stats.predictedRows
         << " avg_latency_ms=" << stats.averageLatencyMs
         << " max_latency_ms=" << stats.maxLatencyMs;
    if (!stats.classCounts.empty()) {
        line << " classes=";
        for (size_t k = 0; k < stats.classCounts.size(); ++k) {
            line << (k > 0 ? "/" : "") << stats.classCounts[k];
        }
    }
    std::cout << line.str() << "\n";
}
} // namespace

ServedModel::ServedModel(ModelMetadata metadataValue, NeuralNet netValue)
    : metadata(std::move(metadataValue)), net(std::move(netValue)) {}

void ModelRegistry::loadFromFile(const std::string& registryPath) {
    std::ifstream in(registryPath);
    if (!in) {
        throw Axon::ConfigurationException("Cannot open model registry: " + registryPath);
    }
    std::ostringstream text;
    text << in.rdbuf();

    const JsonValue root = parseJsonText(text.str());
    const JsonValue* entries = root.find("models");
    if (entries == nullptr || !entries->isArray()) {
        throw Axon::ConfigurationException("Model registry needs a top-level 'models' array");
    }
    if (entries->arrayValue.empty()) {
        throw Axon::ConfigurationException("Model registry lists no models");
    }

    const std::filesystem::path baseDir = std::filesystem::path(registryPath).parent_path();
    std::unordered_map<std::string, std::shared_ptr<ServedModel>> loaded;
    std::vector<std::string> loadedOrder;

    for (const auto& entry : entries->arrayValue) {
        ModelMetadata metadata = readRegistryEntry(entry);
        if (loaded.count(metadata.modelId) != 0) {
            throw Axon::ConfigurationException("Duplicate model_id in registry: " + metadata.modelId);
        }

        std::filesystem::path file(metadata.modelPath);
        if (file.is_relative()) file = baseDir / file;
        NeuralNet net = ModelSerializer::load(file.string(), metadata.format);

        const std::string id = metadata.modelId;
        loaded.emplace(id, std::make_shared<ServedModel>(std::move(metadata), std::move(net)));
        loadedOrder.push_back(id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    models = std::move(loaded);
    order = std::move(loadedOrder);
}

void ModelRegistry::registerModel(ModelMetadata metadata, NeuralNet net) {
    if (metadata.modelId.empty()) {
        throw Axon::ConfigurationException("model_id cannot be empty");
    }

    const std::string id = metadata.modelId;
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (models.count(id) != 0) {
        throw Axon::ConfigurationException("Duplicate model_id in registry: " + id);
    }
    models.emplace(id, std::make_shared<ServedModel>(std::move(metadata), std::move(net)));
    order.push_back(id);
}

std::shared_ptr<ServedModel> ModelRegistry::find(const std::string& modelId) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    const auto it = models.find(modelId);
    return it == models.end() ? nullptr : it->second;
}

std::string ModelRegistry::defaultModelId() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return order.empty() ? std::string() : order.front();
}

std::vector<ModelMetadata> ModelRegistry::listModels() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<ModelMetadata> out;
    out.reserve(order.size());
    for (const auto& id : order) {
        out.push_back(models.at(id)->metadata);
    }
    return out;
}

size_t ModelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return models.size();
}

void RequestMonitor::countRequest(Endpoint endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    auto& perEndpoint = endpoint == Endpoint::PREDICT ? predictRequests : batchRequests;
    perEndpoint.fetch_add(1, std::memory_order_relaxed);

    const uint64_t micros = latencyMicros(latencyMs);
    latencyMicrosSum.fetch_add(micros, std::memory_order_relaxed);
    uint64_t seen = latencyMicrosMax.load(std::memory_order_relaxed);
    while (micros > seen && !latencyMicrosMax.compare_exchange_weak(seen, micros, std::memory_order_relaxed)) {
    }
}

void RequestMonitor::recordSuccess(Endpoint endpoint, double latencyMs, const std::vector<int>& predictedClasses) {
    countRequest(endpoint, latencyMs);
    predictedRows.fetch_add(predictedClasses.size(), std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(classMutex);
    for (int k : predictedClasses) {
        if (k < 0) continue;
        const size_t index = static_cast<size_t>(k);
        if (classCounts.size() <= index) classCounts.resize(index + 1, 0);
        ++classCounts[index];
    }
}

void RequestMonitor::recordError(Endpoint endpoint, double latencyMs) {
    countRequest(endpoint, latencyMs);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
}

ServiceStats RequestMonitor::snapshot() const {
    ServiceStats stats;
    stats.totalRequests = totalRequests.load(std::memory_order_relaxed);
    stats.predictRequests = predictRequests.load(std::memory_order_relaxed);
    stats.batchRequests = batchRequests.load(std::memory_order_relaxed);
    stats.errorRequests = errorRequests.load(std::memory_order_relaxed);
    stats.predictedRows = predictedRows.load(std::memory_order_relaxed);
    if (stats.totalRequests > 0) {
        stats.averageLatencyMs = static_cast<double>(latencyMicrosSum.load(std::memory_order_relaxed)) /
                                 static_cast<double>(stats.totalRequests) / 1000.0;
    }
    stats.maxLatencyMs = static_cast<double>(latencyMicrosMax.load(std::memory_order_relaxed)) / 1000.0;

    std::lock_guard<std::mutex> lock(classMutex);
    stats.classCounts = classCounts;
    return stats;
}

PredictionService::PredictionService(ModelRegistry& registryRef, RequestMonitor& monitorRef)
    : registry(registryRef), monitor(monitorRef) {}

PredictionService::Response PredictionService::handlePredict(const std::string& body) {
    const auto started = Clock::now();
    try {
        const JsonValue request = parseRequest(body);
        const std::shared_ptr<ServedModel> model = selectModel(request, registry);
        const std::vector<double> features = jsonToNumberVector(requiredField(request, "features"), "features");

        std::vector<double> output;
        {
            std::lock_guard<std::mutex> guard(model->inferenceMutex);
            output = model->net.predict(features);
        }
        const int predictedClass = VectorUtils::argMax(output);

        const double latencyMs = millisecondsSince(started);
        monitor.recordSuccess(Endpoint::PREDICT, latencyMs, {predictedClass});
        const ServiceStats stats = monitor.snapshot();
        if (logRequests) logRequestLine(Endpoint::PREDICT, latencyMs, stats);

        JsonValue out = JsonValue::object();
        out.set("model_id", JsonValue::string(model->metadata.modelId));
        out.set("prediction", JsonValue::numberArray(output));
        out.set("class", JsonValue::number(predictedClass));
        out.set("latency_ms", JsonValue::number(latencyMs));
        out.set("monitoring", statsJson(stats));
        return {200, out.dump()};
    } catch (const std::exception& e) {
        const double latencyMs = millisecondsSince(started);
        monitor.recordError(Endpoint::PREDICT, latencyMs);
        if (logRequests) logRequestLine(Endpoint::PREDICT, latencyMs, monitor.snapshot());
        return errorResponse(e.what(), latencyMs);
    }
}

PredictionService::Response PredictionService::handleBatchPredict(const std::string& body) {
    const auto started = Clock::now();
    try {
        const JsonValue request = parseRequest(body);
        const std::shared_ptr<ServedModel> model = selectModel(request, registry);
        const JsonValue& instances = requiredField(request, "instances");
        if (!instances.isArray()) {
            throw Axon::ConfigurationException("instances must be an array of feature arrays");
        }

        std::vector<std::vector<double>> rows;
        rows.reserve(instances.arrayValue.size());
        for (size_t i = 0; i < instances.arrayValue.size(); ++i) {
            rows.push_back(jsonToNumberVector(instances.arrayValue[i], "instances[" + std::to_string(i) + "]"));
        }

        JsonValue predictions = JsonValue::array();
        JsonValue classes = JsonValue::array();
        std::vector<int> predictedClasses;
        predictedClasses.reserve(rows.size());
        {
            std::lock_guard<std::mutex> guard(model->inferenceMutex);
            for (const auto& row : rows) {
                const std::vector<double> output = model->net.predict(row);
                predictedClasses.push_back(VectorUtils::argMax(output));
                predictions.arrayValue.push_back(JsonValue::numberArray(output));
                classes.arrayValue.push_back(JsonValue::number(predictedClasses.back()));
            }
        }

        const double latencyMs = millisecondsSince(started);
        monitor.recordSuccess(Endpoint::BATCH_PREDICT, latencyMs, predictedClasses);
        const ServiceStats stats = monitor.snapshot();
        if (logRequests) logRequestLine(Endpoint::BATCH_PREDICT, latencyMs, stats);

        JsonValue out = JsonValue::object();
        out.set("model_id", JsonValue::string(model->metadata.modelId));
        out.set("count", JsonValue::number(static_cast<double>(rows.size())));
        out.set("predictions", std::move(predictions));
        out.set("classes", std::move(classes));
        out.set("latency_ms", JsonValue::number(latencyMs));
        out.set("monitoring", statsJson(stats));
        return {200, out.dump()};
    } catch (const std::exception& e) {
        const double latencyMs = millisecondsSince(started);
        monitor.recordError(Endpoint::BATCH_PREDICT, latencyMs);
        if (logRequests) logRequestLine(Endpoint::BATCH_PREDICT, latencyMs, monitor.snapshot());
        return errorResponse(e.what(), latencyMs);
    }
}

PredictionService::Response PredictionService::handleHealth() const {
    JsonValue ids = JsonValue::array();
    for (const auto& metadata : registry.listModels()) {
        ids.arrayValue.push_back(JsonValue::string(metadata.modelId));
    }

    JsonValue out = JsonValue::object();
    out.set("status", JsonValue::string("ok"));
    out.set("models", std::move(ids));
    out.set("monitoring", statsJson(monitor.snapshot()));
    return {200, out.dump()};
}

int PredictionService::start(const Config& config) {
    logRequests = true;
    const size_t threads = std::max<size_t>(1, config.threadCount);

    httplib::Server server;
    server.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<int>(threads)); };

    auto reply = [](httplib::Response& response, const Response& result) {
        response.status = result.status;
        response.set_content(result.payload, "application/json");
    };
    server.Post("/predict", [this, reply](const httplib::Request& request, httplib::Response& response) {
        reply(response, handlePredict(request.body));
    });
    server.Post("/batch_predict", [this, reply](const httplib::Request& request, httplib::Response& response) {
        reply(response, handleBatchPredict(request.body));
    });
    server.Get("/health", [this, reply](const httplib::Request&, httplib::Response& response) {
        reply(response, handleHealth());
    });

    const std::vector<ModelMetadata> served = registry.listModels();
    std::cout << "[AxonService] serving " << served.size() << " model(s) on " << config.host << ":" << config.port
              << " threads=" << threads << "\n";
    for (const auto& model : served) {
        std::cout << "[AxonService] model_id=" << model.modelId << " path=" << model.modelPath;
        if (!model.trainingTimestamp.empty()) std::cout << " trained=" << model.trainingTimestamp;
        if (std::isfinite(model.accuracy)) std::cout << " accuracy=" << model.accuracy;
        std::cout << "\n";
    }

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[AxonService] failed to bind " << config.host << ":" << config.port << "\n";
        return 1;
    }
    return 0;
}
