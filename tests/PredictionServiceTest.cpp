#include "AxonExceptions.h"
#include "PredictionService.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace {
NeuralNet makeNet(uint32_t seed) {
    return NeuralNet({2, 3, 2}, {Activation::tanh(), Activation::softmax()}, seed);
}

ModelMetadata metadataFor(const std::string& id) {
    ModelMetadata metadata;
    metadata.modelId = id;
    return metadata;
}

class PredictionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.registerModel(metadataFor("xor"), makeNet(1));
        registry.registerModel(metadataFor("other"), makeNet(2));
    }

    ModelRegistry registry;
    RequestMonitor monitor;
    PredictionService service{registry, monitor};
};
} // namespace

TEST_F(PredictionServiceTest, PredictUsesDefaultModel) {
    const auto response = service.handlePredict(R"({"features": [0.0, 1.0]})");
    ASSERT_EQ(response.status, 200) << response.payload;

    const JsonValue body = parseJsonText(response.payload);
    EXPECT_EQ(body.find("model_id")->stringValue, "xor");
    const auto prediction = jsonToNumberVector(*body.find("prediction"), "prediction");
    ASSERT_EQ(prediction.size(), 2u);
    EXPECT_NEAR(prediction[0] + prediction[1], 1.0, 1e-9);

    NeuralNet reference = makeNet(1);
    const auto expected = reference.predict({0.0, 1.0});
    EXPECT_NEAR(prediction[0], expected[0], 1e-12);
    EXPECT_NE(body.find("class"), nullptr);
    EXPECT_NE(body.find("monitoring"), nullptr);
}

TEST_F(PredictionServiceTest, PredictSelectsModelById) {
    const auto response = service.handlePredict(R"({"model_id": "other", "features": [0.5, -0.5]})");
    ASSERT_EQ(response.status, 200);
    const JsonValue body = parseJsonText(response.payload);
    EXPECT_EQ(body.find("model_id")->stringValue, "other");
}

TEST_F(PredictionServiceTest, BatchPredict) {
    const auto response = service.handleBatchPredict(R"({"instances": [[0, 0], [0, 1], [1, 0]]})");
    ASSERT_EQ(response.status, 200) << response.payload;

    const JsonValue body = parseJsonText(response.payload);
    EXPECT_DOUBLE_EQ(body.find("count")->numberValue, 3.0);
    ASSERT_EQ(body.find("predictions")->arrayValue.size(), 3u);
    ASSERT_EQ(body.find("classes")->arrayValue.size(), 3u);
    EXPECT_EQ(body.find("predictions")->arrayValue[2].arrayValue.size(), 2u);
}

TEST_F(PredictionServiceTest, BadRequestsReturn400) {
    const std::vector<std::string> bodies = {
        "not json",
        R"([1, 2])",
        R"({"inputs": [0, 1]})",
        R"({"features": [0, 1, 2]})",
        R"({"features": ["a", 1]})",
        R"({"model_id": "missing", "features": [0, 1]})",
    };
    for (const auto& text : bodies) {
        const auto response = service.handlePredict(text);
        EXPECT_EQ(response.status, 400) << text;
        const JsonValue body = parseJsonText(response.payload);
        ASSERT_NE(body.find("error"), nullptr) << text;
        EXPECT_FALSE(body.find("error")->stringValue.empty());
    }

    EXPECT_EQ(service.handleBatchPredict(R"({"instances": [0, 1]})").status, 400);
    EXPECT_EQ(service.handleBatchPredict(R"({"instances": [[0, 1], [1]]})").status, 400);
}

TEST_F(PredictionServiceTest, MonitorCountsRequests) {
    service.handlePredict(R"({"features": [0, 1]})");
    service.handleBatchPredict(R"({"instances": [[0, 0], [1, 1]]})");
    service.handlePredict(R"({"features": []})");

    const ServiceStats stats = monitor.snapshot();
    EXPECT_EQ(stats.totalRequests, 3u);
    EXPECT_EQ(stats.predictRequests, 2u);
    EXPECT_EQ(stats.batchRequests, 1u);
    EXPECT_EQ(stats.errorRequests, 1u);
    EXPECT_EQ(stats.predictedRows, 3u);
    uint64_t classified = 0;
    for (uint64_t count : stats.classCounts) classified += count;
    EXPECT_EQ(classified, 3u);
    EXPECT_LE(stats.classCounts.size(), 2u);
    EXPECT_GE(stats.maxLatencyMs, stats.averageLatencyMs);
}

TEST_F(PredictionServiceTest, HealthListsModels) {
    const auto response = service.handleHealth();
    EXPECT_EQ(response.status, 200);
    const JsonValue body = parseJsonText(response.payload);
    EXPECT_EQ(body.find("status")->stringValue, "ok");
    const auto& models = body.find("models")->arrayValue;
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0].stringValue, "xor");
    EXPECT_EQ(models[1].stringValue, "other");
}

TEST(ModelRegistryTest, RejectsEmptyAndDuplicateIds) {
    ModelRegistry registry;
    EXPECT_TRUE(registry.defaultModelId().empty());
    EXPECT_THROW(registry.registerModel(metadataFor(""), makeNet(1)), Axon::ConfigurationException);
    registry.registerModel(metadataFor("a"), makeNet(1));
    EXPECT_THROW(registry.registerModel(metadataFor("a"), makeNet(2)), Axon::ConfigurationException);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("b"), nullptr);
}

TEST(ModelRegistryTest, LoadsRegistryFile) {
    const auto dir = std::filesystem::temp_directory_path() / "axon_registry_test";
    std::filesystem::create_directories(dir);
    ModelSerializer::saveModelJson(makeNet(3), (dir / "first.json").string());
    ModelSerializer::saveModelBinary(makeNet(4), (dir / "second.bin").string());

    const auto registryPath = (dir / "registry.json").string();
    {
        std::ofstream out(registryPath);
        out << R"({"models": [
            {"model_id": "first", "model_path": "first.json", "training_timestamp": "2026-01-01T00:00:00Z",
             "metrics": {"accuracy": 0.93}, "hyperparameters": {"lr": 0.1, "activation": "tanh"}},
            {"model_id": "second", "model_path": "second.bin", "format": "binary"}
        ]})";
    }

    ModelRegistry registry;
    registry.loadFromFile(registryPath);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.defaultModelId(), "first");

    const auto first = registry.find("first");
    ASSERT_NE(first, nullptr);
    EXPECT_DOUBLE_EQ(first->metadata.accuracy, 0.93);
    EXPECT_EQ(first->metadata.trainingTimestamp, "2026-01-01T00:00:00Z");
    EXPECT_EQ(first->metadata.hyperparameters.at("activation"), "tanh");

    const auto second = registry.find("second");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->metadata.format, ModelFormat::BINARY);
    NeuralNet reference = makeNet(4);
    EXPECT_EQ(second->net.predict({0.3, 0.7}), reference.predict({0.3, 0.7}));

    {
        std::ofstream out(registryPath);
        out << R"({"models": [{"model_id": "x", "model_path": "first.json"},
                              {"model_id": "x", "model_path": "first.json"}]})";
    }
    EXPECT_THROW(registry.loadFromFile(registryPath), Axon::ConfigurationException);
    EXPECT_EQ(registry.size(), 2u);

    {
        std::ofstream out(registryPath);
        out << R"({"models": [{"model_id": "x"}]})";
    }
    EXPECT_THROW(registry.loadFromFile(registryPath), Axon::ConfigurationException);
    EXPECT_THROW(registry.loadFromFile((dir / "absent.json").string()), Axon::ConfigurationException);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
