#include "AxonExceptions.h"
#include "NeuralNet.h"
#include "VectorUtils.h"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <random>

namespace {
const std::vector<std::vector<double>> kXorInputs = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};
const std::vector<std::vector<double>> kXorTargets = {{1, 0}, {0, 1}, {0, 1}, {1, 0}};

NeuralNet makeXorNet(uint32_t seed = 1337) {
    return NeuralNet({2, 4, 2}, {Activation::relu(), Activation::softmax()}, seed);
}

void expectSameParameters(const NeuralNet& a, const NeuralNet& b) {
    ASSERT_EQ(a.layers().size(), b.layers().size());
    for (size_t l = 0; l < a.layers().size(); ++l) {
        EXPECT_EQ(a.layers()[l].weights(), b.layers()[l].weights()) << "layer " << l;
        EXPECT_EQ(a.layers()[l].biases(), b.layers()[l].biases()) << "layer " << l;
    }
}
} // namespace

TEST(NeuralNetTest, ConstructionValidatesTopology) {
    EXPECT_THROW(NeuralNet({3}, {}), Axon::NeuralNetException);
    EXPECT_THROW(NeuralNet({2, 0, 1}, {Activation::relu(), Activation::sigmoid()}), Axon::NeuralNetException);
    EXPECT_THROW(NeuralNet({2, 3, 1}, {Activation::relu()}), Axon::NeuralNetException);
    EXPECT_NO_THROW(NeuralNet({2, 3, 1}, {Activation::relu(), Activation::sigmoid()}));
}

TEST(NeuralNetTest, LayersChainTopology) {
    NeuralNet net({3, 5, 4, 2}, {Activation::tanh(), Activation::relu(), Activation::softmax()});
    ASSERT_EQ(net.layers().size(), 3u);
    EXPECT_EQ(net.layers()[0].prevSize(), 3u);
    EXPECT_EQ(net.layers()[0].size(), 5u);
    EXPECT_EQ(net.layers()[1].prevSize(), 5u);
    EXPECT_EQ(net.layers()[2].size(), 2u);
    EXPECT_EQ(net.inputSize(), 3u);
    EXPECT_EQ(net.outputSize(), 2u);
    EXPECT_EQ(net.layers()[1].activation(), Activation::relu());
}

TEST(NeuralNetTest, LayerListConstructorRejectsBrokenChain) {
    std::mt19937 rng(1);
    std::vector<DenseLayer> layers;
    layers.emplace_back(4, 2, Activation::relu(), rng);
    layers.emplace_back(1, 3, Activation::sigmoid(), rng);
    EXPECT_THROW(NeuralNet(std::move(layers)), Axon::NeuralNetException);
    EXPECT_THROW(NeuralNet(std::vector<DenseLayer>{}), Axon::NeuralNetException);
}

TEST(NeuralNetTest, PredictShapeAndInputValidation) {
    NeuralNet net({3, 6, 2}, {Activation::sigmoid(), Activation::softmax()});
    const auto out = net.predict({0.1, 0.2, 0.3});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_NEAR(out[0] + out[1], 1.0, 1e-12);
    EXPECT_THROW(net.predict({0.1, 0.2}), Axon::ShapeException);
}

TEST(NeuralNetTest, SameSeedSameNetwork) {
    NeuralNet a = makeXorNet(5);
    NeuralNet b = makeXorNet(5);
    NeuralNet c = makeXorNet(6);
    expectSameParameters(a, b);
    EXPECT_NE(a.layers()[0].weights(), c.layers()[0].weights());
}

TEST(NeuralNetTest, BatchOfOneMatchesTrainBitForBit) {
    NeuralNet single = makeXorNet(21);
    NeuralNet batched = single;

    for (int step = 0; step < 25; ++step) {
        const size_t i = static_cast<size_t>(step) % kXorInputs.size();
        const double lossA = single.train(kXorInputs[i], kXorTargets[i], 0.1);
        const double lossB = batched.trainBatch({kXorInputs[i]}, {kXorTargets[i]}, 0.1);
        EXPECT_EQ(lossA, lossB);
    }
    expectSameParameters(single, batched);
}

TEST(NeuralNetTest, BatchOfOneMatchesTrainWithMse) {
    NeuralNet single({2, 3, 1}, {Activation::tanh(), Activation::sigmoid()}, 8);
    single.setLossFunction(LossFunction::MSE);
    NeuralNet batched = single;

    for (int step = 0; step < 10; ++step) {
        single.train({0.3, -0.8}, {1.0}, 0.05);
        batched.trainBatch({{0.3, -0.8}}, {{1.0}}, 0.05);
    }
    expectSameParameters(single, batched);
}

TEST(NeuralNetTest, TrainBatchEdgeCases) {
    NeuralNet net = makeXorNet();
    const NeuralNet untouched = net;

    EXPECT_DOUBLE_EQ(net.trainBatch({}, {}, 0.1), 0.0);
    expectSameParameters(net, untouched);

    EXPECT_THROW(net.trainBatch({{0, 1}}, {}, 0.1), Axon::ShapeException);
    EXPECT_THROW(net.train({0, 1}, {1, 0, 0}, 0.1), Axon::ShapeException);
}

TEST(NeuralNetTest, TrainBatchReturnsMeanLoss) {
    NeuralNet net = makeXorNet();
    NeuralNet snapshot = net;
    double expected = 0.0;
    for (size_t i = 0; i < kXorInputs.size(); ++i) {
        expected += snapshot.computeLoss(snapshot.predict(kXorInputs[i]), kXorTargets[i]);
    }
    expected /= static_cast<double>(kXorInputs.size());

    EXPECT_NEAR(net.trainBatch(kXorInputs, kXorTargets, 0.1), expected, 1e-12);
}

TEST(NeuralNetTest, XorConverges) {
    NeuralNet net = makeXorNet();
    for (int epoch = 0; epoch < 1000; ++epoch) {
        net.trainBatch(kXorInputs, kXorTargets, 0.1);
    }

    for (const auto& input : kXorInputs) {
        const auto out = net.predict(input);
        EXPECT_NEAR(out[0] + out[1], 1.0, 1e-12);
    }
    EXPECT_GE(net.evaluate(kXorInputs, kXorTargets), 0.75);
    EXPECT_FALSE(net.hasNonFinite());
}

TEST(NeuralNetTest, TrainingReducesLoss) {
    NeuralNet net = makeXorNet(3);
    const double first = net.trainBatch(kXorInputs, kXorTargets, 0.1);
    double last = first;
    for (int epoch = 0; epoch < 300; ++epoch) {
        last = net.trainBatch(kXorInputs, kXorTargets, 0.1);
    }
    EXPECT_LT(last, first);
}

TEST(NeuralNetTest, FitRecordsHistory) {
    NeuralNet net = makeXorNet();
    NeuralNet::TrainingOptions options;
    options.epochs = 50;
    options.batchSize = 2;
    options.learningRate = 0.1;
    net.fit(kXorInputs, kXorTargets, options);

    ASSERT_EQ(net.getTrainLossHistory().size(), 50u);
    for (double loss : net.getTrainLossHistory()) {
        EXPECT_TRUE(std::isfinite(loss));
        EXPECT_GE(loss, 0.0);
    }

    options.batchSize = 0;
    EXPECT_THROW(net.fit(kXorInputs, kXorTargets, options), Axon::NeuralNetException);
    options.batchSize = 2;
    EXPECT_THROW(net.fit({}, {}, options), Axon::NeuralNetException);
}

TEST(NeuralNetTest, GradientCheckSigmoidMse) {
    // Single output: the MSE gradient 2*(p-t) is exact only when the mean runs over one element.
    NeuralNet net({3, 4, 1}, {Activation::tanh(), Activation::sigmoid()}, 11);
    net.setLossFunction(LossFunction::MSE);
    const std::vector<double> input = {0.5, -0.3, 0.8};
    const std::vector<double> target = {1.0};

    NeuralNet before = net;
    EXPECT_LT(net.gradientCheck(input, target), 1e-4);
    expectSameParameters(net, before);
}

TEST(NeuralNetTest, GradientCheckSoftmaxCrossEntropy) {
    NeuralNet net({2, 5, 3}, {Activation::sigmoid(), Activation::softmax()}, 17);
    EXPECT_LT(net.gradientCheck({0.9, -0.4}, {0.0, 1.0, 0.0}), 1e-4);
    EXPECT_THROW(net.gradientCheck({0.9, -0.4}, {0.0, 1.0, 0.0}, 0.0), Axon::NeuralNetException);
}

TEST(NeuralNetTest, GradientCheckSwishElu) {
    NeuralNet net({2, 3, 3, 1}, {Activation::swish(), Activation::elu(), Activation::linear()}, 4);
    net.setLossFunction(LossFunction::MSE);
    EXPECT_LT(net.gradientCheck({-0.6, 0.7}, {0.25}), 1e-4);
}

TEST(NeuralNetTest, NonFiniteDetectionAndDescribe) {
    NeuralNet net = makeXorNet();
    EXPECT_FALSE(net.hasNonFinite());

    const std::string text = net.describe();
    EXPECT_NE(text.find("2 -> 4 -> 2"), std::string::npos);
    EXPECT_NE(text.find("softmax"), std::string::npos);

    net.layers()[1].biases()[0] = std::nan("");
    EXPECT_TRUE(net.hasNonFinite());
}
