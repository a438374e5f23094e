#include "AxonExceptions.h"
#include "Loss.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(LossTest, CrossEntropyValueAndGradient) {
    const LossResult r = Loss::crossEntropy({0.7, 0.2, 0.1}, {1.0, 0.0, 0.0});
    EXPECT_NEAR(r.loss, -std::log(0.7), 1e-12);
    ASSERT_EQ(r.gradient.size(), 3u);
    EXPECT_NEAR(r.gradient[0], -0.3, 1e-12);
    EXPECT_NEAR(r.gradient[1], 0.2, 1e-12);
    EXPECT_NEAR(r.gradient[2], 0.1, 1e-12);
}

TEST(LossTest, CrossEntropyClampsZeroProbability) {
    const LossResult r = Loss::crossEntropy({0.0, 1.0}, {1.0, 0.0});
    EXPECT_TRUE(std::isfinite(r.loss));
    EXPECT_NEAR(r.loss, -std::log(Loss::kProbabilityEpsilon), 1e-9);
    // gradient uses the unclamped prediction
    EXPECT_DOUBLE_EQ(r.gradient[0], -1.0);
    EXPECT_DOUBLE_EQ(r.gradient[1], 1.0);
}

TEST(LossTest, MeanSquaredError) {
    const LossResult r = Loss::meanSquaredError({1.0, 2.0}, {0.0, 4.0});
    EXPECT_DOUBLE_EQ(r.loss, (1.0 + 4.0) / 2.0);
    EXPECT_DOUBLE_EQ(r.gradient[0], 2.0);
    EXPECT_DOUBLE_EQ(r.gradient[1], -4.0);

    const LossResult empty = Loss::meanSquaredError({}, {});
    EXPECT_DOUBLE_EQ(empty.loss, 0.0);
    EXPECT_TRUE(empty.gradient.empty());
}

TEST(LossTest, NonNegative) {
    EXPECT_GE(Loss::crossEntropy({0.5, 0.5}, {0.0, 1.0}).loss, 0.0);
    EXPECT_GE(Loss::meanSquaredError({-3.0, 8.0}, {2.0, 8.0}).loss, 0.0);
    EXPECT_DOUBLE_EQ(Loss::meanSquaredError({0.25}, {0.25}).loss, 0.0);
}

TEST(LossTest, ShapeMismatchThrows) {
    EXPECT_THROW(Loss::crossEntropy({0.5, 0.5}, {1.0}), Axon::ShapeException);
    EXPECT_THROW(Loss::meanSquaredError({0.5}, {1.0, 0.0}), Axon::ShapeException);
}

TEST(LossTest, NamesAndDispatch) {
    EXPECT_STREQ(Loss::name(LossFunction::MSE), "mse");
    EXPECT_STREQ(Loss::name(LossFunction::CROSS_ENTROPY), "cross_entropy");
    EXPECT_EQ(Loss::fromName("MSE"), LossFunction::MSE);
    EXPECT_EQ(Loss::fromName("cross_entropy"), LossFunction::CROSS_ENTROPY);
    EXPECT_THROW(Loss::fromName("hinge"), Axon::ConfigurationException);

    EXPECT_DOUBLE_EQ(Loss::compute(LossFunction::MSE, {1.0}, {0.0}).loss, 1.0);
}
