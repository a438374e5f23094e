#include "AxonExceptions.h"
#include "VectorUtils.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

TEST(VectorUtilsTest, DotAddSubtract) {
    const std::vector<double> a = {1.0, 2.0, 3.0};
    const std::vector<double> b = {4.0, -5.0, 0.5};

    EXPECT_DOUBLE_EQ(VectorUtils::dot(a, b), 4.0 - 10.0 + 1.5);
    EXPECT_EQ(VectorUtils::add(a, b), (std::vector<double>{5.0, -3.0, 3.5}));
    EXPECT_EQ(VectorUtils::subtract(a, b), (std::vector<double>{-3.0, 7.0, 2.5}));
    EXPECT_DOUBLE_EQ(VectorUtils::dot({}, {}), 0.0);
}

TEST(VectorUtilsTest, SizeMismatchThrows) {
    const std::vector<double> a = {1.0, 2.0};
    const std::vector<double> b = {1.0};
    EXPECT_THROW(VectorUtils::dot(a, b), Axon::ShapeException);
    EXPECT_THROW(VectorUtils::add(a, b), Axon::ShapeException);
    EXPECT_THROW(VectorUtils::subtract(b, a), Axon::ShapeException);
}

TEST(VectorUtilsTest, MeanRejectsEmpty) {
    EXPECT_DOUBLE_EQ(VectorUtils::mean({2.0, 4.0, 9.0}), 5.0);
    EXPECT_THROW(VectorUtils::mean({}), Axon::ShapeException);
}

TEST(VectorUtilsTest, NormalizeToUnitLength) {
    const auto out = VectorUtils::normalize({3.0, 4.0});
    EXPECT_DOUBLE_EQ(out[0], 0.6);
    EXPECT_DOUBLE_EQ(out[1], 0.8);

    EXPECT_THROW(VectorUtils::normalize({}), Axon::ShapeException);
    EXPECT_THROW(VectorUtils::normalize({0.0, 0.0}), Axon::ShapeException);
}

TEST(VectorUtilsTest, ArgMaxPicksFirstMaximum) {
    EXPECT_EQ(VectorUtils::argMax({0.1, 0.7, 0.7, 0.2}), 1);
    EXPECT_EQ(VectorUtils::argMax({-3.0}), 0);
    EXPECT_EQ(VectorUtils::argMax({}), -1);
}

TEST(VectorUtilsTest, AccuracyComparesArgMax) {
    const std::vector<std::vector<double>> predictions = {{0.9, 0.1}, {0.2, 0.8}, {0.6, 0.4}, {0.3, 0.7}};
    const std::vector<std::vector<double>> targets = {{1, 0}, {0, 1}, {0, 1}, {0, 1}};
    EXPECT_DOUBLE_EQ(VectorUtils::accuracy(predictions, targets), 0.75);

    EXPECT_DOUBLE_EQ(VectorUtils::accuracy({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(VectorUtils::accuracy(predictions, {{1, 0}}), 0.0);

    const std::vector<std::vector<double>> emptyRows(1);
    EXPECT_DOUBLE_EQ(VectorUtils::accuracy(emptyRows, emptyRows), 0.0);
    const std::vector<std::vector<double>> mixedPredictions = {{}, {0.2, 0.8}};
    const std::vector<std::vector<double>> mixedTargets = {{}, {0, 1}};
    EXPECT_DOUBLE_EQ(VectorUtils::accuracy(mixedPredictions, mixedTargets), 0.5);
}

TEST(VectorUtilsTest, AllFinite) {
    EXPECT_TRUE(VectorUtils::allFinite({0.0, -1.5, 1e300}));
    EXPECT_FALSE(VectorUtils::allFinite({0.0, std::numeric_limits<double>::quiet_NaN()}));
    EXPECT_FALSE(VectorUtils::allFinite({std::numeric_limits<double>::infinity()}));
}
