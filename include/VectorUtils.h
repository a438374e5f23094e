#pragma once

#include <vector>

namespace VectorUtils {

/**
 * @brief Inner product of two equally sized vectors.
 * @throws Axon::ShapeException when sizes differ.
 */
double dot(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Elementwise a + b.
 * @throws Axon::ShapeException when sizes differ.
 */
std::vector<double> add(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Elementwise a - b.
 * @throws Axon::ShapeException when sizes differ.
 */
std::vector<double> subtract(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Arithmetic mean.
 * @throws Axon::ShapeException on empty input.
 */
double mean(const std::vector<double>& values);

/**
 * @brief Scales a vector to unit Euclidean length.
 * @throws Axon::ShapeException on empty input or a zero-norm vector.
 */
std::vector<double> normalize(const std::vector<double>& values);

/**
 * @brief Index of the first maximum element.
 * @post Returns -1 for empty input.
 */
int argMax(const std::vector<double>& values);

/**
 * @brief Fraction of rows whose argMax matches the target argMax.
 * @post Returns 0 when either set is empty or their sizes differ.
 *       A row with an empty prediction never counts as correct.
 */
double accuracy(const std::vector<std::vector<double>>& predictions,
                const std::vector<std::vector<double>>& targets);

bool allFinite(const std::vector<double>& values);

} // namespace VectorUtils
