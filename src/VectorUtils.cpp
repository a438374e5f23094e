#include "VectorUtils.h"

#include "AxonExceptions.h"

#include <cmath>
#include <numeric>
#include <string>

namespace {
void requireSameSize(const std::vector<double>& a, const std::vector<double>& b, const char* op) {
    if (a.size() != b.size()) {
        throw Axon::ShapeException(std::string(op) + ": size mismatch (" + std::to_string(a.size()) +
                                   " vs " + std::to_string(b.size()) + ")");
    }
}
} // namespace

namespace VectorUtils {

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    requireSameSize(a, b, "dot");
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
    return sum;
}

std::vector<double> add(const std::vector<double>& a, const std::vector<double>& b) {
    requireSameSize(a, b, "add");
    std::vector<double> out(a.size());
    for (size_t i = 0; i < a.size(); ++i) out[i] = a[i] + b[i];
    return out;
}

std::vector<double> subtract(const std::vector<double>& a, const std::vector<double>& b) {
    requireSameSize(a, b, "subtract");
    std::vector<double> out(a.size());
    for (size_t i = 0; i < a.size(); ++i) out[i] = a[i] - b[i];
    return out;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) throw Axon::ShapeException("mean of an empty vector is undefined");
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

std::vector<double> normalize(const std::vector<double>& values) {
    if (values.empty()) throw Axon::ShapeException("cannot normalize an empty vector");
    double sq = 0.0;
    for (double v : values) sq += v * v;
    const double norm = std::sqrt(sq);
    if (norm == 0.0 || !std::isfinite(norm)) {
        throw Axon::ShapeException("cannot normalize a vector with zero or non-finite norm");
    }
    std::vector<double> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) out[i] = values[i] / norm;
    return out;
}

int argMax(const std::vector<double>& values) {
    if (values.empty()) return -1;
    size_t best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) best = i;
    }
    return static_cast<int>(best);
}

double accuracy(const std::vector<std::vector<double>>& predictions,
                const std::vector<std::vector<double>>& targets) {
    if (predictions.empty() || predictions.size() != targets.size()) return 0.0;
    size_t correct = 0;
    for (size_t i = 0; i < predictions.size(); ++i) {
        const int predicted = argMax(predictions[i]);
        if (predicted >= 0 && predicted == argMax(targets[i])) ++correct;
    }
    return static_cast<double>(correct) / static_cast<double>(predictions.size());
}

bool allFinite(const std::vector<double>& values) {
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

} // namespace VectorUtils
