#pragma once

#include "JsonValue.h"
#include "NeuralNet.h"

#include <iosfwd>
#include <string>

enum class ModelFormat { JSON, BINARY };

namespace ModelSerializer {

/**
 * @brief Parses "json" or "binary" (case-insensitive).
 * @throws Axon::ConfigurationException for any other name.
 */
ModelFormat formatFromName(const std::string& name);

/**
 * @brief JSON document {"layers": [{"weights": [[..]], "biases": [..], "activation": "relu"}]}.
 * "alpha" is emitted only for parameterized activations (leaky_relu, elu).
 * @throws Axon::SerializationException when a parameter is not finite.
 */
JsonValue toJsonValue(const NeuralNet& net);
std::string toJson(const NeuralNet& net, int indent = 2);

/**
 * @brief Rebuilds a network from its JSON document.
 * @throws Axon::SerializationException on unknown activation tags, missing
 * fields, ragged or empty weight matrices, or layers that do not chain.
 */
NeuralNet fromJsonValue(const JsonValue& root);
NeuralNet fromJson(const std::string& text);

void writeBinary(const NeuralNet& net, std::ostream& out);

/**
 * @throws Axon::SerializationException on bad signature, version, widths,
 * activation tag, truncated data, or checksum mismatch.
 */
NeuralNet readBinary(std::istream& in);

/**
 * @throws Axon::IOException when the file cannot be opened or written.
 */
void save(const NeuralNet& net, const std::string& filename, ModelFormat format = ModelFormat::JSON);
NeuralNet load(const std::string& filename, ModelFormat format = ModelFormat::JSON);

inline void saveModelJson(const NeuralNet& net, const std::string& filename) { save(net, filename, ModelFormat::JSON); }
inline NeuralNet loadModelJson(const std::string& filename) { return load(filename, ModelFormat::JSON); }
inline void saveModelBinary(const NeuralNet& net, const std::string& filename) { save(net, filename, ModelFormat::BINARY); }
inline NeuralNet loadModelBinary(const std::string& filename) { return load(filename, ModelFormat::BINARY); }

} // namespace ModelSerializer
