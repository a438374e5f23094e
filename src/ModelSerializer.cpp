#include "ModelSerializer.h"

#include "AxonExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
constexpr char kBinarySignature[] = "AXON_MODEL_V1";
constexpr uint32_t kModelFormatVersion = 1;
constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;
constexpr uint64_t kMaxLayerCount = 4096;
constexpr uint64_t kMaxLayerWidth = 1000000ULL;
constexpr uint32_t kMaxTagLength = 64;

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

void updateChecksumBytes(uint64_t& checksum, const unsigned char* bytes, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(&copy), sizeof(T));
}

template <typename T>
void writeLE(std::ostream& out, T value, uint64_t& checksum) {
    updateChecksum(checksum, value);
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw Axon::IOException("Binary write failed");
}

template <typename T>
T readLE(std::istream& in, uint64_t& checksum) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw Axon::SerializationException("Binary read failed or model file is truncated");
    if (!isLittleEndian()) swapEndian(value);
    updateChecksum(checksum, value);
    return value;
}

void requireFinite(const std::vector<double>& values, size_t layer) {
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw Axon::SerializationException("Layer " + std::to_string(layer) + " contains non-finite parameters");
        }
    }
}

Activation withStoredAlpha(const Activation& base, double alpha, size_t layer) {
    if (!std::isfinite(alpha) || alpha < 0.0) {
        throw Axon::SerializationException("layers[" + std::to_string(layer) +
                                           "].alpha must be a finite non-negative number");
    }
    return Activation(base.kind(), alpha);
}

Activation activationFromRecord(const std::string& tag, const JsonValue* alphaNode, size_t layer) {
    const Activation base = Activation::fromTag(tag);
    if (alphaNode == nullptr || !base.hasAlpha()) {
        return base;
    }
    if (!alphaNode->isNumber()) {
        throw Axon::SerializationException("layers[" + std::to_string(layer) + "].alpha must be a number");
    }
    return withStoredAlpha(base, alphaNode->numberValue, layer);
}

std::string readWholeFile(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) throw Axon::IOException("Could not open " + filename + " for reading");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw Axon::IOException("Failed while reading " + filename);
    return buffer.str();
}
} // namespace

namespace ModelSerializer {

ModelFormat formatFromName(const std::string& name) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(name));
    if (lowered == "json") return ModelFormat::JSON;
    if (lowered == "binary" || lowered == "bin") return ModelFormat::BINARY;
    throw Axon::ConfigurationException("Unknown model format: " + name + " (expected json|binary)");
}

JsonValue toJsonValue(const NeuralNet& net) {
    JsonValue layers = JsonValue::array();
    const auto& netLayers = net.layers();
    for (size_t l = 0; l < netLayers.size(); ++l) {
        const DenseLayer& layer = netLayers[l];
        requireFinite(layer.weights(), l);
        requireFinite(layer.biases(), l);

        JsonValue rows = JsonValue::array();
        rows.arrayValue.reserve(layer.size());
        for (size_t n = 0; n < layer.size(); ++n) {
            const auto rowBegin = layer.weights().begin() + static_cast<std::ptrdiff_t>(n * layer.prevSize());
            rows.arrayValue.push_back(JsonValue::numberArray(
                std::vector<double>(rowBegin, rowBegin + static_cast<std::ptrdiff_t>(layer.prevSize()))));
        }

        JsonValue record = JsonValue::object();
        record.set("weights", std::move(rows));
        record.set("biases", JsonValue::numberArray(layer.biases()));
        record.set("activation", JsonValue::string(layer.activation().tag()));
        if (layer.activation().hasAlpha()) {
            record.set("alpha", JsonValue::number(layer.activation().alpha()));
        }
        layers.arrayValue.push_back(std::move(record));
    }

    JsonValue root = JsonValue::object();
    root.set("layers", std::move(layers));
    return root;
}

std::string toJson(const NeuralNet& net, int indent) {
    return toJsonValue(net).dump(indent);
}

NeuralNet fromJsonValue(const JsonValue& root) {
    const JsonValue* layersNode = root.find("layers");
    if (!root.isObject() || layersNode == nullptr || !layersNode->isArray()) {
        throw Axon::SerializationException("Model must contain a top-level 'layers' array");
    }
    if (layersNode->arrayValue.empty()) {
        throw Axon::SerializationException("Model has no layers");
    }

    std::vector<DenseLayer> layers;
    layers.reserve(layersNode->arrayValue.size());
    for (size_t l = 0; l < layersNode->arrayValue.size(); ++l) {
        const JsonValue& record = layersNode->arrayValue[l];
        const std::string label = "layers[" + std::to_string(l) + "]";
        if (!record.isObject()) {
            throw Axon::SerializationException(label + " must be an object");
        }

        const JsonValue* weightsNode = record.find("weights");
        const JsonValue* biasesNode = record.find("biases");
        const JsonValue* activationNode = record.find("activation");
        if (weightsNode == nullptr || !weightsNode->isArray()) {
            throw Axon::SerializationException(label + " requires a 'weights' 2D array");
        }
        if (biasesNode == nullptr) {
            throw Axon::SerializationException(label + " requires a 'biases' array");
        }
        if (activationNode == nullptr || !activationNode->isString()) {
            throw Axon::SerializationException(label + " requires a string 'activation'");
        }

        const size_t size = weightsNode->arrayValue.size();
        if (size == 0) {
            throw Axon::SerializationException(label + ".weights has no rows");
        }

        std::vector<double> flat;
        size_t prevSize = 0;
        for (size_t n = 0; n < size; ++n) {
            const std::vector<double> row =
                jsonToNumberVector(weightsNode->arrayValue[n], label + ".weights[" + std::to_string(n) + "]");
            if (n == 0) {
                prevSize = row.size();
                if (prevSize == 0) {
                    throw Axon::SerializationException(label + ".weights rows are empty");
                }
                flat.reserve(size * prevSize);
            } else if (row.size() != prevSize) {
                throw Axon::SerializationException(label + ".weights is ragged");
            }
            flat.insert(flat.end(), row.begin(), row.end());
        }

        std::vector<double> biases = jsonToNumberVector(*biasesNode, label + ".biases");
        if (biases.size() != size) {
            throw Axon::SerializationException(label + ".biases has " + std::to_string(biases.size()) +
                                               " entries, expected " + std::to_string(size));
        }
        if (!layers.empty() && layers.back().size() != prevSize) {
            throw Axon::SerializationException(label + " expects " + std::to_string(prevSize) +
                                               " inputs but previous layer emits " +
                                               std::to_string(layers.back().size()));
        }

        const Activation activation = activationFromRecord(activationNode->stringValue, record.find("alpha"), l);
        layers.emplace_back(size, prevSize, activation, std::move(flat), std::move(biases));
    }

    return NeuralNet(std::move(layers));
}

NeuralNet fromJson(const std::string& text) {
    return fromJsonValue(parseJsonText(text));
}

void writeBinary(const NeuralNet& net, std::ostream& out) {
    out.write(kBinarySignature, sizeof(kBinarySignature));
    if (!out) throw Axon::IOException("Binary write failed");

    uint64_t checksum = kChecksumOffsetBasis;
    writeLE(out, kModelFormatVersion, checksum);

    const auto& layers = net.layers();
    writeLE(out, static_cast<uint64_t>(layers.size()), checksum);

    for (size_t l = 0; l < layers.size(); ++l) {
        const DenseLayer& layer = layers[l];
        requireFinite(layer.weights(), l);
        requireFinite(layer.biases(), l);

        writeLE(out, static_cast<uint64_t>(layer.prevSize()), checksum);
        writeLE(out, static_cast<uint64_t>(layer.size()), checksum);

        const std::string tag = layer.activation().tag();
        writeLE(out, static_cast<uint32_t>(tag.size()), checksum);
        out.write(tag.data(), static_cast<std::streamsize>(tag.size()));
        if (!out) throw Axon::IOException("Binary write failed");
        updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(tag.data()), tag.size());
        writeLE(out, layer.activation().alpha(), checksum);
    }

    for (const auto& layer : layers) {
        for (double b : layer.biases()) writeLE(out, b, checksum);
        for (double w : layer.weights()) writeLE(out, w, checksum);
    }

    uint64_t unused = 0;
    writeLE(out, checksum, unused);
}

NeuralNet readBinary(std::istream& in) {
    char signature[sizeof(kBinarySignature)];
    in.read(signature, sizeof(signature));
    if (!in) throw Axon::SerializationException("Failed to read model signature");
    if (!std::equal(signature, signature + sizeof(signature), kBinarySignature)) {
        throw Axon::SerializationException("Unsupported or invalid binary model signature");
    }

    uint64_t checksum = kChecksumOffsetBasis;
    const auto version = readLE<uint32_t>(in, checksum);
    if (version != kModelFormatVersion) {
        throw Axon::SerializationException("Unsupported model version " + std::to_string(version));
    }

    const auto layerCount = readLE<uint64_t>(in, checksum);
    if (layerCount == 0 || layerCount > kMaxLayerCount) {
        throw Axon::SerializationException("Invalid layer count in model file");
    }

    struct LayerHeader {
        size_t prevSize;
        size_t size;
        Activation activation;
    };
    std::vector<LayerHeader> headers;
    headers.reserve(static_cast<size_t>(layerCount));
    for (uint64_t l = 0; l < layerCount; ++l) {
        const auto prevSize = readLE<uint64_t>(in, checksum);
        const auto size = readLE<uint64_t>(in, checksum);
        if (prevSize == 0 || size == 0 || prevSize > kMaxLayerWidth || size > kMaxLayerWidth) {
            throw Axon::SerializationException("Invalid layer width in model file");
        }
        if (!headers.empty() && headers.back().size != prevSize) {
            throw Axon::SerializationException("Layer widths in model file do not chain");
        }

        const auto tagLength = readLE<uint32_t>(in, checksum);
        if (tagLength == 0 || tagLength > kMaxTagLength) {
            throw Axon::SerializationException("Invalid activation tag length in model file");
        }
        std::string tag(tagLength, '\0');
        in.read(&tag[0], static_cast<std::streamsize>(tagLength));
        if (!in) throw Axon::SerializationException("Binary read failed or model file is truncated");
        updateChecksumBytes(checksum, reinterpret_cast<const unsigned char*>(tag.data()), tag.size());

        const auto alpha = readLE<double>(in, checksum);
        const Activation base = Activation::fromTag(tag);
        const Activation activation = base.hasAlpha() ? withStoredAlpha(base, alpha, static_cast<size_t>(l)) : base;
        headers.push_back({static_cast<size_t>(prevSize), static_cast<size_t>(size), activation});
    }

    // Widths come straight from the file, so apply the network limits before sizing any buffer.
    size_t totalNodes = headers.front().prevSize;
    size_t totalParams = 0;
    for (const auto& header : headers) {
        totalNodes += header.size;
        totalParams += header.size * header.prevSize + header.size;
    }
    if (totalNodes > NeuralNet::kMaxTopologyNodes || totalParams > NeuralNet::kMaxTrainableParams) {
        throw Axon::SerializationException("Model file topology exceeds network size limits");
    }

    std::vector<DenseLayer> layers;
    layers.reserve(headers.size());
    for (const auto& header : headers) {
        std::vector<double> biases(header.size);
        for (double& b : biases) b = readLE<double>(in, checksum);
        std::vector<double> weights(header.size * header.prevSize);
        for (double& w : weights) w = readLE<double>(in, checksum);
        layers.emplace_back(header.size, header.prevSize, header.activation, std::move(weights), std::move(biases));
    }

    uint64_t unused = 0;
    const auto stored = readLE<uint64_t>(in, unused);
    if (stored != checksum) {
        throw Axon::SerializationException("Model checksum mismatch; file is corrupted");
    }

    return NeuralNet(std::move(layers));
}

void save(const NeuralNet& net, const std::string& filename, ModelFormat format) {
    if (format == ModelFormat::BINARY) {
        std::ofstream out(filename, std::ios::binary);
        if (!out) throw Axon::IOException("Could not open " + filename + " for writing");
        writeBinary(net, out);
        return;
    }

    const std::string text = toJson(net);
    std::ofstream out(filename);
    if (!out) throw Axon::IOException("Could not open " + filename + " for writing");
    out << text << "\n";
    if (!out.good()) throw Axon::IOException("Failed while writing " + filename);
}

NeuralNet load(const std::string& filename, ModelFormat format) {
    if (format == ModelFormat::BINARY) {
        std::ifstream in(filename, std::ios::binary);
        if (!in) throw Axon::IOException("Could not open " + filename + " for reading");
        return readBinary(in);
    }
    return fromJson(readWholeFile(filename));
}

} // namespace ModelSerializer
