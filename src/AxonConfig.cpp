#include "AxonConfig.h"

#include "AxonExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Axon::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Axon::AxonException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Axon::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Axon::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

size_t parseSizeStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Axon::ConfigurationException("Value for " + key + " must be non-negative");
    }
    return parseNumericStrict<size_t>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return static_cast<size_t>(std::stoull(v, pos)); });
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    const size_t parsed = parseSizeStrict(value, key);
    if (parsed > static_cast<size_t>(std::numeric_limits<uint32_t>::max())) {
        throw Axon::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Axon::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

std::string maybeUnquote(const std::string& value) {
    std::string v = CommonUtils::trim(value);
    if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

bool isKnownCommand(const std::string& command) {
    return command == "train" || command == "predict" || command == "serve" || command == "help";
}

// Flags that may appear without a value on the command line.
bool isSwitch(const std::string& key) {
    return key == "verbose";
}
} // namespace

void AxonConfig::set(const std::string& rawKey, const std::string& rawValue) {
    const std::string key = normalizeConfigKey(rawKey);
    const std::string value = CommonUtils::trim(rawValue);

    if (key == "command") {
        command = CommonUtils::toLower(value);
    } else if (key == "topology") {
        topology.clear();
        for (const auto& item : CommonUtils::splitList(value)) {
            topology.push_back(parseSizeStrict(item, "topology"));
        }
    } else if (key == "activations") {
        activations.clear();
        for (const auto& item : CommonUtils::splitList(value)) {
            activations.push_back(CommonUtils::toLower(item));
        }
    } else if (key == "loss") {
        loss = CommonUtils::toLower(value);
    } else if (key == "epochs") {
        epochs = parseSizeStrict(value, "epochs");
    } else if (key == "lr" || key == "learning_rate") {
        learningRate = parseDoubleStrict(value, "lr");
    } else if (key == "batch_size") {
        batchSize = parseSizeStrict(value, "batch_size");
    } else if (key == "seed") {
        seed = parseUIntStrict(value, "seed");
    } else if (key == "data") {
        dataPath = value;
    } else if (key == "targets") {
        targetColumns = parseSizeStrict(value, "targets");
    } else if (key == "delimiter") {
        const std::string v = (value == "\\t" || CommonUtils::toLower(value) == "tab") ? "\t" : rawValue;
        if (v.size() != 1) throw Axon::ConfigurationException("delimiter expects a single character");
        delimiter = v[0];
    } else if (key == "model") {
        modelPath = value;
    } else if (key == "format") {
        format = CommonUtils::toLower(value);
    } else if (key == "input") {
        input.clear();
        for (const auto& item : CommonUtils::splitList(value)) {
            input.push_back(parseDoubleStrict(item, "input"));
        }
    } else if (key == "registry") {
        registryPath = value;
    } else if (key == "host") {
        host = value;
    } else if (key == "port") {
        port = parseIntStrict(value, "port", 1);
    } else if (key == "threads") {
        threads = parseSizeStrict(value, "threads");
    } else if (key == "verbose") {
        verbose = parseBoolStrict(value, "verbose");
    } else if (key == "config") {
        configPath = value;
    } else {
        throw Axon::ConfigurationException("Unknown option: " + rawKey);
    }
}

AxonConfig AxonConfig::fromArgs(int argc, char* argv[]) {
    AxonConfig config;
    if (argc < 2) {
        return config;
    }

    int first = 1;
    const std::string head = argv[1];
    if (head.rfind("--", 0) != 0) {
        config.command = CommonUtils::toLower(head);
        first = 2;
    }
    if (config.command == "--help" || config.command == "-h") {
        config.command = "help";
    }

    std::vector<std::pair<std::string, std::string>> overrides;
    std::string configPath;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.command = "help";
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
            throw Axon::ConfigurationException("Unexpected argument: " + arg);
        }

        const std::string key = normalizeConfigKey(arg.substr(2));
        const bool hasValue = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
        if (isSwitch(key) && !hasValue) {
            overrides.emplace_back(key, "true");
            continue;
        }
        if (!hasValue) {
            throw Axon::ConfigurationException("Missing value for " + arg);
        }

        const std::string value = argv[++i];
        if (key == "config") {
            configPath = value;
        } else {
            overrides.emplace_back(key, value);
        }
    }

    if (!configPath.empty()) {
        const std::string command = config.command;
        config = fromFile(configPath, config);
        config.command = command;
        config.configPath = configPath;
    }
    for (const auto& kv : overrides) {
        config.set(kv.first, kv.second);
    }

    config.validate();
    return config;
}

AxonConfig AxonConfig::fromFile(const std::string& configPath, const AxonConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Axon::ConfigurationException("Could not open config file: " + configPath);

    AxonConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t sep = line.find_first_of(":=");
        if (sep == std::string::npos) {
            throw Axon::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                               ": expected key: value");
        }

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const Axon::AxonException& ex) {
            throw Axon::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                               ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AxonConfig::validate() const {
    if (!isKnownCommand(command)) {
        throw Axon::ConfigurationException("Unknown command: " + command + " (expected train|predict|serve|help)");
    }
    if (command == "help") return;

    if (topology.size() < 2) {
        throw Axon::ConfigurationException("topology needs at least an input and an output size");
    }
    if (std::find(topology.begin(), topology.end(), size_t{0}) != topology.end()) {
        throw Axon::ConfigurationException("topology sizes must be positive");
    }
    if (activations.size() != topology.size() - 1) {
        throw Axon::ConfigurationException("activations must list " + std::to_string(topology.size() - 1) +
                                           " entries, got " + std::to_string(activations.size()));
    }
    buildActivations();
    lossFunction();
    modelFormat();

    if (!std::isfinite(learningRate) || learningRate <= 0.0) {
        throw Axon::ConfigurationException("lr must be a positive finite number");
    }
    if (epochs == 0) throw Axon::ConfigurationException("epochs must be positive");
    if (batchSize == 0) throw Axon::ConfigurationException("batch_size must be positive");
    if (targetColumns == 0) throw Axon::ConfigurationException("targets must be positive");
    if (port < 1 || port > 65535) throw Axon::ConfigurationException("port must be in [1, 65535]");
    if (threads == 0) throw Axon::ConfigurationException("threads must be positive");

    if (command == "predict") {
        if (modelPath.empty()) throw Axon::ConfigurationException("predict requires --model");
        if (input.empty()) throw Axon::ConfigurationException("predict requires --input");
    }
    if (command == "serve" && registryPath.empty() && modelPath.empty()) {
        throw Axon::ConfigurationException("serve requires --registry or --model");
    }
}

std::vector<Activation> AxonConfig::buildActivations() const {
    std::vector<Activation> out;
    out.reserve(activations.size());
    for (const auto& tag : activations) {
        try {
            out.push_back(Activation::fromTag(tag));
        } catch (const Axon::SerializationException&) {
            throw Axon::ConfigurationException("Unknown activation: " + tag);
        }
    }
    return out;
}

NeuralNet::TrainingOptions AxonConfig::trainingOptions() const {
    NeuralNet::TrainingOptions options;
    options.epochs = epochs;
    options.learningRate = learningRate;
    options.batchSize = batchSize;
    options.verbose = verbose;
    return options;
}

std::string AxonConfig::usage() {
    return "Usage: axon_cli <train|predict|serve|help> [options]\n"
           "  --config <file>          key: value file applied before other flags\n"
           "  --topology 2,4,2         layer widths, input first\n"
           "  --activations relu,softmax\n"
           "  --loss cross_entropy|mse\n"
           "  --epochs N  --lr X  --batch-size N  --seed N\n"
           "  --data <csv>  --targets N  --delimiter c\n"
           "  --model <path>  --format json|binary\n"
           "  --input 0,1               feature vector for predict\n"
           "  --registry <json>  --host h  --port p  --threads n\n"
           "  --verbose\n";
}
