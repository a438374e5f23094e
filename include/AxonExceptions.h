#ifndef AXON_EXCEPTIONS_H
#define AXON_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Axon {

class AxonException : public std::runtime_error {
public:
    explicit AxonException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public AxonException {
public:
    explicit IOException(const std::string& message) : AxonException("IO Error: " + message) {}
};

class DatasetException : public AxonException {
public:
    explicit DatasetException(const std::string& message) : AxonException("Dataset Error: " + message) {}
};

class ConfigurationException : public AxonException {
public:
    explicit ConfigurationException(const std::string& message) : AxonException("Config Error: " + message) {}
};

class NeuralNetException : public AxonException {
public:
    explicit NeuralNetException(const std::string& message) : AxonException("NeuralNet Error: " + message) {}
};

class ShapeException : public AxonException {
public:
    explicit ShapeException(const std::string& message) : AxonException("Shape Error: " + message) {}
};

class SerializationException : public AxonException {
public:
    explicit SerializationException(const std::string& message) : AxonException("Serialization Error: " + message) {}
};

} // namespace Axon

#endif // AXON_EXCEPTIONS_H
