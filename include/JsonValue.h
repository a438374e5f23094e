#pragma once

#include <map>
#include <string>
#include <vector>

// Minimal JSON document model used for model files, registries and service payloads.
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue array(std::vector<JsonValue> items = {});
    static JsonValue object();
    static JsonValue numberArray(const std::vector<double>& values);

    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const;
    void set(const std::string& key, JsonValue value);

    /**
     * @brief Serializes the value. Numbers use 17 significant digits so doubles
     * survive a write/parse cycle bit for bit; non-finite numbers become null.
     * @param indent negative for compact output, otherwise spaces per level.
     */
    std::string dump(int indent = -1) const;
};

/**
 * @brief Parses a complete JSON document.
 * @throws Axon::SerializationException on malformed input or trailing content.
 */
JsonValue parseJsonText(const std::string& text);

std::string escapeJsonString(const std::string& value);
std::string formatJsonNumber(double value);

/**
 * @brief Reads a numeric array node.
 * @throws Axon::SerializationException when the node is not an array of finite numbers.
 */
std::vector<double> jsonToNumberVector(const JsonValue& value, const std::string& label);
