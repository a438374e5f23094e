#include "JsonValue.h"

#include "AxonExceptions.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
constexpr int kRoundTripDigits = 17;
constexpr size_t kMaxNestingDepth = 256;

// Recursive-descent reader over a complete document. Errors carry the byte offset.
class JsonReader {
public:
    explicit JsonReader(const std::string& source) : text(source) {}

    JsonValue readDocument() {
        JsonValue root = readValue();
        skipSpace();
        if (pos != text.size()) fail("trailing content after JSON document");
        return root;
    }

private:
    const std::string& text;
    size_t pos = 0;
    size_t depth = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw Axon::SerializationException("JSON " + what + " at offset " + std::to_string(pos));
    }

    void skipSpace() {
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
            ++pos;
        }
    }

    bool atEnd() const { return pos >= text.size(); }

    char next() {
        if (atEnd()) fail("input ends unexpectedly");
        return text[pos++];
    }

    // Skips whitespace, then consumes `c` if it is the next character.
    bool consume(char c) {
        skipSpace();
        if (!atEnd() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    void require(char c) {
        if (!consume(c)) fail(std::string("expected '") + c + "'");
    }

    JsonValue readValue() {
        skipSpace();
        if (atEnd()) fail("input ends unexpectedly");

        switch (text[pos]) {
            case '{':
            case '[': {
                if (++depth > kMaxNestingDepth) fail("nesting too deep");
                JsonValue nested = text[pos] == '{' ? readObject() : readArray();
                --depth;
                return nested;
            }
            case '"':
                return JsonValue::string(readString());
            case 't':
                return readLiteral("true", JsonValue::Type::Bool, true);
            case 'f':
                return readLiteral("false", JsonValue::Type::Bool, false);
            case 'n':
                return readLiteral("null", JsonValue::Type::Null, false);
            default:
                return readNumber();
        }
    }

    JsonValue readObject() {
        JsonValue object = JsonValue::object();
        require('{');
        if (consume('}')) return object;
        do {
            skipSpace();
            if (atEnd() || text[pos] != '"') fail("expected object key");
            std::string key = readString();
            require(':');
            object.objectValue[std::move(key)] = readValue();
        } while (consume(','));
        require('}');
        return object;
    }

    JsonValue readArray() {
        JsonValue array = JsonValue::array();
        require('[');
        if (consume(']')) return array;
        do {
            array.arrayValue.push_back(readValue());
        } while (consume(','));
        require(']');
        return array;
    }

    void appendUtf8(unsigned codePoint, std::string& out) {
        if (codePoint < 0x80) {
            out.push_back(static_cast<char>(codePoint));
        } else if (codePoint < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        } else if (codePoint < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
        }
    }

    unsigned readHex4() {
        if (pos + 4 > text.size()) fail("truncated \\u escape");
        const std::string hex = text.substr(pos, 4);
        if (hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) fail("bad \\u escape");
        pos += 4;
        return static_cast<unsigned>(std::strtoul(hex.c_str(), nullptr, 16));
    }

    // A high surrogate must be followed by an escaped low surrogate; lone halves are rejected.
    unsigned readCodePoint() {
        const unsigned unit = readHex4();
        if (unit >= 0xDC00 && unit <= 0xDFFF) fail("unpaired low surrogate");
        if (unit < 0xD800 || unit > 0xDBFF) return unit;

        if (text.compare(pos, 2, "\\u") != 0) fail("unpaired high surrogate");
        pos += 2;
        const unsigned low = readHex4();
        if (low < 0xDC00 || low > 0xDFFF) fail("unpaired high surrogate");
        return 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    }

    std::string readString() {
        ++pos; // opening quote
        std::string out;
        for (char c = next(); c != '"'; c = next()) {
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            const char escaped = next();
            switch (escaped) {
                case '"':
                case '\\':
                case '/': out.push_back(escaped); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': appendUtf8(readCodePoint(), out); break;
                default:
                    fail("unsupported escape");
            }
        }
        return out;
    }

    JsonValue readLiteral(const char* word, JsonValue::Type type, bool flag) {
        const std::string literal(word);
        if (text.compare(pos, literal.size(), literal) != 0) fail("invalid literal");
        pos += literal.size();
        JsonValue value;
        value.type = type;
        value.booleanValue = flag;
        return value;
    }

    bool isDigitAt(size_t at) const {
        return at < text.size() && std::isdigit(static_cast<unsigned char>(text[at])) != 0;
    }

    size_t skipDigits(size_t at) const {
        while (isDigitAt(at)) ++at;
        return at;
    }

    // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    JsonValue readNumber() {
        const size_t start = pos;
        size_t end = pos;
        if (end < text.size() && text[end] == '-') ++end;
        if (!isDigitAt(end)) fail(end == start ? "unexpected character" : "invalid number");
        end = text[end] == '0' ? end + 1 : skipDigits(end);
        if (end < text.size() && text[end] == '.') {
            if (!isDigitAt(end + 1)) fail("invalid number fraction");
            end = skipDigits(end + 1);
        }
        if (end < text.size() && (text[end] == 'e' || text[end] == 'E')) {
            ++end;
            if (end < text.size() && (text[end] == '+' || text[end] == '-')) ++end;
            if (!isDigitAt(end)) fail("invalid number exponent");
            end = skipDigits(end);
        }

        const std::string token = text.substr(start, end - start);
        pos = end;
        return JsonValue::number(std::strtod(token.c_str(), nullptr));
    }
};

bool isScalar(const JsonValue& value) {
    return !value.isArray() && !value.isObject();
}

void dumpValue(const JsonValue& value, int indent, int level, std::ostringstream& out) {
    const bool pretty = indent >= 0;
    auto newline = [&](int lvl) {
        if (!pretty) return;
        out << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
    };

    switch (value.type) {
        case JsonValue::Type::Null:
            out << "null";
            return;
        case JsonValue::Type::Bool:
            out << (value.booleanValue ? "true" : "false");
            return;
        case JsonValue::Type::Number:
            out << formatJsonNumber(value.numberValue);
            return;
        case JsonValue::Type::String:
            out << '"' << escapeJsonString(value.stringValue) << '"';
            return;
        case JsonValue::Type::Array: {
            bool allScalar = true;
            for (const auto& item : value.arrayValue) allScalar = allScalar && isScalar(item);

            out << '[';
            for (size_t i = 0; i < value.arrayValue.size(); ++i) {
                if (i > 0) out << (pretty && allScalar ? ", " : ",");
                if (!allScalar) newline(level + 1);
                dumpValue(value.arrayValue[i], indent, level + 1, out);
            }
            if (!allScalar && !value.arrayValue.empty()) newline(level);
            out << ']';
            return;
        }
        case JsonValue::Type::Object: {
            out << '{';
            bool first = true;
            for (const auto& kv : value.objectValue) {
                if (!first) out << ',';
                first = false;
                newline(level + 1);
                out << '"' << escapeJsonString(kv.first) << "\":" << (pretty ? " " : "");
                dumpValue(kv.second, indent, level + 1, out);
            }
            if (!value.objectValue.empty()) newline(level);
            out << '}';
            return;
        }
    }
}
} // namespace

JsonValue JsonValue::number(double value) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = value;
    return out;
}

JsonValue JsonValue::string(std::string value) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(value);
    return out;
}

JsonValue JsonValue::array(std::vector<JsonValue> items) {
    JsonValue out;
    out.type = Type::Array;
    out.arrayValue = std::move(items);
    return out;
}

JsonValue JsonValue::object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

JsonValue JsonValue::numberArray(const std::vector<double>& values) {
    JsonValue out = array();
    out.arrayValue.reserve(values.size());
    for (double v : values) out.arrayValue.push_back(number(v));
    return out;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    auto it = objectValue.find(key);
    if (it == objectValue.end()) return nullptr;
    return &it->second;
}

void JsonValue::set(const std::string& key, JsonValue value) {
    type = Type::Object;
    objectValue[key] = std::move(value);
}

std::string JsonValue::dump(int indent) const {
    std::ostringstream out;
    dumpValue(*this, indent, 0, out);
    return out.str();
}

JsonValue parseJsonText(const std::string& text) {
    JsonReader reader(text);
    return reader.readDocument();
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u00" << std::hex << std::setw(2) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

std::string formatJsonNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(kRoundTripDigits) << value;
    return out.str();
}

std::vector<double> jsonToNumberVector(const JsonValue& value, const std::string& label) {
    if (!value.isArray()) {
        throw Axon::SerializationException(label + " must be a numeric array");
    }

    std::vector<double> out;
    out.reserve(value.arrayValue.size());
    for (const auto& item : value.arrayValue) {
        if (!item.isNumber() || !std::isfinite(item.numberValue)) {
            throw Axon::SerializationException(label + " must contain finite numbers only");
        }
        out.push_back(item.numberValue);
    }
    return out;
}
