#include "CSVUtils.h"

#include "AxonExceptions.h"
#include "CommonUtils.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <unordered_set>

namespace {
bool parseNumericCell(const std::string& cell, double& out) {
    if (cell.empty()) return false;
    char* end = nullptr;
    const double parsed = std::strtod(cell.c_str(), &end);
    if (end != cell.c_str() + cell.size() || !std::isfinite(parsed)) return false;
    out = parsed;
    return true;
}

bool isNumericRow(const std::vector<std::string>& row) {
    double ignored = 0.0;
    for (const auto& cell : row) {
        if (!parseNumericCell(cell, ignored)) return false;
    }
    return true;
}
} // namespace

namespace CSVUtils {
void skipBOM(std::istream& is) {
    static const char kUtf8Bom[3] = {'\xEF', '\xBB', '\xBF'};
    const std::streampos start = is.tellg();
    char head[3] = {};
    if (!is.read(head, 3) || std::memcmp(head, kUtf8Bom, 3) != 0) {
        is.clear();
        is.seekg(start);
    }
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : CommonUtils::trim(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else {
                val += c;
            }
            continue;
        }

        if (c == '"' && CommonUtils::trim(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawContent = true;
        } else if (c == delimiter) {
            pushField();
            sawContent = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
            sawContent = true;
        }
    }

    if (inQuotes && malformed) {
        *malformed = true;
    }
    if (!sawContent && CommonUtils::trim(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}

NumericDataset readNumericDataset(std::istream& is, char delimiter, size_t targetColumns) {
    if (targetColumns == 0) {
        throw Axon::DatasetException("At least one target column is required");
    }

    skipBOM(is);

    NumericDataset dataset;
    size_t expectedColumns = 0;
    size_t record = 0;
    bool firstRecord = true;

    while (is.peek() != EOF) {
        bool malformed = false;
        std::vector<std::string> row = parseCSVLine(is, delimiter, &malformed);
        ++record;
        if (malformed) {
            throw Axon::DatasetException("Unterminated quoted field in record " + std::to_string(record));
        }
        if (row.empty()) continue;

        if (firstRecord) {
            firstRecord = false;
            expectedColumns = row.size();
            if (expectedColumns <= targetColumns) {
                throw Axon::DatasetException("Dataset has " + std::to_string(expectedColumns) +
                                             " columns; need more than " + std::to_string(targetColumns));
            }
            if (!isNumericRow(row)) {
                dataset.header = normalizeHeader(row);
                continue;
            }
        }

        if (row.size() != expectedColumns) {
            throw Axon::DatasetException("Record " + std::to_string(record) + " has " + std::to_string(row.size()) +
                                         " fields, expected " + std::to_string(expectedColumns));
        }

        const size_t featureCount = expectedColumns - targetColumns;
        std::vector<double> features(featureCount);
        std::vector<double> targets(targetColumns);
        for (size_t col = 0; col < row.size(); ++col) {
            double value = 0.0;
            if (!parseNumericCell(row[col], value)) {
                throw Axon::DatasetException("Non-numeric value '" + row[col] + "' in record " +
                                             std::to_string(record) + ", column " + std::to_string(col + 1));
            }
            if (col < featureCount) {
                features[col] = value;
            } else {
                targets[col - featureCount] = value;
            }
        }
        dataset.features.push_back(std::move(features));
        dataset.targets.push_back(std::move(targets));
    }

    if (dataset.features.empty()) {
        throw Axon::DatasetException("Dataset contains no data rows");
    }
    return dataset;
}

NumericDataset loadNumericDataset(const std::string& path, char delimiter, size_t targetColumns) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Axon::IOException("Could not open dataset " + path);
    }
    return readNumericDataset(in, delimiter, targetColumns);
}
} // namespace CSVUtils
