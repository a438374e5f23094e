#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Numeric CSV loading for training data. Every cell must parse as a number.
struct NumericDataset {
	std::vector<std::string> header;
	std::vector<std::vector<double>> features;
	std::vector<std::vector<double>> targets;

	size_t rows() const noexcept { return features.size(); }
};

// Consumes a leading UTF-8 byte order mark, if present.
void skipBOM(std::istream& is);

// Reads one record; quoted fields may span lines. Returns {} at end of input or on a blank line.
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Splits each row into features and the trailing `targetColumns` values.
 * A first row with any non-numeric field is treated as the header.
 * @throws Axon::DatasetException on ragged rows, non-numeric cells, unterminated
 * quotes, no data rows, or fewer columns than targetColumns + 1.
 */
NumericDataset readNumericDataset(std::istream& is, char delimiter, size_t targetColumns);

// @throws Axon::IOException when the file cannot be opened.
NumericDataset loadNumericDataset(const std::string& path, char delimiter, size_t targetColumns);
}
