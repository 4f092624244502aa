#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// This module does not infer semantic types.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
    size_t maxColumns = 20000;
    size_t maxPhysicalLinesPerRecord = 10000;
};

struct Record {
    std::vector<std::string> fields;
    bool malformed = false;
    bool limitExceeded = false;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record, honouring quoted delimiters and embedded newlines.
 * @post Returns a record with no fields for blank lines and at end of stream.
 */
Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});

/**
 * @brief Picks the most plausible delimiter among ',', '\t', ';' and '|' from a header line.
 */
char detectDelimiter(const std::string& headerLine);

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
