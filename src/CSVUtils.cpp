#include "CSVUtils.h"

#include <algorithm>
#include <array>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    static const std::array<unsigned char, 3> kBom = {0xEF, 0xBB, 0xBF};
    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits) {
    Record record;
    if (is.peek() == EOF) return record;

    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    size_t physicalLines = 1;
    char c;

    auto pushField = [&]() {
        record.fields.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && record.fields.size() > limits.maxColumns) {
            record.limitExceeded = true;
        }
    };

    auto appendChar = [&](char ch) {
        val.push_back(ch);
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            record.limitExceeded = true;
        }
    };

    while (!record.limitExceeded && is.get(c)) {
        if (c == '"') {
            sawContent = true;
            if (!inQuotes && trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    appendChar('"');
                } else {
                    const int next = is.peek();
                    if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                        inQuotes = false;
                    } else {
                        appendChar(c);
                    }
                }
            } else {
                appendChar(c);
            }
        } else if (c == delimiter && !inQuotes) {
            sawContent = true;
            pushField();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (!inQuotes) break;
            ++physicalLines;
            if (limits.maxPhysicalLinesPerRecord > 0 && physicalLines > limits.maxPhysicalLinesPerRecord) {
                record.limitExceeded = true;
                break;
            }
            appendChar('\n');
        } else {
            sawContent = true;
            appendChar(c);
        }
    }

    if (inQuotes) record.malformed = true;
    if (!sawContent) return record;

    pushField();
    return record;
}

char detectDelimiter(const std::string& headerLine) {
    static const std::array<char, 4> kCandidates = {',', '\t', ';', '|'};
    char best = ',';
    size_t bestCount = 0;
    for (char candidate : kCandidates) {
        size_t count = 0;
        bool inQuotes = false;
        for (char ch : headerLine) {
            if (ch == '"') inQuotes = !inQuotes;
            else if (!inQuotes && ch == candidate) ++count;
        }
        if (count > bestCount) {
            bestCount = count;
            best = candidate;
        }
    }
    return best;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "Unnamed: " + std::to_string(i);
        }

        const std::string original = out[i];
        if (seen.find(out[i]) != seen.end()) {
            size_t suffix = 1;
            while (seen.find(original + "." + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            out[i] = original + "." + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
