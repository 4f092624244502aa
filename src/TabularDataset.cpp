#include "TabularDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "DataFlowExceptions.h"
#include "Encoding.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>

TabularDataset::TabularDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "nan" || s == "none" || s == "#n/a";
}

bool parseNumber(const std::string& raw, double& out) {
    std::string s = CommonUtils::trim(raw);
    if (!s.empty() && s.front() == '+') s.erase(s.begin());
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

void requireUtf8(const std::string& value, const std::string& filename, const std::string& where) {
    const size_t bad = Encoding::findInvalidUtf8(value);
    if (bad == std::string::npos) return;
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned>(static_cast<unsigned char>(value[bad])));
    throw DataFlow::DatasetException("'" + filename + "' is not valid UTF-8: byte " + hex + " at offset " +
                                     std::to_string(bad) + " in " + where);
}

bool isWholeNumber(double v) {
    return std::abs(v) < 9007199254740992.0 && std::floor(v) == v;
}

template <typename T>
void filterByMask(std::vector<T>& values, const MissingMask& keepMask) {
    std::vector<T> next;
    next.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (keepMask[i]) next.push_back(std::move(values[i]));
    }
    values = std::move(next);
}
} // namespace

const char* columnKindName(ColumnKind kind) noexcept {
    switch (kind) {
        case ColumnKind::NUMERIC: return "numeric";
        case ColumnKind::TEXT: return "text";
        case ColumnKind::DATETIME: return "datetime";
        case ColumnKind::UNKNOWN: break;
    }
    return "unknown";
}

void TabularDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw DataFlow::IOException("Could not open file: " + filename_);
    loadFromStream(in);
}

void TabularDataset::loadFromStream(std::istream& in) {
    CSVUtils::skipBOM(in);

    CSVUtils::Record headerRecord;
    while (in.peek() != EOF && headerRecord.fields.empty()) {
        headerRecord = CSVUtils::readRecord(in, delimiter_);
    }
    if (headerRecord.malformed || headerRecord.fields.empty()) {
        throw DataFlow::DatasetException("Malformed or empty header in '" + filename_ + "'");
    }
    for (size_t c = 0; c < headerRecord.fields.size(); ++c) {
        requireUtf8(headerRecord.fields[c], filename_, "header field " + std::to_string(c + 1));
    }
    const std::vector<std::string> header = CSVUtils::normalizeHeader(headerRecord.fields);
    const size_t width = header.size();

    std::vector<std::vector<std::string>> rows;
    while (in.peek() != EOF) {
        CSVUtils::Record record = CSVUtils::readRecord(in, delimiter_);
        const size_t rowNumber = rows.size() + 1;
        if (record.limitExceeded) {
            throw DataFlow::DatasetException("Record exceeds parse limits near data row " + std::to_string(rowNumber));
        }
        if (record.fields.empty()) continue;
        if (record.malformed) {
            throw DataFlow::DatasetException("Unterminated quoted field in data row " + std::to_string(rowNumber) +
                                             " of '" + filename_ + "'");
        }
        if (record.fields.size() > width) {
            throw DataFlow::DatasetException("Expected " + std::to_string(width) + " fields in data row " +
                                             std::to_string(rowNumber) + " of '" + filename_ + "', saw " +
                                             std::to_string(record.fields.size()));
        }
        for (size_t c = 0; c < record.fields.size(); ++c) {
            requireUtf8(record.fields[c], filename_, "data row " + std::to_string(rowNumber) + ", column '" + header[c] + "'");
        }
        record.fields.resize(width);
        rows.push_back(std::move(record.fields));
    }

    rowCount_ = rows.size();
    columns_.clear();
    columns_.reserve(width);

    for (size_t c = 0; c < width; ++c) {
        size_t present = 0;
        size_t numericHits = 0;
        size_t wholeHits = 0;
        size_t datetimeHits = 0;
        for (const auto& row : rows) {
            if (isMissingToken(row[c])) continue;
            ++present;
            double dv = 0.0;
            int64_t ts = 0;
            if (parseNumber(row[c], dv)) {
                ++numericHits;
                if (isWholeNumber(dv)) ++wholeHits;
            } else if (DateTimeUtils::parse(row[c], ts, dateLocaleHint_)) {
                ++datetimeHits;
            }
        }

        TypedColumn col;
        col.name = header[c];
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));

        if (present == 0) {
            col.kind = ColumnKind::UNKNOWN;
        } else if (numericHits == present) {
            col.kind = ColumnKind::NUMERIC;
            col.integral = (wholeHits == present);
        } else if (datetimeHits == present) {
            col.kind = ColumnKind::DATETIME;
        } else {
            col.kind = ColumnKind::TEXT;
        }

        if (col.kind == ColumnKind::NUMERIC) {
            std::vector<double> values(rowCount_, std::numeric_limits<double>::quiet_NaN());
            for (size_t r = 0; r < rowCount_; ++r) {
                if (isMissingToken(rows[r][c]) || !parseNumber(rows[r][c], values[r])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else if (col.kind == ColumnKind::DATETIME) {
            std::vector<int64_t> values(rowCount_, 0);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (isMissingToken(rows[r][c]) || !DateTimeUtils::parse(rows[r][c], values[r], dateLocaleHint_)) {
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else {
            std::vector<std::string> values(rowCount_);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (isMissingToken(rows[r][c])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                } else {
                    values[r] = rows[r][c];
                }
            }
            col.values = std::move(values);
        }
        columns_.push_back(std::move(col));
    }
}

void TabularDataset::appendColumn(TypedColumn column) {
    const size_t length = std::visit([](const auto& values) { return values.size(); }, column.values);
    if (length != column.missing.size()) {
        throw DataFlow::DatasetException("Column '" + column.name + "' has a missing mask of the wrong length");
    }
    if (!columns_.empty() && length != rowCount_) {
        throw DataFlow::DatasetException("Column '" + column.name + "' has " + std::to_string(length) +
                                         " rows, expected " + std::to_string(rowCount_));
    }
    rowCount_ = length;
    columns_.push_back(std::move(column));
}

int TabularDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::string TabularDataset::formatNumber(double value, bool integral) {
    if (integral && isWholeNumber(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    char buf[64];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return std::to_string(value);
    std::string out(buf, p);
    if (out.find_first_of(".eE") == std::string::npos && std::isfinite(value)) out += ".0";
    return out;
}

std::string TabularDataset::cellText(size_t col, size_t row) const {
    const TypedColumn& column = columns_[col];
    if (column.missing[row]) return "";
    switch (column.kind) {
        case ColumnKind::NUMERIC:
            return formatNumber(std::get<std::vector<double>>(column.values)[row], column.integral);
        case ColumnKind::DATETIME:
            return DateTimeUtils::toIsoString(std::get<std::vector<int64_t>>(column.values)[row]);
        default:
            return std::get<std::vector<std::string>>(column.values)[row];
    }
}

void TabularDataset::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw DataFlow::DatasetException("Row mask size mismatch");

    for (auto& col : columns_) {
        std::visit([&](auto& values) { filterByMask(values, keepMask); }, col.values);
        filterByMask(col.missing, keepMask);
    }

    rowCount_ = static_cast<size_t>(std::count(keepMask.begin(), keepMask.end(), static_cast<uint8_t>(1)));
}

void TabularDataset::removeColumn(size_t index) {
    if (index >= columns_.size()) throw DataFlow::DatasetException("Column index out of range");
    columns_.erase(columns_.begin() + static_cast<std::ptrdiff_t>(index));
}
