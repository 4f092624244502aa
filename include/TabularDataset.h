#pragma once
#include "DateTimeUtils.h"

#include <cstdint>
#include <istream>
#include <string>
#include <variant>
#include <vector>

// Declared once per column at load time and never re-derived.
enum class ColumnKind { NUMERIC, TEXT, DATETIME, UNKNOWN };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnKind kind = ColumnKind::UNKNOWN;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;
    // Numeric columns whose present values are all whole numbers render without a fraction.
    bool integral = false;
};

const char* columnKindName(ColumnKind kind) noexcept;

class TabularDataset {
public:
    TabularDataset() = default;
    explicit TabularDataset(std::string filename, char delimiter = ',');

    void setDateLocaleHint(DateTimeUtils::DateLocaleHint hint) noexcept { dateLocaleHint_ = hint; }

    /**
     * @brief Loads the file given at construction and infers per-column kinds.
     * @throws DataFlow::IOException when the file cannot be opened.
     * @throws DataFlow::DatasetException on a malformed or empty header.
     */
    void load();

    /**
     * @brief Same as load() but reads from an already open stream.
     * @throws DataFlow::DatasetException on a malformed header, an unterminated quoted field, a row with
     * more fields than the header, or any header or cell that is not valid UTF-8.
     * @post columns() holds aligned typed vectors and missing masks.
     */
    void loadFromStream(std::istream& in);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    /**
     * @brief Appends a fully built column.
     * @throws DataFlow::DatasetException when its length differs from the existing row count.
     */
    void appendColumn(TypedColumn column);

    int findColumnIndex(const std::string& name) const;

    bool isMissing(size_t col, size_t row) const { return columns_[col].missing[row] != 0; }

    /**
     * @brief String form of a present cell: whole numbers without a fraction, datetimes as ISO text.
     */
    std::string cellText(size_t col, size_t row) const;

    /**
     * @brief Removes rows where keepMask is false across all columns.
     * @throws DataFlow::DatasetException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

    void removeColumn(size_t index);

    static std::string formatNumber(double value, bool integral);

private:
    std::string filename_;
    char delimiter_ = ',';
    DateTimeUtils::DateLocaleHint dateLocaleHint_ = DateTimeUtils::DateLocaleHint::AUTO;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
