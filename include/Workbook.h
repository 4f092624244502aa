#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <variant>
#include <vector>

// Style ids match the cellXfs order written by XlsxWriter.
enum class CellStyle : int { DEFAULT = 0, BOLD = 1, TITLE = 2, DATETIME = 3 };

struct DateTimeCell {
    int64_t unixSeconds = 0;
};

using CellValue = std::variant<std::monostate, std::string, double, int64_t, DateTimeCell>;

struct Cell {
    CellValue value;
    CellStyle style = CellStyle::DEFAULT;
};

// 1-based, inclusive.
struct MergeRange {
    int firstRow = 1;
    int firstCol = 1;
    int lastRow = 1;
    int lastCol = 1;
};

struct SheetImage {
    // 1-based top-left cell.
    int row = 1;
    int col = 1;
    int widthPx = 600;
    int heightPx = 400;
    std::vector<uint8_t> png;
    std::string name;
};

class Worksheet {
public:
    explicit Worksheet(std::string name) : name_(std::move(name)) {}

    const std::string& name() const noexcept { return name_; }

    /**
     * @throws DataFlow::WorkbookException for a row or column below 1.
     */
    void setCell(int row, int col, CellValue value, CellStyle style = CellStyle::DEFAULT);
    const Cell* cell(int row, int col) const;

    // Writes values into the row after the last used one, starting at column A.
    int appendRow(const std::vector<CellValue>& values, CellStyle style = CellStyle::DEFAULT);

    void merge(const MergeRange& range);
    void addImage(SheetImage image);
    void setShowGridLines(bool show) noexcept { showGridLines_ = show; }

    bool showGridLines() const noexcept { return showGridLines_; }
    const std::map<int, std::map<int, Cell>>& rows() const noexcept { return rows_; }
    const std::vector<MergeRange>& merges() const noexcept { return merges_; }
    const std::vector<SheetImage>& images() const noexcept { return images_; }
    int maxRow() const noexcept { return rows_.empty() ? 0 : rows_.rbegin()->first; }

    // 1 -> "A", 27 -> "AA".
    static std::string columnLetters(int col);
    static std::string cellRef(int row, int col);

private:
    std::string name_;
    std::map<int, std::map<int, Cell>> rows_;
    std::vector<MergeRange> merges_;
    std::vector<SheetImage> images_;
    bool showGridLines_ = true;
};

class Workbook {
public:
    /**
     * @throws DataFlow::WorkbookException for an empty, over-long (>31), duplicate or
     * otherwise invalid sheet name.
     */
    Worksheet& addSheet(const std::string& name);

    const std::deque<Worksheet>& sheets() const noexcept { return sheets_; }
    std::vector<std::string> sheetNames() const;
    const Worksheet* find(const std::string& name) const;

private:
    std::deque<Worksheet> sheets_;
};
