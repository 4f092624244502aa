#include "Workbook.h"
#include "DataFlowExceptions.h"

void Worksheet::setCell(int row, int col, CellValue value, CellStyle style) {
    if (row < 1 || col < 1) {
        throw DataFlow::WorkbookException("Cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                          ") is outside sheet '" + name_ + "'");
    }
    rows_[row][col] = Cell{std::move(value), style};
}

const Cell* Worksheet::cell(int row, int col) const {
    auto r = rows_.find(row);
    if (r == rows_.end()) return nullptr;
    auto c = r->second.find(col);
    return c == r->second.end() ? nullptr : &c->second;
}

int Worksheet::appendRow(const std::vector<CellValue>& values, CellStyle style) {
    const int row = maxRow() + 1;
    auto& target = rows_[row];
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::holds_alternative<std::monostate>(values[i])) continue;
        const CellStyle cellStyle = std::holds_alternative<DateTimeCell>(values[i]) ? CellStyle::DATETIME : style;
        target[static_cast<int>(i) + 1] = Cell{values[i], cellStyle};
    }
    return row;
}

void Worksheet::merge(const MergeRange& range) {
    if (range.firstRow < 1 || range.firstCol < 1 || range.lastRow < range.firstRow || range.lastCol < range.firstCol) {
        throw DataFlow::WorkbookException("Invalid merge range on sheet '" + name_ + "'");
    }
    merges_.push_back(range);
}

void Worksheet::addImage(SheetImage image) {
    if (image.row < 1 || image.col < 1) {
        throw DataFlow::WorkbookException("Image anchor is outside sheet '" + name_ + "'");
    }
    images_.push_back(std::move(image));
}

std::string Worksheet::columnLetters(int col) {
    std::string out;
    while (col > 0) {
        const int rem = (col - 1) % 26;
        out.insert(out.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return out;
}

std::string Worksheet::cellRef(int row, int col) {
    return columnLetters(col) + std::to_string(row);
}

Worksheet& Workbook::addSheet(const std::string& name) {
    if (name.empty() || name.size() > 31 || name.find_first_of("[]:*?/\\") != std::string::npos) {
        throw DataFlow::WorkbookException("Invalid sheet name '" + name + "'");
    }
    if (find(name)) throw DataFlow::WorkbookException("Duplicate sheet name '" + name + "'");
    sheets_.emplace_back(name);
    return sheets_.back();
}

std::vector<std::string> Workbook::sheetNames() const {
    std::vector<std::string> out;
    out.reserve(sheets_.size());
    for (const auto& s : sheets_) out.push_back(s.name());
    return out;
}

const Worksheet* Workbook::find(const std::string& name) const {
    for (const auto& s : sheets_) {
        if (s.name() == name) return &s;
    }
    return nullptr;
}
