#include "WorkbookAssembler.h"

std::pair<int, int> WorkbookAssembler::anchorFor(size_t position) const noexcept {
    const int row = layout_.baseRow + static_cast<int>(position / 2) * layout_.rowSpacing;
    const int col = layout_.baseCol + static_cast<int>(position % 2) * layout_.colSpacing;
    return {row, col};
}

void WorkbookAssembler::writeCleanedSheet(Worksheet& sheet, const TabularDataset& cleaned) {
    std::vector<CellValue> header;
    header.reserve(cleaned.colCount());
    for (const auto& col : cleaned.columns()) header.emplace_back(col.name);
    sheet.appendRow(header);

    for (size_t r = 0; r < cleaned.rowCount(); ++r) {
        std::vector<CellValue> row(cleaned.colCount());
        for (size_t c = 0; c < cleaned.colCount(); ++c) {
            const TypedColumn& col = cleaned.columns()[c];
            if (col.missing[r]) continue;
            switch (col.kind) {
                case ColumnKind::NUMERIC: {
                    const double v = std::get<std::vector<double>>(col.values)[r];
                    if (col.integral) row[c] = static_cast<int64_t>(v);
                    else row[c] = v;
                    break;
                }
                case ColumnKind::DATETIME:
                    row[c] = DateTimeCell{std::get<std::vector<int64_t>>(col.values)[r]};
                    break;
                default:
                    row[c] = std::get<std::vector<std::string>>(col.values)[r];
                    break;
            }
        }
        // Keeps fully blank rows (possible under keep_partial) in their place.
        const int target = static_cast<int>(r) + 2;
        for (size_t c = 0; c < row.size(); ++c) {
            if (std::holds_alternative<std::monostate>(row[c])) continue;
            const CellStyle style = std::holds_alternative<DateTimeCell>(row[c]) ? CellStyle::DATETIME : CellStyle::DEFAULT;
            sheet.setCell(target, static_cast<int>(c) + 1, std::move(row[c]), style);
        }
    }
}

void WorkbookAssembler::writePivotSheet(Worksheet& sheet, const std::vector<PivotTable>& pivots) {
    sheet.setCell(1, 1, std::string("All Pivot Tables"), CellStyle::TITLE);

    int row = 3;
    for (const auto& pivot : pivots) {
        const int width = 1 + static_cast<int>(pivot.headers.size());
        if (width > 1) sheet.merge(MergeRange{row, 1, row, width});
        sheet.setCell(row, 1, "Pivot: " + pivot.title, CellStyle::BOLD);
        ++row;

        for (size_t h = 0; h < pivot.headers.size(); ++h) {
            sheet.setCell(row, static_cast<int>(h) + 2, pivot.headers[h]);
        }
        ++row;
        sheet.setCell(row, 1, pivot.indexColumn);
        ++row;

        for (size_t i = 0; i < pivot.indexLabels.size(); ++i) {
            sheet.setCell(row, 1, pivot.indexLabels[i]);
            for (size_t h = 0; h < pivot.headers.size(); ++h) {
                sheet.setCell(row, static_cast<int>(h) + 2, pivot.counts[i][h]);
            }
            ++row;
        }
        row += 2;
    }
}

void WorkbookAssembler::writeDashboardSheet(Worksheet& sheet, const std::vector<ChartSpec>& charts) const {
    sheet.setShowGridLines(false);
    sheet.setCell(2, 2, std::string("Dashboard - Auto Generated"), CellStyle::TITLE);

    size_t placed = 0;
    for (const auto& chart : charts) {
        if (!chart.hasImage()) continue;
        const auto [row, col] = anchorFor(placed++);
        SheetImage image;
        image.row = row;
        image.col = col;
        image.widthPx = layout_.imageWidthPx;
        image.heightPx = layout_.imageHeightPx;
        image.png = *chart.image;
        image.name = chart.chartTitle;
        sheet.addImage(std::move(image));
    }
}

Workbook WorkbookAssembler::assemble(const TabularDataset& cleaned,
                                     const std::vector<PivotTable>& pivots,
                                     const std::vector<ChartSpec>& charts,
                                     bool includeDashboard) const {
    Workbook wb;
    writeCleanedSheet(wb.addSheet(kCleanedSheet), cleaned);
    writePivotSheet(wb.addSheet(kPivotSheet), pivots);
    if (includeDashboard) writeDashboardSheet(wb.addSheet(kDashboardSheet), charts);
    return wb;
}
