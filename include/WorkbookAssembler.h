#pragma once
#include "ChartRenderer.h"
#include "PivotBuilder.h"
#include "TabularDataset.h"
#include "Workbook.h"

#include <utility>
#include <vector>

struct DashboardLayout {
    int baseRow = 5;
    int baseCol = 2;
    int rowSpacing = 25;
    int colSpacing = 10;
    int imageWidthPx = 600;
    int imageHeightPx = 400;
};

class WorkbookAssembler {
public:
    static constexpr const char* kCleanedSheet = "CleanedData";
    static constexpr const char* kPivotSheet = "PivotTables";
    static constexpr const char* kDashboardSheet = "Dashboard";

    explicit WorkbookAssembler(DashboardLayout layout = DashboardLayout{}) : layout_(layout) {}

    /**
     * @brief Builds the cleaned-data and pivot sheets, plus the dashboard sheet when
     * includeDashboard is set.
     * @details Only charts holding an image are placed; they take consecutive anchors.
     */
    Workbook assemble(const TabularDataset& cleaned,
                      const std::vector<PivotTable>& pivots,
                      const std::vector<ChartSpec>& charts,
                      bool includeDashboard) const;

    // 1-based (row, column) of the n-th placed chart, two per row.
    std::pair<int, int> anchorFor(size_t position) const noexcept;

    static void writeCleanedSheet(Worksheet& sheet, const TabularDataset& cleaned);
    static void writePivotSheet(Worksheet& sheet, const std::vector<PivotTable>& pivots);
    void writeDashboardSheet(Worksheet& sheet, const std::vector<ChartSpec>& charts) const;

private:
    DashboardLayout layout_;
};
