#pragma once
#include "RelationshipDiscoverer.h"
#include "TabularDataset.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct PivotRecord {
    std::string index;
    // Header -> count, in header order.
    std::vector<std::pair<std::string, int64_t>> values;
};

/**
 * @brief Canonical summary of one relationship. The workbook sheet and the nested
 * record list are both views of this structure.
 * @invariant counts has indexLabels.size() rows of headers.size() non-negative cells.
 */
struct PivotTable {
    std::string title;
    std::string indexColumn;
    // Name of the column spread across the headers; empty for frequency tables.
    std::string columnAxis;
    std::vector<std::string> headers;
    std::vector<std::string> indexLabels;
    std::vector<std::vector<int64_t>> counts;

    int64_t total() const;
    std::vector<PivotRecord> records() const;
};

class PivotBuilder {
public:
    /**
     * @brief Cross-tab for a pair, value frequency ("Count") for a single column.
     * @details Rows with a missing value in a summarized column are not counted.
     * @throws DataFlow::DatasetException when a relationship names an absent column.
     */
    static PivotTable build(const TabularDataset& data, const Relationship& relationship);

    static PivotTable crossTab(const TabularDataset& data, size_t rowCol, size_t colCol);
    static PivotTable frequency(const TabularDataset& data, size_t col);
};
