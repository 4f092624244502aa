#pragma once
#include "BundleValue.h"
#include "ChartRenderer.h"
#include "PivotBuilder.h"
#include "RelationshipDiscoverer.h"
#include "TabularDataset.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Everything one request produced. Built once by the pipeline and not modified afterwards.
 */
struct ResultBundle {
    TabularDataset cleaned;
    std::vector<ColumnProfile> profiles;
    std::vector<PivotTable> pivots;
    std::vector<ChartSpec> charts;
    bool hasDashboard = false;
    std::vector<std::string> sheetNames;
    std::vector<uint8_t> workbook;
    std::string fileName;
    int requestedRelations = 1;
    size_t generatedRelations = 0;
    std::string description;
};

class BundleSerializer {
public:
    /**
     * @brief Builds the JSON-safe bundle tree: cleaned_data, pivot_tables, has_dashboard, sheets,
     * file_content_base64, file_name, requested_relations, generated_relations, description,
     * file_sha1, file_size, column_profiles and, when a dashboard exists, charts.
     */
    static BundleValue toBundleValue(const ResultBundle& bundle);

    static std::string toJson(const ResultBundle& bundle, int indent = -1);

    // Replaces every DateTime in a nested tree by its ISO text.
    static BundleValue makeJsonSafe(const BundleValue& value);

    // One object per row, keyed by column name; missing cells are null.
    static BundleValue cleanedRecords(const TabularDataset& cleaned);
    static BundleValue pivotTableValue(const PivotTable& pivot);
    static BundleValue chartValue(const ChartSpec& chart);

    /**
     * @brief Recovers the workbook bytes from a serialized bundle and checks they form an XLSX package.
     * @throws DataFlow::WorkbookException when the field is absent, not valid base64, not a readable
     * ZIP archive, or lacks the workbook parts.
     */
    static std::vector<uint8_t> decodeWorkbook(const BundleValue& bundle);
};
