#pragma once
#include "TabularDataset.h"

#include <string>
#include <vector>

enum class ColumnRole { CATEGORICAL, NUMERIC, DATETIME_LIKE, UNKNOWN };

const char* columnRoleName(ColumnRole role) noexcept;

struct ColumnProfile {
    std::string name;
    ColumnKind kind = ColumnKind::UNKNOWN;
    ColumnRole role = ColumnRole::UNKNOWN;
    // Declared datetime kind, or "date"/"time" anywhere in the name (case-insensitive).
    bool datetimeLike = false;
    size_t distinctCount = 0;
};

struct Relationship {
    // One column for a frequency table, two for a cross-tabulation.
    std::vector<std::string> columns;

    bool isPair() const noexcept { return columns.size() == 2; }
    std::string title() const;
};

class RelationshipDiscoverer {
public:
    static ColumnProfile profileColumn(const TypedColumn& column);
    static std::vector<ColumnProfile> profile(const TabularDataset& data);

    /**
     * @brief Selects the relationships to summarize.
     * @details Two or more categorical columns: ranked by descending distinct count (ties keep
     * column order), all 2-combinations in ranked order, first max(1, requested). Exactly one
     * categorical column: its frequency table. Otherwise the first numeric column's frequency table.
     * @throws DataFlow::NoUsableColumnsException when there is neither a categorical nor a numeric column.
     */
    static std::vector<Relationship> discover(const TabularDataset& data, int requested);
};
