#include "PivotBuilder.h"
#include "DataFlowExceptions.h"

#include <algorithm>
#include <initializer_list>
#include <unordered_map>

namespace {
struct DistinctValues {
    std::vector<std::string> labels;
    std::unordered_map<std::string, size_t> position;
};

// Distinct present labels of a column in ascending value order.
DistinctValues sortedDistinct(const TabularDataset& data, size_t col, const MissingMask& usable) {
    const TypedColumn& column = data.columns()[col];
    struct Entry {
        std::string label;
        double number = 0.0;
        int64_t stamp = 0;
    };
    std::vector<Entry> entries;
    std::unordered_map<std::string, size_t> seen;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!usable[r]) continue;
        std::string label = data.cellText(col, r);
        if (seen.count(label)) continue;
        seen.emplace(label, entries.size());
        Entry e;
        e.label = std::move(label);
        if (column.kind == ColumnKind::NUMERIC) e.number = std::get<std::vector<double>>(column.values)[r];
        if (column.kind == ColumnKind::DATETIME) e.stamp = std::get<std::vector<int64_t>>(column.values)[r];
        entries.push_back(std::move(e));
    }

    std::stable_sort(entries.begin(), entries.end(), [&](const Entry& a, const Entry& b) {
        if (column.kind == ColumnKind::NUMERIC) return a.number < b.number;
        if (column.kind == ColumnKind::DATETIME) return a.stamp < b.stamp;
        return a.label < b.label;
    });

    DistinctValues out;
    for (auto& e : entries) {
        out.position.emplace(e.label, out.labels.size());
        out.labels.push_back(std::move(e.label));
    }
    return out;
}

MissingMask usableRows(const TabularDataset& data, std::initializer_list<size_t> cols) {
    MissingMask usable(data.rowCount(), static_cast<uint8_t>(1));
    for (size_t c : cols) {
        for (size_t r = 0; r < usable.size(); ++r) {
            if (data.isMissing(c, r)) usable[r] = static_cast<uint8_t>(0);
        }
    }
    return usable;
}

size_t requireColumn(const TabularDataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) throw DataFlow::DatasetException("Relationship column '" + name + "' not found");
    return static_cast<size_t>(idx);
}
} // namespace

int64_t PivotTable::total() const {
    int64_t sum = 0;
    for (const auto& row : counts) {
        for (int64_t v : row) sum += v;
    }
    return sum;
}

std::vector<PivotRecord> PivotTable::records() const {
    std::vector<PivotRecord> out;
    out.reserve(indexLabels.size());
    for (size_t i = 0; i < indexLabels.size(); ++i) {
        PivotRecord rec;
        rec.index = indexLabels[i];
        rec.values.reserve(headers.size());
        for (size_t h = 0; h < headers.size(); ++h) rec.values.emplace_back(headers[h], counts[i][h]);
        out.push_back(std::move(rec));
    }
    return out;
}

PivotTable PivotBuilder::build(const TabularDataset& data, const Relationship& relationship) {
    if (relationship.columns.empty() || relationship.columns.size() > 2) {
        throw DataFlow::DatasetException("A relationship needs one or two columns");
    }
    if (relationship.isPair()) {
        return crossTab(data, requireColumn(data, relationship.columns[0]), requireColumn(data, relationship.columns[1]));
    }
    return frequency(data, requireColumn(data, relationship.columns[0]));
}

PivotTable PivotBuilder::crossTab(const TabularDataset& data, size_t rowCol, size_t colCol) {
    const MissingMask usable = usableRows(data, {rowCol, colCol});
    const DistinctValues rows = sortedDistinct(data, rowCol, usable);
    const DistinctValues cols = sortedDistinct(data, colCol, usable);

    PivotTable pivot;
    pivot.indexColumn = data.columns()[rowCol].name;
    pivot.columnAxis = data.columns()[colCol].name;
    pivot.title = pivot.indexColumn + " vs " + pivot.columnAxis;
    pivot.indexLabels = rows.labels;
    pivot.headers = cols.labels;
    pivot.counts.assign(rows.labels.size(), std::vector<int64_t>(cols.labels.size(), 0));

    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!usable[r]) continue;
        const size_t i = rows.position.at(data.cellText(rowCol, r));
        const size_t j = cols.position.at(data.cellText(colCol, r));
        ++pivot.counts[i][j];
    }
    return pivot;
}

PivotTable PivotBuilder::frequency(const TabularDataset& data, size_t col) {
    const MissingMask usable = usableRows(data, {col});

    std::vector<std::string> order;
    std::unordered_map<std::string, int64_t> counts;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!usable[r]) continue;
        std::string label = data.cellText(col, r);
        auto it = counts.find(label);
        if (it == counts.end()) {
            counts.emplace(label, 1);
            order.push_back(std::move(label));
        } else {
            ++it->second;
        }
    }
    std::stable_sort(order.begin(), order.end(), [&](const std::string& a, const std::string& b) {
        return counts.at(a) > counts.at(b);
    });

    PivotTable pivot;
    pivot.indexColumn = data.columns()[col].name;
    pivot.title = pivot.indexColumn + " Frequency";
    pivot.headers = {"Count"};
    pivot.indexLabels = order;
    for (const auto& label : order) pivot.counts.push_back({counts.at(label)});
    return pivot;
}
