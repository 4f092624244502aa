#include "Cleaner.h"
#include "CommonUtils.h"
#include "DataFlowExceptions.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace {
bool hasMissing(const TypedColumn& col) {
    for (uint8_t m : col.missing) if (m) return true;
    return false;
}

std::string mostFrequent(const std::vector<std::string>& values, const MissingMask& missing) {
    std::unordered_map<std::string, size_t> counts;
    std::string best;
    size_t bestCount = 0;
    for (size_t r = 0; r < values.size(); ++r) {
        if (missing[r]) continue;
        const size_t c = ++counts[values[r]];
        if (c > bestCount) {
            bestCount = c;
            best = values[r];
        }
    }
    return best;
}
} // namespace

void DropRowsWithAnyMissing::apply(TabularDataset& data) const {
    MissingMask keep(data.rowCount(), static_cast<uint8_t>(1));
    for (const auto& col : data.columns()) {
        for (size_t r = 0; r < keep.size(); ++r) {
            if (col.missing[r]) keep[r] = static_cast<uint8_t>(0);
        }
    }
    data.removeRows(keep);
}

void ImputeMissing::apply(TabularDataset& data) const {
    for (auto& col : data.columns()) {
        if (!hasMissing(col)) continue;

        if (col.kind == ColumnKind::NUMERIC) {
            auto& values = std::get<std::vector<double>>(col.values);
            std::vector<double> present;
            for (size_t r = 0; r < values.size(); ++r) if (!col.missing[r]) present.push_back(values[r]);
            if (present.empty()) continue;
            const double fill = CommonUtils::medianByNth(std::move(present));
            if (std::floor(fill) != fill) col.integral = false;
            for (size_t r = 0; r < values.size(); ++r) {
                if (col.missing[r]) values[r] = fill;
            }
        } else if (col.kind == ColumnKind::DATETIME) {
            auto& values = std::get<std::vector<int64_t>>(col.values);
            std::vector<double> present;
            for (size_t r = 0; r < values.size(); ++r) {
                if (!col.missing[r]) present.push_back(static_cast<double>(values[r]));
            }
            if (present.empty()) continue;
            const int64_t fill = static_cast<int64_t>(std::llround(CommonUtils::medianByNth(std::move(present))));
            for (size_t r = 0; r < values.size(); ++r) {
                if (col.missing[r]) values[r] = fill;
            }
        } else if (col.kind == ColumnKind::TEXT) {
            auto& values = std::get<std::vector<std::string>>(col.values);
            const std::string fill = mostFrequent(values, col.missing);
            for (size_t r = 0; r < values.size(); ++r) {
                if (col.missing[r]) values[r] = fill;
            }
        } else {
            continue;
        }
        std::fill(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(0));
    }
}

std::shared_ptr<const MissingRowPolicy> makeMissingRowPolicy(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key.empty() || key == "drop_any") return std::make_shared<DropRowsWithAnyMissing>();
    if (key == "keep_partial") return std::make_shared<KeepPartialRows>();
    if (key == "impute") return std::make_shared<ImputeMissing>();
    throw DataFlow::ConfigurationException("missing_row_policy must be one of drop_any, keep_partial, impute (got '" + name + "')");
}

Cleaner::Cleaner(CleaningPolicy policy) : policy_(std::move(policy)) {
    if (!policy_.missingRowPolicy) policy_.missingRowPolicy = std::make_shared<DropRowsWithAnyMissing>();
}

size_t Cleaner::dropFullyEmptyRows(TabularDataset& data) {
    const size_t rows = data.rowCount();
    if (data.colCount() == 0) return 0;
    MissingMask keep(rows, static_cast<uint8_t>(0));
    for (const auto& col : data.columns()) {
        for (size_t r = 0; r < rows; ++r) {
            if (!col.missing[r]) keep[r] = static_cast<uint8_t>(1);
        }
    }
    data.removeRows(keep);
    return rows - data.rowCount();
}

size_t Cleaner::dropFullyEmptyColumns(TabularDataset& data) {
    size_t dropped = 0;
    for (size_t c = data.colCount(); c-- > 0;) {
        const auto& missing = data.columns()[c].missing;
        bool anyPresent = false;
        for (uint8_t m : missing) {
            if (!m) {
                anyPresent = true;
                break;
            }
        }
        if (!anyPresent) {
            data.removeColumn(c);
            ++dropped;
        }
    }
    return dropped;
}

void Cleaner::markBlankStringsMissing(TabularDataset& data) {
    for (auto& col : data.columns()) {
        auto* values = std::get_if<std::vector<std::string>>(&col.values);
        if (!values) continue;
        for (size_t r = 0; r < values->size(); ++r) {
            if (!col.missing[r] && CommonUtils::trim((*values)[r]).empty()) {
                col.missing[r] = static_cast<uint8_t>(1);
            }
        }
    }
}

TabularDataset Cleaner::clean(TabularDataset data, CleaningReport* report) const {
    CleaningReport local;
    local.rowsIn = data.rowCount();
    local.colsIn = data.colCount();

    if (policy_.dropFullyEmptyRows) local.emptyRowsDropped += dropFullyEmptyRows(data);
    if (policy_.dropFullyEmptyColumns) local.emptyColumnsDropped += dropFullyEmptyColumns(data);

    markBlankStringsMissing(data);

    const size_t beforePolicy = data.rowCount();
    policy_.missingRowPolicy->apply(data);
    local.partialRowsDropped = beforePolicy - data.rowCount();

    if (policy_.missingRowPolicy->needsResweep()) {
        if (policy_.dropFullyEmptyRows) local.emptyRowsDropped += dropFullyEmptyRows(data);
        if (policy_.dropFullyEmptyColumns) local.emptyColumnsDropped += dropFullyEmptyColumns(data);
    }

    for (const auto& name : policy_.columnsToRemove) {
        const int idx = data.findColumnIndex(name);
        if (idx < 0) continue;
        data.removeColumn(static_cast<size_t>(idx));
        local.removedColumns.push_back(name);
    }

    if (report) *report = std::move(local);
    return data;
}
