#include "RelationshipDiscoverer.h"
#include "CommonUtils.h"
#include "DataFlowExceptions.h"

#include <algorithm>
#include <type_traits>
#include <unordered_set>
#include <variant>

const char* columnRoleName(ColumnRole role) noexcept {
    switch (role) {
        case ColumnRole::CATEGORICAL: return "categorical";
        case ColumnRole::NUMERIC: return "numeric";
        case ColumnRole::DATETIME_LIKE: return "datetime_like";
        case ColumnRole::UNKNOWN: break;
    }
    return "unknown";
}

std::string Relationship::title() const {
    if (isPair()) return columns[0] + " vs " + columns[1];
    return columns.empty() ? std::string() : columns[0] + " Frequency";
}

ColumnProfile RelationshipDiscoverer::profileColumn(const TypedColumn& column) {
    ColumnProfile p;
    p.name = column.name;
    p.kind = column.kind;
    const bool nameHint = CommonUtils::containsInsensitive(column.name, "date") ||
                          CommonUtils::containsInsensitive(column.name, "time");
    p.datetimeLike = (column.kind == ColumnKind::DATETIME) || nameHint;

    switch (column.kind) {
        case ColumnKind::TEXT: p.role = ColumnRole::CATEGORICAL; break;
        case ColumnKind::NUMERIC: p.role = ColumnRole::NUMERIC; break;
        case ColumnKind::DATETIME: p.role = ColumnRole::DATETIME_LIKE; break;
        case ColumnKind::UNKNOWN: p.role = nameHint ? ColumnRole::DATETIME_LIKE : ColumnRole::UNKNOWN; break;
    }

    std::visit([&](const auto& values) {
        using T = typename std::decay_t<decltype(values)>::value_type;
        std::unordered_set<T> seen;
        for (size_t r = 0; r < values.size(); ++r) {
            if (!column.missing[r]) seen.insert(values[r]);
        }
        p.distinctCount = seen.size();
    }, column.values);
    return p;
}

std::vector<ColumnProfile> RelationshipDiscoverer::profile(const TabularDataset& data) {
    std::vector<ColumnProfile> out;
    out.reserve(data.colCount());
    for (const auto& col : data.columns()) out.push_back(profileColumn(col));
    return out;
}

std::vector<Relationship> RelationshipDiscoverer::discover(const TabularDataset& data, int requested) {
    const size_t limit = static_cast<size_t>(std::max(1, requested));
    const std::vector<ColumnProfile> profiles = profile(data);

    std::vector<const ColumnProfile*> categorical;
    for (const auto& p : profiles) {
        if (p.role == ColumnRole::CATEGORICAL) categorical.push_back(&p);
    }
    std::stable_sort(categorical.begin(), categorical.end(), [](const ColumnProfile* a, const ColumnProfile* b) {
        return a->distinctCount > b->distinctCount;
    });

    std::vector<Relationship> out;
    if (categorical.size() >= 2) {
        for (size_t i = 0; i < categorical.size() && out.size() < limit; ++i) {
            for (size_t j = i + 1; j < categorical.size() && out.size() < limit; ++j) {
                out.push_back(Relationship{{categorical[i]->name, categorical[j]->name}});
            }
        }
        return out;
    }
    if (categorical.size() == 1) {
        out.push_back(Relationship{{categorical.front()->name}});
        return out;
    }
    for (const auto& p : profiles) {
        if (p.role == ColumnRole::NUMERIC) {
            out.push_back(Relationship{{p.name}});
            return out;
        }
    }
    throw DataFlow::NoUsableColumnsException("no categorical or numeric column to build relationships from");
}
