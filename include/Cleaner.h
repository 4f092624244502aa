#pragma once
#include "TabularDataset.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @brief Decides what happens to rows that still contain a missing cell after
 * fully-empty rows and columns have been swept.
 */
class MissingRowPolicy {
public:
    virtual ~MissingRowPolicy() = default;
    virtual std::string name() const = 0;
    virtual void apply(TabularDataset& data) const = 0;
    // Whether fully-empty rows/columns must be swept again after apply().
    virtual bool needsResweep() const { return true; }
};

// Default: any row with at least one missing cell is dropped.
class DropRowsWithAnyMissing : public MissingRowPolicy {
public:
    std::string name() const override { return "drop_any"; }
    void apply(TabularDataset& data) const override;
    bool needsResweep() const override { return false; }
};

// Rows are retained as-is; downstream stages skip missing cells.
class KeepPartialRows : public MissingRowPolicy {
public:
    std::string name() const override { return "keep_partial"; }
    void apply(TabularDataset&) const override {}
};

// Fills gaps: median for numeric and datetime columns, most frequent value for text.
class ImputeMissing : public MissingRowPolicy {
public:
    std::string name() const override { return "impute"; }
    void apply(TabularDataset& data) const override;
};

/**
 * @throws DataFlow::ConfigurationException for an unknown policy name.
 */
std::shared_ptr<const MissingRowPolicy> makeMissingRowPolicy(const std::string& name);

struct CleaningPolicy {
    // Dropped when present, silently ignored otherwise.
    std::vector<std::string> columnsToRemove;
    bool dropFullyEmptyRows = true;
    bool dropFullyEmptyColumns = true;
    // Null means DropRowsWithAnyMissing.
    std::shared_ptr<const MissingRowPolicy> missingRowPolicy;
};

struct CleaningReport {
    size_t rowsIn = 0;
    size_t colsIn = 0;
    size_t emptyRowsDropped = 0;
    size_t emptyColumnsDropped = 0;
    size_t partialRowsDropped = 0;
    std::vector<std::string> removedColumns;
};

class Cleaner {
public:
    explicit Cleaner(CleaningPolicy policy = CleaningPolicy{});

    /**
     * @brief Applies, in order: drop fully-empty rows, drop fully-empty columns, treat
     * blank strings as missing, apply the missing-row policy, drop requested columns.
     * @post With the default policy no cell of the result is missing. Zero rows is a valid result.
     */
    TabularDataset clean(TabularDataset data, CleaningReport* report = nullptr) const;

    const CleaningPolicy& policy() const noexcept { return policy_; }

private:
    static size_t dropFullyEmptyRows(TabularDataset& data);
    static size_t dropFullyEmptyColumns(TabularDataset& data);
    static void markBlankStringsMissing(TabularDataset& data);

    CleaningPolicy policy_;
};
