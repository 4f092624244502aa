#include <gtest/gtest.h>

#include "Cleaner.h"
#include "DataFlowExceptions.h"
#include "test_helpers.h"

#include <random>

namespace {
bool anyMissing(const TabularDataset& data) {
    for (size_t c = 0; c < data.colCount(); ++c) {
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (data.isMissing(c, r)) return true;
        }
    }
    return false;
}

std::string randomSparseCsv(std::mt19937& rng, size_t rows, size_t cols, double fill) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> pick(0, 3);
    static const char* kWords[] = {"alpha", "beta", "gamma", "delta"};

    std::string csv;
    for (size_t c = 0; c < cols; ++c) csv += (c ? "," : "") + std::string("c") + std::to_string(c);
    csv += "\n";
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            if (c) csv += ",";
            if (coin(rng) >= fill) continue;
            if (c % 2 == 0) csv += std::to_string(pick(rng));
            else csv += kWords[pick(rng)];
        }
        csv += "\n";
    }
    return csv;
}
} // namespace

// ============================================================================
// Default policy
// ============================================================================

TEST(CleanerTest, DefaultPolicyLeavesNoMissingCells) {
    TabularDataset raw = datasetFromCsv("id,name,score,empty\n1,a,2,\n,,,\n2,,3,\n3,c,4,\n");
    CleaningReport report;
    TabularDataset cleaned = Cleaner().clean(std::move(raw), &report);

    EXPECT_EQ(report.rowsIn, 4u);
    EXPECT_EQ(report.colsIn, 4u);
    EXPECT_EQ(report.emptyRowsDropped, 1u);
    EXPECT_EQ(report.emptyColumnsDropped, 1u);
    EXPECT_EQ(report.partialRowsDropped, 1u);
    EXPECT_EQ(cleaned.colCount(), 3u);
    EXPECT_EQ(cleaned.rowCount(), 2u);
    EXPECT_FALSE(anyMissing(cleaned));
}

TEST(CleanerTest, WhitespaceOnlyQuotedTextIsMissing) {
    TabularDataset raw = datasetFromCsv("k,v\na,\"   \"\nb,x\n");
    TabularDataset cleaned = Cleaner().clean(std::move(raw));
    ASSERT_EQ(cleaned.rowCount(), 1u);
    EXPECT_EQ(cleaned.cellText(0, 0), "b");
}

TEST(CleanerTest, RemovesRequestedColumnsAndIgnoresUnknown) {
    CleaningPolicy policy;
    policy.columnsToRemove = {"b", "not_there"};
    CleaningReport report;
    TabularDataset cleaned = Cleaner(policy).clean(datasetFromCsv("a,b,c\n1,2,3\n"), &report);
    ASSERT_EQ(cleaned.colCount(), 2u);
    EXPECT_EQ(cleaned.columns()[0].name, "a");
    EXPECT_EQ(cleaned.columns()[1].name, "c");
    ASSERT_EQ(report.removedColumns.size(), 1u);
    EXPECT_EQ(report.removedColumns[0], "b");
}

TEST(CleanerTest, ZeroRowsIsValid) {
    TabularDataset cleaned = Cleaner().clean(datasetFromCsv("a,b\n1,\n,2\n"));
    EXPECT_EQ(cleaned.rowCount(), 0u);
}

// Randomized sparse matrices: no missing cell, no fully-empty row or column survives.
TEST(CleanerTest, RandomSparseMatricesCleanCompletely) {
    std::mt19937 rng(20240611u);
    for (int round = 0; round < 60; ++round) {
        const size_t rows = 1 + static_cast<size_t>(round % 17);
        const size_t cols = 1 + static_cast<size_t>(round % 6);
        const double fill = 0.35 + 0.01 * (round % 60);
        TabularDataset cleaned = Cleaner().clean(datasetFromCsv(randomSparseCsv(rng, rows, cols, fill)));

        EXPECT_FALSE(anyMissing(cleaned)) << "round " << round;
        for (const auto& col : cleaned.columns()) {
            EXPECT_EQ(col.missing.size(), cleaned.rowCount());
        }
        if (cleaned.rowCount() > 0) {
            for (size_t c = 0; c < cleaned.colCount(); ++c) {
                bool present = false;
                for (size_t r = 0; r < cleaned.rowCount(); ++r) present = present || !cleaned.isMissing(c, r);
                EXPECT_TRUE(present) << "round " << round << " column " << c;
            }
        }
    }
}

// ============================================================================
// Alternative policies
// ============================================================================

TEST(CleanerTest, KeepPartialRetainsRowsWithGaps) {
    CleaningPolicy policy;
    policy.missingRowPolicy = makeMissingRowPolicy("keep_partial");
    TabularDataset cleaned = Cleaner(policy).clean(datasetFromCsv("a,b\n1,\n,2\n,\n3,4\n"));
    EXPECT_EQ(cleaned.rowCount(), 3u);
    EXPECT_TRUE(cleaned.isMissing(1, 0));
}

TEST(CleanerTest, ImputeFillsMedianAndMode) {
    CleaningPolicy policy;
    policy.missingRowPolicy = makeMissingRowPolicy("impute");
    TabularDataset cleaned = Cleaner(policy).clean(
        datasetFromCsv("n,t,d\n1,x,2024-01-01\n,y,\n4,x,2024-01-03\n2,,2024-01-05\n"));
    ASSERT_EQ(cleaned.rowCount(), 4u);
    EXPECT_FALSE(anyMissing(cleaned));
    EXPECT_EQ(cleaned.cellText(0, 1), "2");
    EXPECT_EQ(cleaned.cellText(1, 3), "x");
    EXPECT_EQ(cleaned.cellText(2, 1), "2024-01-03T00:00:00");
}

TEST(CleanerTest, ImputeWithFractionalMedianClearsIntegral) {
    CleaningPolicy policy;
    policy.missingRowPolicy = makeMissingRowPolicy("impute");
    TabularDataset cleaned = Cleaner(policy).clean(datasetFromCsv("n,k\n1,a\n2,b\n,c\n"));
    EXPECT_FALSE(cleaned.columns()[0].integral);
    EXPECT_EQ(cleaned.cellText(0, 2), "1.5");
}

TEST(CleanerTest, UnknownPolicyNameIsConfigurationError) {
    EXPECT_THROW(makeMissingRowPolicy("drop_some"), DataFlow::ConfigurationException);
    EXPECT_EQ(makeMissingRowPolicy("")->name(), "drop_any");
    EXPECT_EQ(makeMissingRowPolicy("IMPUTE")->name(), "impute");
}
