#include <gtest/gtest.h>

#include "Cleaner.h"
#include "DataFlowExceptions.h"
#include "PivotBuilder.h"
#include "test_helpers.h"

TEST(PivotBuilderTest, CrossTabIsZeroFilledAndSorted) {
    TabularDataset data = datasetFromCsv("r,c\nb,y\na,x\nb,x\nb,x\n");
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"r", "c"}});

    EXPECT_EQ(pivot.title, "r vs c");
    EXPECT_EQ(pivot.indexColumn, "r");
    EXPECT_EQ(pivot.columnAxis, "c");
    ASSERT_EQ(pivot.indexLabels, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(pivot.headers, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(pivot.counts[0], (std::vector<int64_t>{1, 0}));
    EXPECT_EQ(pivot.counts[1], (std::vector<int64_t>{2, 1}));
    EXPECT_EQ(pivot.total(), 4);
}

TEST(PivotBuilderTest, NumericLabelsSortNumerically) {
    TabularDataset data = datasetFromCsv("n,c\n10,a\n9,a\n100,b\n");
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"n", "c"}});
    EXPECT_EQ(pivot.indexLabels, (std::vector<std::string>{"9", "10", "100"}));
}

TEST(PivotBuilderTest, FrequencyOrderedByCountThenFirstSeen) {
    TabularDataset data = datasetFromCsv("k\nb\na\nc\na\nc\nd\n");
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"k"}});
    EXPECT_EQ(pivot.title, "k Frequency");
    EXPECT_EQ(pivot.headers, (std::vector<std::string>{"Count"}));
    EXPECT_EQ(pivot.indexLabels, (std::vector<std::string>{"a", "c", "b", "d"}));
    EXPECT_EQ(pivot.total(), 6);
}

// Cell sum equals the rows with both summarized values present.
TEST(PivotBuilderTest, ConservationSkipsRowsMissingEitherValue) {
    CleaningPolicy policy;
    policy.missingRowPolicy = makeMissingRowPolicy("keep_partial");
    TabularDataset data = Cleaner(policy).clean(datasetFromCsv("r,c,z\na,x,1\n,y,2\nb,,3\nb,y,4\na,y,\n"));
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"r", "c"}});

    int64_t expected = 0;
    for (size_t row = 0; row < data.rowCount(); ++row) {
        if (!data.isMissing(0, row) && !data.isMissing(1, row)) ++expected;
    }
    EXPECT_EQ(expected, 3);
    EXPECT_EQ(pivot.total(), expected);
}

TEST(PivotBuilderTest, RecordsMirrorTheTable) {
    TabularDataset data = datasetFromCsv("r,c\na,x\na,y\nb,y\n");
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"r", "c"}});
    auto records = pivot.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].index, "b");
    ASSERT_EQ(records[1].values.size(), 2u);
    EXPECT_EQ(records[1].values[0].first, "x");
    EXPECT_EQ(records[1].values[0].second, 0);
    EXPECT_EQ(records[1].values[1].second, 1);
}

TEST(PivotBuilderTest, DatetimeLabelsUseIsoText) {
    TabularDataset data = datasetFromCsv("d,k\n2024-02-01,a\n2024-01-01,a\n");
    PivotTable pivot = PivotBuilder::build(data, Relationship{{"d", "k"}});
    EXPECT_EQ(pivot.indexLabels.front(), "2024-01-01T00:00:00");
}

TEST(PivotBuilderTest, UnknownColumnRaises) {
    TabularDataset data = datasetFromCsv("r,c\na,x\n");
    EXPECT_THROW(PivotBuilder::build(data, Relationship{{"r", "missing"}}), DataFlow::DatasetException);
    EXPECT_THROW(PivotBuilder::build(data, Relationship{}), DataFlow::DatasetException);
}
