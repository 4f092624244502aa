#include <gtest/gtest.h>

#include "DataFlowExceptions.h"
#include "RelationshipDiscoverer.h"
#include "test_helpers.h"

namespace {
// colour: 3 distinct, size: 2 distinct, shape: 4 distinct, n numeric.
const char* kThreeCategorical =
    "colour,size,shape,n\n"
    "red,S,circle,1\n"
    "blue,L,square,2\n"
    "green,S,star,3\n"
    "red,L,hex,4\n";
} // namespace

TEST(RelationshipDiscovererTest, ProfilesRolesAndDatetimeHint) {
    TabularDataset data = datasetFromCsv("when_date,label,n,stamp\n2024-01-01,a,1,2024-02-02\nlater,b,2,2024-03-03\n");
    auto profiles = RelationshipDiscoverer::profile(data);
    ASSERT_EQ(profiles.size(), 4u);

    // Text with a date-ish name stays categorical and carries the flag.
    EXPECT_EQ(profiles[0].role, ColumnRole::CATEGORICAL);
    EXPECT_TRUE(profiles[0].datetimeLike);
    EXPECT_EQ(profiles[1].role, ColumnRole::CATEGORICAL);
    EXPECT_FALSE(profiles[1].datetimeLike);
    EXPECT_EQ(profiles[2].role, ColumnRole::NUMERIC);
    EXPECT_EQ(profiles[3].role, ColumnRole::DATETIME_LIKE);
    EXPECT_TRUE(profiles[3].datetimeLike);
    EXPECT_EQ(profiles[1].distinctCount, 2u);
}

TEST(RelationshipDiscovererTest, PairsFollowDistinctCountRanking) {
    TabularDataset data = datasetFromCsv(kThreeCategorical);
    auto rels = RelationshipDiscoverer::discover(data, 3);
    ASSERT_EQ(rels.size(), 3u);
    EXPECT_EQ(rels[0].title(), "shape vs colour");
    EXPECT_EQ(rels[1].title(), "shape vs size");
    EXPECT_EQ(rels[2].title(), "colour vs size");
}

TEST(RelationshipDiscovererTest, RequestedCountCapsAndIsCoercedToOne) {
    TabularDataset data = datasetFromCsv(kThreeCategorical);
    EXPECT_EQ(RelationshipDiscoverer::discover(data, 2).size(), 2u);
    EXPECT_EQ(RelationshipDiscoverer::discover(data, 10).size(), 3u);
    EXPECT_EQ(RelationshipDiscoverer::discover(data, 0).size(), 1u);
    EXPECT_EQ(RelationshipDiscoverer::discover(data, -4).size(), 1u);
}

TEST(RelationshipDiscovererTest, SelectionIsDeterministic) {
    TabularDataset data = datasetFromCsv(kThreeCategorical);
    auto first = RelationshipDiscoverer::discover(data, 3);
    for (int i = 0; i < 5; ++i) {
        auto again = RelationshipDiscoverer::discover(data, 3);
        ASSERT_EQ(again.size(), first.size());
        for (size_t k = 0; k < first.size(); ++k) EXPECT_EQ(again[k].columns, first[k].columns);
    }
}

TEST(RelationshipDiscovererTest, TiesKeepColumnOrder) {
    TabularDataset data = datasetFromCsv("a,b\nx,p\ny,q\n");
    auto rels = RelationshipDiscoverer::discover(data, 1);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].title(), "a vs b");
}

TEST(RelationshipDiscovererTest, SingleCategoricalGivesFrequency) {
    TabularDataset data = datasetFromCsv("kind,n\na,1\nb,2\n");
    auto rels = RelationshipDiscoverer::discover(data, 5);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_FALSE(rels[0].isPair());
    EXPECT_EQ(rels[0].title(), "kind Frequency");
}

TEST(RelationshipDiscovererTest, NumericFallbackUsesFirstNumericColumn) {
    TabularDataset data = datasetFromCsv("day,x,y\n2024-01-01,1,2\n2024-01-02,3,4\n");
    auto rels = RelationshipDiscoverer::discover(data, 3);
    ASSERT_EQ(rels.size(), 1u);
    EXPECT_EQ(rels[0].columns[0], "x");
}

TEST(RelationshipDiscovererTest, NoUsableColumnsRaises) {
    TabularDataset data = datasetFromCsv("day\n2024-01-01\n2024-01-02\n");
    EXPECT_THROW(RelationshipDiscoverer::discover(data, 1), DataFlow::NoUsableColumnsException);
}
