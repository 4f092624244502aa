#include <gtest/gtest.h>

#include "BundleSerializer.h"
#include "DataFlowExceptions.h"
#include "Encoding.h"
#include "ZipArchive.h"
#include "test_helpers.h"

namespace {
std::vector<uint8_t> minimalPackage(bool withWorkbookPart = true) {
    ZipArchive zip;
    zip.addFile("[Content_Types].xml", "<Types/>");
    if (withWorkbookPart) zip.addFile("xl/workbook.xml", "<workbook/>");
    return zip.finish();
}

ResultBundle smallBundle() {
    ResultBundle bundle;
    bundle.cleaned = datasetFromCsv("name,n,x,when\nA,1,0.5,2024-05-06 07:08:09\nB,2,1.5,2024-05-07\n");
    bundle.profiles = RelationshipDiscoverer::profile(bundle.cleaned);

    PivotTable pivot;
    pivot.title = "name Frequency";
    pivot.indexColumn = "name";
    pivot.headers = {"Count"};
    pivot.indexLabels = {"A", "B"};
    pivot.counts = {{1}, {1}};
    bundle.pivots = {pivot};

    ChartSpec chart;
    chart.title = pivot.title;
    chart.chartTitle = pivot.title + " Bar Chart";
    chart.backend = RenderBackend::SECONDARY;
    chart.image = std::vector<uint8_t>{1, 2, 3};
    bundle.charts = {chart};

    bundle.hasDashboard = true;
    bundle.sheetNames = {"CleanedData", "PivotTables", "Dashboard"};
    bundle.workbook = minimalPackage();
    bundle.fileName = "processed_file.xlsx";
    bundle.requestedRelations = 3;
    bundle.generatedRelations = 1;
    bundle.description = "demo";
    return bundle;
}

bool containsDateTime(const BundleValue& v) {
    if (v.isDateTime()) return true;
    if (v.isArray()) {
        for (const auto& item : v.asArray()) if (containsDateTime(item)) return true;
    }
    if (v.isObject()) {
        for (const auto& kv : v.asObject()) if (containsDateTime(kv.second)) return true;
    }
    return false;
}
} // namespace

TEST(BundleSerializerTest, RequiredKeysInOrder) {
    BundleValue out = BundleSerializer::toBundleValue(smallBundle());
    const std::vector<std::string> expected = {
        "cleaned_data", "pivot_tables", "has_dashboard", "sheets", "file_content_base64", "file_name",
        "requested_relations", "generated_relations", "description", "file_sha1", "file_size",
        "column_profiles", "charts"};
    ASSERT_EQ(out.asObject().size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) EXPECT_EQ(out.asObject()[i].first, expected[i]);

    EXPECT_TRUE(out.find("has_dashboard")->asBool());
    EXPECT_EQ(out.find("requested_relations")->asInt(), 3);
    EXPECT_EQ(out.find("generated_relations")->asInt(), 1);
    EXPECT_EQ(out.find("file_size")->asInt(), static_cast<int64_t>(minimalPackage().size()));
}

TEST(BundleSerializerTest, CleanedRecordsAreTypedAndJsonSafe) {
    BundleValue out = BundleSerializer::toBundleValue(smallBundle());
    EXPECT_FALSE(containsDateTime(out));

    const auto& rows = out.find("cleaned_data")->asArray();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].find("name")->asString(), "A");
    EXPECT_EQ(rows[0].find("n")->asInt(), 1);
    EXPECT_DOUBLE_EQ(rows[0].find("x")->asDouble(), 0.5);
    EXPECT_EQ(rows[0].find("when")->asString(), "2024-05-06T07:08:09");
    EXPECT_EQ(rows[1].find("when")->asString(), "2024-05-07T00:00:00");
}

TEST(BundleSerializerTest, MissingCellsBecomeNull) {
    TabularDataset data = datasetFromCsv("a,b\n1,\n");
    BundleValue rows = BundleSerializer::cleanedRecords(data);
    EXPECT_TRUE(rows.asArray()[0].find("b")->isNull());
}

TEST(BundleSerializerTest, PivotRecordsCarryIndexThenHeaders) {
    BundleValue out = BundleSerializer::toBundleValue(smallBundle());
    const BundleValue& pivot = out.find("pivot_tables")->asArray()[0];
    EXPECT_EQ(pivot.find("title")->asString(), "name Frequency");
    EXPECT_EQ(pivot.find("index_column")->asString(), "name");
    EXPECT_EQ(pivot.find("column_headers")->asArray()[0].asString(), "Count");
    const BundleValue& first = pivot.find("data")->asArray()[0];
    EXPECT_EQ(first.asObject()[0].first, "index");
    EXPECT_EQ(first.find("index")->asString(), "A");
    EXPECT_EQ(first.find("Count")->asInt(), 1);
}

TEST(BundleSerializerTest, ChartsOnlyWithDashboard) {
    ResultBundle bundle = smallBundle();
    BundleValue withDash = BundleSerializer::toBundleValue(bundle);
    const BundleValue& chart = withDash.find("charts")->asArray()[0];
    EXPECT_EQ(chart.find("kind")->asString(), "bar");
    EXPECT_EQ(chart.find("backend")->asString(), "secondary");
    EXPECT_TRUE(chart.find("figure")->isNull());

    bundle.hasDashboard = false;
    EXPECT_EQ(BundleSerializer::toBundleValue(bundle).find("charts"), nullptr);
}

TEST(BundleSerializerTest, WorkbookSurvivesTextRoundTrip) {
    ResultBundle bundle = smallBundle();
    BundleValue out = BundleSerializer::toBundleValue(bundle);
    EXPECT_EQ(BundleSerializer::decodeWorkbook(out), bundle.workbook);
    EXPECT_EQ(out.find("file_sha1")->asString(), Encoding::sha1Hex(bundle.workbook));

    BundleValue broken = BundleValue::object();
    broken.set("file_content_base64", "%%%%");
    EXPECT_THROW(BundleSerializer::decodeWorkbook(broken), DataFlow::WorkbookException);
    EXPECT_THROW(BundleSerializer::decodeWorkbook(BundleValue::object()), DataFlow::WorkbookException);
}

TEST(BundleSerializerTest, DecodeWorkbookRejectsNonPackages) {
    BundleValue notZip = BundleValue::object();
    notZip.set("file_content_base64", Encoding::base64Encode({0x50, 0x4B, 0x03, 0x04, 0x00, 0xFF, 0x10}));
    EXPECT_THROW(BundleSerializer::decodeWorkbook(notZip), DataFlow::WorkbookException);

    BundleValue noWorkbook = BundleValue::object();
    noWorkbook.set("file_content_base64", Encoding::base64Encode(minimalPackage(false)));
    EXPECT_THROW(BundleSerializer::decodeWorkbook(noWorkbook), DataFlow::WorkbookException);
}

TEST(BundleSerializerTest, MakeJsonSafeWalksNestedStructures) {
    BundleValue inner = BundleValue::array();
    inner.push(BundleValue::DateTime{0});
    BundleValue outer = BundleValue::object();
    outer.set("nested", std::move(inner));
    BundleValue safe = BundleSerializer::makeJsonSafe(outer);
    EXPECT_EQ(safe.find("nested")->asArray()[0].asString(), "1970-01-01T00:00:00");
}

TEST(BundleSerializerTest, JsonTextIsEmitted) {
    const std::string json = BundleSerializer::toJson(smallBundle());
    EXPECT_NE(json.find("\"has_dashboard\":true"), std::string::npos);
    EXPECT_NE(json.find("\"file_name\":\"processed_file.xlsx\""), std::string::npos);
}
