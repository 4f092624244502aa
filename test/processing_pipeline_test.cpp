#include <gtest/gtest.h>

#include "DataFlowExceptions.h"
#include "Encoding.h"
#include "ProcessingPipeline.h"
#include "WorkbookAssembler.h"
#include "ZipArchive.h"
#include "test_helpers.h"

#include <algorithm>

namespace {
PipelineConfig configFor(const std::string& source) {
    PipelineConfig cfg;
    cfg.sourcePath = source;
    cfg.numberOfRelations = 1;
    cfg.render.gnuplotExecutable = "/nonexistent/dataflow-gnuplot";
    return cfg;
}

std::unique_ptr<ChartRenderer> fakeRenderer(std::unique_ptr<ChartRasterizer> primary,
                                            std::unique_ptr<ChartRasterizer> secondary) {
    return std::make_unique<ChartRenderer>(RenderConfig{}, std::move(primary), std::move(secondary));
}

size_t imagesIn(const ResultBundle& bundle) {
    return static_cast<size_t>(std::count_if(bundle.charts.begin(), bundle.charts.end(),
                                             [](const ChartSpec& c) { return c.hasImage(); }));
}
} // namespace

// ============================================================================
// End to end
// ============================================================================

TEST(ProcessingPipelineTest, SalesDatasetWithOneRelation) {
    ProcessingPipeline pipeline(configFor(dataPath("sales.csv")));
    pipeline.setChartRenderer(fakeRenderer(std::make_unique<FixedImageRasterizer>(), nullptr));
    const ResultBundle bundle = pipeline.run();

    EXPECT_EQ(bundle.cleaned.rowCount(), 12u);
    EXPECT_EQ(bundle.cleaned.colCount(), 3u);

    ASSERT_EQ(bundle.pivots.size(), 1u);
    const PivotTable& pivot = bundle.pivots[0];
    std::vector<std::string> pair = {pivot.indexColumn, pivot.columnAxis};
    std::sort(pair.begin(), pair.end());
    EXPECT_EQ(pair, (std::vector<std::string>{"category", "region"}));
    EXPECT_EQ(pivot.total(), 12);

    EXPECT_TRUE(bundle.hasDashboard);
    ASSERT_EQ(bundle.charts.size(), 1u);
    EXPECT_EQ(bundle.charts[0].kind, ChartKind::BAR);
    EXPECT_EQ(bundle.charts[0].backend, RenderBackend::PRIMARY);
    EXPECT_EQ(imagesIn(bundle), 1u);

    EXPECT_EQ(bundle.sheetNames, (std::vector<std::string>{"CleanedData", "PivotTables", "Dashboard"}));
    EXPECT_EQ(bundle.requestedRelations, 1);
    EXPECT_EQ(bundle.generatedRelations, 1u);
    EXPECT_EQ(bundle.fileName, "processed_file.xlsx");

    BundleValue out = BundleSerializer::toBundleValue(bundle);
    EXPECT_EQ(out.find("cleaned_data")->size(), 12u);
    EXPECT_EQ(out.find("charts")->asArray()[0].find("kind")->asString(), "bar");
    EXPECT_EQ(BundleSerializer::decodeWorkbook(out), bundle.workbook);

    const auto parts = ZipArchive::extract(bundle.workbook);
    EXPECT_EQ(parts.count("xl/worksheets/sheet3.xml"), 1u);
    EXPECT_EQ(parts.count("xl/media/image1.png"), 1u);
}

TEST(ProcessingPipelineTest, DefaultRendererFallsBackWhenPrimaryIsMissing) {
    PipelineConfig cfg = configFor(dataPath("sales.csv"));
    cfg.numberOfRelations = 3;
    ProcessingPipeline pipeline(cfg);
    const ResultBundle bundle = pipeline.run();

    ASSERT_EQ(bundle.charts.size(), 1u);
    EXPECT_EQ(bundle.charts[0].backend, RenderBackend::SECONDARY);
    EXPECT_EQ(imagesIn(bundle), 1u);
    EXPECT_EQ(bundle.requestedRelations, 3);
    EXPECT_EQ(bundle.generatedRelations, 1u);
}

TEST(ProcessingPipelineTest, ForcedPrimaryFailureGivesOneSecondaryImagePerRelationship) {
    TempDir dir;
    PipelineConfig cfg = configFor(dir.write("multi.csv", "a,b,c,d\np,q,r,s\nt,u,v,w\np,u,r,w\nx,q,v,s\n"));
    cfg.numberOfRelations = 6;

    auto secondary = std::make_unique<FixedImageRasterizer>();
    auto* secondaryRaw = secondary.get();
    ProcessingPipeline pipeline(cfg);
    pipeline.setChartRenderer(fakeRenderer(std::make_unique<FailingRasterizer>("primary"), std::move(secondary)));
    const ResultBundle bundle = pipeline.run();

    ASSERT_EQ(bundle.charts.size(), 6u);
    for (size_t i = 0; i < bundle.charts.size(); ++i) {
        EXPECT_EQ(bundle.charts[i].backend, RenderBackend::SECONDARY);
        EXPECT_EQ(bundle.charts[i].kind, chartKindForPosition(i));
    }
    EXPECT_EQ(imagesIn(bundle), 6u);
    EXPECT_EQ(secondaryRaw->calls, 6);
}

TEST(ProcessingPipelineTest, BothRenderersFailingKeepsDashboardWithoutImages) {
    ProcessingPipeline pipeline(configFor(dataPath("sales.csv")));
    pipeline.setChartRenderer(fakeRenderer(std::make_unique<FailingRasterizer>("primary"),
                                           std::make_unique<FailingRasterizer>("secondary")));
    const ResultBundle bundle = pipeline.run();

    EXPECT_TRUE(bundle.hasDashboard);
    ASSERT_EQ(bundle.charts.size(), 1u);
    EXPECT_EQ(bundle.charts[0].backend, RenderBackend::NONE);
    EXPECT_EQ(imagesIn(bundle), 0u);
    EXPECT_EQ(bundle.sheetNames.back(), "Dashboard");
    EXPECT_EQ(ZipArchive::extract(bundle.workbook).count("xl/media/image1.png"), 0u);

    BundleValue out = BundleSerializer::toBundleValue(bundle);
    EXPECT_TRUE(out.find("has_dashboard")->asBool());
    EXPECT_EQ(out.find("charts")->asArray()[0].find("backend")->asString(), "none");
}

TEST(ProcessingPipelineTest, DashboardNotRequested) {
    PipelineConfig cfg = configFor(dataPath("sales.csv"));
    cfg.requireDashboard = false;
    auto primary = std::make_unique<FixedImageRasterizer>();
    auto* primaryRaw = primary.get();
    ProcessingPipeline pipeline(cfg);
    pipeline.setChartRenderer(fakeRenderer(std::move(primary), nullptr));
    const ResultBundle bundle = pipeline.run();

    EXPECT_FALSE(bundle.hasDashboard);
    EXPECT_TRUE(bundle.charts.empty());
    EXPECT_EQ(primaryRaw->calls, 0);
    EXPECT_EQ(bundle.sheetNames, (std::vector<std::string>{"CleanedData", "PivotTables"}));
    EXPECT_EQ(BundleSerializer::toBundleValue(bundle).find("charts"), nullptr);
}

TEST(ProcessingPipelineTest, RemovedFieldsAndSparseInput) {
    PipelineConfig cfg = configFor(dataPath("sparse.csv"));
    cfg.removeFields = "id, nope";
    ProcessingPipeline pipeline(cfg);
    pipeline.setChartRenderer(fakeRenderer(std::make_unique<FixedImageRasterizer>(), nullptr));
    const ResultBundle bundle = pipeline.run();

    // Rows 1 (Alice) and 5 (Eve) are the only complete ones; notes is empty throughout.
    EXPECT_EQ(bundle.cleaned.rowCount(), 2u);
    EXPECT_EQ(bundle.cleaned.findColumnIndex("id"), -1);
    EXPECT_EQ(bundle.cleaned.findColumnIndex("notes"), -1);
    ASSERT_EQ(bundle.pivots.size(), 1u);
    EXPECT_EQ(bundle.pivots[0].title, "name Frequency");
    EXPECT_EQ(pipeline.cleaningReport().emptyRowsDropped, 1u);
    EXPECT_EQ(pipeline.cleaningReport().emptyColumnsDropped, 1u);
}

TEST(ProcessingPipelineTest, NumericOnlyInputUsesFrequencyOfFirstNumericColumn) {
    ProcessingPipeline pipeline(configFor(dataPath("numeric_only.csv")));
    pipeline.setChartRenderer(fakeRenderer(std::make_unique<FixedImageRasterizer>(), nullptr));
    const ResultBundle bundle = pipeline.run();
    ASSERT_EQ(bundle.pivots.size(), 1u);
    EXPECT_EQ(bundle.pivots[0].title, "measure Frequency");
    EXPECT_EQ(bundle.pivots[0].indexLabels.front(), "2.0");
}

TEST(ProcessingPipelineTest, MultiByteTextSurvivesIntoBundleAndWorkbook) {
    TempDir dir;
    PipelineConfig cfg = configFor(dir.write("cities.csv", "city,code\nZ\xC3\xBCrich,a\nK\xC3\xB6ln,b\nZ\xC3\xBCrich,b\n"));
    cfg.requireDashboard = false;
    const ResultBundle bundle = ProcessingPipeline(cfg).run();

    const std::string json = BundleSerializer::toJson(bundle);
    EXPECT_EQ(Encoding::findInvalidUtf8(json), std::string::npos);
    EXPECT_NE(json.find("\"city\":\"Z\xC3\xBCrich\""), std::string::npos);
    EXPECT_NE(json.find("K\xC3\xB6ln"), std::string::npos);

    const auto parts = ZipArchive::extract(bundle.workbook);
    const std::vector<uint8_t>& sheetBytes = parts.at("xl/worksheets/sheet1.xml");
    const std::string sheet(sheetBytes.begin(), sheetBytes.end());
    EXPECT_EQ(Encoding::findInvalidUtf8(sheet), std::string::npos);
    EXPECT_NE(sheet.find("Z\xC3\xBCrich"), std::string::npos);
}

TEST(ProcessingPipelineTest, Latin1InputIsRejectedAsClientError) {
    TempDir dir;
    PipelineConfig cfg = configFor(dir.write("cities.csv", "city,code\nZ\xFCrich,a\nK\xF6ln,b\n"));
    cfg.requireDashboard = false;
    try {
        ProcessingPipeline(cfg).run();
        FAIL() << "expected DatasetException";
    } catch (const DataFlow::DatasetException& e) {
        EXPECT_EQ(e.statusCode(), 400);
    }
}

// ============================================================================
// Fatal errors
// ============================================================================

TEST(ProcessingPipelineTest, FatalErrorsPropagate) {
    EXPECT_THROW(ProcessingPipeline(configFor(dataPath("notes.json"))).run(), DataFlow::UnsupportedFormatException);
    EXPECT_THROW(ProcessingPipeline(configFor(dataPath("absent.csv"))).run(), DataFlow::NoInputException);

    TempDir dir;
    const std::string onlyDates = dir.write("dates.csv", "day\n2024-01-01\n2024-01-02\n");
    EXPECT_THROW(ProcessingPipeline(configFor(onlyDates)).run(), DataFlow::NoUsableColumnsException);
}

TEST(ProcessingPipelineTest, InvalidConfigurationIsRejectedUpFront) {
    PipelineConfig cfg = configFor(dataPath("sales.csv"));
    cfg.missingRowPolicy = "whatever";
    EXPECT_THROW(ProcessingPipeline{cfg}, DataFlow::ConfigurationException);
}
