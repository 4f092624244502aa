#include <gtest/gtest.h>

#include "DataFlowExceptions.h"
#include "PipelineConfig.h"
#include "test_helpers.h"

namespace {
PipelineConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "dataflow");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return PipelineConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST(PipelineConfigTest, DefaultsMatchTheDocumentedKnobs) {
    PipelineConfig cfg = parse({"input.csv"});
    EXPECT_EQ(cfg.sourcePath, "input.csv");
    EXPECT_TRUE(cfg.requireDashboard);
    EXPECT_EQ(cfg.missingRowPolicy, "drop_any");
    EXPECT_EQ(cfg.render.width, 600);
    EXPECT_EQ(cfg.render.height, 400);
    EXPECT_EQ(cfg.layout.baseRow, 5);
    EXPECT_EQ(cfg.layout.colSpacing, 10);
    EXPECT_EQ(cfg.outputFileName, "processed_file.xlsx");
    EXPECT_TRUE(cfg.columnsToRemove().empty());
}

TEST(PipelineConfigTest, ParsesFlags) {
    PipelineConfig cfg = parse({"data.tsv", "--remove-fields", "a, b", "--relations", "4", "--require-dashboard", "no",
                                "--delimiter", "tab", "--plot-theme", "dark", "--missing-row-policy", "impute",
                                "--description", "quarterly", "--verbose", "on"});
    EXPECT_EQ(cfg.columnsToRemove(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cfg.numberOfRelations, 4);
    EXPECT_FALSE(cfg.requireDashboard);
    EXPECT_EQ(cfg.delimiter, '\t');
    EXPECT_EQ(cfg.render.theme, "dark");
    EXPECT_EQ(cfg.missingRowPolicy, "impute");
    EXPECT_EQ(cfg.description, "quarterly");
    EXPECT_TRUE(cfg.verbose);
}

TEST(PipelineConfigTest, RelationsAreCoercedNotRejected) {
    PipelineConfig cfg = parse({"x.csv", "--relations", "-3"});
    EXPECT_EQ(cfg.numberOfRelations, -3);
    EXPECT_EQ(cfg.effectiveRelations(), 1);
}

TEST(PipelineConfigTest, StrictParsingRejectsGarbage) {
    EXPECT_THROW(parse({"x.csv", "--relations", "3x"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "--verbose", "maybe"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "--unknown-flag", "1"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "--relations"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "extra.csv"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({}), DataFlow::ConfigurationException);
}

TEST(PipelineConfigTest, ValidationNamesTheBadSetting) {
    try {
        parse({"x.csv", "--plot-theme", "neon"});
        FAIL() << "expected ConfigurationException";
    } catch (const DataFlow::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("plot_theme"), std::string::npos);
    }
    EXPECT_THROW(parse({"x.csv", "--chart-width", "50"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "--missing-row-policy", "sometimes"}), DataFlow::ConfigurationException);
    EXPECT_THROW(parse({"x.csv", "--output-name", "dir/out.xlsx"}), DataFlow::ConfigurationException);
}

TEST(PipelineConfigTest, ConfigFileThenFlagOverrides) {
    TempDir dir;
    const std::string path = dir.write("run.yaml",
                                       "# request\n"
                                       "source: from_file.csv\n"
                                       "relations: 2\n"
                                       "plot_theme: dark\n"
                                       "chart-width: 800\n");
    PipelineConfig cfg = parse({"--config", path, "--relations", "5"});
    EXPECT_EQ(cfg.sourcePath, "from_file.csv");
    EXPECT_EQ(cfg.numberOfRelations, 5);
    EXPECT_EQ(cfg.render.theme, "dark");
    EXPECT_EQ(cfg.render.width, 800);

    PipelineConfig positional = parse({"cli.csv", "--config", path});
    EXPECT_EQ(positional.sourcePath, "cli.csv");
}

TEST(PipelineConfigTest, JsonStyleConfigFile) {
    TempDir dir;
    const std::string path = dir.write("run.json",
                                       "{\n"
                                       "  \"source\": \"a.csv\",\n"
                                       "  \"description\": \"sales: Q1\",\n"
                                       "  \"require_dashboard\": \"false\"\n"
                                       "}\n");
    PipelineConfig cfg = PipelineConfig::fromFile(path, PipelineConfig{});
    EXPECT_EQ(cfg.sourcePath, "a.csv");
    EXPECT_EQ(cfg.description, "sales: Q1");
    EXPECT_FALSE(cfg.requireDashboard);
}

TEST(PipelineConfigTest, ConfigFileErrorsNameTheLine) {
    TempDir dir;
    const std::string path = dir.write("bad.yaml", "source: a.csv\nrelations: many\n");
    try {
        PipelineConfig::fromFile(path, PipelineConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const DataFlow::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    EXPECT_THROW(PipelineConfig::fromFile(dir.path.string() + "/absent.yaml", PipelineConfig{}),
                 DataFlow::ConfigurationException);
}
