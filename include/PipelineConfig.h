#pragma once
#include "ChartRasterizer.h"
#include "DateTimeUtils.h"
#include "WorkbookAssembler.h"

#include <string>
#include <vector>

struct PipelineConfig {
    // Request
    std::string sourcePath;
    std::string removeFields;
    int numberOfRelations = 3;
    std::string description;
    bool requireDashboard = true;
    std::string outputFileName = "processed_file.xlsx";

    // CLI outputs; empty means derived from outputFileName.
    std::string workbookPath;
    std::string bundlePath;
    int jsonIndent = 2;

    // Loading and cleaning
    char delimiter = '\0';
    std::string datetimeLocaleHint = "auto";  // auto|dmy|mdy
    std::string missingRowPolicy = "drop_any";  // drop_any|keep_partial|impute

    RenderConfig render;
    DashboardLayout layout;

    bool verbose = false;

    /**
     * @brief Parses `dataflow <source> [--key value]...`; `--config file` is applied first,
     * later flags override it.
     * @throws DataFlow::ConfigurationException on unknown flags or invalid values.
     */
    static PipelineConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Reads loose YAML (`key: value`) or JSON-ish (`"key": "value",`) lines over base.
     * @throws DataFlow::ConfigurationException naming the offending line.
     */
    static PipelineConfig fromFile(const std::string& configPath, const PipelineConfig& base);

    // Applies one setting by its snake_case key.
    void set(const std::string& key, const std::string& value);

    void validate() const;

    std::vector<std::string> columnsToRemove() const;
    int effectiveRelations() const noexcept { return numberOfRelations < 1 ? 1 : numberOfRelations; }
    DateTimeUtils::DateLocaleHint dateLocaleHint() const;

    static std::string usage();
};
