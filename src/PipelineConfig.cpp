#include "PipelineConfig.h"
#include "Cleaner.h"
#include "CommonUtils.h"
#include "DataFlowExceptions.h"

#include <algorithm>
#include <fstream>
#include <limits>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw DataFlow::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const DataFlow::DataFlowException&) {
        throw;
    } catch (const std::exception& ex) {
        throw DataFlow::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        CommonUtils::trim(value),
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw DataFlow::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw DataFlow::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.empty() || CommonUtils::toLower(value) == "auto") return '\0';
    if (value.size() != 1) throw DataFlow::ConfigurationException("delimiter expects a single character");
    return value[0];
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') out.erase(lastNonSpace, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    while (!out.empty() && out.front() == '-') out.erase(out.begin());
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}
} // namespace

std::string PipelineConfig::usage() {
    return "Usage: dataflow <source file or upload dir> [--config path] [--remove-fields a,b] [--relations N] "
           "[--description text] [--require-dashboard true|false] [--output-name name.xlsx] "
           "[--workbook-out path] [--bundle-out path] [--json-indent N] [--delimiter c|tab|auto] "
           "[--datetime-locale-hint auto|dmy|mdy] [--missing-row-policy drop_any|keep_partial|impute] "
           "[--chart-width N] [--chart-height N] [--gnuplot path] [--scratch-dir dir] "
           "[--primary-renderer true|false] [--secondary-renderer true|false] [--plot-theme light|dark] "
           "[--dashboard-base-row N] [--dashboard-base-col N] [--dashboard-row-spacing N] "
           "[--dashboard-col-spacing N] [--verbose true|false]";
}

void PipelineConfig::set(const std::string& rawKey, const std::string& value) {
    const std::string key = normalizeConfigKey(rawKey);
    if (key == "source" || key == "source_path" || key == "dataset") {
        sourcePath = value;
    } else if (key == "remove_fields") {
        removeFields = value;
    } else if (key == "relations" || key == "number_of_relations") {
        numberOfRelations = parseIntStrict(value, key, std::numeric_limits<int>::min());
    } else if (key == "description") {
        description = value;
    } else if (key == "require_dashboard" || key == "dashboard") {
        requireDashboard = parseBoolStrict(value, key);
    } else if (key == "output_name" || key == "output_filename") {
        outputFileName = value;
    } else if (key == "workbook_out") {
        workbookPath = value;
    } else if (key == "bundle_out") {
        bundlePath = value;
    } else if (key == "json_indent") {
        jsonIndent = parseIntStrict(value, key, -1);
    } else if (key == "delimiter") {
        delimiter = parseDelimiter(value);
    } else if (key == "datetime_locale_hint") {
        datetimeLocaleHint = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "missing_row_policy") {
        missingRowPolicy = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "chart_width") {
        render.width = parseIntStrict(value, key, 1);
    } else if (key == "chart_height") {
        render.height = parseIntStrict(value, key, 1);
    } else if (key == "gnuplot") {
        render.gnuplotExecutable = value;
    } else if (key == "scratch_dir") {
        render.scratchDir = value;
    } else if (key == "primary_renderer") {
        render.primaryEnabled = parseBoolStrict(value, key);
    } else if (key == "secondary_renderer") {
        render.secondaryEnabled = parseBoolStrict(value, key);
    } else if (key == "plot_theme") {
        render.theme = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "dashboard_base_row") {
        layout.baseRow = parseIntStrict(value, key, 1);
    } else if (key == "dashboard_base_col") {
        layout.baseCol = parseIntStrict(value, key, 1);
    } else if (key == "dashboard_row_spacing") {
        layout.rowSpacing = parseIntStrict(value, key, 1);
    } else if (key == "dashboard_col_spacing") {
        layout.colSpacing = parseIntStrict(value, key, 1);
    } else if (key == "verbose") {
        verbose = parseBoolStrict(value, key);
    } else {
        throw DataFlow::ConfigurationException("Unknown setting '" + rawKey + "'");
    }
}

PipelineConfig PipelineConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) throw DataFlow::ConfigurationException(usage());

    PipelineConfig config;
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            if (!config.sourcePath.empty()) {
                throw DataFlow::ConfigurationException("Unexpected argument '" + arg + "'\n" + usage());
            }
            config.sourcePath = arg;
            continue;
        }
        if (i + 1 >= argc) throw DataFlow::ConfigurationException(arg + " expects a value");
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
        } else {
            overrides.emplace_back(arg, value);
        }
    }

    if (!configPath.empty()) {
        const std::string source = config.sourcePath;
        config = fromFile(configPath, config);
        if (!source.empty()) config.sourcePath = source;
    }
    for (const auto& kv : overrides) config.set(kv.first, kv.second);

    config.validate();
    return config;
}

PipelineConfig PipelineConfig::fromFile(const std::string& configPath, const PipelineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw DataFlow::ConfigurationException("Could not open config file: " + configPath);

    PipelineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const DataFlow::DataFlowException& ex) {
            throw DataFlow::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

void PipelineConfig::validate() const {
    if (sourcePath.empty()) {
        throw DataFlow::ConfigurationException("source path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(datetimeLocaleHint, {"auto", "dmy", "mdy"})) {
        throw DataFlow::ConfigurationException("datetime_locale_hint must be one of: auto, dmy, mdy");
    }
    if (!isIn(render.theme, {"light", "dark"})) {
        throw DataFlow::ConfigurationException("plot_theme must be one of: light, dark");
    }
    makeMissingRowPolicy(missingRowPolicy);

    if (render.width < 100 || render.width > 4000 || render.height < 100 || render.height > 4000) {
        throw DataFlow::ConfigurationException("chart_width and chart_height must be within [100,4000]");
    }
    if (render.gnuplotExecutable.empty()) {
        throw DataFlow::ConfigurationException("gnuplot must name an executable");
    }
    if (layout.baseRow < 1 || layout.baseCol < 1 || layout.rowSpacing < 1 || layout.colSpacing < 1) {
        throw DataFlow::ConfigurationException("dashboard layout values must be >= 1");
    }
    if (outputFileName.empty() || outputFileName.find('/') != std::string::npos) {
        throw DataFlow::ConfigurationException("output_name must be a plain file name");
    }
    if (jsonIndent < -1 || jsonIndent > 8) {
        throw DataFlow::ConfigurationException("json_indent must be within [-1,8]");
    }
}

std::vector<std::string> PipelineConfig::columnsToRemove() const {
    return CommonUtils::splitList(removeFields);
}

DateTimeUtils::DateLocaleHint PipelineConfig::dateLocaleHint() const {
    if (datetimeLocaleHint == "dmy") return DateTimeUtils::DateLocaleHint::DMY;
    if (datetimeLocaleHint == "mdy") return DateTimeUtils::DateLocaleHint::MDY;
    return DateTimeUtils::DateLocaleHint::AUTO;
}
