#include "DatasetLoader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "DataFlowExceptions.h"
#include "ProcessUtils.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {
struct TempFileGuard {
    std::string path;
    ~TempFileGuard() {
        if (path.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

std::string makeTempCsvPath() {
    static std::atomic<unsigned> counter{0};
    const auto name = "dataflow_input_" + std::to_string(static_cast<long long>(::getpid())) + "_" +
                      std::to_string(counter.fetch_add(1)) + ".csv";
    return (std::filesystem::temp_directory_path() / name).string();
}

char sniffDelimiter(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw DataFlow::IOException("Could not open file: " + path);
    CSVUtils::skipBOM(in);
    std::string firstLine;
    std::getline(in, firstLine);
    return CSVUtils::detectDelimiter(firstLine);
}
} // namespace

std::string DatasetLoader::resolveSourceFile(const std::string& sourcePath) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (sourcePath.empty() || !fs::exists(sourcePath, ec)) {
        throw DataFlow::NoInputException("No file found at '" + sourcePath + "'");
    }
    if (!fs::is_directory(sourcePath, ec)) return sourcePath;

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(sourcePath, ec)) {
        if (entry.is_regular_file(ec)) files.push_back(entry.path().string());
    }
    if (ec) throw DataFlow::IOException("Could not list directory '" + sourcePath + "': " + ec.message());
    if (files.empty()) {
        throw DataFlow::NoInputException("No file found in upload directory '" + sourcePath + "'");
    }
    std::sort(files.begin(), files.end());
    return files.front();
}

SourceFormat DatasetLoader::formatForPath(const std::string& path) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
    if (ext == ".csv" || ext == ".tsv" || ext == ".txt") return SourceFormat::DELIMITED_TEXT;
    if (ext == ".xlsx") return SourceFormat::XLSX;
    if (ext == ".xls") return SourceFormat::XLS;
    throw DataFlow::UnsupportedFormatException("'" + std::filesystem::path(path).filename().string() +
                                               "' is not a spreadsheet or delimited text file");
}

TabularDataset DatasetLoader::load(const std::string& sourcePath) const {
    const std::string path = resolveSourceFile(sourcePath);
    const SourceFormat format = formatForPath(path);

    if (format == SourceFormat::DELIMITED_TEXT) {
        char delimiter = options_.delimiter;
        if (delimiter == '\0') {
            const std::string ext = CommonUtils::toLower(std::filesystem::path(path).extension().string());
            if (ext == ".tsv") delimiter = '\t';
            else if (ext == ".txt") delimiter = sniffDelimiter(path);
            else delimiter = ',';
        }
        TabularDataset data(path, delimiter);
        data.setDateLocaleHint(options_.dateLocaleHint);
        data.load();
        return data;
    }

    const std::string tool = (format == SourceFormat::XLSX) ? "xlsx2csv" : "xls2csv";
    const std::string exe = ProcessUtils::findExecutableInPath(tool);
    if (exe.empty()) {
        throw DataFlow::DatasetException("Spreadsheet import requires " + tool + " on PATH");
    }

    TempFileGuard guard{makeTempCsvPath()};
    const int rc = ProcessUtils::spawnToFile(exe, {path}, guard.path);
    if (rc != 0) {
        throw DataFlow::DatasetException("Failed to convert spreadsheet '" + path + "' (" + tool +
                                         " exit code " + std::to_string(rc) + ")");
    }

    TabularDataset data(guard.path, ',');
    data.setDateLocaleHint(options_.dateLocaleHint);
    data.load();
    return data;
}
