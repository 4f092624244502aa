#include "DataFlowExceptions.h"
#include "PipelineConfig.h"
#include "ProcessingPipeline.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {
void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw DataFlow::IOException("Could not open output file: " + path);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw DataFlow::IOException("Failed writing output file: " + path);
}

void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw DataFlow::IOException("Could not open output file: " + path);
    out << text << "\n";
    if (!out) throw DataFlow::IOException("Failed writing output file: " + path);
}

int exitCodeFor(const DataFlow::DataFlowException& e) {
    return (e.statusCode() >= 400 && e.statusCode() < 500) ? 2 : 1;
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        std::cout << PipelineConfig::usage() << "\n";
        return 0;
    }

    try {
        PipelineConfig config = PipelineConfig::fromArgs(argc, argv);

        const std::string workbookPath = config.workbookPath.empty() ? config.outputFileName : config.workbookPath;
        std::string bundlePath = config.bundlePath;
        if (bundlePath.empty()) {
            bundlePath = std::filesystem::path(workbookPath).replace_extension(".json").string();
        }

        ProcessingPipeline pipeline(config);
        const ResultBundle bundle = pipeline.run();

        writeBytes(workbookPath, bundle.workbook);
        writeText(bundlePath, BundleSerializer::toJson(bundle, config.jsonIndent));

        std::cout << "[DataFlow] Workbook: " << workbookPath << " (" << bundle.sheetNames.size() << " sheets, "
                  << bundle.generatedRelations << " pivot tables, dashboard "
                  << (bundle.hasDashboard ? "yes" : "no") << ")\n";
        std::cout << "[DataFlow] Bundle: " << bundlePath << "\n";
    } catch (const DataFlow::DataFlowException& e) {
        std::cerr << "[DataFlow][Error " << e.statusCode() << "] " << e.what() << "\n";
        return exitCodeFor(e);
    } catch (const std::exception& e) {
        std::cerr << "[DataFlow][Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
