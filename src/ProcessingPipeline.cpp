#include "ProcessingPipeline.h"
#include "DatasetLoader.h"
#include "PivotBuilder.h"
#include "RelationshipDiscoverer.h"
#include "WorkbookAssembler.h"
#include "XlsxWriter.h"

#include <chrono>
#include <iostream>

ProcessingPipeline::ProcessingPipeline(PipelineConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void ProcessingPipeline::setChartRenderer(std::unique_ptr<ChartRenderer> renderer) {
    renderer_ = std::move(renderer);
}

void ProcessingPipeline::log(const std::string& stage, const std::string& message) const {
    if (!config_.verbose) return;
    std::cout << "[DataFlow][" << stage << "] " << message << "\n";
}

CleaningPolicy ProcessingPipeline::cleaningPolicy() const {
    CleaningPolicy policy;
    policy.columnsToRemove = config_.columnsToRemove();
    policy.missingRowPolicy = makeMissingRowPolicy(config_.missingRowPolicy);
    return policy;
}

ResultBundle ProcessingPipeline::run() {
    const auto started = std::chrono::steady_clock::now();

    LoadOptions loadOptions;
    loadOptions.delimiter = config_.delimiter;
    loadOptions.dateLocaleHint = config_.dateLocaleHint();
    TabularDataset raw = DatasetLoader(loadOptions).load(config_.sourcePath);
    log("Load", "Read " + std::to_string(raw.rowCount()) + " rows x " + std::to_string(raw.colCount()) + " columns");

    ResultBundle bundle;
    report_ = CleaningReport{};
    bundle.cleaned = Cleaner(cleaningPolicy()).clean(std::move(raw), &report_);
    log("Clean", "Policy '" + config_.missingRowPolicy + "': dropped " +
                 std::to_string(report_.emptyRowsDropped) + " empty row(s), " +
                 std::to_string(report_.emptyColumnsDropped) + " empty column(s), " +
                 std::to_string(report_.partialRowsDropped) + " partial row(s); kept " +
                 std::to_string(bundle.cleaned.rowCount()) + " rows");
    for (const auto& removed : report_.removedColumns) log("Clean", "Removed column '" + removed + "'");

    bundle.profiles = RelationshipDiscoverer::profile(bundle.cleaned);
    const std::vector<Relationship> relationships =
        RelationshipDiscoverer::discover(bundle.cleaned, config_.numberOfRelations);
    log("Relations", "Selected " + std::to_string(relationships.size()) + " relationship(s) of " +
                     std::to_string(config_.effectiveRelations()) + " requested");

    bundle.pivots.reserve(relationships.size());
    for (const auto& rel : relationships) {
        bundle.pivots.push_back(PivotBuilder::build(bundle.cleaned, rel));
        log("Pivot", bundle.pivots.back().title + ": " + std::to_string(bundle.pivots.back().indexLabels.size()) +
                     " x " + std::to_string(bundle.pivots.back().headers.size()) +
                     ", total " + std::to_string(bundle.pivots.back().total()));
    }

    bundle.hasDashboard = config_.requireDashboard && !bundle.pivots.empty();
    if (bundle.hasDashboard) {
        if (!renderer_) renderer_ = std::make_unique<ChartRenderer>(ChartRenderer::createDefault(config_.render));
        bundle.charts = renderer_->renderAll(bundle.pivots);
        size_t images = 0;
        for (const auto& chart : bundle.charts) {
            if (chart.hasImage()) ++images;
            log("Chart", chart.chartTitle + " -> " + renderBackendName(chart.backend));
        }
        log("Chart", std::to_string(images) + " of " + std::to_string(bundle.charts.size()) + " chart(s) rendered");
    }

    DashboardLayout layout = config_.layout;
    layout.imageWidthPx = config_.render.width;
    layout.imageHeightPx = config_.render.height;
    const Workbook workbook = WorkbookAssembler(layout).assemble(bundle.cleaned, bundle.pivots, bundle.charts, bundle.hasDashboard);
    bundle.sheetNames = workbook.sheetNames();
    bundle.workbook = XlsxWriter::write(workbook);
    log("Workbook", "Wrote " + std::to_string(bundle.sheetNames.size()) + " sheet(s), " +
                    std::to_string(bundle.workbook.size()) + " bytes");

    bundle.fileName = config_.outputFileName;
    bundle.requestedRelations = config_.numberOfRelations;
    bundle.generatedRelations = bundle.pivots.size();
    bundle.description = config_.description;

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    log("Done", "Pipeline finished in " + std::to_string(elapsedMs) + " ms");
    return bundle;
}
