#pragma once
#include "BundleSerializer.h"
#include "ChartRenderer.h"
#include "Cleaner.h"
#include "PipelineConfig.h"

#include <memory>

/**
 * @brief Runs one request end to end: load, clean, discover relationships, pivot,
 * render charts, assemble and serialize the workbook.
 * @details Structural and input errors propagate as DataFlow exceptions; per-chart
 * rendering failures are absorbed by the ChartRenderer.
 */
class ProcessingPipeline {
public:
    explicit ProcessingPipeline(PipelineConfig config);

    // Replaces the default gnuplot/static renderer pair.
    void setChartRenderer(std::unique_ptr<ChartRenderer> renderer);

    ResultBundle run();

    const PipelineConfig& config() const noexcept { return config_; }
    const CleaningReport& cleaningReport() const noexcept { return report_; }

private:
    CleaningPolicy cleaningPolicy() const;
    void log(const std::string& stage, const std::string& message) const;

    PipelineConfig config_;
    std::unique_ptr<ChartRenderer> renderer_;
    CleaningReport report_;
};
