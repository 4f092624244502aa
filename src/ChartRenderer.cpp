#include "ChartRenderer.h"
#include "DataFlowExceptions.h"
#include "GnuplotRasterizer.h"
#include "StaticRasterizer.h"

#include <iostream>

namespace {
// Returns an empty string on success, the failure text otherwise.
std::string attempt(ChartRasterizer* rasterizer, const ChartFigure& figure, std::vector<uint8_t>& image) {
    if (!rasterizer) return "renderer disabled";
    try {
        image = rasterizer->rasterize(figure);
        if (image.empty()) return rasterizer->name() + " produced no image";
        return "";
    } catch (const DataFlow::RenderBackendException& e) {
        return e.what();
    } catch (const std::exception& e) {
        return rasterizer->name() + ": " + e.what();
    }
}
} // namespace

const char* renderBackendName(RenderBackend backend) noexcept {
    switch (backend) {
        case RenderBackend::PRIMARY: return "primary";
        case RenderBackend::SECONDARY: return "secondary";
        case RenderBackend::NONE: break;
    }
    return "none";
}

ChartRenderer::ChartRenderer(RenderConfig cfg,
                             std::unique_ptr<ChartRasterizer> primary,
                             std::unique_ptr<ChartRasterizer> secondary)
    : cfg_(std::move(cfg)), primary_(std::move(primary)), secondary_(std::move(secondary)) {}

ChartRenderer ChartRenderer::createDefault(const RenderConfig& cfg) {
    std::unique_ptr<ChartRasterizer> primary;
    std::unique_ptr<ChartRasterizer> secondary;
    if (cfg.primaryEnabled) primary = std::make_unique<GnuplotRasterizer>(cfg);
    if (cfg.secondaryEnabled) secondary = std::make_unique<StaticRasterizer>(cfg);
    return ChartRenderer(cfg, std::move(primary), std::move(secondary));
}

ChartOutcome ChartRenderer::renderFigure(const ChartFigure& figure) {
    RenderedChart rendered;
    const std::string primaryError = attempt(primary_.get(), figure, rendered.image);
    if (primaryError.empty()) {
        rendered.backend = RenderBackend::PRIMARY;
        rendered.description = figure.describe();
        return rendered;
    }
    if (primary_) {
        std::cerr << "[DataFlow][Chart] Primary renderer failed for '" << figure.title << "': " << primaryError << "\n";
    }

    rendered.image.clear();
    const std::string secondaryError = attempt(secondary_.get(), figure, rendered.image);
    if (secondaryError.empty()) {
        rendered.backend = RenderBackend::SECONDARY;
        return rendered;
    }
    std::cerr << "[DataFlow][Chart] Secondary renderer failed for '" << figure.title << "': " << secondaryError
              << "; chart omitted\n";
    return FailedChart{primaryError, secondaryError};
}

ChartSpec ChartRenderer::render(const PivotTable& pivot, size_t position) {
    const ChartKind kind = chartKindForPosition(position);
    const ChartFigure figure = ChartFigure::fromPivot(pivot, kind, cfg_.width, cfg_.height);

    ChartSpec spec;
    spec.title = pivot.title;
    spec.chartTitle = figure.title;
    spec.kind = kind;
    spec.position = position;

    ChartOutcome outcome = renderFigure(figure);
    if (auto* rendered = std::get_if<RenderedChart>(&outcome)) {
        spec.backend = rendered->backend;
        spec.image = std::move(rendered->image);
        spec.description = std::move(rendered->description);
    }
    return spec;
}

std::vector<ChartSpec> ChartRenderer::renderAll(const std::vector<PivotTable>& pivots) {
    std::vector<ChartSpec> out;
    out.reserve(pivots.size());
    for (size_t i = 0; i < pivots.size(); ++i) out.push_back(render(pivots[i], i));
    return out;
}
