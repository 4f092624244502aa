#pragma once
#include "BundleValue.h"
#include "ChartFigure.h"
#include "ChartRasterizer.h"
#include "PivotBuilder.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class RenderBackend { PRIMARY, SECONDARY, NONE };

const char* renderBackendName(RenderBackend backend) noexcept;

struct RenderedChart {
    RenderBackend backend = RenderBackend::PRIMARY;
    std::vector<uint8_t> image;
    // Only the primary backend keeps a re-renderable description.
    std::optional<BundleValue> description;
};

struct FailedChart {
    std::string primaryError;
    std::string secondaryError;
};

using ChartOutcome = std::variant<RenderedChart, FailedChart>;

struct ChartSpec {
    std::string title;
    std::string chartTitle;
    ChartKind kind = ChartKind::BAR;
    size_t position = 0;
    RenderBackend backend = RenderBackend::NONE;
    std::optional<std::vector<uint8_t>> image;
    std::optional<BundleValue> description;

    bool hasImage() const noexcept { return image.has_value(); }
};

/**
 * @brief Renders one chart per pivot through a primary and a secondary rasterizer.
 * @details Each chart resolves independently: primary success, secondary success, or
 * backend=none. Rasterizer failures are logged and never escape.
 */
class ChartRenderer {
public:
    ChartRenderer(RenderConfig cfg,
                  std::unique_ptr<ChartRasterizer> primary,
                  std::unique_ptr<ChartRasterizer> secondary);

    // gnuplot primary and in-process static secondary, each omitted when disabled in cfg.
    static ChartRenderer createDefault(const RenderConfig& cfg);

    ChartOutcome renderFigure(const ChartFigure& figure);
    ChartSpec render(const PivotTable& pivot, size_t position);
    std::vector<ChartSpec> renderAll(const std::vector<PivotTable>& pivots);

    const RenderConfig& config() const noexcept { return cfg_; }

private:
    const RenderConfig cfg_;
    std::unique_ptr<ChartRasterizer> primary_;
    std::unique_ptr<ChartRasterizer> secondary_;
};
