#pragma once
#include "ChartRasterizer.h"
#include "RasterCanvas.h"

/**
 * @brief Secondary backend: draws the chart in-process with cairo and encodes the surface
 * as PNG. Same size, axes and labels as the primary output; no external process.
 */
class StaticRasterizer : public ChartRasterizer {
public:
    explicit StaticRasterizer(RenderConfig cfg);

    std::string name() const override { return "static"; }
    std::vector<uint8_t> rasterize(const ChartFigure& figure) override;

    // Draws without encoding; exposed for inspection.
    RasterCanvas draw(const ChartFigure& figure) const;

private:
    struct Theme {
        Rgb background;
        Rgb text;
        Rgb axis;
        Rgb grid;
        Rgb series;
    };

    void drawCartesian(RasterCanvas& canvas, const ChartFigure& figure) const;
    void drawPie(RasterCanvas& canvas, const ChartFigure& figure) const;
    void drawHeatmap(RasterCanvas& canvas, const ChartFigure& figure) const;
    void drawTitle(RasterCanvas& canvas, const std::string& title) const;
    void drawAxisLabels(RasterCanvas& canvas, const ChartFigure& figure,
                        double plotX, double plotY, double plotW, double plotH) const;

    RenderConfig cfg_;
    Theme theme_;
};
