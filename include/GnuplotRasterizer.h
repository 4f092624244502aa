#pragma once
#include "ChartRasterizer.h"

#include <string>

/**
 * @brief Primary backend: writes a data file and a script into a per-chart scratch
 * directory, runs gnuplot with the pngcairo terminal and reads the image back.
 * @details The gnuplot process is waited for and the scratch directory removed before
 * rasterize() returns or throws.
 */
class GnuplotRasterizer : public ChartRasterizer {
public:
    explicit GnuplotRasterizer(RenderConfig cfg);

    std::string name() const override { return "gnuplot"; }
    std::vector<uint8_t> rasterize(const ChartFigure& figure) override;

    bool isAvailable() const;

    static std::string quoteForGnuplot(const std::string& value);
    static std::string sanitizeLabel(const std::string& value, size_t maxLen = 24);

    // Script text only, for a given output and data path.
    std::string buildScript(const ChartFigure& figure, const std::string& outputPath, const std::string& dataPath) const;
    static std::string buildData(const ChartFigure& figure);

private:
    std::string styledHeader(const std::string& title, const std::string& outputPath) const;
    std::string axisColor() const;

    RenderConfig cfg_;
};
