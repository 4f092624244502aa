#pragma once
#include "ChartFigure.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Immutable rendering settings shared by every rasterizer of one run.
 */
struct RenderConfig {
    int width = 600;
    int height = 400;
    std::string gnuplotExecutable = "gnuplot";
    // Parent of per-chart scratch directories; empty means the system temp directory.
    std::string scratchDir;
    bool primaryEnabled = true;
    bool secondaryEnabled = true;
    std::string theme = "light";
};

/**
 * @brief Turns a chart figure into PNG bytes.
 * @details Implementations throw DataFlow::RenderBackendException on any failure and must
 * release every temporary resource before returning or throwing.
 */
class ChartRasterizer {
public:
    virtual ~ChartRasterizer() = default;
    virtual std::string name() const = 0;
    virtual std::vector<uint8_t> rasterize(const ChartFigure& figure) = 0;
};
