#pragma once
#include "BundleValue.h"
#include "PivotBuilder.h"

#include <string>
#include <vector>

enum class ChartKind { BAR, PIE, LINE, HEATMAP, SCATTER, AREA };

// Fixed rotation: bar, pie, line, heatmap, scatter, area, then bar again.
ChartKind chartKindForPosition(size_t position) noexcept;
const char* chartKindName(ChartKind kind) noexcept;
// " Bar Chart", " Pie Chart", ..., " Heatmap".
const char* chartTitleSuffix(ChartKind kind) noexcept;

/**
 * @brief Renderer-neutral description of one chart, built from a pivot table with the
 * index promoted to the first column.
 */
struct ChartFigure {
    ChartKind kind = ChartKind::BAR;
    std::string title;
    int width = 600;
    int height = 400;

    // X/labels come from the index, Y/values from the first value column.
    std::string xLabel;
    std::string yLabel;
    std::vector<std::string> categories;
    std::vector<double> values;

    // Heatmap only: rows are index labels, columns are headers.
    std::vector<std::string> columnLabels;
    std::vector<std::vector<double>> matrix;
    std::string colorLabel = "Count";

    static ChartFigure fromPivot(const PivotTable& pivot, ChartKind kind, int width, int height);

    bool empty() const noexcept;
    double maxValue() const noexcept;

    // Plotly-style {data, layout} description that a client can re-render interactively.
    BundleValue describe() const;
};
