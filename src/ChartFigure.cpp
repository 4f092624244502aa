#include "ChartFigure.h"

#include <algorithm>

namespace {
constexpr ChartKind kRotation[] = {ChartKind::BAR, ChartKind::PIE, ChartKind::LINE,
                                   ChartKind::HEATMAP, ChartKind::SCATTER, ChartKind::AREA};

BundleValue stringArray(const std::vector<std::string>& items) {
    BundleValue out = BundleValue::array();
    for (const auto& s : items) out.push(s);
    return out;
}

BundleValue numberArray(const std::vector<double>& items) {
    BundleValue out = BundleValue::array();
    for (double v : items) out.push(v);
    return out;
}

BundleValue axisTitle(const std::string& text) {
    BundleValue title = BundleValue::object();
    title.set("text", text);
    BundleValue axis = BundleValue::object();
    axis.set("title", std::move(title));
    return axis;
}
} // namespace

ChartKind chartKindForPosition(size_t position) noexcept {
    return kRotation[position % (sizeof(kRotation) / sizeof(kRotation[0]))];
}

const char* chartKindName(ChartKind kind) noexcept {
    switch (kind) {
        case ChartKind::BAR: return "bar";
        case ChartKind::PIE: return "pie";
        case ChartKind::LINE: return "line";
        case ChartKind::HEATMAP: return "heatmap";
        case ChartKind::SCATTER: return "scatter";
        case ChartKind::AREA: return "area";
    }
    return "bar";
}

const char* chartTitleSuffix(ChartKind kind) noexcept {
    switch (kind) {
        case ChartKind::BAR: return " Bar Chart";
        case ChartKind::PIE: return " Pie Chart";
        case ChartKind::LINE: return " Line Chart";
        case ChartKind::HEATMAP: return " Heatmap";
        case ChartKind::SCATTER: return " Scatter Chart";
        case ChartKind::AREA: return " Area Chart";
    }
    return "";
}

ChartFigure ChartFigure::fromPivot(const PivotTable& pivot, ChartKind kind, int width, int height) {
    ChartFigure fig;
    fig.kind = kind;
    fig.title = pivot.title + chartTitleSuffix(kind);
    fig.width = width;
    fig.height = height;

    if (kind == ChartKind::HEATMAP) {
        fig.xLabel = pivot.columnAxis;
        fig.yLabel = pivot.indexColumn;
        fig.categories = pivot.indexLabels;
        fig.columnLabels = pivot.headers;
        fig.matrix.reserve(pivot.counts.size());
        for (const auto& row : pivot.counts) {
            fig.matrix.emplace_back(row.begin(), row.end());
        }
        return fig;
    }

    fig.xLabel = pivot.indexColumn;
    fig.categories = pivot.indexLabels;
    if (!pivot.headers.empty()) {
        fig.yLabel = pivot.headers.front();
        fig.values.reserve(pivot.counts.size());
        for (const auto& row : pivot.counts) fig.values.push_back(static_cast<double>(row.front()));
    }
    return fig;
}

bool ChartFigure::empty() const noexcept {
    if (kind == ChartKind::HEATMAP) return matrix.empty() || columnLabels.empty();
    return values.empty();
}

double ChartFigure::maxValue() const noexcept {
    double best = 0.0;
    for (double v : values) best = std::max(best, v);
    for (const auto& row : matrix) {
        for (double v : row) best = std::max(best, v);
    }
    return best;
}

BundleValue ChartFigure::describe() const {
    BundleValue trace = BundleValue::object();
    switch (kind) {
        case ChartKind::PIE:
            trace.set("type", "pie");
            trace.set("labels", stringArray(categories));
            trace.set("values", numberArray(values));
            break;
        case ChartKind::HEATMAP: {
            trace.set("type", "heatmap");
            trace.set("x", stringArray(columnLabels));
            trace.set("y", stringArray(categories));
            BundleValue z = BundleValue::array();
            for (const auto& row : matrix) z.push(numberArray(row));
            trace.set("z", std::move(z));
            trace.set("colorbar", axisTitle(colorLabel));
            break;
        }
        default:
            trace.set("type", kind == ChartKind::BAR ? "bar" : "scatter");
            if (kind == ChartKind::LINE) trace.set("mode", "lines");
            if (kind == ChartKind::SCATTER) trace.set("mode", "markers");
            if (kind == ChartKind::AREA) {
                trace.set("mode", "lines");
                trace.set("fill", "tozeroy");
            }
            trace.set("x", stringArray(categories));
            trace.set("y", numberArray(values));
            break;
    }

    BundleValue data = BundleValue::array();
    data.push(std::move(trace));

    BundleValue title = BundleValue::object();
    title.set("text", this->title);
    BundleValue layout = BundleValue::object();
    layout.set("title", std::move(title));
    layout.set("width", width);
    layout.set("height", height);
    if (kind != ChartKind::PIE) {
        layout.set("xaxis", axisTitle(xLabel));
        layout.set("yaxis", axisTitle(yLabel));
    }

    BundleValue figure = BundleValue::object();
    figure.set("data", std::move(data));
    figure.set("layout", std::move(layout));
    return figure;
}
