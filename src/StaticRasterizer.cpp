#include "StaticRasterizer.h"
#include "DataFlowExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kLeft = 64.0;
constexpr double kRight = 20.0;
constexpr double kTop = 44.0;
constexpr double kBottom = 64.0;
constexpr double kLabelSize = 11.0;
constexpr double kTitleSize = 16.0;

const Rgb kPalette[] = {
    {0x25, 0x63, 0xeb}, {0x05, 0x96, 0x69}, {0xdc, 0x26, 0x26}, {0x7c, 0x3a, 0xed},
    {0xd9, 0x77, 0x06}, {0x08, 0x91, 0xb2}, {0xbe, 0x12, 0x3c}, {0x4f, 0x46, 0xe5},
};

Rgb mix(Rgb a, Rgb b, double t) {
    t = std::clamp(t, 0.0, 1.0);
    auto lerp = [t](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>(std::lround(static_cast<double>(x) + (static_cast<double>(y) - x) * t));
    };
    return Rgb{lerp(a.r, b.r), lerp(a.g, b.g), lerp(a.b, b.b)};
}

// Clips text to a pixel budget, marking truncation with "..".
std::string fitText(const RasterCanvas& canvas, const std::string& text, double maxWidth, double size = kLabelSize) {
    if (canvas.textWidth(text, size) <= maxWidth) return text;
    std::string out = text;
    while (!out.empty() && canvas.textWidth(out + "..", size) > maxWidth) {
        out.pop_back();
        // Never leave a partial UTF-8 sequence behind.
        while (!out.empty() && (static_cast<unsigned char>(out.back()) & 0xC0) == 0x80) out.pop_back();
        if (!out.empty() && static_cast<unsigned char>(out.back()) >= 0xC0) out.pop_back();
    }
    return out.empty() ? std::string() : out + "..";
}

// Rounds the axis maximum up to 1, 2 or 5 times a power of ten.
double niceCeiling(double v) {
    if (v <= 1.0) return 1.0;
    const double mag = std::pow(10.0, std::floor(std::log10(v)));
    for (double step : {1.0, 2.0, 5.0, 10.0}) {
        if (step * mag >= v) return step * mag;
    }
    return 10.0 * mag;
}

std::string tickText(double v) {
    if (std::floor(v) == v && std::abs(v) < 1e15) return std::to_string(static_cast<long long>(v));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}
} // namespace

StaticRasterizer::StaticRasterizer(RenderConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.theme == "dark") {
        theme_ = Theme{{0x11, 0x18, 0x27}, {0xf9, 0xfa, 0xfb}, {0x6b, 0x72, 0x80}, {0x37, 0x41, 0x51}, kPalette[0]};
    } else {
        theme_ = Theme{{0xff, 0xff, 0xff}, {0x1f, 0x29, 0x37}, {0x9c, 0xa3, 0xaf}, {0xe5, 0xe7, 0xeb}, kPalette[0]};
    }
}

void StaticRasterizer::drawTitle(RasterCanvas& canvas, const std::string& title) const {
    const std::string text = fitText(canvas, title, canvas.width() - 20.0, kTitleSize);
    const double w = canvas.textWidth(text, kTitleSize, true);
    canvas.drawText((canvas.width() - w) / 2.0, 26.0, text, theme_.text, kTitleSize, true);
}

void StaticRasterizer::drawAxisLabels(RasterCanvas& canvas, const ChartFigure& figure,
                                      double plotX, double plotY, double plotW, double plotH) const {
    const std::string xLabel = fitText(canvas, figure.xLabel, plotW);
    canvas.drawText(plotX + (plotW - canvas.textWidth(xLabel)) / 2.0, canvas.height() - 10.0, xLabel, theme_.text);
    const std::string yLabel = fitText(canvas, figure.yLabel, plotH);
    canvas.drawTextVertical(18.0, plotY + (plotH + canvas.textWidth(yLabel)) / 2.0, yLabel, theme_.text);
}

void StaticRasterizer::drawCartesian(RasterCanvas& canvas, const ChartFigure& figure) const {
    const double plotX = kLeft;
    const double plotY = kTop;
    const double plotW = canvas.width() - kLeft - kRight;
    const double plotH = canvas.height() - kTop - kBottom;
    if (plotW <= 10.0 || plotH <= 10.0) return;

    const double yMax = niceCeiling(figure.maxValue());
    const int ticks = 5;
    for (int t = 0; t <= ticks; ++t) {
        const double v = yMax * t / ticks;
        const double y = plotY + plotH - plotH * (v / yMax);
        if (t > 0) canvas.drawLine(plotX + 1.0, y, plotX + plotW, y, theme_.grid);
        const std::string label = tickText(v);
        canvas.drawText(plotX - 6.0 - canvas.textWidth(label), y + 4.0, label, theme_.text);
    }
    canvas.drawLine(plotX, plotY, plotX, plotY + plotH, theme_.axis);
    canvas.drawLine(plotX, plotY + plotH, plotX + plotW, plotY + plotH, theme_.axis);

    const size_t n = figure.values.size();
    const double slot = n > 0 ? plotW / static_cast<double>(n) : plotW;
    auto centerX = [&](size_t i) { return plotX + slot * (static_cast<double>(i) + 0.5); };
    auto valueY = [&](double v) { return plotY + plotH - plotH * std::clamp(v / yMax, 0.0, 1.0); };

    const bool verticalLabels = n > 0 && slot < 40.0;
    for (size_t i = 0; i < n && i < figure.categories.size(); ++i) {
        const double cx = centerX(i);
        canvas.drawLine(cx, plotY + plotH, cx, plotY + plotH + 4.0, theme_.axis);
        if (verticalLabels) {
            if (slot < 12.0 && i % static_cast<size_t>(std::ceil(12.0 / slot)) != 0) continue;
            const std::string label = fitText(canvas, figure.categories[i], kBottom - 24.0);
            canvas.drawTextVertical(cx + 4.0, plotY + plotH + 8.0 + canvas.textWidth(label), label, theme_.text);
        } else {
            const std::string label = fitText(canvas, figure.categories[i], slot - 4.0);
            canvas.drawText(cx - canvas.textWidth(label) / 2.0, plotY + plotH + 18.0, label, theme_.text);
        }
    }

    switch (figure.kind) {
        case ChartKind::BAR: {
            const double barW = std::max(1.0, slot * 0.7);
            for (size_t i = 0; i < n; ++i) {
                const double top = valueY(figure.values[i]);
                canvas.fillRect(centerX(i) - barW / 2.0, top, barW, plotY + plotH - top, theme_.series);
            }
            break;
        }
        case ChartKind::AREA: {
            std::vector<std::pair<double, double>> outline;
            outline.reserve(n + 2);
            outline.emplace_back(centerX(0), plotY + plotH);
            for (size_t i = 0; i < n; ++i) outline.emplace_back(centerX(i), valueY(figure.values[i]));
            outline.emplace_back(centerX(n - 1), plotY + plotH);
            canvas.fillPolygon(outline, mix(theme_.background, theme_.series, 0.35));
            for (size_t i = 0; i + 1 < n; ++i) {
                canvas.drawLine(centerX(i), valueY(figure.values[i]), centerX(i + 1), valueY(figure.values[i + 1]), theme_.series, 2.0);
            }
            break;
        }
        case ChartKind::LINE:
            for (size_t i = 0; i + 1 < n; ++i) {
                canvas.drawLine(centerX(i), valueY(figure.values[i]), centerX(i + 1), valueY(figure.values[i + 1]), theme_.series, 2.0);
            }
            for (size_t i = 0; i < n; ++i) canvas.fillCircle(centerX(i), valueY(figure.values[i]), 3.0, theme_.series);
            break;
        default:
            for (size_t i = 0; i < n; ++i) canvas.fillCircle(centerX(i), valueY(figure.values[i]), 4.0, theme_.series);
            break;
    }

    drawAxisLabels(canvas, figure, plotX, plotY, plotW, plotH);
}

void StaticRasterizer::drawPie(RasterCanvas& canvas, const ChartFigure& figure) const {
    double total = 0.0;
    for (double v : figure.values) if (v > 0.0) total += v;

    const double legendW = std::min(200.0, canvas.width() / 3.0);
    const double areaW = canvas.width() - legendW;
    const double radius = std::max(4.0, std::min(areaW, canvas.height() - kTop) / 2.0 - 16.0);
    const double cx = areaW / 2.0;
    const double cy = kTop + (canvas.height() - kTop) / 2.0;

    if (total <= 0.0) {
        canvas.fillCircle(cx, cy, radius, theme_.grid);
        return;
    }

    // Clockwise from twelve o'clock.
    double angle = -kPi / 2.0;
    double legendY = kTop + 10.0;
    for (size_t i = 0; i < figure.values.size(); ++i) {
        if (figure.values[i] <= 0.0) continue;
        const double frac = figure.values[i] / total;
        const double next = angle + frac * 2.0 * kPi;
        const Rgb color = kPalette[i % (sizeof(kPalette) / sizeof(kPalette[0]))];
        canvas.fillWedge(cx, cy, radius, angle, next, color);
        angle = next;

        if (legendY + 14.0 < canvas.height()) {
            const int pct = static_cast<int>(std::lround(frac * 100.0));
            const std::string label = fitText(canvas, figure.categories[i], legendW - 60.0) + " (" + std::to_string(pct) + "%)";
            canvas.fillRect(areaW, legendY, 9.0, 9.0, color);
            canvas.drawText(areaW + 14.0, legendY + 9.0, label, theme_.text);
            legendY += 16.0;
        }
    }
}

void StaticRasterizer::drawHeatmap(RasterCanvas& canvas, const ChartFigure& figure) const {
    const size_t rows = figure.matrix.size();
    const size_t cols = figure.columnLabels.size();
    const double plotX = kLeft + 20.0;
    const double plotY = kTop;
    const double plotW = canvas.width() - plotX - kRight;
    const double plotH = canvas.height() - kTop - kBottom;
    if (rows == 0 || cols == 0 || plotW <= 10.0 || plotH <= 10.0) return;

    const double maxValue = std::max(1.0, figure.maxValue());
    const Rgb low{0xf3, 0xf4, 0xf6};
    const Rgb high{0x1e, 0x3a, 0x8a};
    const double cellW = plotW / static_cast<double>(cols);
    const double cellH = plotH / static_cast<double>(rows);

    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols && c < figure.matrix[r].size(); ++c) {
            const double x0 = plotX + cellW * c;
            const double y0 = plotY + cellH * r;
            const double t = figure.matrix[r][c] / maxValue;
            canvas.fillRect(x0, y0, cellW, cellH, mix(low, high, t));

            const std::string value = tickText(figure.matrix[r][c]);
            const double w = canvas.textWidth(value);
            if (w + 4.0 < cellW && 13.0 < cellH) {
                const Rgb ink = t > 0.5 ? Rgb{0xff, 0xff, 0xff} : Rgb{0x1f, 0x29, 0x37};
                canvas.drawText(x0 + (cellW - w) / 2.0, y0 + cellH / 2.0 + 4.0, value, ink);
            }
        }
    }
    canvas.strokeRect(plotX, plotY, plotW, plotH, theme_.axis);

    for (size_t r = 0; r < rows && r < figure.categories.size(); ++r) {
        const std::string label = fitText(canvas, figure.categories[r], plotX - 24.0);
        const double y = plotY + cellH * (r + 0.5);
        canvas.drawText(plotX - 4.0 - canvas.textWidth(label), y + 4.0, label, theme_.text);
    }
    for (size_t c = 0; c < cols; ++c) {
        const std::string label = fitText(canvas, figure.columnLabels[c], cellW - 2.0);
        const double x = plotX + cellW * (c + 0.5);
        canvas.drawText(x - canvas.textWidth(label) / 2.0, plotY + plotH + 16.0, label, theme_.text);
    }

    drawAxisLabels(canvas, figure, plotX, plotY, plotW, plotH);
}

RasterCanvas StaticRasterizer::draw(const ChartFigure& figure) const {
    RasterCanvas canvas(cfg_.width, cfg_.height, theme_.background);
    drawTitle(canvas, figure.title);
    if (figure.empty()) {
        const std::string text = "No data";
        const double size = 22.0;
        canvas.drawText((canvas.width() - canvas.textWidth(text, size)) / 2.0, canvas.height() / 2.0, text, theme_.axis, size);
        return canvas;
    }
    switch (figure.kind) {
        case ChartKind::PIE: drawPie(canvas, figure); break;
        case ChartKind::HEATMAP: drawHeatmap(canvas, figure); break;
        default: drawCartesian(canvas, figure); break;
    }
    return canvas;
}

std::vector<uint8_t> StaticRasterizer::rasterize(const ChartFigure& figure) {
    if (cfg_.width <= 0 || cfg_.height <= 0) {
        throw DataFlow::RenderBackendException("Invalid canvas size " + std::to_string(cfg_.width) + "x" + std::to_string(cfg_.height));
    }
    return draw(figure).encodePng();
}
