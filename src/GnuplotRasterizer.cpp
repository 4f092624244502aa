#include "GnuplotRasterizer.h"
#include "DataFlowExceptions.h"
#include "ProcessUtils.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace {
constexpr double kPi = 3.14159265358979323846;

const std::vector<std::string>& palette() {
    static const std::vector<std::string> colors = {
        "#2563eb", "#059669", "#dc2626", "#7c3aed", "#d97706", "#0891b2", "#be123c", "#4f46e5"
    };
    return colors;
}

// Owns one chart's scratch directory; removed with everything in it on scope exit.
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& parent) {
        static std::atomic<unsigned> counter{0};
        std::error_code ec;
        const std::filesystem::path base = parent.empty() ? std::filesystem::temp_directory_path(ec)
                                                          : std::filesystem::path(parent);
        if (ec) throw DataFlow::RenderBackendException("No temporary directory available: " + ec.message());
        path_ = base / ("dataflow_chart_" + std::to_string(static_cast<long long>(::getpid())) + "_" +
                        std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_, ec);
        if (ec) {
            throw DataFlow::RenderBackendException("Could not create scratch directory '" + path_.string() + "': " + ec.message());
        }
    }
    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

bool writeFile(const std::string& path, const std::string& body) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << body;
    return static_cast<bool>(out);
}

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool looksLikePng(const std::vector<uint8_t>& bytes) {
    static const uint8_t kSig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    return bytes.size() > 8 && std::equal(std::begin(kSig), std::end(kSig), bytes.begin());
}
} // namespace

GnuplotRasterizer::GnuplotRasterizer(RenderConfig cfg) : cfg_(std::move(cfg)) {}

bool GnuplotRasterizer::isAvailable() const {
    return !ProcessUtils::findExecutableInPath(cfg_.gnuplotExecutable).empty();
}

std::string GnuplotRasterizer::quoteForGnuplot(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotRasterizer::sanitizeLabel(const std::string& value, size_t maxLen) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        const unsigned char uc = static_cast<unsigned char>(ch);
        // Enhanced-text control characters would otherwise be interpreted as markup.
        if (ch == '_' || ch == '^' || ch == '@' || ch == '&' || ch == '{' || ch == '}') {
            out.push_back('\\');
            out.push_back('\\');
            out.push_back(ch);
        } else if (uc < 0x20) {
            out.push_back(' ');
        } else {
            out.push_back(ch);
        }
    }
    if (maxLen > 3 && value.size() > maxLen) {
        std::string shortened = sanitizeLabel(value.substr(0, maxLen - 3), 0);
        return shortened + "...";
    }
    return out;
}

std::string GnuplotRasterizer::axisColor() const {
    return (cfg_.theme == "dark") ? "#e5e7eb" : "#374151";
}

std::string GnuplotRasterizer::styledHeader(const std::string& title, const std::string& outputPath) const {
    const bool darkTheme = (cfg_.theme == "dark");
    const std::string titleColor = darkTheme ? "#f9fafb" : "#1f2937";
    const std::string borderColor = darkTheme ? "#6b7280" : "#9ca3af";
    const std::string gridColor = darkTheme ? "#374151" : "#e5e7eb";
    const std::string bgColor = darkTheme ? "#111827" : "#ffffff";

    std::ostringstream script;
    script << "set terminal pngcairo size " << cfg_.width << "," << cfg_.height
           << " enhanced background rgb " << quoteForGnuplot(bgColor) << "\n";
    script << "set output " << quoteForGnuplot(outputPath) << "\n";
    script << "set title " << quoteForGnuplot(sanitizeLabel(title, 80))
           << " tc rgb " << quoteForGnuplot(titleColor) << " font ',14'\n";
    script << "set tmargin 3.4\nset bmargin 5.2\nset lmargin 8.6\nset rmargin 3.2\n";
    script << "set border linewidth 1.2 lc rgb " << quoteForGnuplot(borderColor) << "\n";
    script << "set tics textcolor rgb " << quoteForGnuplot(axisColor()) << " font ',10'\n";
    script << "set tics out nomirror\n";
    script << "set grid back lc rgb " << quoteForGnuplot(gridColor) << " lw 1 dt 2\n";
    script << "unset key\n";
    script << "set style line 1 lc rgb '#2563eb' lw 2 pt 7 ps 1.2\n";
    return script.str();
}

std::string GnuplotRasterizer::buildData(const ChartFigure& figure) {
    std::ostringstream data;
    data.precision(17);
    if (figure.kind == ChartKind::HEATMAP) {
        for (size_t r = 0; r < figure.matrix.size(); ++r) {
            for (size_t c = 0; c < figure.matrix[r].size(); ++c) {
                data << c << " " << r << " " << figure.matrix[r][c] << "\n";
            }
            data << "\n";
        }
        return data.str();
    }
    if (figure.kind == ChartKind::PIE) return "";
    for (size_t i = 0; i < figure.values.size(); ++i) data << i << " " << figure.values[i] << "\n";
    return data.str();
}

std::string GnuplotRasterizer::buildScript(const ChartFigure& figure,
                                           const std::string& outputPath,
                                           const std::string& dataPath) const {
    std::ostringstream script;
    script << styledHeader(figure.title, outputPath);
    const std::string color = quoteForGnuplot(axisColor());

    auto ticList = [&](char axis, const std::vector<std::string>& labels, const char* extra) {
        script << "set " << axis << "tics (";
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) script << ", ";
            script << quoteForGnuplot(sanitizeLabel(labels[i], 16)) << " " << i;
        }
        script << ")" << extra << "\n";
    };

    if (figure.kind == ChartKind::PIE) {
        double total = 0.0;
        for (double v : figure.values) if (v > 0.0) total += v;

        script << "unset border\nunset xtics\nunset ytics\nunset grid\n";
        script << "set size ratio -1\n";
        script << "set xrange [-1.6:1.6]\nset yrange [-1.25:1.25]\n";

        double angleStart = kPi / 2.0;
        int objectId = 1;
        for (size_t i = 0; i < figure.values.size(); ++i) {
            if (figure.values[i] <= 0.0 || total <= 0.0) continue;
            const double frac = figure.values[i] / total;
            const double angleEnd = angleStart - frac * 2.0 * kPi;

            script << "set object " << objectId << " polygon from 0,0 ";
            const int seg = std::max(2, static_cast<int>(std::ceil(frac * 72.0)));
            for (int s = 0; s <= seg; ++s) {
                const double t = angleStart + (angleEnd - angleStart) * static_cast<double>(s) / static_cast<double>(seg);
                script << "to " << std::cos(t) << "," << std::sin(t) << " ";
            }
            script << "to 0,0 fs solid 0.93 border lc rgb '#ffffff' fc rgb "
                   << quoteForGnuplot(palette()[i % palette().size()]) << "\n";

            const double mid = 0.5 * (angleStart + angleEnd);
            const int pct = static_cast<int>(std::round(frac * 100.0));
            script << "set label " << objectId << " "
                   << quoteForGnuplot(sanitizeLabel(figure.categories[i], 16) + " (" + std::to_string(pct) + "%)")
                   << " at " << 1.2 * std::cos(mid) << "," << 1.1 * std::sin(mid)
                   << " center tc rgb " << color << " font ',9'\n";
            ++objectId;
            angleStart = angleEnd;
        }
        script << "plot 1/0 notitle\n";
        return script.str();
    }

    if (figure.kind == ChartKind::HEATMAP) {
        const double maxValue = std::max(1.0, figure.maxValue());
        script << "unset grid\n";
        script << "set palette defined (0 '#f3f4f6', 1 '#93c5fd', 2 '#1e3a8a')\n";
        script << "set cbrange [0:" << maxValue << "]\n";
        script << "set cblabel " << quoteForGnuplot(sanitizeLabel(figure.colorLabel)) << " tc rgb " << color << "\n";
        script << "set xlabel " << quoteForGnuplot(sanitizeLabel(figure.xLabel, 40)) << " tc rgb " << color << " font ',11'\n";
        script << "set ylabel " << quoteForGnuplot(sanitizeLabel(figure.yLabel, 40)) << " tc rgb " << color << " font ',11'\n";
        script << "set xrange [-0.5:" << (static_cast<double>(figure.columnLabels.size()) - 0.5) << "]\n";
        script << "set yrange [" << (static_cast<double>(figure.categories.size()) - 0.5) << ":-0.5]\n";
        ticList('x', figure.columnLabels, " rotate by -30 font ',9'");
        ticList('y', figure.categories, " font ',9'");
        script << "plot " << quoteForGnuplot(dataPath) << " using 1:2:3 with image\n";
        return script.str();
    }

    const double maxValue = std::max(1.0, figure.maxValue());
    script << "set xlabel " << quoteForGnuplot(sanitizeLabel(figure.xLabel, 40)) << " tc rgb " << color << " font ',11'\n";
    script << "set ylabel " << quoteForGnuplot(sanitizeLabel(figure.yLabel, 40)) << " tc rgb " << color << " font ',11'\n";
    script << "set yrange [0:" << (maxValue * 1.12) << "]\n";
    script << "set xrange [-0.6:" << (static_cast<double>(figure.categories.size()) - 0.4) << "]\n";
    ticList('x', figure.categories, " rotate by -30 font ',9'");

    const std::string file = quoteForGnuplot(dataPath);
    switch (figure.kind) {
        case ChartKind::BAR:
            script << "set style fill solid 0.85 border lc rgb '#1d4ed8'\n";
            script << "set boxwidth 0.7\n";
            script << "plot " << file << " using 1:2 with boxes ls 1 notitle\n";
            break;
        case ChartKind::LINE:
            script << "plot " << file << " using 1:2 with linespoints ls 1 notitle\n";
            break;
        case ChartKind::SCATTER:
            script << "plot " << file << " using 1:2 with points ls 1 notitle\n";
            break;
        default:
            script << "set style fill transparent solid 0.35 noborder\n";
            script << "plot " << file << " using 1:2 with filledcurves y1=0 lc rgb '#2563eb' notitle, "
                   << file << " using 1:2 with lines ls 1 notitle\n";
            break;
    }
    return script.str();
}

std::vector<uint8_t> GnuplotRasterizer::rasterize(const ChartFigure& figure) {
    if (figure.empty()) {
        throw DataFlow::RenderBackendException("'" + figure.title + "' has no values to plot");
    }
    const std::string exe = ProcessUtils::findExecutableInPath(cfg_.gnuplotExecutable);
    if (exe.empty()) {
        throw DataFlow::RenderBackendException("gnuplot executable '" + cfg_.gnuplotExecutable + "' not found");
    }

    ScratchDirectory scratch(cfg_.scratchDir);
    const std::string dataFile = scratch.file("chart.dat");
    const std::string scriptFile = scratch.file("chart.plt");
    const std::string outputFile = scratch.file("chart.png");
    const std::string errFile = scratch.file("chart.err.log");

    if (!writeFile(dataFile, buildData(figure)) ||
        !writeFile(scriptFile, buildScript(figure, outputFile, dataFile))) {
        throw DataFlow::RenderBackendException("Could not write gnuplot inputs for '" + figure.title + "'");
    }

    const int rc = ProcessUtils::spawnWithStderr(exe, {scriptFile}, errFile);
    std::vector<uint8_t> png = readFile(outputFile);
    if (rc != 0 || !looksLikePng(png)) {
        const std::string firstLine = ProcessUtils::firstLineOf(errFile);
        std::string message = "gnuplot failed for '" + figure.title + "' rc=" + std::to_string(rc);
        if (!firstLine.empty()) message += " stderr='" + firstLine + "'";
        throw DataFlow::RenderBackendException(message);
    }
    return png;
}
