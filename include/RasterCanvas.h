#pragma once

#include <cairo.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/**
 * @brief Cairo image surface (RGB24) plus its drawing context.
 * @details Coordinates are pixels with y growing downwards. Text uses the cairo "toy" font API
 * with a sans-serif face; sizes are in pixels.
 */
class RasterCanvas {
public:
    /**
     * @throws DataFlow::RenderBackendException when cairo cannot create the surface.
     */
    RasterCanvas(int width, int height, Rgb background);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    Rgb pixel(int x, int y) const;

    void fillRect(double x, double y, double w, double h, Rgb color);
    void strokeRect(double x, double y, double w, double h, Rgb color);
    void drawLine(double x0, double y0, double x1, double y1, Rgb color, double thickness = 1.0);
    // Closed polygon from the given points, filled.
    void fillPolygon(const std::vector<std::pair<double, double>>& points, Rgb color);
    // Angles in radians, clockwise from the positive x axis (cairo convention).
    void fillWedge(double cx, double cy, double radius, double startAngle, double endAngle, Rgb color);
    void fillCircle(double cx, double cy, double radius, Rgb color);

    // (x, y) is the left end of the baseline.
    void drawText(double x, double y, const std::string& text, Rgb color, double size = 11.0, bool bold = false);
    // Rotated 90 degrees counter-clockwise; (x, y) is the start of the baseline.
    void drawTextVertical(double x, double y, const std::string& text, Rgb color, double size = 11.0);
    double textWidth(const std::string& text, double size = 11.0, bool bold = false) const;

    /**
     * @brief Encodes the surface through cairo_surface_write_to_png_stream.
     * @throws DataFlow::RenderBackendException when cairo reports an error.
     */
    std::vector<uint8_t> encodePng() const;

private:
    struct SurfaceDeleter {
        void operator()(cairo_surface_t* s) const { cairo_surface_destroy(s); }
    };
    struct ContextDeleter {
        void operator()(cairo_t* c) const { cairo_destroy(c); }
    };

    void setColor(Rgb color);
    void selectFont(double size, bool bold) const;

    int width_;
    int height_;
    std::unique_ptr<cairo_surface_t, SurfaceDeleter> surface_;
    std::unique_ptr<cairo_t, ContextDeleter> cr_;
};
