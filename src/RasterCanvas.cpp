#include "RasterCanvas.h"
#include "DataFlowExceptions.h"

#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;

cairo_status_t appendToVector(void* closure, const unsigned char* data, unsigned int length) {
    auto* out = static_cast<std::vector<uint8_t>*>(closure);
    out->insert(out->end(), data, data + length);
    return CAIRO_STATUS_SUCCESS;
}

double channel(uint8_t v) { return static_cast<double>(v) / 255.0; }
} // namespace

RasterCanvas::RasterCanvas(int width, int height, Rgb background)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw DataFlow::RenderBackendException("Invalid canvas size " + std::to_string(width) + "x" + std::to_string(height));
    }
    surface_.reset(cairo_image_surface_create(CAIRO_FORMAT_RGB24, width, height));
    if (cairo_surface_status(surface_.get()) != CAIRO_STATUS_SUCCESS) {
        throw DataFlow::RenderBackendException(std::string("cairo surface: ") +
                                               cairo_status_to_string(cairo_surface_status(surface_.get())));
    }
    cr_.reset(cairo_create(surface_.get()));
    if (cairo_status(cr_.get()) != CAIRO_STATUS_SUCCESS) {
        throw DataFlow::RenderBackendException(std::string("cairo context: ") + cairo_status_to_string(cairo_status(cr_.get())));
    }
    setColor(background);
    cairo_paint(cr_.get());
}

void RasterCanvas::setColor(Rgb color) {
    cairo_set_source_rgb(cr_.get(), channel(color.r), channel(color.g), channel(color.b));
}

void RasterCanvas::selectFont(double size, bool bold) const {
    cairo_select_font_face(cr_.get(), "sans-serif", CAIRO_FONT_SLANT_NORMAL,
                           bold ? CAIRO_FONT_WEIGHT_BOLD : CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr_.get(), size);
}

Rgb RasterCanvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Rgb{};
    cairo_surface_flush(surface_.get());
    const unsigned char* data = cairo_image_surface_get_data(surface_.get());
    const int stride = cairo_image_surface_get_stride(surface_.get());
    // RGB24 keeps each pixel as a native-endian 0x00RRGGBB word.
    const uint32_t word = *reinterpret_cast<const uint32_t*>(data + static_cast<size_t>(y) * stride + static_cast<size_t>(x) * 4);
    return Rgb{static_cast<uint8_t>((word >> 16) & 0xFF), static_cast<uint8_t>((word >> 8) & 0xFF),
               static_cast<uint8_t>(word & 0xFF)};
}

void RasterCanvas::fillRect(double x, double y, double w, double h, Rgb color) {
    if (w <= 0.0 || h <= 0.0) return;
    setColor(color);
    cairo_rectangle(cr_.get(), x, y, w, h);
    cairo_fill(cr_.get());
}

void RasterCanvas::strokeRect(double x, double y, double w, double h, Rgb color) {
    setColor(color);
    cairo_set_line_width(cr_.get(), 1.0);
    cairo_rectangle(cr_.get(), x + 0.5, y + 0.5, w - 1.0, h - 1.0);
    cairo_stroke(cr_.get());
}

void RasterCanvas::drawLine(double x0, double y0, double x1, double y1, Rgb color, double thickness) {
    setColor(color);
    cairo_set_line_width(cr_.get(), thickness);
    cairo_set_line_cap(cr_.get(), CAIRO_LINE_CAP_ROUND);
    cairo_move_to(cr_.get(), x0, y0);
    cairo_line_to(cr_.get(), x1, y1);
    cairo_stroke(cr_.get());
}

void RasterCanvas::fillPolygon(const std::vector<std::pair<double, double>>& points, Rgb color) {
    if (points.size() < 3) return;
    setColor(color);
    cairo_move_to(cr_.get(), points.front().first, points.front().second);
    for (size_t i = 1; i < points.size(); ++i) cairo_line_to(cr_.get(), points[i].first, points[i].second);
    cairo_close_path(cr_.get());
    cairo_fill(cr_.get());
}

void RasterCanvas::fillWedge(double cx, double cy, double radius, double startAngle, double endAngle, Rgb color) {
    setColor(color);
    cairo_move_to(cr_.get(), cx, cy);
    cairo_arc(cr_.get(), cx, cy, radius, startAngle, endAngle);
    cairo_close_path(cr_.get());
    cairo_fill(cr_.get());
}

void RasterCanvas::fillCircle(double cx, double cy, double radius, Rgb color) {
    setColor(color);
    cairo_new_sub_path(cr_.get());
    cairo_arc(cr_.get(), cx, cy, radius, 0.0, 2.0 * kPi);
    cairo_fill(cr_.get());
}

void RasterCanvas::drawText(double x, double y, const std::string& text, Rgb color, double size, bool bold) {
    if (text.empty()) return;
    selectFont(size, bold);
    setColor(color);
    cairo_move_to(cr_.get(), x, y);
    cairo_show_text(cr_.get(), text.c_str());
}

void RasterCanvas::drawTextVertical(double x, double y, const std::string& text, Rgb color, double size) {
    if (text.empty()) return;
    cairo_save(cr_.get());
    cairo_translate(cr_.get(), x, y);
    cairo_rotate(cr_.get(), -kPi / 2.0);
    selectFont(size, false);
    setColor(color);
    cairo_move_to(cr_.get(), 0.0, 0.0);
    cairo_show_text(cr_.get(), text.c_str());
    cairo_restore(cr_.get());
}

double RasterCanvas::textWidth(const std::string& text, double size, bool bold) const {
    if (text.empty()) return 0.0;
    selectFont(size, bold);
    cairo_text_extents_t extents;
    cairo_text_extents(cr_.get(), text.c_str(), &extents);
    return extents.x_advance;
}

std::vector<uint8_t> RasterCanvas::encodePng() const {
    cairo_surface_flush(surface_.get());
    std::vector<uint8_t> out;
    const cairo_status_t status = cairo_surface_write_to_png_stream(surface_.get(), appendToVector, &out);
    if (status != CAIRO_STATUS_SUCCESS) {
        throw DataFlow::RenderBackendException(std::string("cairo PNG encoding failed: ") + cairo_status_to_string(status));
    }
    return out;
}
