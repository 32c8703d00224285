#include "cairo_canvas.hpp"

#include "core/errors.hpp"

#include <cairo-pdf.h>
#include <cairo-svg.h>
#include <pango/pangocairo.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace geoplot::rendering {

namespace {

struct SurfaceDeleter {
    void operator()(cairo_surface_t* surface) const { cairo_surface_destroy(surface); }
};

struct ContextDeleter {
    void operator()(cairo_t* cr) const { cairo_destroy(cr); }
};

using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDeleter>;
using ContextPtr = std::unique_ptr<cairo_t, ContextDeleter>;

void check_status(cairo_status_t status, const std::string& what) {
    if (status != CAIRO_STATUS_SUCCESS) {
        throw core::BackendFailure(what + ": " + cairo_status_to_string(status));
    }
}

void set_source(cairo_t* cr, const core::Color& color, double alpha) {
    cairo_set_source_rgba(cr, color.r, color.g, color.b, color.a * alpha);
}

// Dash lengths in multiples of the line width
void apply_dash(cairo_t* cr, core::LineStyle line_style, double line_width) {
    static constexpr std::array<double, 2> kDashed{3.7, 1.6};
    static constexpr std::array<double, 2> kDotted{1.0, 1.65};
    static constexpr std::array<double, 4> kDashDot{6.4, 1.6, 1.0, 1.6};

    auto set = [&](const auto& pattern) {
        std::array<double, 4> scaled{};
        for (std::size_t i = 0; i < pattern.size(); ++i) {
            scaled[i] = pattern[i] * line_width;
        }
        cairo_set_dash(cr, scaled.data(), static_cast<int>(pattern.size()), 0.0);
    };

    switch (line_style) {
    case core::LineStyle::Dashed: set(kDashed); break;
    case core::LineStyle::Dotted: set(kDotted); break;
    case core::LineStyle::DashDot: set(kDashDot); break;
    case core::LineStyle::Solid:
    case core::LineStyle::None:
        cairo_set_dash(cr, nullptr, 0, 0.0);
        break;
    }
}

void draw_marker_glyph(cairo_t* cr, const core::Point2D& at, const core::Style& style, double units_per_point) {
    const double size = style.marker_size * units_per_point;
    const double r = size * 0.5;
    const double edge = std::max(0.5, style.line_width * 0.5) * units_per_point;

    cairo_new_path(cr);
    bool fillable = true;
    switch (style.marker) {
    case core::MarkerShape::None:
        return;
    case core::MarkerShape::Circle:
        cairo_arc(cr, at.x, at.y, r, 0, 2 * M_PI);
        break;
    case core::MarkerShape::Point:
        cairo_arc(cr, at.x, at.y, r * 0.5, 0, 2 * M_PI);
        break;
    case core::MarkerShape::Square:
        cairo_rectangle(cr, at.x - r, at.y - r, size, size);
        break;
    case core::MarkerShape::TriangleUp:
        cairo_move_to(cr, at.x, at.y - r);
        cairo_line_to(cr, at.x + r, at.y + r);
        cairo_line_to(cr, at.x - r, at.y + r);
        cairo_close_path(cr);
        break;
    case core::MarkerShape::TriangleDown:
        cairo_move_to(cr, at.x, at.y + r);
        cairo_line_to(cr, at.x + r, at.y - r);
        cairo_line_to(cr, at.x - r, at.y - r);
        cairo_close_path(cr);
        break;
    case core::MarkerShape::Diamond:
        cairo_move_to(cr, at.x, at.y - r);
        cairo_line_to(cr, at.x + r, at.y);
        cairo_line_to(cr, at.x, at.y + r);
        cairo_line_to(cr, at.x - r, at.y);
        cairo_close_path(cr);
        break;
    case core::MarkerShape::Plus:
        cairo_move_to(cr, at.x - r, at.y);
        cairo_line_to(cr, at.x + r, at.y);
        cairo_move_to(cr, at.x, at.y - r);
        cairo_line_to(cr, at.x, at.y + r);
        fillable = false;
        break;
    case core::MarkerShape::Cross:
        cairo_move_to(cr, at.x - r, at.y - r);
        cairo_line_to(cr, at.x + r, at.y + r);
        cairo_move_to(cr, at.x - r, at.y + r);
        cairo_line_to(cr, at.x + r, at.y - r);
        fillable = false;
        break;
    }

    set_source(cr, style.color, style.alpha);
    cairo_set_dash(cr, nullptr, 0, 0.0);
    if (fillable) {
        cairo_fill_preserve(cr);
        cairo_set_line_width(cr, edge);
    } else {
        cairo_set_line_width(cr, std::max(edge, style.line_width * units_per_point));
    }
    cairo_stroke(cr);
}

// 1, 2 or 5 times a power of ten giving roughly `target` intervals
double nice_step(double range, int target) {
    if (range <= 0.0) {
        return 1.0;
    }
    const double raw = range / target;
    const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
    const double fraction = raw / magnitude;
    if (fraction < 1.5) return magnitude;
    if (fraction < 3.5) return 2.0 * magnitude;
    if (fraction < 7.5) return 5.0 * magnitude;
    return 10.0 * magnitude;
}

constexpr int kMaxTicks = 100;

// Multiples of `step` inside [lo, hi]. Empty when the step no longer moves a
// value of this magnitude.
std::vector<double> tick_positions(double lo, double hi, double step) {
    std::vector<double> ticks;
    if (!(step > 0.0) || lo + step == lo || (hi - lo) / step > kMaxTicks) {
        return ticks;
    }
    const double first = std::ceil(lo / step);
    for (int k = 0; k <= kMaxTicks; ++k) {
        const double value = (first + k) * step;
        if (value > hi + step * 1e-9) {
            break;
        }
        ticks.push_back(value);
    }
    return ticks;
}

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

core::Point2D CairoCanvas::Frame::to_device(const core::Point2D& point) const {
    const double x = left + offset_x + (point.x - view.x_min) * scale_x;
    const double y = top + height - offset_y - (point.y - view.y_min) * scale_y;
    return core::Point2D{x, y};
}

CairoCanvas::CairoCanvas() : CairoCanvas(Options{}) {}

CairoCanvas::CairoCanvas(const Options& options) : options_(options) {}

std::unique_ptr<Primitive> CairoCanvas::draw_marker(const core::Point2D& point, const core::Style& style) {
    if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
        throw core::BackendFailure("Cannot draw a marker at a non-finite coordinate");
    }
    return std::make_unique<Primitive>(PrimitiveKind::Marker, std::vector<core::Point2D>{point},
                                       std::vector<core::PathInstruction>{core::PathInstruction::MoveTo}, style);
}

std::unique_ptr<Primitive> CairoCanvas::draw_path(const std::vector<core::Point2D>& vertices,
                                                  const core::Style& style, bool closed) {
    if (vertices.empty()) {
        throw core::BackendFailure("Cannot draw a path without vertices");
    }
    std::vector<core::PathInstruction> instructions(vertices.size(), core::PathInstruction::LineTo);
    instructions.front() = core::PathInstruction::MoveTo;
    return std::make_unique<Primitive>(PrimitiveKind::StrokedPath, vertices, std::move(instructions), style, closed);
}

std::unique_ptr<Primitive> CairoCanvas::draw_compound_path(const core::PathSpec& path, const core::Style& style) {
    if (path.vertices.empty() || path.vertices.size() != path.instructions.size()) {
        throw core::BackendFailure("Compound path needs one instruction per vertex");
    }
    if (path.instructions.front() != core::PathInstruction::MoveTo) {
        throw core::BackendFailure("Compound path must start with a MoveTo");
    }
    return std::make_unique<Primitive>(PrimitiveKind::CompoundPath, path.vertices, path.instructions, style, true);
}

bool CairoCanvas::is_attached(const Primitive& primitive) const {
    return std::find(attached_.begin(), attached_.end(), &primitive) != attached_.end();
}

void CairoCanvas::attach(Primitive& primitive) {
    if (is_attached(primitive)) {
        throw core::BackendFailure("Primitive is already attached to the canvas");
    }
    attached_.push_back(&primitive);
}

void CairoCanvas::detach(Primitive& primitive) {
    auto it = std::find(attached_.begin(), attached_.end(), &primitive);
    if (it == attached_.end()) {
        throw core::BackendFailure("Primitive is not attached to the canvas");
    }
    attached_.erase(it);
}

void CairoCanvas::detach_all() {
    attached_.clear();
}

void CairoCanvas::set_bounds(const core::Bounds2D& bounds) {
    if (!bounds.is_valid() || bounds.width() <= 0.0 || bounds.height() <= 0.0) {
        throw core::BackendFailure("View limits must have positive width and height");
    }
    explicit_bounds_ = bounds;
}

void CairoCanvas::clear_bounds() {
    explicit_bounds_.reset();
}

core::Bounds2D CairoCanvas::bounds() const {
    if (explicit_bounds_) {
        return *explicit_bounds_;
    }
    if (attached_.empty()) {
        return core::Bounds2D{0.0, 1.0, 0.0, 1.0};
    }

    core::Bounds2D data = attached_.front()->bounds();
    for (const auto* primitive : attached_) {
        const auto b = primitive->bounds();
        data.expand(core::Point2D{b.x_min, b.y_min});
        data.expand(core::Point2D{b.x_max, b.y_max});
    }

    // 5% padding, or a unit window around a single location
    const double pad_x = data.width() > 0.0 ? data.width() * 0.05 : 0.5;
    const double pad_y = data.height() > 0.0 ? data.height() * 0.05 : 0.5;
    return core::Bounds2D{data.x_min - pad_x, data.x_max + pad_x, data.y_min - pad_y, data.y_max + pad_y};
}

void CairoCanvas::set_equal_aspect(bool equal) {
    options_.equal_aspect = equal;
}

void CairoCanvas::set_axis_visible(bool visible) {
    options_.axis_visible = visible;
}

CairoCanvas::Frame CairoCanvas::make_frame(double width, double height, double units_per_point) const {
    const double margin = (options_.ticks ? 32.0 : 8.0) * units_per_point;

    Frame frame;
    frame.left = margin;
    frame.top = margin * 0.5;
    frame.width = std::max(1.0, width - margin * 1.5);
    frame.height = std::max(1.0, height - margin * 1.5);
    frame.view = bounds();

    frame.scale_x = frame.width / frame.view.width();
    frame.scale_y = frame.height / frame.view.height();
    if (options_.equal_aspect) {
        const double scale = std::min(frame.scale_x, frame.scale_y);
        frame.scale_x = scale;
        frame.scale_y = scale;
        frame.offset_x = (frame.width - frame.view.width() * scale) * 0.5;
        frame.offset_y = (frame.height - frame.view.height() * scale) * 0.5;
    }
    return frame;
}

void CairoCanvas::render(cairo_t* cr, double width, double height, double units_per_point) const {
    cairo_save(cr);

    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_rectangle(cr, 0, 0, width, height);
    cairo_fill(cr);

    const Frame frame = make_frame(width, height, units_per_point);

    cairo_save(cr);
    cairo_rectangle(cr, frame.left, frame.top, frame.width, frame.height);
    cairo_clip(cr);
    cairo_set_line_join(cr, CAIRO_LINE_JOIN_ROUND);
    cairo_set_line_cap(cr, CAIRO_LINE_CAP_BUTT);
    for (const auto* primitive : attached_) {
        draw_primitive(cr, frame, *primitive, units_per_point);
    }
    cairo_restore(cr);

    if (options_.axis_visible) {
        draw_axes(cr, frame, units_per_point);
    }

    cairo_restore(cr);
    check_status(cairo_status(cr), "Rendering failed");
}

void CairoCanvas::draw_primitive(cairo_t* cr, const Frame& frame, const Primitive& primitive,
                                 double units_per_point) const {
    const auto& style = primitive.style();
    const auto& vertices = primitive.vertices();
    const double line_width = style.line_width * units_per_point;

    switch (primitive.kind()) {
    case PrimitiveKind::Marker:
        draw_marker_glyph(cr, frame.to_device(vertices.front()), style, units_per_point);
        return;

    case PrimitiveKind::StrokedPath: {
        if (style.line_style != core::LineStyle::None && vertices.size() > 1) {
            cairo_new_path(cr);
            auto first = frame.to_device(vertices.front());
            cairo_move_to(cr, first.x, first.y);
            for (std::size_t i = 1; i < vertices.size(); ++i) {
                auto point = frame.to_device(vertices[i]);
                cairo_line_to(cr, point.x, point.y);
            }
            if (primitive.closed()) {
                cairo_close_path(cr);
            }
            set_source(cr, style.color, style.alpha);
            cairo_set_line_width(cr, line_width);
            apply_dash(cr, style.line_style, line_width);
            cairo_stroke(cr);
        }
        if (style.marker != core::MarkerShape::None) {
            for (const auto& vertex : vertices) {
                draw_marker_glyph(cr, frame.to_device(vertex), style, units_per_point);
            }
        }
        return;
    }

    case PrimitiveKind::CompoundPath: {
        cairo_new_path(cr);
        const auto& instructions = primitive.instructions();
        for (std::size_t i = 0; i < vertices.size(); ++i) {
            auto point = frame.to_device(vertices[i]);
            if (instructions[i] == core::PathInstruction::MoveTo) {
                if (i > 0) {
                    cairo_close_path(cr);
                }
                cairo_move_to(cr, point.x, point.y);
            } else {
                cairo_line_to(cr, point.x, point.y);
            }
        }
        cairo_close_path(cr);

        // Holes are wound against the outer ring, so non-zero winding leaves them empty
        cairo_set_fill_rule(cr, CAIRO_FILL_RULE_WINDING);
        if (style.filled) {
            set_source(cr, style.face_color, style.alpha);
            cairo_fill_preserve(cr);
        }
        if (style.line_style != core::LineStyle::None && style.line_width > 0.0) {
            set_source(cr, style.color, style.alpha);
            cairo_set_line_width(cr, line_width);
            apply_dash(cr, style.line_style, line_width);
            cairo_stroke(cr);
        } else {
            cairo_new_path(cr);
        }
        return;
    }
    }
}

void CairoCanvas::draw_axes(cairo_t* cr, const Frame& frame, double units_per_point) const {
    cairo_set_dash(cr, nullptr, 0, 0.0);
    cairo_set_source_rgb(cr, 0.0, 0.0, 0.0);
    cairo_set_line_width(cr, 0.8 * units_per_point);
    cairo_rectangle(cr, frame.left, frame.top, frame.width, frame.height);
    cairo_stroke(cr);

    if (!options_.ticks) {
        return;
    }

    // Visible data window, which is wider than the limits under equal aspect
    const double x0 = frame.view.x_min - frame.offset_x / frame.scale_x;
    const double x1 = x0 + frame.width / frame.scale_x;
    const double y0 = frame.view.y_min - frame.offset_y / frame.scale_y;
    const double y1 = y0 + frame.height / frame.scale_y;

    PangoLayout* layout = pango_cairo_create_layout(cr);
    PangoFontDescription* font = pango_font_description_from_string("Sans 8");
    pango_font_description_set_absolute_size(font, 8.0 * units_per_point * PANGO_SCALE);
    pango_layout_set_font_description(layout, font);
    pango_font_description_free(font);

    const double tick_length = 3.5 * units_per_point;
    char label[32];

    const double step_x = nice_step(x1 - x0, 5);
    for (const double x : tick_positions(x0, x1, step_x)) {
        const double dx = frame.left + (x - x0) * frame.scale_x;
        const double bottom = frame.top + frame.height;
        cairo_move_to(cr, dx, bottom);
        cairo_line_to(cr, dx, bottom + tick_length);
        cairo_stroke(cr);

        std::snprintf(label, sizeof(label), "%g", std::abs(x) < step_x * 1e-9 ? 0.0 : x);
        pango_layout_set_text(layout, label, -1);
        int text_w = 0;
        int text_h = 0;
        pango_layout_get_pixel_size(layout, &text_w, &text_h);
        cairo_move_to(cr, dx - text_w * 0.5, bottom + tick_length + units_per_point);
        pango_cairo_show_layout(cr, layout);
    }

    const double step_y = nice_step(y1 - y0, 5);
    for (const double y : tick_positions(y0, y1, step_y)) {
        const double dy = frame.top + frame.height - (y - y0) * frame.scale_y;
        cairo_move_to(cr, frame.left, dy);
        cairo_line_to(cr, frame.left - tick_length, dy);
        cairo_stroke(cr);

        std::snprintf(label, sizeof(label), "%g", std::abs(y) < step_y * 1e-9 ? 0.0 : y);
        pango_layout_set_text(layout, label, -1);
        int text_w = 0;
        int text_h = 0;
        pango_layout_get_pixel_size(layout, &text_w, &text_h);
        cairo_move_to(cr, frame.left - tick_length - units_per_point - text_w, dy - text_h * 0.5);
        pango_cairo_show_layout(cr, layout);
    }

    g_object_unref(layout);
}

void CairoCanvas::rasterize_to_file(const std::string& path, double dpi) {
    if (dpi <= 0.0) {
        throw core::BackendFailure("Resolution must be positive, got " + std::to_string(dpi));
    }

    const std::string ext = lower_extension(path);
    const double width_pt = options_.width_in * 72.0;
    const double height_pt = options_.height_in * 72.0;

    if (ext == ".png") {
        const int width_px = static_cast<int>(std::lround(options_.width_in * dpi));
        const int height_px = static_cast<int>(std::lround(options_.height_in * dpi));
        SurfacePtr surface(cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width_px, height_px));
        check_status(cairo_surface_status(surface.get()), "Failed to create image surface");
        {
            ContextPtr cr(cairo_create(surface.get()));
            render(cr.get(), width_px, height_px, dpi / 72.0);
        }
        check_status(cairo_surface_write_to_png(surface.get(), path.c_str()), "Failed to write " + path);
        log_message("Wrote " + path + " (" + std::to_string(width_px) + "x" + std::to_string(height_px) + " px)");
        return;
    }

    SurfacePtr surface;
    if (ext == ".pdf") {
        surface.reset(cairo_pdf_surface_create(path.c_str(), width_pt, height_pt));
    } else if (ext == ".svg") {
        surface.reset(cairo_svg_surface_create(path.c_str(), width_pt, height_pt));
    } else {
        throw core::BackendFailure("Unsupported output format '" + ext + "' for " + path);
    }
    check_status(cairo_surface_status(surface.get()), "Failed to create surface for " + path);
    {
        ContextPtr cr(cairo_create(surface.get()));
        render(cr.get(), width_pt, height_pt, 1.0);
    }
    cairo_surface_finish(surface.get());
    check_status(cairo_surface_status(surface.get()), "Failed to write " + path);
    log_message("Wrote " + path);
}

void CairoCanvas::log_message(const std::string& message, bool is_error) const {
    core::log_message(options_.log_callback, "CairoCanvas", message, is_error);
}

} // namespace geoplot::rendering
