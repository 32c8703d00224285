#pragma once

#include "render_backend.hpp"

#include "core/log.hpp"
#include "core/types.hpp"

#include <cairo.h>
#include <optional>
#include <string>
#include <vector>

namespace geoplot::rendering {

// Cairo rendering backend. Keeps attached primitives in draw order and paints
// them into any cairo context: a GTK drawing area, an image or a vector file.
class CairoCanvas : public RenderBackend {
public:
    struct Options {
        double width_in = 8.0;
        double height_in = 6.0;
        double dpi = 100.0;
        bool equal_aspect = true;
        bool axis_visible = true;
        bool ticks = false;
        core::LogCallback log_callback;
    };

    CairoCanvas();
    explicit CairoCanvas(const Options& options);

    std::unique_ptr<Primitive> draw_marker(const core::Point2D& point, const core::Style& style) override;
    std::unique_ptr<Primitive> draw_path(const std::vector<core::Point2D>& vertices,
                                         const core::Style& style, bool closed = false) override;
    std::unique_ptr<Primitive> draw_compound_path(const core::PathSpec& path, const core::Style& style) override;

    void attach(Primitive& primitive) override;
    void detach(Primitive& primitive) override;
    void detach_all() override;

    void set_bounds(const core::Bounds2D& bounds) override;
    void clear_bounds() override;
    [[nodiscard]] core::Bounds2D bounds() const override;
    void set_equal_aspect(bool equal) override;
    void set_axis_visible(bool visible) override;

    void rasterize_to_file(const std::string& path, double dpi) override;

    // Paints the figure into `cr` covering width x height device units.
    // `units_per_point` converts style sizes (points) to device units.
    void render(cairo_t* cr, double width, double height, double units_per_point) const;

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const std::vector<const Primitive*>& attached() const { return attached_; }
    [[nodiscard]] bool is_attached(const Primitive& primitive) const;

private:
    // Maps data coordinates into the plot area of the current frame
    struct Frame {
        double left = 0.0;
        double top = 0.0;
        double width = 0.0;
        double height = 0.0;
        double scale_x = 1.0;
        double scale_y = 1.0;
        double offset_x = 0.0;
        double offset_y = 0.0;
        core::Bounds2D view;

        [[nodiscard]] core::Point2D to_device(const core::Point2D& point) const;
    };

    Options options_;
    std::vector<const Primitive*> attached_;
    std::optional<core::Bounds2D> explicit_bounds_;

    Frame make_frame(double width, double height, double units_per_point) const;
    void draw_primitive(cairo_t* cr, const Frame& frame, const Primitive& primitive, double units_per_point) const;
    void draw_axes(cairo_t* cr, const Frame& frame, double units_per_point) const;
    void log_message(const std::string& message, bool is_error = false) const;
};

} // namespace geoplot::rendering
