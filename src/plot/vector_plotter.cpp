#include "vector_plotter.hpp"

#include "core/geometry_extract.hpp"

#include <stdexcept>
#include <utility>

namespace geoplot::plot {

VectorPlotter::VectorPlotter(rendering::RenderBackend& backend, PlotterConfig config)
    : config_(std::move(config))
    , palette_(config_.palette)
    , backend_(backend)
    , dispatcher_(backend_, config_)
    , layers_(backend_, config_.log_callback) {
    apply_view_config();
}

std::string VectorPlotter::plot(const core::Geometry& geometry, const core::StyleOverrides& overrides,
                                const std::string& name) {
    auto primitives = dispatcher_.plot(geometry, overrides, palette_);
    return layers_.set(name, std::move(primitives), !overrides.empty());
}

std::string VectorPlotter::plot(const core::GeometryRecord& record, const core::StyleOverrides& overrides,
                                const std::string& name) {
    return plot(core::extract(record), overrides, name);
}

std::string VectorPlotter::plot(core::GeometrySource& source, const core::StyleOverrides& overrides,
                                const std::string& name) {
    // Extract everything first so a bad record leaves the layers untouched
    std::vector<core::Geometry> geometries;
    core::GeometryRecord record;
    source.rewind();
    while (source.next(record)) {
        geometries.push_back(core::extract(record));
    }
    source.rewind();

    core::StyleOverrides layer_style = overrides;
    if (!geometries.empty()) {
        const core::GeometryKind kind = geometries.front().kind();
        if ((core::is_point_kind(kind) || core::is_line_kind(kind)) &&
            !layer_style.color && !layer_style.edge_color) {
            layer_style.color = palette_.next();
        } else if (core::is_polygon_kind(kind) && !layer_style.face_color && !layer_style.color) {
            layer_style.face_color = palette_.next();
        }
    } else {
        log_message("Geometry source is empty", true);
    }

    PrimitiveList primitives;
    for (const auto& geometry : geometries) {
        auto drawn = dispatcher_.plot(geometry, layer_style, palette_);
        for (auto& primitive : drawn) {
            primitives.push_back(std::move(primitive));
        }
    }

    if (!geometries.empty()) {
        log_message("Plotted " + std::to_string(geometries.size()) + " geometries, first is " +
                    std::string(core::geometry_kind_name(geometries.front().kind())));
    }
    return layers_.set(name, std::move(primitives), !overrides.empty());
}

std::string VectorPlotter::plot_symbol(const core::Geometry& geometry, std::string_view symbol,
                                       const std::string& name) {
    return plot(geometry, core::parse_symbol(symbol), name);
}

void VectorPlotter::clear() {
    layers_.clear();
    apply_view_config();
}

void VectorPlotter::set_limits(double x_min, double x_max, double y_min, double y_max) {
    backend_.set_bounds(core::Bounds2D{x_min, x_max, y_min, y_max});
}

void VectorPlotter::zoom(double percent) {
    if (percent >= 50.0) {
        throw std::invalid_argument("Zoom of " + std::to_string(percent) + "% would collapse the view");
    }
    const core::Bounds2D view = backend_.bounds();
    const double dx = view.width() * percent / 100.0;
    const double dy = view.height() * percent / 100.0;
    backend_.set_bounds(core::Bounds2D{view.x_min + dx, view.x_max - dx, view.y_min + dy, view.y_max - dy});
}

void VectorPlotter::axis_on(bool on) {
    backend_.set_axis_visible(on);
}

void VectorPlotter::save(const std::string& path, std::optional<double> dpi) {
    backend_.rasterize_to_file(path, dpi.value_or(config_.dpi));
}

void VectorPlotter::apply_view_config() {
    backend_.set_equal_aspect(config_.equal_aspect);
    backend_.set_axis_visible(config_.axis_visible);
    if (config_.limits) {
        backend_.set_bounds(*config_.limits);
    } else {
        backend_.clear_bounds();
    }
}

void VectorPlotter::log_message(const std::string& message, bool is_error) const {
    core::log_message(config_.log_callback, "VectorPlotter", message, is_error);
}

} // namespace geoplot::plot
