#pragma once

#include "dispatcher.hpp"
#include "layer_registry.hpp"
#include "plotter_config.hpp"

#include "core/geometry.hpp"
#include "core/geometry_record.hpp"
#include "core/geometry_source.hpp"
#include "core/palette.hpp"
#include "core/style.hpp"
#include "rendering/render_backend.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geoplot::plot {

// Plotting session: draws geometries onto a backend as named layers, picking
// default colors from its own palette cursor.
class VectorPlotter {
public:
    explicit VectorPlotter(rendering::RenderBackend& backend, PlotterConfig config = {});

    VectorPlotter(const VectorPlotter&) = delete;
    VectorPlotter& operator=(const VectorPlotter&) = delete;

    // Each plot call fills one layer and returns its name. An empty name asks
    // for an ordinal one. Non-empty overrides count as an explicit style.
    std::string plot(const core::Geometry& geometry, const core::StyleOverrides& overrides = {},
                     const std::string& name = "");
    std::string plot(const core::GeometryRecord& record, const core::StyleOverrides& overrides = {},
                     const std::string& name = "");

    // Every geometry of the source goes into one layer and shares one default
    // color, chosen from the kind of the first geometry.
    std::string plot(core::GeometrySource& source, const core::StyleOverrides& overrides = {},
                     const std::string& name = "");

    // Format-string variant, e.g. plot_symbol(points, "ro", "cities").
    std::string plot_symbol(const core::Geometry& geometry, std::string_view symbol,
                            const std::string& name = "");

    void hide(const std::string& name) { layers_.hide(name); }
    void show(const std::string& name) { layers_.show(name); }
    void remove(const std::string& name) { layers_.remove(name); }

    // Drops every layer and restores the configured view limits.
    void clear();

    void set_limits(double x_min, double x_max, double y_min, double y_max);

    // Zooms in by `percent` of the current view on each side; negative zooms out.
    void zoom(double percent);

    void axis_on(bool on);

    void save(const std::string& path, std::optional<double> dpi = std::nullopt);

    [[nodiscard]] const LayerRegistry& layers() const { return layers_; }
    [[nodiscard]] const std::vector<std::string>& layer_names() const { return layers_.names(); }
    [[nodiscard]] const core::PaletteCursor& palette() const { return palette_; }
    [[nodiscard]] const PlotterConfig& config() const { return config_; }

private:
    PlotterConfig config_;
    core::PaletteCursor palette_;
    rendering::RenderBackend& backend_;
    GeometryDispatcher dispatcher_;
    LayerRegistry layers_;

    void apply_view_config();
    void log_message(const std::string& message, bool is_error = false) const;
};

} // namespace geoplot::plot
