#pragma once

#include "core/log.hpp"
#include "core/palette.hpp"
#include "core/style.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace geoplot::plot {

struct PlotterConfig {
    double figure_width_in = 8.0;
    double figure_height_in = 6.0;
    double dpi = 100.0;
    bool ticks = false;                          // Draw axis tick marks and labels
    bool axis_visible = true;                    // Draw the frame around the plot area
    bool equal_aspect = true;                    // Same scale on both axes
    std::optional<core::Bounds2D> limits;        // Fixed view limits, otherwise fit to data
    std::vector<core::Color> palette = core::PaletteCursor::default_colors();

    double line_width = 1.0;                     // Points
    double marker_size = 6.0;                    // Points
    core::Color edge_color = {0.0, 0.0, 0.0, 1.0};
    bool scale_to_figure = false;                // Scale line width and marker size with the figure

    core::LogCallback log_callback;
};

// Line width and marker size for the configured figure. With scale_to_figure
// they grow with r = min(width / 8, height / 6) inches.
struct ScaledDefaults {
    double line_width = 1.0;
    double marker_size = 6.0;
};

ScaledDefaults scaled_defaults(const PlotterConfig& config);

} // namespace geoplot::plot
