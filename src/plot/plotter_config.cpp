#include "plotter_config.hpp"

#include <algorithm>

namespace geoplot::plot {

ScaledDefaults scaled_defaults(const PlotterConfig& config) {
    if (!config.scale_to_figure) {
        return ScaledDefaults{config.line_width, config.marker_size};
    }
    const double r = std::min(config.figure_width_in / 8.0, config.figure_height_in / 6.0);
    return ScaledDefaults{config.line_width * r, config.marker_size * r};
}

} // namespace geoplot::plot
