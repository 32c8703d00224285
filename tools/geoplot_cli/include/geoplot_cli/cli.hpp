#pragma once

#include "geoplot_cli/osm_source.hpp"

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace geoplot::cli {

struct CliConfig {
  std::vector<std::filesystem::path> inputs;
  std::filesystem::path output;
  std::string symbol;
  std::string color;
  bool no_fill = false;
  double width_in = 8.0;
  double height_in = 6.0;
  double dpi = 100.0;
  std::optional<core::Bounds2D> limits;
  std::optional<double> zoom_percent;
  bool ticks = false;
  bool show = false;
  bool quiet = false;
  OsmSourceOptions kinds;
};

// Plots every input as its own layer, then saves and/or shows the figure.
// Returns the process exit code.
int run_geoplot(const CliConfig& config);

}  // namespace geoplot::cli
