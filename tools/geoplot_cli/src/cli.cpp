#include "geoplot_cli/cli.hpp"

#include "core/style.hpp"
#include "plot/plotter_config.hpp"
#include "plot/vector_plotter.hpp"
#include "rendering/cairo_canvas.hpp"
#include "ui/viewer.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace geoplot::cli {
namespace {

void log_progress(const CliConfig& config, const std::string& message) {
  if (!config.quiet) {
    std::cout << "[geoplot] " << message << std::endl;
  }
}

// Layer name for an input: file name without any OSM extensions
std::string layer_name_for(const fs::path& input) {
  std::string name = input.filename().string();
  const auto dot = name.find('.');
  if (dot != std::string::npos && dot > 0) {
    name.resize(dot);
  }
  return name;
}

core::StyleOverrides overrides_from(const CliConfig& config) {
  core::StyleOverrides overrides;
  if (!config.symbol.empty()) {
    overrides = core::parse_symbol(config.symbol);
  }
  if (!config.color.empty()) {
    auto color = core::parse_color(config.color);
    if (!color) {
      throw std::invalid_argument("Unrecognized color '" + config.color + "'");
    }
    overrides.color = color;
  }
  if (config.no_fill) {
    overrides.filled = false;
  }
  return overrides;
}

}  // namespace

int run_geoplot(const CliConfig& config) {
  if (config.inputs.empty()) {
    std::cerr << "[geoplot] No input files given" << std::endl;
    return 1;
  }

  plot::PlotterConfig plotter_config;
  plotter_config.figure_width_in = config.width_in;
  plotter_config.figure_height_in = config.height_in;
  plotter_config.dpi = config.dpi;
  plotter_config.ticks = config.ticks;
  plotter_config.limits = config.limits;
  plotter_config.scale_to_figure = true;
  if (config.quiet) {
    plotter_config.log_callback = [](const std::string& message, bool is_error) {
      if (is_error) {
        std::cerr << "[geoplot] " << message << std::endl;
      }
    };
  }

  rendering::CairoCanvas::Options canvas_options;
  canvas_options.width_in = config.width_in;
  canvas_options.height_in = config.height_in;
  canvas_options.dpi = config.dpi;
  canvas_options.ticks = config.ticks;
  canvas_options.log_callback = plotter_config.log_callback;

  try {
    const auto overrides = overrides_from(config);

    rendering::CairoCanvas canvas{canvas_options};
    plot::VectorPlotter plotter{canvas, plotter_config};

    for (const auto& input : config.inputs) {
      if (!fs::exists(input)) {
        std::cerr << "[geoplot] Input not found: " << input << std::endl;
        return 1;
      }
      const auto start = std::chrono::steady_clock::now();
      OsmGeometrySource source{input, config.kinds};
      const auto name = plotter.plot(source, overrides, layer_name_for(input));
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      log_progress(config, "Layer '" + name + "': " + std::to_string(source.size()) +
                               " geometries from " + input.string() + " in " +
                               std::to_string(elapsed.count()) + " ms");
    }

    if (config.zoom_percent) {
      plotter.zoom(*config.zoom_percent);
    }

    fs::path output = config.output;
    if (output.empty() && !config.show) {
      output = "geoplot.png";
    }
    if (!output.empty()) {
      plotter.save(output.string());
    }

    if (config.show) {
      ui::Viewer viewer{canvas, "GeoPlot - " + layer_name_for(config.inputs.front())};
      return viewer.run();
    }
  } catch (const std::exception& ex) {
    std::cerr << "[geoplot] " << ex.what() << std::endl;
    return 1;
  }

  return 0;
}

}  // namespace geoplot::cli
