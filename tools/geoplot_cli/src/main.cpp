#include "geoplot_cli/cli.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

void print_usage() {
  std::cout << "Usage: geoplot [options] <input.osm|.osm.pbf|.osm.bz2> [more inputs...]\n"
               "\n"
               "Options:\n"
               "  -o, --output <path>         Write the figure (.png, .pdf or .svg)\n"
               "  -s, --symbol <fmt>          Format string for every input (e.g. ro, b-, k--)\n"
               "  -c, --color <color>         Color for every input (r, C2, tab:green, #336699)\n"
               "      --no-fill               Draw polygons as outlines\n"
               "  -k, --kinds <list>          Geometries to read: point,line,area (default: all)\n"
               "  -W, --width <inches>        Figure width (default 8)\n"
               "  -H, --height <inches>       Figure height (default 6)\n"
               "  -d, --dpi <n>               Output resolution (default 100)\n"
               "  -l, --limits x0 x1 y0 y1    Fixed view limits\n"
               "  -z, --zoom <percent>        Zoom in (or out when negative) after plotting\n"
               "  -t, --ticks                 Draw axis ticks\n"
               "      --show                  Open a viewer window\n"
               "  -q, --quiet                 Suppress progress logging\n"
               "  -h, --help                  Show this help text\n";
}

bool parse_number(const char* text, double& value) {
  std::istringstream in(text);
  in >> value;
  return !in.fail() && in.eof();
}

bool parse_kinds(std::string_view list, geoplot::cli::OsmSourceOptions& kinds) {
  kinds = geoplot::cli::OsmSourceOptions{false, false, false};
  while (!list.empty()) {
    const auto comma = list.find(',');
    const auto item = list.substr(0, comma);
    if (item == "point" || item == "points") {
      kinds.points = true;
    } else if (item == "line" || item == "lines") {
      kinds.lines = true;
    } else if (item == "area" || item == "areas") {
      kinds.areas = true;
    } else {
      return false;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    list.remove_prefix(comma + 1);
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  geoplot::cli::CliConfig config;

  auto require_value = [&](int i, std::string_view arg, int count = 1) {
    if (i + count >= argc) {
      std::cerr << "[geoplot] Missing value for " << arg << std::endl;
      return false;
    }
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "-o" || arg == "--output") {
      if (!require_value(i, arg)) return 1;
      config.output = argv[++i];
    } else if (arg == "-s" || arg == "--symbol") {
      if (!require_value(i, arg)) return 1;
      config.symbol = argv[++i];
    } else if (arg == "-c" || arg == "--color") {
      if (!require_value(i, arg)) return 1;
      config.color = argv[++i];
    } else if (arg == "--no-fill") {
      config.no_fill = true;
    } else if (arg == "-k" || arg == "--kinds") {
      if (!require_value(i, arg)) return 1;
      if (!parse_kinds(argv[++i], config.kinds)) {
        std::cerr << "[geoplot] Invalid value for --kinds: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "-W" || arg == "--width" || arg == "-H" || arg == "--height" ||
               arg == "-d" || arg == "--dpi" || arg == "-z" || arg == "--zoom") {
      if (!require_value(i, arg)) return 1;
      double value = 0.0;
      if (!parse_number(argv[++i], value)) {
        std::cerr << "[geoplot] Invalid number for " << arg << ": " << argv[i] << std::endl;
        return 1;
      }
      if (arg == "-W" || arg == "--width") {
        config.width_in = value;
      } else if (arg == "-H" || arg == "--height") {
        config.height_in = value;
      } else if (arg == "-d" || arg == "--dpi") {
        config.dpi = value;
      } else {
        config.zoom_percent = value;
      }
    } else if (arg == "-l" || arg == "--limits") {
      if (!require_value(i, arg, 4)) return 1;
      double values[4] = {};
      for (double& value : values) {
        if (!parse_number(argv[++i], value)) {
          std::cerr << "[geoplot] Invalid number for --limits: " << argv[i] << std::endl;
          return 1;
        }
      }
      config.limits = geoplot::core::Bounds2D{values[0], values[1], values[2], values[3]};
    } else if (arg == "-t" || arg == "--ticks") {
      config.ticks = true;
    } else if (arg == "--show") {
      config.show = true;
    } else if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "[geoplot] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    } else {
      config.inputs.emplace_back(argv[i]);
    }
  }

  if (config.width_in <= 0.0 || config.height_in <= 0.0 || config.dpi <= 0.0) {
    std::cerr << "[geoplot] Figure size and resolution must be positive" << std::endl;
    return 1;
  }

  return geoplot::cli::run_geoplot(config);
}
