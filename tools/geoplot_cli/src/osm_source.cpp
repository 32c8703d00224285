#include "geoplot_cli/osm_source.hpp"

#include <osmium/area/assembler.hpp>
#include <osmium/area/multipolygon_manager.hpp>
#include <osmium/handler.hpp>
#include <osmium/handler/node_locations_for_ways.hpp>
#include <osmium/index/map/flex_mem.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/osm/area.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/tag.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/relations/relations_manager.hpp>
#include <osmium/visitor.hpp>

#include <cstring>
#include <utility>
#include <vector>

namespace geoplot::cli {
namespace {

using index_type = osmium::index::map::FlexMem<osmium::unsigned_object_id_type, osmium::Location>;
using location_handler_type = osmium::handler::NodeLocationsForWays<index_type>;

core::GeometryRecord ring_record(const osmium::NodeRefList& nodes) {
  core::GeometryRecord ring(core::wkb::kLineString);
  for (const auto& node_ref : nodes) {
    if (node_ref.location().valid()) {
      ring.add_point(core::Point2D{node_ref.location().lon(), node_ref.location().lat()});
    }
  }
  return ring;
}

// Closed, tagged ways are turned into areas by the multipolygon manager
bool forms_area(const osmium::Way& way) {
  if (!way.is_closed() || way.nodes().size() < 4 || way.tags().empty()) {
    return false;
  }
  const char* area = way.tags().get_value_by_key("area");
  return area == nullptr || std::strcmp(area, "no") != 0;
}

class RecordCollector : public osmium::handler::Handler {
 public:
  explicit RecordCollector(const OsmSourceOptions& options) : options_(options) {}

  void node(const osmium::Node& node) {
    if (!options_.points || node.tags().empty() || !node.location().valid()) {
      return;
    }
    records_.emplace_back(core::wkb::kPoint,
                          std::vector<core::Point2D>{core::Point2D{node.location().lon(), node.location().lat()}});
  }

  void way(const osmium::Way& way) {
    if (!options_.lines || forms_area(way)) {
      return;
    }
    auto line = ring_record(way.nodes());
    if (line.points().size() >= 2) {
      records_.push_back(std::move(line));
    }
  }

  void area(const osmium::Area& area) {
    if (!options_.areas) {
      return;
    }
    core::GeometryRecord multipolygon(core::wkb::kMultiPolygon);
    for (const auto& outer : area.outer_rings()) {
      core::GeometryRecord polygon(core::wkb::kPolygon);
      polygon.add_part(ring_record(outer));
      for (const auto& inner : area.inner_rings(outer)) {
        polygon.add_part(ring_record(inner));
      }
      multipolygon.add_part(std::move(polygon));
    }
    if (multipolygon.subcount() > 0) {
      records_.push_back(std::move(multipolygon));
    }
  }

  std::vector<core::GeometryRecord> take_records() { return std::move(records_); }

 private:
  OsmSourceOptions options_;
  std::vector<core::GeometryRecord> records_;
};

}  // namespace

OsmGeometrySource::OsmGeometrySource(const std::filesystem::path& path, const OsmSourceOptions& options) {
  const osmium::io::File input_file{path.string()};

  osmium::area::Assembler::config_type assembler_config;
  osmium::area::MultipolygonManager<osmium::area::Assembler> mp_manager{assembler_config};
  if (options.areas) {
    osmium::relations::read_relations(input_file, mp_manager);
  }

  index_type index;
  location_handler_type location_handler{index};
  location_handler.ignore_errors();

  RecordCollector collector{options};
  osmium::io::Reader reader{input_file, osmium::io::read_meta::no};
  if (options.areas) {
    osmium::apply(reader, location_handler, collector,
                  mp_manager.handler([&collector](osmium::memory::Buffer&& buffer) {
                    osmium::apply(buffer, collector);
                  }));
  } else {
    osmium::apply(reader, location_handler, collector);
  }
  reader.close();

  records_ = core::VectorSource(collector.take_records());
}

}  // namespace geoplot::cli
