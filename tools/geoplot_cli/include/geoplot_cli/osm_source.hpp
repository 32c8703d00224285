#pragma once

#include "core/geometry_record.hpp"
#include "core/geometry_source.hpp"

#include <cstddef>
#include <filesystem>

namespace geoplot::cli {

struct OsmSourceOptions {
  bool points = true;  // tagged nodes
  bool lines = true;   // ways that do not form areas
  bool areas = true;   // closed ways and multipolygon relations
};

// Geometry source over an OSM file (.osm, .osm.pbf, .osm.bz2, ...). The file
// is read once on construction; longitude/latitude become x/y unchanged.
class OsmGeometrySource : public core::GeometrySource {
 public:
  OsmGeometrySource(const std::filesystem::path& path, const OsmSourceOptions& options);

  bool next(core::GeometryRecord& record) override { return records_.next(record); }
  void rewind() override { records_.rewind(); }

  [[nodiscard]] std::size_t size() const { return records_.size(); }

 private:
  core::VectorSource records_;
};

}  // namespace geoplot::cli
