#pragma once

#include "geometry.hpp"
#include "geometry_record.hpp"

#include <cstdint>

namespace geoplot::core {

// Maps a WKB tag (2D, 2.5D flag or ISO Z/M/ZM offsets) to a geometry kind.
// Throws UnsupportedGeometryKind for anything else.
GeometryKind geometry_kind_from_tag(std::uint32_t tag);

// Converts a source record into a typed geometry with the coordinate nesting
// of its kind. Throws UnsupportedGeometryKind for unknown tags and for point
// records without coordinates.
Geometry extract(const GeometryRecord& record);

} // namespace geoplot::core
