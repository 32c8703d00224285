#include "geometry_extract.hpp"

#include "errors.hpp"

#include <string>

namespace geoplot::core {

namespace {

Point2D point_coords(const GeometryRecord& record) {
    if (record.points().empty()) {
        throw UnsupportedGeometryKind(record.kind(), "empty point");
    }
    return record.points().front();
}

std::vector<Point2D> line_coords(const GeometryRecord& record) {
    return record.points();
}

Polygon polygon_coords(const GeometryRecord& record) {
    Polygon polygon;
    polygon.rings.reserve(record.subcount());
    for (std::size_t i = 0; i < record.subcount(); ++i) {
        polygon.rings.push_back(line_coords(record.subgeometry(i)));
    }
    return polygon;
}

} // namespace

GeometryKind geometry_kind_from_tag(std::uint32_t tag) {
    const std::uint32_t base = (tag & ~wkb::k25DFlag) % 1000;
    switch (base) {
    case wkb::kPoint: return GeometryKind::Point;
    case wkb::kLineString: return GeometryKind::LineString;
    case wkb::kPolygon: return GeometryKind::Polygon;
    case wkb::kMultiPoint: return GeometryKind::MultiPoint;
    case wkb::kMultiLineString: return GeometryKind::MultiLineString;
    case wkb::kMultiPolygon: return GeometryKind::MultiPolygon;
    case wkb::kGeometryCollection: return GeometryKind::GeometryCollection;
    default:
        throw UnsupportedGeometryKind(tag);
    }
}

Geometry extract(const GeometryRecord& record) {
    switch (geometry_kind_from_tag(record.kind())) {
    case GeometryKind::Point:
        return Point{point_coords(record)};

    case GeometryKind::LineString:
        return LineString{line_coords(record)};

    case GeometryKind::Polygon:
        return polygon_coords(record);

    case GeometryKind::MultiPoint: {
        MultiPoint multi;
        multi.points.reserve(record.subcount());
        for (std::size_t i = 0; i < record.subcount(); ++i) {
            multi.points.push_back(point_coords(record.subgeometry(i)));
        }
        return multi;
    }

    case GeometryKind::MultiLineString: {
        MultiLineString multi;
        multi.lines.reserve(record.subcount());
        for (std::size_t i = 0; i < record.subcount(); ++i) {
            multi.lines.push_back(line_coords(record.subgeometry(i)));
        }
        return multi;
    }

    case GeometryKind::MultiPolygon: {
        MultiPolygon multi;
        multi.polygons.reserve(record.subcount());
        for (std::size_t i = 0; i < record.subcount(); ++i) {
            multi.polygons.push_back(polygon_coords(record.subgeometry(i)));
        }
        return multi;
    }

    case GeometryKind::GeometryCollection: {
        GeometryCollection collection;
        collection.members.reserve(record.subcount());
        for (std::size_t i = 0; i < record.subcount(); ++i) {
            collection.members.push_back(extract(record.subgeometry(i)));
        }
        return collection;
    }
    }
    throw UnsupportedGeometryKind(record.kind());
}

} // namespace geoplot::core
