#include "geometry.hpp"

#include "overloaded.hpp"

#include <limits>

namespace geoplot::core {

namespace {

void expand(Bounds2D& bounds, const std::vector<Point2D>& points) {
    for (const auto& point : points) {
        bounds.expand(point);
    }
}

void expand(Bounds2D& bounds, const Geometry& geometry) {
    std::visit(overloaded{
        [&](const Point& point) { bounds.expand(point.position); },
        [&](const MultiPoint& multi) { expand(bounds, multi.points); },
        [&](const LineString& line) { expand(bounds, line.points); },
        [&](const MultiLineString& multi) {
            for (const auto& line : multi.lines) expand(bounds, line);
        },
        [&](const Polygon& polygon) {
            for (const auto& ring : polygon.rings) expand(bounds, ring);
        },
        [&](const MultiPolygon& multi) {
            for (const auto& polygon : multi.polygons) {
                for (const auto& ring : polygon.rings) expand(bounds, ring);
            }
        },
        [&](const GeometryCollection& collection) {
            for (const auto& member : collection.members) expand(bounds, member);
        },
    }, geometry.value());
}

} // namespace

std::string_view geometry_kind_name(GeometryKind kind) {
    switch (kind) {
    case GeometryKind::Point: return "POINT";
    case GeometryKind::MultiPoint: return "MULTIPOINT";
    case GeometryKind::LineString: return "LINESTRING";
    case GeometryKind::MultiLineString: return "MULTILINESTRING";
    case GeometryKind::Polygon: return "POLYGON";
    case GeometryKind::MultiPolygon: return "MULTIPOLYGON";
    case GeometryKind::GeometryCollection: return "GEOMETRYCOLLECTION";
    }
    return "UNKNOWN";
}

bool is_point_kind(GeometryKind kind) {
    return kind == GeometryKind::Point || kind == GeometryKind::MultiPoint;
}

bool is_line_kind(GeometryKind kind) {
    return kind == GeometryKind::LineString || kind == GeometryKind::MultiLineString;
}

bool is_polygon_kind(GeometryKind kind) {
    return kind == GeometryKind::Polygon || kind == GeometryKind::MultiPolygon;
}

Bounds2D geometry_bounds(const Geometry& geometry) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    Bounds2D bounds{inf, -inf, inf, -inf};
    expand(bounds, geometry);
    return bounds;
}

} // namespace geoplot::core
