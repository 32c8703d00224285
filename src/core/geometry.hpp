#pragma once

#include "style.hpp"
#include "types.hpp"

#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geoplot::core {

enum class GeometryKind {
    Point,
    MultiPoint,
    LineString,
    MultiLineString,
    Polygon,
    MultiPolygon,
    GeometryCollection
};

struct Point {
    Point2D position;
};

struct MultiPoint {
    std::vector<Point2D> points;
};

struct LineString {
    std::vector<Point2D> points;
};

struct MultiLineString {
    std::vector<std::vector<Point2D>> lines;
};

// rings[0] is the outer boundary, the rest are holes.
struct Polygon {
    std::vector<Ring> rings;
};

struct MultiPolygon {
    std::vector<Polygon> polygons;
};

class Geometry;

struct GeometryCollection {
    std::vector<Geometry> members;
};

class Geometry {
public:
    using Value = std::variant<Point, MultiPoint, LineString, MultiLineString,
                               Polygon, MultiPolygon, GeometryCollection>;

    Geometry(Point value) : value_(std::move(value)) {}
    Geometry(MultiPoint value) : value_(std::move(value)) {}
    Geometry(LineString value) : value_(std::move(value)) {}
    Geometry(MultiLineString value) : value_(std::move(value)) {}
    Geometry(Polygon value) : value_(std::move(value)) {}
    Geometry(MultiPolygon value) : value_(std::move(value)) {}
    Geometry(GeometryCollection value) : value_(std::move(value)) {}

    [[nodiscard]] GeometryKind kind() const { return static_cast<GeometryKind>(value_.index()); }
    [[nodiscard]] const Value& value() const { return value_; }

    // Style carried by this geometry. Inside a collection it overrides the
    // collection's style field by field.
    [[nodiscard]] const StyleOverrides& style() const { return style_; }
    Geometry& with_style(StyleOverrides style) {
        style_ = std::move(style);
        return *this;
    }

private:
    Value value_;
    StyleOverrides style_;
};

// OGC upper-case name ("POINT", "MULTIPOLYGON", ...).
std::string_view geometry_kind_name(GeometryKind kind);

[[nodiscard]] bool is_point_kind(GeometryKind kind);
[[nodiscard]] bool is_line_kind(GeometryKind kind);
[[nodiscard]] bool is_polygon_kind(GeometryKind kind);

// Extent of every coordinate in the geometry. Invalid bounds for empty input.
Bounds2D geometry_bounds(const Geometry& geometry);

} // namespace geoplot::core
