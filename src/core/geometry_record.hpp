#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace geoplot::core {

// OGC well-known-binary geometry type codes
namespace wkb {
    constexpr std::uint32_t kPoint = 1;
    constexpr std::uint32_t kLineString = 2;
    constexpr std::uint32_t kPolygon = 3;
    constexpr std::uint32_t kMultiPoint = 4;
    constexpr std::uint32_t kMultiLineString = 5;
    constexpr std::uint32_t kMultiPolygon = 6;
    constexpr std::uint32_t kGeometryCollection = 7;
    constexpr std::uint32_t k25DFlag = 0x80000000u;
}

// Geometry as handed over by a geometry source: a type tag, the coordinates of
// a simple geometry and the parts of a compound one. Polygons keep one part per
// ring; multi types and collections keep one part per member.
class GeometryRecord {
public:
    GeometryRecord() = default;
    explicit GeometryRecord(std::uint32_t tag) : tag_(tag) {}
    GeometryRecord(std::uint32_t tag, std::vector<Point2D> points)
        : tag_(tag), points_(std::move(points)) {}

    [[nodiscard]] std::uint32_t kind() const { return tag_; }
    [[nodiscard]] const std::vector<Point2D>& points() const { return points_; }
    [[nodiscard]] std::size_t subcount() const { return parts_.size(); }
    [[nodiscard]] const GeometryRecord& subgeometry(std::size_t index) const { return parts_.at(index); }

    GeometryRecord& add_point(const Point2D& point) {
        points_.push_back(point);
        return *this;
    }

    GeometryRecord& add_part(GeometryRecord part) {
        parts_.push_back(std::move(part));
        return *this;
    }

private:
    std::uint32_t tag_ = 0;
    std::vector<Point2D> points_;
    std::vector<GeometryRecord> parts_;
};

} // namespace geoplot::core
