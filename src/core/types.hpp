#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace geoplot::core {

struct Point2D {
    double x = 0.0;
    double y = 0.0;
    Point2D() = default;
    Point2D(double x_val, double y_val) : x(x_val), y(y_val) {}

    bool operator==(const Point2D& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2D& other) const { return !(*this == other); }
};

// Closed sequence of points bounding a polygon or one of its holes.
using Ring = std::vector<Point2D>;

struct Bounds2D {
    double x_min = 0.0;
    double x_max = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;

    [[nodiscard]] bool is_valid() const {
        return x_min <= x_max && y_min <= y_max;
    }

    [[nodiscard]] double width() const { return x_max - x_min; }
    [[nodiscard]] double height() const { return y_max - y_min; }

    void expand(const Point2D& point) {
        x_min = std::min(x_min, point.x);
        x_max = std::max(x_max, point.x);
        y_min = std::min(y_min, point.y);
        y_max = std::max(y_max, point.y);
    }

    static Bounds2D around(const Point2D& point) {
        return Bounds2D{point.x, point.x, point.y, point.y};
    }
};

} // namespace geoplot::core
