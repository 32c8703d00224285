#include "ring_orientation.hpp"

#include "errors.hpp"

#include <algorithm>

namespace geoplot::core {

double signed_area(const Ring& ring) {
    if (ring.empty()) {
        return 0.0;
    }

    double total = 0.0;
    Point2D previous = ring.front();
    for (std::size_t i = 1; i < ring.size(); ++i) {
        const Point2D& current = ring[i];
        total += (current.x - previous.x) * (current.y + previous.y);
        previous = current;
    }
    const Point2D& first = ring.front();
    total += (first.x - previous.x) * (first.y + previous.y);
    return total * 0.5;
}

bool is_clockwise(const Ring& ring) {
    return signed_area(ring) > 0.0;
}

Ring normalize(Ring ring, bool want_clockwise) {
    if (ring.empty()) {
        throw DegenerateRing("Cannot determine the winding of an empty ring");
    }

    const double area = signed_area(ring);
    if (area != 0.0 && (area > 0.0) != want_clockwise) {
        std::reverse(ring.begin(), ring.end());
    }

    if (ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    return ring;
}

} // namespace geoplot::core
