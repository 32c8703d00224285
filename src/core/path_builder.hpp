#pragma once

#include "geometry.hpp"
#include "types.hpp"

#include <cstddef>
#include <vector>

namespace geoplot::core {

enum class PathInstruction {
    MoveTo,
    LineTo
};

// One drawable outline made of several sub-contours. instructions[i] tells how
// to reach vertices[i].
struct PathSpec {
    std::vector<Point2D> vertices;
    std::vector<PathInstruction> instructions;

    [[nodiscard]] std::size_t contour_count() const;
};

// Outer ring wound clockwise, holes counter-clockwise, each ring closed and
// started with a MoveTo. Output order: outer first, then holes as given.
PathSpec build_path(const Ring& outer, const std::vector<Ring>& holes);

// Uses rings[0] as the outer ring. Throws DegenerateRing when the polygon has
// no rings.
PathSpec build_path(const Polygon& polygon);

} // namespace geoplot::core
