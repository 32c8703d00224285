#pragma once

#include "types.hpp"

namespace geoplot::core {

// Shoelace sum over (x2 - x1) * (y2 + y1), wrapping last to first, halved.
// Positive for clockwise rings on y-up axes, negative for counter-clockwise.
double signed_area(const Ring& ring);

[[nodiscard]] bool is_clockwise(const Ring& ring);

// Reorders `ring` to the requested winding and closes it (first point repeated
// at the end). Rings with zero area keep their order. Throws DegenerateRing for
// an empty ring.
Ring normalize(Ring ring, bool want_clockwise);

} // namespace geoplot::core
