#include "path_builder.hpp"

#include "errors.hpp"
#include "ring_orientation.hpp"

#include <algorithm>

namespace geoplot::core {

namespace {

void append_ring(PathSpec& path, const Ring& ring) {
    path.vertices.insert(path.vertices.end(), ring.begin(), ring.end());
    path.instructions.push_back(PathInstruction::MoveTo);
    path.instructions.insert(path.instructions.end(), ring.size() - 1, PathInstruction::LineTo);
}

} // namespace

std::size_t PathSpec::contour_count() const {
    return static_cast<std::size_t>(
        std::count(instructions.begin(), instructions.end(), PathInstruction::MoveTo));
}

PathSpec build_path(const Ring& outer, const std::vector<Ring>& holes) {
    PathSpec path;
    append_ring(path, normalize(outer, true));
    for (const auto& hole : holes) {
        append_ring(path, normalize(hole, false));
    }
    return path;
}

PathSpec build_path(const Polygon& polygon) {
    if (polygon.rings.empty()) {
        throw DegenerateRing("Polygon has no rings");
    }
    const std::vector<Ring> holes(polygon.rings.begin() + 1, polygon.rings.end());
    return build_path(polygon.rings.front(), holes);
}

} // namespace geoplot::core
