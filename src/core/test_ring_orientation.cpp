#include "errors.hpp"
#include "ring_orientation.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace geoplot::core {

namespace ring_orientation_tests {

// Unit square listed counter-clockwise on y-up axes
Ring ccw_square() {
    return Ring{{0, 0}, {1, 0}, {1, 1}, {0, 1}};
}

Ring cw_square() {
    return Ring{{0, 0}, {0, 1}, {1, 1}, {1, 0}};
}

bool test_signed_area_sign() {
    if (signed_area(cw_square()) != 1.0) {
        std::cerr << "Clockwise unit square should have area +1, got " << signed_area(cw_square()) << std::endl;
        return false;
    }
    if (signed_area(ccw_square()) != -1.0) {
        std::cerr << "Counter-clockwise unit square should have area -1" << std::endl;
        return false;
    }
    return is_clockwise(cw_square()) && !is_clockwise(ccw_square());
}

bool test_closing_point_does_not_change_area() {
    Ring closed = ccw_square();
    closed.push_back(closed.front());
    return signed_area(closed) == signed_area(ccw_square());
}

bool test_normalize_to_clockwise() {
    const Ring ring = normalize(ccw_square(), true);
    if (ring.size() != 5 || ring.front() != ring.back()) {
        std::cerr << "Normalized ring should be closed with 5 points" << std::endl;
        return false;
    }
    if (signed_area(ring) < 0.0) {
        std::cerr << "Ring normalized clockwise has negative area" << std::endl;
        return false;
    }
    return true;
}

bool test_normalize_to_counter_clockwise() {
    const Ring ring = normalize(cw_square(), false);
    return ring.size() == 5 && signed_area(ring) <= 0.0 && ring.front() == ring.back();
}

bool test_matching_orientation_keeps_order() {
    const Ring input = cw_square();
    const Ring ring = normalize(input, true);
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (ring[i] != input[i]) {
            std::cerr << "Ring already clockwise should not be reordered" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_already_closed_ring_not_extended() {
    Ring input = cw_square();
    input.push_back(input.front());
    return normalize(input, true).size() == 5;
}

bool test_idempotent() {
    const std::vector<Ring> rings{
        ccw_square(),
        cw_square(),
        Ring{{0, 0}, {4, 0}, {0, 4}},
        Ring{{2, 1}, {5, 3}, {4, 7}, {1, 6}, {-1, 3}},
        Ring{{0, 0}, {3, 0}, {3, 3}, {2, 3}, {2, 1}, {1, 1}, {1, 3}, {0, 3}},
        Ring{{0, 0}, {1, 1}, {2, 2}},
    };
    for (const auto& ring : rings) {
        for (bool clockwise : {true, false}) {
            const Ring once = normalize(ring, clockwise);
            const Ring twice = normalize(once, clockwise);
            if (once != twice) {
                std::cerr << "normalize is not idempotent for a ring of " << ring.size() << " points" << std::endl;
                return false;
            }
        }
    }
    return true;
}

bool test_winding_property_over_rings() {
    const std::vector<Ring> rings{
        Ring{{0, 0}, {4, 0}, {0, 4}},
        Ring{{0, 0}, {0, 4}, {4, 0}},
        Ring{{2, 1}, {5, 3}, {4, 7}, {1, 6}, {-1, 3}},
        Ring{{-10, -10}, {-10, 10}, {10, 10}, {10, -10}, {-10, -10}},
    };
    for (const auto& ring : rings) {
        if (signed_area(normalize(ring, true)) < 0.0 || signed_area(normalize(ring, false)) > 0.0) {
            std::cerr << "Normalized ring has the wrong winding" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_collinear_ring_keeps_order() {
    const Ring ring = normalize(Ring{{0, 0}, {1, 1}, {2, 2}}, true);
    return ring.size() == 4 && ring[0] == Point2D(0, 0) && ring[1] == Point2D(1, 1) && ring[3] == Point2D(0, 0);
}

bool test_single_point_ring() {
    const Ring ring = normalize(Ring{{3, 4}}, true);
    return ring.size() == 1 && ring.front() == Point2D(3, 4);
}

bool test_empty_ring_throws() {
    try {
        (void)normalize(Ring{}, true);
    } catch (const DegenerateRing&) {
        return true;
    }
    std::cerr << "Empty ring should raise DegenerateRing" << std::endl;
    return false;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"signed_area_sign", &test_signed_area_sign},
        {"closing_point_does_not_change_area", &test_closing_point_does_not_change_area},
        {"normalize_to_clockwise", &test_normalize_to_clockwise},
        {"normalize_to_counter_clockwise", &test_normalize_to_counter_clockwise},
        {"matching_orientation_keeps_order", &test_matching_orientation_keeps_order},
        {"already_closed_ring_not_extended", &test_already_closed_ring_not_extended},
        {"idempotent", &test_idempotent},
        {"winding_property_over_rings", &test_winding_property_over_rings},
        {"collinear_ring_keeps_order", &test_collinear_ring_keeps_order},
        {"single_point_ring", &test_single_point_ring},
        {"empty_ring_throws", &test_empty_ring_throws},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace ring_orientation_tests

} // namespace geoplot::core

int main() {
    if (geoplot::core::ring_orientation_tests::run_all_tests()) {
        std::cout << "All ring orientation tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Ring orientation tests failed" << std::endl;
    return 1;
}
