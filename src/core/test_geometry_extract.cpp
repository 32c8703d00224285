#include "errors.hpp"
#include "geometry_extract.hpp"

#include <iostream>
#include <utility>
#include <variant>
#include <vector>

namespace geoplot::core {

namespace geometry_extract_tests {

GeometryRecord ring_record(std::vector<Point2D> points) {
    return GeometryRecord(wkb::kLineString, std::move(points));
}

GeometryRecord square_polygon(double min, double max) {
    GeometryRecord polygon(wkb::kPolygon);
    polygon.add_part(ring_record({{min, min}, {max, min}, {max, max}, {min, max}, {min, min}}));
    return polygon;
}

bool test_tag_normalisation() {
    const std::pair<std::uint32_t, GeometryKind> cases[] = {
        {1, GeometryKind::Point},
        {2, GeometryKind::LineString},
        {3, GeometryKind::Polygon},
        {4, GeometryKind::MultiPoint},
        {5, GeometryKind::MultiLineString},
        {6, GeometryKind::MultiPolygon},
        {7, GeometryKind::GeometryCollection},
        {wkb::kPolygon | wkb::k25DFlag, GeometryKind::Polygon},
        {1001, GeometryKind::Point},
        {2003, GeometryKind::Polygon},
        {3006, GeometryKind::MultiPolygon},
    };
    for (const auto& [tag, expected] : cases) {
        if (geometry_kind_from_tag(tag) != expected) {
            std::cerr << "Tag " << tag << " mapped to the wrong kind" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_unknown_tags_throw() {
    for (std::uint32_t tag : {0u, 8u, 15u, 1017u}) {
        try {
            (void)geometry_kind_from_tag(tag);
            std::cerr << "Tag " << tag << " should be rejected" << std::endl;
            return false;
        } catch (const UnsupportedGeometryKind& ex) {
            if (ex.tag() != tag) {
                return false;
            }
        }
    }
    return true;
}

bool test_point() {
    const Geometry geometry = extract(GeometryRecord(wkb::kPoint, {{2.5, -1.0}}));
    const auto* point = std::get_if<Point>(&geometry.value());
    return point && point->position == Point2D(2.5, -1.0) && geometry.kind() == GeometryKind::Point;
}

bool test_empty_point_throws() {
    try {
        (void)extract(GeometryRecord(wkb::kPoint));
    } catch (const UnsupportedGeometryKind&) {
        return true;
    }
    std::cerr << "Point without coordinates should be rejected" << std::endl;
    return false;
}

bool test_line_string() {
    const Geometry geometry = extract(ring_record({{0, 0}, {1, 1}, {2, 0}}));
    const auto* line = std::get_if<LineString>(&geometry.value());
    return line && line->points.size() == 3 && line->points[2] == Point2D(2, 0);
}

bool test_polygon_rings() {
    GeometryRecord record = square_polygon(0, 10);
    record.add_part(ring_record({{4, 4}, {6, 4}, {6, 6}, {4, 6}, {4, 4}}));

    const Geometry geometry = extract(record);
    const auto* polygon = std::get_if<Polygon>(&geometry.value());
    if (!polygon || polygon->rings.size() != 2) {
        std::cerr << "Polygon should keep both rings" << std::endl;
        return false;
    }
    return polygon->rings[0].size() == 5 && polygon->rings[1].front() == Point2D(4, 4);
}

bool test_multi_point() {
    GeometryRecord record(wkb::kMultiPoint);
    record.add_part(GeometryRecord(wkb::kPoint, {{1, 2}}));
    record.add_part(GeometryRecord(wkb::kPoint, {{3, 4}}));

    const Geometry geometry = extract(record);
    const auto* multi = std::get_if<MultiPoint>(&geometry.value());
    return multi && multi->points.size() == 2 && multi->points[1] == Point2D(3, 4);
}

bool test_multi_line_string() {
    GeometryRecord record(wkb::kMultiLineString | wkb::k25DFlag);
    record.add_part(ring_record({{0, 0}, {1, 0}}));
    record.add_part(ring_record({{0, 1}, {1, 1}, {2, 1}}));

    const Geometry geometry = extract(record);
    const auto* multi = std::get_if<MultiLineString>(&geometry.value());
    return multi && multi->lines.size() == 2 && multi->lines[1].size() == 3;
}

bool test_multi_polygon() {
    GeometryRecord record(wkb::kMultiPolygon);
    record.add_part(square_polygon(0, 1));
    record.add_part(square_polygon(5, 6));

    const Geometry geometry = extract(record);
    const auto* multi = std::get_if<MultiPolygon>(&geometry.value());
    return multi && multi->polygons.size() == 2 && multi->polygons[1].rings[0].front() == Point2D(5, 5);
}

bool test_nested_collection() {
    GeometryRecord inner(wkb::kGeometryCollection);
    inner.add_part(ring_record({{0, 0}, {1, 1}}));

    GeometryRecord outer(wkb::kGeometryCollection);
    outer.add_part(GeometryRecord(wkb::kPoint, {{9, 9}}));
    outer.add_part(square_polygon(0, 1));
    outer.add_part(inner);

    const Geometry geometry = extract(outer);
    const auto* collection = std::get_if<GeometryCollection>(&geometry.value());
    if (!collection || collection->members.size() != 3) {
        std::cerr << "Collection should keep its three members" << std::endl;
        return false;
    }
    if (collection->members[0].kind() != GeometryKind::Point ||
        collection->members[1].kind() != GeometryKind::Polygon ||
        collection->members[2].kind() != GeometryKind::GeometryCollection) {
        std::cerr << "Collection members extracted with the wrong kinds" << std::endl;
        return false;
    }
    const auto& nested = std::get<GeometryCollection>(collection->members[2].value());
    return nested.members.size() == 1 && nested.members[0].kind() == GeometryKind::LineString;
}

bool test_unsupported_member_in_collection() {
    GeometryRecord outer(wkb::kGeometryCollection);
    outer.add_part(GeometryRecord(17, {{0, 0}}));
    try {
        (void)extract(outer);
    } catch (const UnsupportedGeometryKind& ex) {
        return ex.tag() == 17;
    }
    return false;
}

bool test_bounds() {
    GeometryRecord record = square_polygon(-2, 3);
    const Bounds2D bounds = geometry_bounds(extract(record));
    return bounds.is_valid() && bounds.x_min == -2 && bounds.x_max == 3 && bounds.y_min == -2 && bounds.y_max == 3;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"tag_normalisation", &test_tag_normalisation},
        {"unknown_tags_throw", &test_unknown_tags_throw},
        {"point", &test_point},
        {"empty_point_throws", &test_empty_point_throws},
        {"line_string", &test_line_string},
        {"polygon_rings", &test_polygon_rings},
        {"multi_point", &test_multi_point},
        {"multi_line_string", &test_multi_line_string},
        {"multi_polygon", &test_multi_polygon},
        {"nested_collection", &test_nested_collection},
        {"unsupported_member_in_collection", &test_unsupported_member_in_collection},
        {"bounds", &test_bounds},
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

} // namespace geometry_extract_tests

} // namespace geoplot::core

int main() {
    if (geoplot::core::geometry_extract_tests::run_all_tests()) {
        std::cout << "All geometry extraction tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Geometry extraction tests failed" << std::endl;
    return 1;
}
