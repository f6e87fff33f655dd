#pragma once

#include <localdoc/geo.hpp>
#include <localdoc/query.hpp>
#include <localdoc/errors.hpp>
#include <cassert>
#include <cmath>
#include <iostream>

namespace geo_query_tests {

using localdoc::json;
using localdoc::document;
namespace geo = localdoc::geo;

json point(double lng, double lat) {
    return {{"type", "Point"}, {"coordinates", json::array({lng, lat})}};
}

json ring(std::initializer_list<std::pair<double, double>> positions) {
    json out = json::array();
    for (const auto& [lng, lat] : positions) out.push_back(json::array({lng, lat}));
    return out;
}

json square(double x0, double y0, double x1, double y1) {
    return {{"type", "Polygon"},
            {"coordinates", json::array({ring({{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}})})}};
}

json line_string(std::initializer_list<std::pair<double, double>> positions) {
    return {{"type", "LineString"}, {"coordinates", ring(positions)}};
}

// Meters per degree of latitude on the store's earth model
const double meters_per_degree = geo::earth_radius_m * 3.14159265358979323846 / 180.0;

// ============================================================================
// test_parse_geometry
// ============================================================================

void test_parse_geometry() {
    std::cout << "  test_parse_geometry..." << std::flush;

    auto p = geo::parse_geometry(point(10, 20));
    assert(p.type == geo::geometry_type::point);
    assert(p.points[0].lng == 10 && p.points[0].lat == 20);

    auto poly = geo::parse_geometry(square(0, 0, 1, 1));
    assert(poly.polygons.size() == 1);
    assert(poly.polygons[0].rings[0].size() == 5);

    auto expect_malformed = [](const json& value) {
        bool threw = false;
        try {
            geo::parse_geometry(value);
        } catch (const localdoc::malformed_geometry&) {
            threw = true;
        }
        assert(threw);
    };
    expect_malformed(json("Point"));
    expect_malformed({{"type", "Circle"}, {"coordinates", json::array({0, 0})}});
    expect_malformed({{"type", "Point"}});
    expect_malformed({{"type", "Point"}, {"coordinates", json::array({"a", 1})}});
    expect_malformed({{"type", "Polygon"}, {"coordinates", json::array({ring({{0, 0}, {1, 1}})})}});

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_distances
// ============================================================================

void test_distances() {
    std::cout << "  test_distances..." << std::flush;

    auto origin = geo::parse_geometry(point(0, 0));

    // One degree of latitude
    double d = geo::distance_meters(origin, geo::parse_geometry(point(0, 1)));
    assert(std::fabs(d - meters_per_degree) < 1.0);
    assert(geo::distance_meters(origin, origin) == 0.0);

    // Nearest point of a line running north along lng 0.001
    auto meridian = geo::parse_geometry(line_string({{0.001, -1}, {0.001, 1}}));
    double to_line = geo::distance_meters(origin, meridian);
    assert(std::fabs(to_line - 0.001 * meters_per_degree) < 1.0);

    // Past the end of a segment the endpoint is nearest
    auto stub = geo::parse_geometry(line_string({{0, 1}, {0, 2}}));
    assert(std::fabs(geo::distance_meters(origin, stub) - meters_per_degree) < 1.0);

    // Antipodal points are half the circumference apart
    double far = geo::distance_meters(geo::parse_geometry(point(-90, 0)), geo::parse_geometry(point(90, 0)));
    assert(!std::isnan(far));
    assert(std::fabs(far - 180.0 * meters_per_degree) < 1.0);
    double pole_to_pole = geo::distance_meters(geo::parse_geometry(point(0, 90)), geo::parse_geometry(point(0, -90)));
    assert(std::fabs(pole_to_pole - 180.0 * meters_per_degree) < 1.0);

    // Empty line has no distance
    auto empty = geo::parse_geometry({{"type", "LineString"}, {"coordinates", json::array()}});
    assert(std::isnan(geo::distance_meters(origin, empty)));

    bool threw = false;
    try {
        geo::distance_meters(origin, geo::parse_geometry(square(0, 0, 1, 1)));
    } catch (const localdoc::unsupported_geometry&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_polygon_predicates
// ============================================================================

void test_polygon_predicates() {
    std::cout << "  test_polygon_predicates..." << std::flush;

    auto area = geo::parse_geometry(square(0, 0, 10, 10));

    assert(geo::point_in_polygon(geo::parse_geometry(point(5, 5)), area));
    assert(geo::point_in_polygon(geo::parse_geometry(point(10, 5)), area));   // boundary
    assert(!geo::point_in_polygon(geo::parse_geometry(point(11, 5)), area));

    // Hole excludes its interior
    json holed = {{"type", "Polygon"}, {"coordinates", json::array({
        ring({{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}}),
        ring({{4, 4}, {6, 4}, {6, 6}, {4, 6}, {4, 4}})})}};
    auto with_hole = geo::parse_geometry(holed);
    assert(!geo::point_in_polygon(geo::parse_geometry(point(5, 5)), with_hole));
    assert(geo::point_in_polygon(geo::parse_geometry(point(2, 2)), with_hole));

    // MultiPolygon parts combine with OR
    json multi = {{"type", "MultiPolygon"}, {"coordinates", json::array({
        square(0, 0, 1, 1)["coordinates"], square(20, 20, 21, 21)["coordinates"]})}};
    assert(geo::point_in_polygon(geo::parse_geometry(point(20.5, 20.5)), geo::parse_geometry(multi)));

    // Overlap, containment and disjoint boxes
    assert(geo::polygons_intersect(area, geo::parse_geometry(square(5, 5, 15, 15))));
    assert(geo::polygons_intersect(area, geo::parse_geometry(square(2, 2, 3, 3))));
    assert(geo::polygons_intersect(geo::parse_geometry(square(2, 2, 3, 3)), area));
    assert(!geo::polygons_intersect(area, geo::parse_geometry(square(11, 11, 12, 12))));

    // Lines crossing, inside, and outside
    assert(geo::line_crosses_or_within(geo::parse_geometry(line_string({{-5, 5}, {15, 5}})), area));
    assert(geo::line_crosses_or_within(geo::parse_geometry(line_string({{2, 2}, {3, 3}})), area));
    assert(!geo::line_crosses_or_within(geo::parse_geometry(line_string({{-5, -5}, {-1, 20}})), area));

    // Empty parts of a MultiLineString are skipped
    json multi_line = {{"type", "MultiLineString"}, {"coordinates", json::array({
        json::array(), ring({{1, 1}, {2, 2}})})}};
    assert(geo::line_crosses_or_within(geo::parse_geometry(multi_line), area));

    auto box = geo::bounds_of(area);
    assert(box.min_lon == 0 && box.max_lon == 10 && box.min_lat == 0 && box.max_lat == 10);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_near_with_max_distance - 100 m kept and first, 2000 m dropped
// ============================================================================

void test_near_with_max_distance() {
    std::cout << "  test_near_with_max_distance..." << std::flush;

    double deg_100m = 100.0 / meters_per_degree;
    double deg_2000m = 2000.0 / meters_per_degree;

    std::vector<document> docs = {
        {{"_id", "far"}, {"loc", point(0, deg_2000m)}},
        {{"_id", "near"}, {"loc", point(0, deg_100m)}},
        {{"_id", "nowhere"}},
    };

    json selector = {{"loc", {{"$near", {{"$geometry", point(0, 0)}, {"$maxDistance", 1000}}}}}};
    auto result = localdoc::process_find(docs, selector);
    assert(result.size() == 1);
    assert(result[0]["_id"] == "near");

    // Without a limit both come back, nearest first, overriding options.sort
    json unbounded = {{"loc", {{"$near", {{"$geometry", point(0, 0)}}}}}};
    localdoc::find_options options;
    options.sort = localdoc::sort_spec{{"_id", true}};
    auto ordered = localdoc::process_find(docs, unbounded, options);
    assert(ordered.size() == 2);
    assert(ordered[0]["_id"] == "near");
    assert(ordered[1]["_id"] == "far");

    // Lines rank by their nearest point; a doc at the query point is kept
    std::vector<document> mixed = {
        {{"_id", "road"}, {"loc", line_string({{-1, deg_100m / 2}, {1, deg_100m / 2}})}},
        {{"_id", "here"}, {"loc", point(0, 0)}},
        {{"_id", "area"}, {"loc", square(0, 0, 1, 1)}},
    };
    auto ranked = localdoc::process_find(mixed, unbounded);
    assert(ranked.size() == 2);
    assert(ranked[0]["_id"] == "here");
    assert(ranked[1]["_id"] == "road");

    // A non-Point query geometry fails closed
    json by_polygon = {{"loc", {{"$near", {{"$geometry", square(0, 0, 1, 1)}}}}}};
    assert(localdoc::process_find(docs, by_polygon).empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_geo_intersects
// ============================================================================

void test_geo_intersects() {
    std::cout << "  test_geo_intersects..." << std::flush;

    std::vector<document> docs = {
        {{"_id", "in"}, {"geo", point(5, 5)}},
        {{"_id", "out"}, {"geo", point(50, 50)}},
        {{"_id", "overlap"}, {"geo", square(8, 8, 12, 12)}},
        {{"_id", "crossing"}, {"geo", line_string({{-1, 1}, {1, 1}})}},
        {{"_id", "broken"}, {"geo", {{"type", "Point"}, {"coordinates", "x"}}}},
        {{"_id", "none"}},
    };

    json selector = {{"geo", {{"$geoIntersects", {{"$geometry", square(0, 0, 10, 10)}}}}}};
    auto result = localdoc::process_find(docs, selector);

    std::vector<std::string> ids;
    for (const auto& d : result) ids.push_back(d["_id"]);
    assert((ids == std::vector<std::string>{"in", "overlap", "crossing"}));

    // Point query geometry is not supported for intersection
    json by_point = {{"geo", {{"$geoIntersects", {{"$geometry", point(5, 5)}}}}}};
    assert(localdoc::process_find(docs, by_point).empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_pipeline_and_projection
// ============================================================================

void test_pipeline_and_projection() {
    std::cout << "  test_pipeline_and_projection..." << std::flush;

    std::vector<document> docs;
    for (int i = 0; i < 10; ++i) {
        docs.push_back({{"_id", "d" + std::to_string(i)}, {"n", i}, {"meta", {{"a", i * 2}, {"b", "x"}}}});
    }

    localdoc::find_options options;
    options.sort = localdoc::sort_spec{{"n", true}};
    options.skip = 2;
    options.limit = 3;
    auto page = localdoc::process_find(docs, json{{"n", {{"$gte", 3}}}}, options);
    assert(page.size() == 3);
    assert(page[0]["n"] == 7 && page[1]["n"] == 6 && page[2]["n"] == 5);

    // Skip past the end
    options.skip = 20;
    assert(localdoc::process_find(docs, json::object(), options).empty());

    // Inclusion keeps listed paths plus _id and skips missing ones
    auto included = localdoc::filter_fields({docs[1]}, {{"meta.a", 1}, {"missing", 1}});
    assert((included[0] == json{{"_id", "d1"}, {"meta", {{"a", 2}}}}));

    // Exclusion removes listed paths
    auto excluded = localdoc::filter_fields({docs[1]}, {{"meta.b", 0}, {"n", 0}});
    assert((excluded[0] == json{{"_id", "d1"}, {"meta", {{"a", 2}}}}));

    // Projection applies last
    localdoc::find_options projected;
    projected.fields = json{{"n", 1}};
    projected.limit = 1;
    auto first = localdoc::process_find(docs, json{{"n", 4}}, projected);
    assert((first[0] == json{{"_id", "d4"}, {"n", 4}}));

    // Wire form
    localdoc::find_options wire;
    wire.sort = localdoc::sort_spec{{"n", true}};
    wire.limit = 5;
    wire.fields = json{{"n", 1}};
    json encoded = wire.to_json();
    assert(encoded["sort"] == json::array({json::array({"n", "desc"})}));
    assert(!encoded.contains("skip"));
    auto decoded = localdoc::find_options::from_json(encoded);
    assert(decoded.sort == wire.sort);
    assert(decoded.limit == wire.limit);
    assert(decoded.fields == wire.fields);
    assert(localdoc::find_options::from_json(json{{"skip", 2.0}, {"limit", 0}}).skip == 2);

    // Negative or fractional counts are rejected rather than wrapped
    for (const json& bad : {json{{"skip", -1}}, json{{"limit", -5}}, json{{"limit", 1.5}}}) {
        bool threw = false;
        try {
            localdoc::find_options::from_json(bad);
        } catch (const localdoc::validation_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Geo & query tests" << std::endl;
    test_parse_geometry();
    test_distances();
    test_polygon_predicates();
    test_near_with_max_distance();
    test_geo_intersects();
    test_pipeline_and_projection();
}

} // namespace geo_query_tests
