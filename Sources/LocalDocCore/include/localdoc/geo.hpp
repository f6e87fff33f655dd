#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace localdoc::geo {

// GeoJSON positions are [longitude, latitude].
struct position {
    double lng = 0.0;
    double lat = 0.0;
};

using line = std::vector<position>;

struct polygon {
    std::vector<line> rings;  // rings[0] is the shell, the rest are holes
};

enum class geometry_type {
    point,
    multi_point,
    line_string,
    multi_line_string,
    polygon,
    multi_polygon
};

struct geometry {
    geometry_type type = geometry_type::point;
    std::vector<position> points;      // point, multi_point
    std::vector<line> lines;           // line_string, multi_line_string
    std::vector<polygon> polygons;     // polygon, multi_polygon
};

/// Mean earth radius used for all distances, in meters.
inline constexpr double earth_radius_m = 6370986.0;

/// Parse a GeoJSON geometry object. Throws malformed_geometry.
geometry parse_geometry(const json& value);

/// The declared GeoJSON "type" of a value, without validating coordinates.
std::optional<geometry_type> declared_type(const json& value);

const char* type_name(geometry_type type);

/// Great-circle distance in meters from a point to a Point or LineString
/// (nearest point on any segment). Throws unsupported_geometry for other
/// targets. An empty LineString yields NaN.
double distance_meters(const geometry& from, const geometry& to);

/// Point against Polygon/MultiPolygon. The boundary counts as inside.
bool point_in_polygon(const geometry& point, const geometry& area);

/// Polygon/MultiPolygon against Polygon/MultiPolygon.
bool polygons_intersect(const geometry& a, const geometry& b);

/// LineString/MultiLineString crossing into, or lying within, a polygon.
/// Empty line parts are skipped.
bool line_crosses_or_within(const geometry& path, const geometry& area);

geo_bounds bounds_of(const geometry& g);

} // namespace localdoc::geo

#endif // __cplusplus
