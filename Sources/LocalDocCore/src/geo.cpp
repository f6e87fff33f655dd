#include "localdoc/geo.hpp"
#include "localdoc/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace localdoc::geo {

namespace {

constexpr double pi = 3.14159265358979323846;

double deg2rad(double deg) {
    return deg * (pi / 180.0);
}

double rad2deg(double rad) {
    return rad * (180.0 / pi);
}

// ============================================================================
// Parsing
// ============================================================================

position parse_position(const json& value) {
    if (!value.is_array() || value.size() < 2 || !value[0].is_number() || !value[1].is_number()) {
        throw malformed_geometry("Invalid position: " + value.dump());
    }
    return position{value[0].get<double>(), value[1].get<double>()};
}

line parse_line(const json& value) {
    if (!value.is_array()) {
        throw malformed_geometry("Invalid line coordinates: " + value.dump());
    }
    line result;
    result.reserve(value.size());
    for (const auto& p : value) {
        result.push_back(parse_position(p));
    }
    return result;
}

polygon parse_polygon(const json& value) {
    if (!value.is_array() || value.empty()) {
        throw malformed_geometry("Invalid polygon coordinates: " + value.dump());
    }
    polygon result;
    for (const auto& ring : value) {
        auto parsed = parse_line(ring);
        if (parsed.size() < 3) {
            throw malformed_geometry("Polygon ring needs at least 3 positions");
        }
        result.rings.push_back(std::move(parsed));
    }
    return result;
}

// ============================================================================
// Planar helpers (coordinates treated as x=lng, y=lat)
// ============================================================================

double cross(const position& o, const position& a, const position& b) {
    return (a.lng - o.lng) * (b.lat - o.lat) - (a.lat - o.lat) * (b.lng - o.lng);
}

bool on_segment(const position& p, const position& a, const position& b) {
    constexpr double eps = 1e-12;
    if (std::fabs(cross(a, b, p)) > eps) return false;
    return p.lng >= std::min(a.lng, b.lng) - eps && p.lng <= std::max(a.lng, b.lng) + eps &&
           p.lat >= std::min(a.lat, b.lat) - eps && p.lat <= std::max(a.lat, b.lat) + eps;
}

int orientation(const position& a, const position& b, const position& c) {
    double v = cross(a, b, c);
    if (std::fabs(v) < 1e-12) return 0;
    return v > 0 ? 1 : -1;
}

bool segments_intersect(const position& p1, const position& p2,
                        const position& q1, const position& q2) {
    int o1 = orientation(p1, p2, q1);
    int o2 = orientation(p1, p2, q2);
    int o3 = orientation(q1, q2, p1);
    int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) return true;
    if (o1 == 0 && on_segment(q1, p1, p2)) return true;
    if (o2 == 0 && on_segment(q2, p1, p2)) return true;
    if (o3 == 0 && on_segment(p1, q1, q2)) return true;
    if (o4 == 0 && on_segment(p2, q1, q2)) return true;
    return false;
}

// Segments cross at a single interior point of both.
bool segments_cross(const position& p1, const position& p2,
                    const position& q1, const position& q2) {
    int o1 = orientation(p1, p2, q1);
    int o2 = orientation(p1, p2, q2);
    int o3 = orientation(q1, q2, p1);
    int o4 = orientation(q1, q2, p2);
    return o1 * o2 < 0 && o3 * o4 < 0;
}

enum class ring_location { outside, boundary, inside };

ring_location locate_in_ring(const position& p, const line& ring) {
    bool inside = false;
    size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& a = ring[i];
        const auto& b = ring[j];
        if (on_segment(p, a, b)) return ring_location::boundary;
        if ((a.lat > p.lat) != (b.lat > p.lat)) {
            double x = (b.lng - a.lng) * (p.lat - a.lat) / (b.lat - a.lat) + a.lng;
            if (p.lng < x) inside = !inside;
        }
    }
    return inside ? ring_location::inside : ring_location::outside;
}

ring_location locate_in_polygon(const position& p, const polygon& poly) {
    auto shell = locate_in_ring(p, poly.rings.front());
    if (shell != ring_location::inside) return shell;
    for (size_t h = 1; h < poly.rings.size(); ++h) {
        auto hole = locate_in_ring(p, poly.rings[h]);
        if (hole == ring_location::inside) return ring_location::outside;
        if (hole == ring_location::boundary) return ring_location::boundary;
    }
    return ring_location::inside;
}

geo_bounds bounds_of_line(const line& l) {
    auto b = geo_bounds::point(l.front().lat, l.front().lng);
    for (const auto& p : l) b.extend(p.lat, p.lng);
    return b;
}

bool polygon_pair_intersects(const polygon& a, const polygon& b) {
    if (!bounds_of_line(a.rings.front()).intersects(bounds_of_line(b.rings.front()))) {
        return false;
    }
    for (const auto& ra : a.rings) {
        for (size_t i = 0; i + 1 < ra.size() || (i + 1 == ra.size() && ra.size() > 1); ++i) {
            const auto& a1 = ra[i];
            const auto& a2 = ra[(i + 1) % ra.size()];
            for (const auto& rb : b.rings) {
                for (size_t j = 0; j < rb.size(); ++j) {
                    if (segments_intersect(a1, a2, rb[j], rb[(j + 1) % rb.size()])) return true;
                }
            }
        }
    }
    // No edge contact: one may contain the other
    if (locate_in_polygon(a.rings.front().front(), b) != ring_location::outside) return true;
    if (locate_in_polygon(b.rings.front().front(), a) != ring_location::outside) return true;
    return false;
}

bool part_crosses_or_within(const line& part, const polygon& poly) {
    for (const auto& p : part) {
        if (locate_in_polygon(p, poly) == ring_location::inside) return true;
    }
    for (size_t i = 0; i + 1 < part.size(); ++i) {
        const auto& p1 = part[i];
        const auto& p2 = part[i + 1];
        for (const auto& ring : poly.rings) {
            for (size_t j = 0; j < ring.size(); ++j) {
                if (segments_cross(p1, p2, ring[j], ring[(j + 1) % ring.size()])) return true;
            }
        }
        // A chord between two boundary points still passes through the interior
        position mid{(p1.lng + p2.lng) / 2.0, (p1.lat + p2.lat) / 2.0};
        if (locate_in_polygon(mid, poly) == ring_location::inside) return true;
    }
    return false;
}

double haversine(const position& a, const position& b) {
    double d_lat = deg2rad(b.lat - a.lat);
    double d_lng = deg2rad(b.lng - a.lng);
    double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
               std::cos(deg2rad(a.lat)) * std::cos(deg2rad(b.lat)) *
               std::sin(d_lng / 2) * std::sin(d_lng / 2);
    // Rounding can push h just past 1 for antipodal points
    h = std::clamp(h, 0.0, 1.0);
    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return earth_radius_m * c;
}

// Nearest point on segment ab to p, projected in a local equirectangular frame.
position nearest_on_segment(const position& p, const position& a, const position& b) {
    double k = std::cos(deg2rad(p.lat));
    double ax = (a.lng - p.lng) * k, ay = a.lat - p.lat;
    double bx = (b.lng - p.lng) * k, by = b.lat - p.lat;
    double dx = bx - ax, dy = by - ay;
    double len2 = dx * dx + dy * dy;
    double t = len2 == 0.0 ? 0.0 : std::clamp(-(ax * dx + ay * dy) / len2, 0.0, 1.0);
    return position{a.lng + (b.lng - a.lng) * t, a.lat + (b.lat - a.lat) * t};
}

const std::vector<polygon>& require_polygons(const geometry& g) {
    if (g.type != geometry_type::polygon && g.type != geometry_type::multi_polygon) {
        throw unsupported_geometry(std::string("Expected Polygon or MultiPolygon, got ") + type_name(g.type));
    }
    return g.polygons;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

std::optional<geometry_type> declared_type(const json& value) {
    if (!value.is_object()) return std::nullopt;
    auto it = value.find("type");
    if (it == value.end() || !it->is_string()) return std::nullopt;
    const auto& t = it->get_ref<const std::string&>();
    if (t == "Point") return geometry_type::point;
    if (t == "MultiPoint") return geometry_type::multi_point;
    if (t == "LineString") return geometry_type::line_string;
    if (t == "MultiLineString") return geometry_type::multi_line_string;
    if (t == "Polygon") return geometry_type::polygon;
    if (t == "MultiPolygon") return geometry_type::multi_polygon;
    return std::nullopt;
}

const char* type_name(geometry_type type) {
    switch (type) {
        case geometry_type::point: return "Point";
        case geometry_type::multi_point: return "MultiPoint";
        case geometry_type::line_string: return "LineString";
        case geometry_type::multi_line_string: return "MultiLineString";
        case geometry_type::polygon: return "Polygon";
        case geometry_type::multi_polygon: return "MultiPolygon";
    }
    return "Unknown";
}

geometry parse_geometry(const json& value) {
    auto type = declared_type(value);
    if (!type) {
        throw malformed_geometry("Not a GeoJSON geometry: " + value.dump());
    }
    auto coords = value.find("coordinates");
    if (coords == value.end()) {
        throw malformed_geometry(std::string(type_name(*type)) + " without coordinates");
    }

    geometry g;
    g.type = *type;
    switch (*type) {
        case geometry_type::point:
            g.points.push_back(parse_position(*coords));
            break;
        case geometry_type::multi_point:
            g.points = parse_line(*coords);
            break;
        case geometry_type::line_string:
            g.lines.push_back(parse_line(*coords));
            break;
        case geometry_type::multi_line_string:
            if (!coords->is_array()) throw malformed_geometry("Invalid MultiLineString coordinates");
            for (const auto& part : *coords) g.lines.push_back(parse_line(part));
            break;
        case geometry_type::polygon:
            g.polygons.push_back(parse_polygon(*coords));
            break;
        case geometry_type::multi_polygon:
            if (!coords->is_array()) throw malformed_geometry("Invalid MultiPolygon coordinates");
            for (const auto& part : *coords) g.polygons.push_back(parse_polygon(part));
            break;
    }
    return g;
}

double distance_meters(const geometry& from, const geometry& to) {
    if (from.type != geometry_type::point) {
        throw unsupported_geometry(std::string("Distance origin must be a Point, got ") + type_name(from.type));
    }
    const auto& origin = from.points.front();

    if (to.type == geometry_type::point) {
        return haversine(origin, to.points.front());
    }
    if (to.type == geometry_type::line_string) {
        const auto& l = to.lines.front();
        if (l.empty()) return std::numeric_limits<double>::quiet_NaN();
        if (l.size() == 1) return haversine(origin, l.front());
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i + 1 < l.size(); ++i) {
            best = std::min(best, haversine(origin, nearest_on_segment(origin, l[i], l[i + 1])));
        }
        return best;
    }
    throw unsupported_geometry(std::string("Cannot measure distance to ") + type_name(to.type));
}

bool point_in_polygon(const geometry& point, const geometry& area) {
    if (point.type != geometry_type::point) {
        throw unsupported_geometry(std::string("Expected Point, got ") + type_name(point.type));
    }
    const auto& p = point.points.front();
    for (const auto& poly : require_polygons(area)) {
        if (locate_in_polygon(p, poly) != ring_location::outside) return true;
    }
    return false;
}

bool polygons_intersect(const geometry& a, const geometry& b) {
    for (const auto& pa : require_polygons(a)) {
        for (const auto& pb : require_polygons(b)) {
            if (polygon_pair_intersects(pa, pb)) return true;
        }
    }
    return false;
}

bool line_crosses_or_within(const geometry& path, const geometry& area) {
    if (path.type != geometry_type::line_string && path.type != geometry_type::multi_line_string) {
        throw unsupported_geometry(std::string("Expected LineString, got ") + type_name(path.type));
    }
    const auto& polys = require_polygons(area);
    for (const auto& part : path.lines) {
        if (part.empty()) continue;
        for (const auto& poly : polys) {
            if (part_crosses_or_within(part, poly)) return true;
        }
    }
    return false;
}

geo_bounds bounds_of(const geometry& g) {
    std::optional<geo_bounds> result;
    auto add = [&result](const position& p) {
        if (!result) {
            result = geo_bounds::point(p.lat, p.lng);
        } else {
            result->extend(p.lat, p.lng);
        }
    };
    for (const auto& p : g.points) add(p);
    for (const auto& l : g.lines) for (const auto& p : l) add(p);
    for (const auto& poly : g.polygons) for (const auto& p : poly.rings.front()) add(p);
    return result.value_or(geo_bounds());
}

} // namespace localdoc::geo
