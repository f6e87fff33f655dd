#include "localdoc/query.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include "localdoc/value.hpp"
#include <algorithm>
#include <cmath>

namespace localdoc {

// ============================================================================
// find_options
// ============================================================================

json find_options::to_json() const {
    json out = json::object();
    if (sort && !sort->empty()) out["sort"] = localdoc::to_json(*sort);
    if (skip > 0) out["skip"] = skip;
    if (limit) out["limit"] = *limit;
    if (fields) out["fields"] = *fields;
    return out;
}

namespace {

/// skip and limit must be whole and non-negative.
size_t read_count(const json& value, const char* name) {
    if (value.is_number_unsigned()) return value.get<size_t>();
    if (value.is_number_integer() && value.get<int64_t>() >= 0) return value.get<size_t>();
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (d >= 0 && std::floor(d) == d && d < 18446744073709551616.0) return static_cast<size_t>(d);
    }
    throw validation_error(std::string("Invalid ") + name + ": " + value.dump());
}

} // namespace

find_options find_options::from_json(const json& value) {
    find_options options;
    if (!value.is_object()) return options;
    if (auto it = value.find("sort"); it != value.end() && !it->is_null()) {
        options.sort = parse_sort(*it);
    }
    if (auto it = value.find("skip"); it != value.end() && it->is_number()) {
        options.skip = read_count(*it, "skip");
    }
    if (auto it = value.find("limit"); it != value.end() && it->is_number()) {
        options.limit = read_count(*it, "limit");
    }
    if (auto it = value.find("fields"); it != value.end() && it->is_object()) {
        options.fields = *it;
    }
    return options;
}

// ============================================================================
// Geo stages
// ============================================================================

namespace {

struct ranked_doc {
    double distance;
    document doc;
};

/// Parsed geometry stored at the clause path, or nullopt when the document
/// holds nothing usable there.
std::optional<geo::geometry> document_geometry(const document& doc, const geo_clause& clause) {
    const json* value = get_path(doc, clause.segments);
    if (value == nullptr || !geo::declared_type(*value)) return std::nullopt;
    try {
        return geo::parse_geometry(*value);
    } catch (const malformed_geometry& e) {
        LOG_DEBUG("query", "Skipping %s with bad geometry: %s", doc_id(doc).c_str(), e.what());
        return std::nullopt;
    }
}

std::vector<document> apply_near(std::vector<document> docs, const geo_clause& clause) {
    if (clause.geometry.type != geo::geometry_type::point) {
        LOG_WARN("query", "$near requires a Point, got %s", geo::type_name(clause.geometry.type));
        return {};
    }

    std::vector<ranked_doc> ranked;
    for (auto& doc : docs) {
        auto g = document_geometry(doc, clause);
        if (!g) continue;
        if (g->type != geo::geometry_type::point && g->type != geo::geometry_type::line_string) continue;

        double d = geo::distance_meters(clause.geometry, *g);
        // Distance 0 stays: a document sitting on the target point is nearest
        if (std::isnan(d) || d < 0) continue;
        ranked.push_back({d, std::move(doc)});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ranked_doc& a, const ranked_doc& b) { return a.distance < b.distance; });

    std::vector<document> out;
    for (auto& r : ranked) {
        if (clause.max_distance && r.distance > *clause.max_distance) break;
        out.push_back(std::move(r.doc));
    }
    return out;
}

bool intersects_area(const geo::geometry& g, const geo::geometry& area) {
    switch (g.type) {
        case geo::geometry_type::point:
            return geo::point_in_polygon(g, area);
        case geo::geometry_type::polygon:
        case geo::geometry_type::multi_polygon:
            return geo::polygons_intersect(g, area);
        case geo::geometry_type::line_string:
        case geo::geometry_type::multi_line_string:
            return geo::line_crosses_or_within(g, area);
        default:
            return false;
    }
}

std::vector<document> apply_intersects(std::vector<document> docs, const geo_clause& clause) {
    if (clause.geometry.type != geo::geometry_type::polygon &&
        clause.geometry.type != geo::geometry_type::multi_polygon) {
        LOG_WARN("query", "$geoIntersects requires a Polygon, got %s", geo::type_name(clause.geometry.type));
        return {};
    }

    std::vector<document> out;
    for (auto& doc : docs) {
        auto g = document_geometry(doc, clause);
        if (g && intersects_area(*g, clause.geometry)) {
            out.push_back(std::move(doc));
        }
    }
    return out;
}

// ============================================================================
// Projection
// ============================================================================

bool is_truthy(const json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0;
    return !v.is_null();
}

document include_fields(const document& doc, const std::vector<std::string>& paths) {
    document out = json::object();
    for (const auto& path : paths) {
        auto segments = split_path(path);
        const json* value = get_path(doc, segments);
        if (value == nullptr || value->is_null()) continue;

        json* to = &out;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            json& next = (*to)[segments[i]];
            if (!next.is_object()) next = json::object();
            to = &next;
        }
        (*to)[segments.back()] = *value;
    }
    return out;
}

void exclude_fields(document& doc, const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        auto segments = split_path(path);
        json* obj = &doc;
        for (size_t i = 0; i + 1 < segments.size() && obj != nullptr; ++i) {
            if (!obj->is_object()) {
                obj = nullptr;
                break;
            }
            auto it = obj->find(segments[i]);
            obj = it == obj->end() ? nullptr : &*it;
        }
        if (obj != nullptr && obj->is_object()) {
            obj->erase(segments.back());
        }
    }
}

} // namespace

std::vector<document> filter_fields(std::vector<document> docs, const json& fields) {
    if (!fields.is_object() || fields.empty()) return docs;

    std::vector<std::string> paths;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        paths.push_back(it.key());
    }

    if (is_truthy(fields.begin().value())) {
        paths.push_back(id_field);
        for (auto& doc : docs) {
            doc = include_fields(doc, paths);
        }
    } else {
        for (auto& doc : docs) {
            exclude_fields(doc, paths);
        }
    }
    return docs;
}

// ============================================================================
// Pipeline
// ============================================================================

std::vector<document> process_find(std::vector<document> docs,
                                   const compiled_selector& selector,
                                   const find_options& options) {
    std::vector<document> filtered;
    filtered.reserve(docs.size());
    for (auto& doc : docs) {
        if (selector.matches(doc)) filtered.push_back(std::move(doc));
    }

    bool near_sorted = false;
    for (const auto& clause : selector.geo_clauses()) {
        if (clause.op == geo_clause::kind::near) {
            filtered = apply_near(std::move(filtered), clause);
            near_sorted = true;
        }
    }
    for (const auto& clause : selector.geo_clauses()) {
        if (clause.op == geo_clause::kind::intersects) {
            filtered = apply_intersects(std::move(filtered), clause);
        }
    }

    if (options.sort && !near_sorted) {
        sort_documents(filtered, *options.sort);
    }

    if (options.skip > 0) {
        if (options.skip >= filtered.size()) {
            filtered.clear();
        } else {
            filtered.erase(filtered.begin(), filtered.begin() + static_cast<std::ptrdiff_t>(options.skip));
        }
    }

    if (options.limit && filtered.size() > *options.limit) {
        filtered.resize(*options.limit);
    }

    if (options.fields) {
        filtered = filter_fields(std::move(filtered), *options.fields);
    }
    return filtered;
}

std::vector<document> process_find(std::vector<document> docs,
                                   const json& selector,
                                   const find_options& options) {
    return process_find(std::move(docs), compile_selector(selector), options);
}

} // namespace localdoc
