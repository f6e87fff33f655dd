#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace localdoc {

using json = nlohmann::json;

// A document is a JSON object carrying a string "_id" and an optional "_rev".
using document = json;
using doc_id_t = std::string;

inline constexpr const char* id_field = "_id";
inline constexpr const char* rev_field = "_rev";

// ============================================================================
// Generated ids
// ============================================================================

/// 32 lowercase hex digits shaped like a random (v4) UUID without hyphens:
/// digit 12 is '4' and digit 16 is one of 8, 9, a, b.
inline doc_id_t create_uid() {
    static constexpr char digits[] = "0123456789abcdef";
    static thread_local std::mt19937_64 engine{std::random_device{}()};

    doc_id_t out(32, '0');
    for (size_t half = 0; half < 2; ++half) {
        uint64_t bits = engine();
        for (size_t i = 0; i < 16; ++i) {
            out[half * 16 + i] = digits[(bits >> (60 - 4 * i)) & 0xF];
        }
    }
    out[12] = '4';
    out[16] = digits[8 + (engine() & 0x3)];
    return out;
}

// ============================================================================
// Document helpers
// ============================================================================

/// Returns the document's id, or an empty string when absent or not a string.
inline doc_id_t doc_id(const document& doc) {
    if (!doc.is_object()) return {};
    auto it = doc.find(id_field);
    if (it == doc.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

inline bool has_revision(const document& doc) {
    if (!doc.is_object()) return false;
    auto it = doc.find(rev_field);
    return it != doc.end() && !it->is_null();
}

/// True when `existing` carries a revision strictly newer than `incoming`.
/// Revisions compare numerically when both are numbers, lexically when both
/// are strings; mismatched or missing markers never block an overwrite.
inline bool is_stale_revision(const document& incoming, const document& existing) {
    if (!has_revision(incoming) || !has_revision(existing)) return false;
    const auto& in_rev = incoming[rev_field];
    const auto& ex_rev = existing[rev_field];
    if (in_rev.is_number() && ex_rev.is_number()) {
        return ex_rev.get<double>() > in_rev.get<double>();
    }
    if (in_rev.is_string() && ex_rev.is_string()) {
        return ex_rev.get<std::string>() > in_rev.get<std::string>();
    }
    return false;
}

/// Split a dotted field path ("a.b.c") into its segments.
inline std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

// ============================================================================
// Upsert items
// ============================================================================

/// A document to write together with the value it was derived from.
/// An absent base means the server should overwrite without merging.
struct upsert_item {
    document doc;
    std::optional<document> base;

    bool operator==(const upsert_item& other) const {
        return doc == other.doc && base == other.base;
    }
};

/// Server answer for one uploaded upsert. `doc`/`base` are the snapshot
/// that was sent; `merged` is what the server stored, when it returned one.
struct upsert_resolution {
    document doc;
    std::optional<document> base;
    std::optional<document> merged;
};

/// Normalize parallel doc/base lists into upsert items, assigning ids to
/// documents without one. Throws base_id_mismatch (see errors.hpp).
std::vector<upsert_item> regularize_upsert(std::vector<document> docs,
                                           std::vector<std::optional<document>> bases = {});

// ============================================================================
// geo_bounds - lat/lng box used to skip exact geometry tests
// ============================================================================

struct geo_bounds {
    double min_lat = 0.0;
    double max_lat = 0.0;
    double min_lon = 0.0;
    double max_lon = 0.0;

    static geo_bounds point(double lat, double lon) {
        return geo_bounds{lat, lat, lon, lon};
    }

    void extend(double lat, double lon) {
        min_lat = std::min(min_lat, lat);
        max_lat = std::max(max_lat, lat);
        min_lon = std::min(min_lon, lon);
        max_lon = std::max(max_lon, lon);
    }

    /// Edges touching counts as overlap.
    bool intersects(const geo_bounds& o) const {
        return o.min_lat <= max_lat && min_lat <= o.max_lat &&
               o.min_lon <= max_lon && min_lon <= o.max_lon;
    }
};

} // namespace localdoc

#endif // __cplusplus
