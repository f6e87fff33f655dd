#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "geo.hpp"
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace localdoc {

// ============================================================================
// Compiled selector tree
// ============================================================================

/// Operator kinds accepted inside a field's operator object.
enum class value_op {
    eq,
    ne,
    lt,
    lte,
    gt,
    gte,
    in,
    nin,
    all,
    exists,
    type,
    size,
    mod,
    regex,
    elem_match,
    not_,
    geo,      // placeholder for $near / $geoIntersects, always true in the predicate
    unknown   // unrecognized or malformed, never matches
};

struct selector_node;

struct value_test {
    value_op op = value_op::eq;
    json operand;
    std::shared_ptr<const std::regex> pattern;    // regex
    std::vector<value_test> nested;               // not_, elem_match over operators
    std::shared_ptr<const selector_node> sub;     // elem_match over documents
};

struct constant_node {
    bool value = true;
};

/// Plain (non-$) key: every test must hold against the values at the path.
struct field_node {
    std::string path;
    std::vector<std::string> segments;
    std::vector<value_test> tests;
};

struct logical_node {
    enum class kind { and_, or_, nor };
    kind op = kind::and_;
    std::vector<selector_node> children;
};

struct selector_node {
    std::variant<constant_node, field_node, logical_node> node;
};

// ============================================================================
// Geospatial clauses
// ============================================================================

struct geo_clause {
    enum class kind { near, intersects };
    kind op = kind::near;
    std::string path;
    std::vector<std::string> segments;
    geo::geometry geometry;
    std::optional<double> max_distance;  // near only
};

class compiled_selector {
public:
    compiled_selector() = default;
    compiled_selector(selector_node root, std::vector<geo_clause> geo)
        : root_(std::move(root)), geo_(std::move(geo)) {}

    /// Boolean part of the selector. Geo clauses are not applied here.
    bool matches(const document& doc) const;
    bool operator()(const document& doc) const { return matches(doc); }

    const std::vector<geo_clause>& geo_clauses() const { return geo_; }

    /// The first $near clause, or nullptr.
    const geo_clause* near_clause() const;
    bool has_near() const { return near_clause() != nullptr; }

private:
    selector_node root_;
    std::vector<geo_clause> geo_;
};

/// Compile a selector. A null or empty selector matches everything; a bare
/// string is shorthand for {"_id": value}. Unknown operators and malformed
/// operands compile to a never-matching test and are logged. Throws
/// malformed_geometry for bad $near / $geoIntersects geometry.
compiled_selector compile_selector(const json& selector);

/// Convenience for one-off matching.
bool matches_selector(const json& selector, const document& doc);

} // namespace localdoc

#endif // __cplusplus
