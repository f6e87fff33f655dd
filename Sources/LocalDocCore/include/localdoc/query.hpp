#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "selector.hpp"
#include "sort.hpp"
#include <optional>
#include <vector>

namespace localdoc {

struct find_options {
    std::optional<sort_spec> sort;
    size_t skip = 0;
    std::optional<size_t> limit;
    std::optional<json> fields;   // {"a": 1, "b.c": 1} or {"x": 0}

    /// Wire form: {"sort": [...], "skip": n, "limit": n, "fields": {...}}, absent keys omitted.
    json to_json() const;
    static find_options from_json(const json& value);

    bool has_projection() const { return fields && fields->is_object() && !fields->empty(); }
};

/// Selector, $near, $geoIntersects, sort, skip, limit, then projection.
std::vector<document> process_find(std::vector<document> docs,
                                   const compiled_selector& selector,
                                   const find_options& options = {});

std::vector<document> process_find(std::vector<document> docs,
                                   const json& selector,
                                   const find_options& options = {});

/// Inclusion projection when the first value is truthy (plus "_id"),
/// exclusion otherwise. An empty projection returns the input unchanged.
std::vector<document> filter_fields(std::vector<document> docs, const json& fields);

} // namespace localdoc

#endif // __cplusplus
