#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <string>
#include <vector>

namespace localdoc {

// Cross-type ordering used by sorting and comparison operators:
// missing/null < numbers < strings < objects < arrays < booleans.
enum class value_rank : int {
    null_rank = 0,
    number_rank = 1,
    string_rank = 2,
    object_rank = 3,
    array_rank = 4,
    boolean_rank = 5
};

value_rank rank_of(const json* value);

/// Total order over JSON values (nullptr means missing). Returns -1, 0 or 1.
int compare_values(const json* a, const json* b);

inline int compare_values(const json& a, const json& b) {
    return compare_values(&a, &b);
}

/// All values reachable at a dotted path. Arrays met before the last segment
/// are expanded element-wise, so {"a":[{"b":1},{"b":2}]} yields 1 and 2 for
/// "a.b". A path that dead-ends contributes a nullptr (missing) branch.
std::vector<const json*> lookup_values(const json& doc, const std::vector<std::string>& segments);

/// First value at a dotted path without array expansion, or nullptr.
const json* get_path(const json& doc, const std::vector<std::string>& segments);

inline const json* get_path(const json& doc, const std::string& path) {
    return get_path(doc, split_path(path));
}

} // namespace localdoc

#endif // __cplusplus
