#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace localdoc {

struct sort_key {
    std::string field;
    bool descending = false;

    bool operator==(const sort_key& other) const {
        return field == other.field && descending == other.descending;
    }
};

using sort_spec = std::vector<sort_key>;

/// Three-way document comparator: negative, zero or positive.
using document_comparator = std::function<int(const document&, const document&)>;

/// Accepts "field", ["a", ["b", "desc"]] or {"a": 1, "b": -1}.
/// Directions: 1/-1, "asc"/"desc", "ascending"/"descending".
/// Throws validation_error for anything else.
sort_spec parse_sort(const json& value);

/// Array form, e.g. ["a", ["b", "desc"]].
json to_json(const sort_spec& spec);

document_comparator compile_sort(const sort_spec& spec);

/// Stable sort; equal documents keep their input order.
void sort_documents(std::vector<document>& docs, const sort_spec& spec);

} // namespace localdoc

#endif // __cplusplus
