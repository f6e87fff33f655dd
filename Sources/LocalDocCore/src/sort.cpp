#include "localdoc/sort.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/value.hpp"
#include <algorithm>

namespace localdoc {

static bool parse_direction(const json& dir) {
    if (dir.is_number()) {
        double d = dir.get<double>();
        if (d == 1) return false;
        if (d == -1) return true;
    } else if (dir.is_string()) {
        const auto& s = dir.get_ref<const std::string&>();
        if (s == "asc" || s == "ascending") return false;
        if (s == "desc" || s == "descending") return true;
    }
    throw validation_error("Invalid sort direction: " + dir.dump());
}

sort_spec parse_sort(const json& value) {
    sort_spec spec;
    if (value.is_null()) return spec;

    if (value.is_string()) {
        spec.push_back({value.get<std::string>(), false});
        return spec;
    }

    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            spec.push_back({it.key(), parse_direction(it.value())});
        }
        return spec;
    }

    if (value.is_array()) {
        for (const auto& entry : value) {
            if (entry.is_string()) {
                spec.push_back({entry.get<std::string>(), false});
            } else if (entry.is_array() && entry.size() == 2 && entry[0].is_string()) {
                spec.push_back({entry[0].get<std::string>(), parse_direction(entry[1])});
            } else {
                throw validation_error("Invalid sort entry: " + entry.dump());
            }
        }
        return spec;
    }

    throw validation_error("Invalid sort specification: " + value.dump());
}

json to_json(const sort_spec& spec) {
    json out = json::array();
    for (const auto& key : spec) {
        if (key.descending) {
            out.push_back(json::array({key.field, "desc"}));
        } else {
            out.push_back(key.field);
        }
    }
    return out;
}

document_comparator compile_sort(const sort_spec& spec) {
    struct compiled_key {
        std::vector<std::string> segments;
        bool descending;
    };
    std::vector<compiled_key> keys;
    keys.reserve(spec.size());
    for (const auto& key : spec) {
        keys.push_back({split_path(key.field), key.descending});
    }

    return [keys = std::move(keys)](const document& a, const document& b) {
        for (const auto& key : keys) {
            int c = compare_values(get_path(a, key.segments), get_path(b, key.segments));
            if (c != 0) return key.descending ? -c : c;
        }
        return 0;
    };
}

void sort_documents(std::vector<document>& docs, const sort_spec& spec) {
    if (spec.empty()) return;
    auto cmp = compile_sort(spec);
    std::stable_sort(docs.begin(), docs.end(),
                     [&cmp](const document& a, const document& b) { return cmp(a, b) < 0; });
}

} // namespace localdoc
