#include "localdoc/value.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace localdoc {

value_rank rank_of(const json* value) {
    if (value == nullptr || value->is_null()) return value_rank::null_rank;
    if (value->is_number()) return value_rank::number_rank;
    if (value->is_string()) return value_rank::string_rank;
    if (value->is_object()) return value_rank::object_rank;
    if (value->is_array()) return value_rank::array_rank;
    return value_rank::boolean_rank;
}

static int sign(double d) {
    return d < 0 ? -1 : (d > 0 ? 1 : 0);
}

int compare_values(const json* a, const json* b) {
    auto ra = rank_of(a);
    auto rb = rank_of(b);
    if (ra != rb) {
        return static_cast<int>(ra) < static_cast<int>(rb) ? -1 : 1;
    }

    switch (ra) {
        case value_rank::null_rank:
            return 0;
        case value_rank::number_rank:
            if (a->is_number_integer() && b->is_number_integer()) {
                auto x = a->get<int64_t>();
                auto y = b->get<int64_t>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            return sign(a->get<double>() - b->get<double>());
        case value_rank::string_rank: {
            int c = a->get_ref<const std::string&>().compare(b->get_ref<const std::string&>());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case value_rank::object_rank: {
            // Key by key in object order, then by size
            auto ia = a->begin();
            auto ib = b->begin();
            for (; ia != a->end() && ib != b->end(); ++ia, ++ib) {
                int c = ia.key().compare(ib.key());
                if (c != 0) return c < 0 ? -1 : 1;
                c = compare_values(&ia.value(), &ib.value());
                if (c != 0) return c;
            }
            if (a->size() == b->size()) return 0;
            return a->size() < b->size() ? -1 : 1;
        }
        case value_rank::array_rank: {
            size_t n = std::min(a->size(), b->size());
            for (size_t i = 0; i < n; ++i) {
                int c = compare_values(&(*a)[i], &(*b)[i]);
                if (c != 0) return c;
            }
            if (a->size() == b->size()) return 0;
            return a->size() < b->size() ? -1 : 1;
        }
        case value_rank::boolean_rank: {
            bool x = a->get<bool>();
            bool y = b->get<bool>();
            return x == y ? 0 : (x ? 1 : -1);
        }
    }
    return 0;
}

/// A segment of digits read as an array position. Positions too large for
/// size_t name no element.
static std::optional<size_t> array_index(const std::string& segment) {
    if (segment.empty() ||
        !std::all_of(segment.begin(), segment.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    size_t index = 0;
    auto [end, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (ec != std::errc() || end != segment.data() + segment.size()) return std::nullopt;
    return index;
}

static void collect(const json& node, const std::vector<std::string>& segments,
                    size_t i, std::vector<const json*>& out) {
    if (i == segments.size()) {
        out.push_back(&node);
        return;
    }

    const auto& segment = segments[i];
    if (node.is_object()) {
        auto it = node.find(segment);
        if (it == node.end()) {
            out.push_back(nullptr);
            return;
        }
        collect(*it, segments, i + 1, out);
        return;
    }

    if (node.is_array()) {
        bool reached = false;
        if (auto index = array_index(segment)) {
            if (*index < node.size()) {
                collect(node[*index], segments, i + 1, out);
                reached = true;
            }
        }
        for (const auto& element : node) {
            if (element.is_object()) {
                collect(element, segments, i, out);
                reached = true;
            }
        }
        if (!reached) out.push_back(nullptr);
        return;
    }

    out.push_back(nullptr);
}

std::vector<const json*> lookup_values(const json& doc, const std::vector<std::string>& segments) {
    std::vector<const json*> out;
    collect(doc, segments, 0, out);
    return out;
}

const json* get_path(const json& doc, const std::vector<std::string>& segments) {
    const json* current = &doc;
    for (const auto& segment : segments) {
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (auto index = current->is_array() ? array_index(segment) : std::nullopt) {
            if (*index >= current->size()) return nullptr;
            current = &(*current)[*index];
        } else {
            return nullptr;
        }
    }
    return current;
}

} // namespace localdoc
