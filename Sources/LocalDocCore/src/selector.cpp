#include "localdoc/selector.hpp"
#include "localdoc/errors.hpp"
#include "localdoc/log.hpp"
#include "localdoc/value.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace localdoc {

namespace {

bool is_operator_key(const std::string& key) {
    return !key.empty() && key[0] == '$';
}

bool has_operator_keys(const json& value) {
    if (!value.is_object()) return false;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (is_operator_key(it.key())) return true;
    }
    return false;
}

value_test failed_test(const std::string& reason) {
    LOG_WARN("selector", "%s", reason.c_str());
    value_test t;
    t.op = value_op::unknown;
    return t;
}

selector_node constant(bool value) {
    return selector_node{constant_node{value}};
}

// ============================================================================
// Evaluation
// ============================================================================

bool match_document(const selector_node& node, const document& doc);
bool match_field(const value_test& test, const std::vector<const json*>& branches);

/// The value itself followed by its elements when it is an array.
std::vector<const json*> candidates(const json* value) {
    std::vector<const json*> out{value};
    if (value && value->is_array()) {
        for (const auto& e : *value) out.push_back(&e);
    }
    return out;
}

bool eq_value(const json* value, const json& operand) {
    if (operand.is_null()) {
        return value == nullptr || value->is_null();
    }
    if (value == nullptr) return false;
    if (*value == operand) return true;
    if (value->is_array()) {
        return std::any_of(value->begin(), value->end(),
                           [&](const json& e) { return e == operand; });
    }
    return false;
}

bool compare_matches(value_op op, int c) {
    switch (op) {
        case value_op::lt:  return c < 0;
        case value_op::lte: return c <= 0;
        case value_op::gt:  return c > 0;
        case value_op::gte: return c >= 0;
        default:            return false;
    }
}

bool type_matches(const json& value, const json& type) {
    if (type.is_string()) {
        const auto& name = type.get_ref<const std::string&>();
        if (name == "number") return value.is_number();
        if (name == "double") return value.is_number();
        if (name == "int" || name == "long") return value.is_number_integer();
        if (name == "string") return value.is_string();
        if (name == "object") return value.is_object();
        if (name == "array") return value.is_array();
        if (name == "bool") return value.is_boolean();
        if (name == "null") return value.is_null();
        return false;
    }
    switch (type.get<int>()) {
        case 1:  return value.is_number();
        case 2:  return value.is_string();
        case 3:  return value.is_object();
        case 4:  return value.is_array();
        case 8:  return value.is_boolean();
        case 10: return value.is_null();
        case 16:
        case 18: return value.is_number_integer();
        default: return false;
    }
}

bool mod_matches(const json& value, const json& operand) {
    if (!value.is_number()) return false;
    const auto& divisor = operand[0];
    const auto& remainder = operand[1];
    if (value.is_number_integer() && divisor.is_number_integer() && remainder.is_number_integer()) {
        // x % -1 is always 0; INT64_MIN % -1 overflows
        if (divisor.get<int64_t>() == -1) return remainder.get<int64_t>() == 0;
        return value.get<int64_t>() % divisor.get<int64_t>() == remainder.get<int64_t>();
    }
    return std::fmod(value.get<double>(), divisor.get<double>()) == remainder.get<double>();
}

bool match_branch(const value_test& test, const json* value) {
    switch (test.op) {
        case value_op::eq:
            return eq_value(value, test.operand);

        case value_op::lt:
        case value_op::lte:
        case value_op::gt:
        case value_op::gte: {
            auto rank = rank_of(&test.operand);
            for (const json* c : candidates(value)) {
                if (rank_of(c) == rank && compare_matches(test.op, compare_values(c, &test.operand))) {
                    return true;
                }
            }
            return false;
        }

        case value_op::in:
            return std::any_of(test.operand.begin(), test.operand.end(),
                               [&](const json& e) { return eq_value(value, e); });

        case value_op::all:
            if (value == nullptr || !value->is_array() || test.operand.empty()) return false;
            return std::all_of(test.operand.begin(), test.operand.end(),
                               [&](const json& e) { return eq_value(value, e); });

        case value_op::type:
            for (const json* c : candidates(value)) {
                if (c && type_matches(*c, test.operand)) return true;
            }
            return false;

        case value_op::size:
            return value != nullptr && value->is_array() &&
                   value->size() == test.operand.get<size_t>();

        case value_op::mod:
            for (const json* c : candidates(value)) {
                if (c && mod_matches(*c, test.operand)) return true;
            }
            return false;

        case value_op::regex:
            for (const json* c : candidates(value)) {
                if (c && c->is_string() &&
                    std::regex_search(c->get_ref<const std::string&>(), *test.pattern)) {
                    return true;
                }
            }
            return false;

        case value_op::elem_match:
            if (value == nullptr || !value->is_array()) return false;
            for (const auto& element : *value) {
                if (test.sub) {
                    if (element.is_object() && match_document(*test.sub, element)) return true;
                } else {
                    std::vector<const json*> one{&element};
                    bool all = std::all_of(test.nested.begin(), test.nested.end(),
                                           [&](const value_test& n) { return match_field(n, one); });
                    if (all) return true;
                }
            }
            return false;

        case value_op::geo:
            return true;

        case value_op::ne:
        case value_op::nin:
        case value_op::exists:
        case value_op::not_:
        case value_op::unknown:
            break;
    }
    return false;
}

bool any_branch(const value_test& test, const std::vector<const json*>& branches) {
    return std::any_of(branches.begin(), branches.end(),
                       [&](const json* v) { return match_branch(test, v); });
}

bool match_field(const value_test& test, const std::vector<const json*>& branches) {
    switch (test.op) {
        case value_op::ne: {
            value_test eq{value_op::eq, test.operand, nullptr, {}, nullptr};
            return !any_branch(eq, branches);
        }
        case value_op::nin: {
            value_test in{value_op::in, test.operand, nullptr, {}, nullptr};
            return !any_branch(in, branches);
        }
        case value_op::exists: {
            bool present = std::any_of(branches.begin(), branches.end(),
                                       [](const json* v) { return v != nullptr; });
            bool wanted = !(test.operand.is_boolean() ? !test.operand.get<bool>()
                                                      : (test.operand.is_number() && test.operand.get<double>() == 0));
            return present == wanted;
        }
        case value_op::not_:
            return !std::all_of(test.nested.begin(), test.nested.end(),
                                [&](const value_test& n) { return match_field(n, branches); });
        case value_op::unknown:
            return false;
        default:
            return any_branch(test, branches);
    }
}

bool match_document(const selector_node& node, const document& doc) {
    return std::visit([&doc](const auto& n) -> bool {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, constant_node>) {
            return n.value;
        } else if constexpr (std::is_same_v<T, field_node>) {
            auto branches = lookup_values(doc, n.segments);
            for (const auto& test : n.tests) {
                if (!match_field(test, branches)) return false;
            }
            return true;
        } else {
            switch (n.op) {
                case logical_node::kind::and_:
                    for (const auto& child : n.children) {
                        if (!match_document(child, doc)) return false;
                    }
                    return true;
                case logical_node::kind::or_:
                    for (const auto& child : n.children) {
                        if (match_document(child, doc)) return true;
                    }
                    return false;
                case logical_node::kind::nor:
                    for (const auto& child : n.children) {
                        if (match_document(child, doc)) return false;
                    }
                    return true;
            }
            return false;
        }
    }, node.node);
}

// ============================================================================
// Compilation
// ============================================================================

const std::unordered_map<std::string, value_op>& operator_table() {
    static const std::unordered_map<std::string, value_op> table = {
        {"$eq", value_op::eq},
        {"$ne", value_op::ne},
        {"$lt", value_op::lt},
        {"$lte", value_op::lte},
        {"$gt", value_op::gt},
        {"$gte", value_op::gte},
        {"$in", value_op::in},
        {"$nin", value_op::nin},
        {"$all", value_op::all},
        {"$exists", value_op::exists},
        {"$type", value_op::type},
        {"$size", value_op::size},
        {"$mod", value_op::mod},
        {"$regex", value_op::regex},
        {"$elemMatch", value_op::elem_match},
        {"$not", value_op::not_},
    };
    return table;
}

selector_node compile_document(const json& selector, std::vector<geo_clause>* geo);
std::vector<value_test> compile_operators(const std::string& path, const json& ops,
                                          std::vector<geo_clause>* geo);

value_test compile_regex(const json& pattern, const json* options) {
    if (!pattern.is_string()) {
        return failed_test("$regex expects a string pattern");
    }
    auto flags = std::regex::ECMAScript;
    if (options && options->is_string()) {
        for (char c : options->get_ref<const std::string&>()) {
            if (c == 'i') flags |= std::regex::icase;
            else if (c == 'm') flags |= std::regex::multiline;
        }
    }
    try {
        value_test t;
        t.op = value_op::regex;
        t.operand = pattern;
        t.pattern = std::make_shared<const std::regex>(pattern.get<std::string>(), flags);
        return t;
    } catch (const std::regex_error& e) {
        return failed_test("Invalid $regex '" + pattern.get<std::string>() + "': " + e.what());
    }
}

geo::geometry parse_query_geometry(const json& operand, const char* op) {
    if (operand.is_object()) {
        auto it = operand.find("$geometry");
        if (it != operand.end()) return geo::parse_geometry(*it);
        if (operand.contains("type")) return geo::parse_geometry(operand);
    }
    if (operand.is_array() && operand.size() == 2) {
        return geo::parse_geometry(json{{"type", "Point"}, {"coordinates", operand}});
    }
    throw malformed_geometry(std::string(op) + " requires a $geometry: " + operand.dump());
}

std::optional<double> read_max_distance(const json& source) {
    if (!source.is_object()) return std::nullopt;
    auto it = source.find("$maxDistance");
    if (it == source.end()) return std::nullopt;
    if (!it->is_number()) {
        LOG_WARN("selector", "Ignoring non-numeric $maxDistance");
        return std::nullopt;
    }
    return it->get<double>();
}

value_test compile_operator(const std::string& name, const json& operand, const json& siblings) {
    auto it = operator_table().find(name);
    if (it == operator_table().end()) {
        return failed_test("Unknown operator " + name);
    }

    value_test t;
    t.op = it->second;
    t.operand = operand;

    switch (t.op) {
        case value_op::in:
        case value_op::nin:
        case value_op::all:
            if (!operand.is_array()) return failed_test(name + " expects an array");
            break;
        case value_op::type:
            if (!operand.is_string() && !operand.is_number_integer()) {
                return failed_test("$type expects a type name or number");
            }
            break;
        case value_op::size:
            if (!operand.is_number_unsigned() && !(operand.is_number_integer() && operand.get<int64_t>() >= 0)) {
                return failed_test("$size expects a non-negative integer");
            }
            break;
        case value_op::mod:
            if (!operand.is_array() || operand.size() != 2 ||
                !operand[0].is_number() || !operand[1].is_number() || operand[0].get<double>() == 0) {
                return failed_test("$mod expects [divisor, remainder] with a non-zero divisor");
            }
            break;
        case value_op::regex: {
            auto options = siblings.find("$options");
            return compile_regex(operand, options != siblings.end() ? &*options : nullptr);
        }
        case value_op::elem_match:
            if (!operand.is_object()) return failed_test("$elemMatch expects an object");
            if (has_operator_keys(operand) && !operand.contains("$and") &&
                !operand.contains("$or") && !operand.contains("$nor")) {
                t.nested = compile_operators("$elemMatch", operand, nullptr);
            } else {
                t.sub = std::make_shared<const selector_node>(compile_document(operand, nullptr));
            }
            break;
        case value_op::not_:
            if (operand.is_object() && has_operator_keys(operand)) {
                t.nested = compile_operators("$not", operand, nullptr);
            } else {
                return failed_test("$not expects an operator object");
            }
            break;
        default:
            break;
    }
    return t;
}

std::vector<value_test> compile_operators(const std::string& path, const json& ops,
                                          std::vector<geo_clause>* geo) {
    std::vector<value_test> tests;
    for (auto it = ops.begin(); it != ops.end(); ++it) {
        const auto& name = it.key();
        if (name == "$options" || name == "$maxDistance") {
            continue;  // read by $regex / $near
        }
        if (name == "$near" || name == "$nearSphere" || name == "$geoIntersects") {
            bool near = name != "$geoIntersects";
            if (geo == nullptr) {
                tests.push_back(failed_test(name + " is only supported at the top level"));
                continue;
            }
            geo_clause clause;
            clause.op = near ? geo_clause::kind::near : geo_clause::kind::intersects;
            clause.path = path;
            clause.segments = split_path(path);
            clause.geometry = parse_query_geometry(it.value(), name.c_str());
            if (near) {
                clause.max_distance = read_max_distance(it.value());
                if (!clause.max_distance) clause.max_distance = read_max_distance(ops);
            }
            geo->push_back(std::move(clause));

            value_test placeholder;
            placeholder.op = value_op::geo;
            tests.push_back(std::move(placeholder));
            continue;
        }
        if (!is_operator_key(name)) {
            tests.push_back(failed_test("Cannot mix operators and fields under '" + path + "'"));
            continue;
        }
        tests.push_back(compile_operator(name, it.value(), ops));
    }
    return tests;
}

selector_node compile_field(const std::string& path, const json& value, std::vector<geo_clause>* geo) {
    field_node field;
    field.path = path;
    field.segments = split_path(path);
    if (has_operator_keys(value)) {
        field.tests = compile_operators(path, value, geo);
    } else {
        value_test eq;
        eq.op = value_op::eq;
        eq.operand = value;
        field.tests.push_back(std::move(eq));
    }
    return selector_node{std::move(field)};
}

selector_node compile_logical(const std::string& name, const json& value, std::vector<geo_clause>* geo) {
    if (!value.is_array() || value.empty()) {
        LOG_WARN("selector", "%s expects a non-empty array", name.c_str());
        return constant(false);
    }
    logical_node logical;
    if (name == "$and") {
        logical.op = logical_node::kind::and_;
    } else if (name == "$or") {
        logical.op = logical_node::kind::or_;
        geo = nullptr;
    } else {
        logical.op = logical_node::kind::nor;
        geo = nullptr;
    }
    for (const auto& child : value) {
        if (!child.is_object()) {
            LOG_WARN("selector", "%s expects selector objects", name.c_str());
            return constant(false);
        }
        logical.children.push_back(compile_document(child, geo));
    }
    return selector_node{std::move(logical)};
}

selector_node compile_document(const json& selector, std::vector<geo_clause>* geo) {
    logical_node all;
    all.op = logical_node::kind::and_;

    for (auto it = selector.begin(); it != selector.end(); ++it) {
        const auto& key = it.key();
        if (key == "$and" || key == "$or" || key == "$nor") {
            all.children.push_back(compile_logical(key, it.value(), geo));
        } else if (key == "$comment") {
            continue;
        } else if (is_operator_key(key)) {
            LOG_WARN("selector", "Unknown top-level operator %s", key.c_str());
            all.children.push_back(constant(false));
        } else {
            all.children.push_back(compile_field(key, it.value(), geo));
        }
    }

    if (all.children.empty()) return constant(true);
    if (all.children.size() == 1) return std::move(all.children.front());
    return selector_node{std::move(all)};
}

} // namespace

// ============================================================================
// compiled_selector
// ============================================================================

bool compiled_selector::matches(const document& doc) const {
    return match_document(root_, doc);
}

const geo_clause* compiled_selector::near_clause() const {
    for (const auto& clause : geo_) {
        if (clause.op == geo_clause::kind::near) return &clause;
    }
    return nullptr;
}

compiled_selector compile_selector(const json& selector) {
    if (selector.is_null()) {
        return compiled_selector(constant(true), {});
    }
    if (selector.is_string()) {
        return compile_selector(json{{id_field, selector}});
    }
    if (!selector.is_object()) {
        LOG_WARN("selector", "Selector must be an object, got %s", selector.type_name());
        return compiled_selector(constant(false), {});
    }

    std::vector<geo_clause> geo;
    auto root = compile_document(selector, &geo);
    return compiled_selector(std::move(root), std::move(geo));
}

bool matches_selector(const json& selector, const document& doc) {
    return compile_selector(selector).matches(doc);
}

} // namespace localdoc
