#pragma once

#include <localdoc/selector.hpp>
#include <localdoc/sort.hpp>
#include <localdoc/errors.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>
#include <limits>
#include <random>

namespace selector_tests {

using localdoc::json;
using localdoc::document;

// ============================================================================
// Reference evaluator for a flat subset of the selector language
// ============================================================================

// Top-level fields holding scalars; operators $eq $ne $gt $gte $lt $lte $in,
// and the $and / $or / $nor combinators.
bool reference_matches(const json& selector, const document& doc);

bool reference_op(const std::string& op, const json& operand, const json* value) {
    if (op == "$eq") return value ? *value == operand : operand.is_null();
    if (op == "$ne") return !reference_op("$eq", operand, value);
    if (op == "$in") {
        for (const auto& e : operand) {
            if (reference_op("$eq", e, value)) return true;
        }
        return false;
    }
    // Comparisons only hold between values of the same kind
    auto kind = [](const json* v) { return !v || v->is_null() ? 0 : v->is_number() ? 1 : 2; };
    if (kind(value) != kind(&operand)) return false;
    int c = 0;
    if (kind(value) == 1) {
        double a = value->get<double>();
        double b = operand.get<double>();
        c = a < b ? -1 : (a > b ? 1 : 0);
    } else if (kind(value) == 2) {
        c = value->get<std::string>().compare(operand.get<std::string>());
    }
    if (op == "$gt") return c > 0;
    if (op == "$gte") return c >= 0;
    if (op == "$lt") return c < 0;
    if (op == "$lte") return c <= 0;
    return false;
}

bool reference_matches(const json& selector, const document& doc) {
    for (auto it = selector.begin(); it != selector.end(); ++it) {
        const auto& key = it.key();
        if (key == "$and" || key == "$or" || key == "$nor") {
            size_t hits = 0;
            for (const auto& child : it.value()) {
                if (reference_matches(child, doc)) ++hits;
            }
            bool ok = key == "$and" ? hits == it.value().size()
                    : key == "$or"  ? hits > 0
                                    : hits == 0;
            if (!ok) return false;
            continue;
        }
        auto found = doc.find(key);
        const json* value = found == doc.end() ? nullptr : &*found;
        if (it.value().is_object()) {
            for (auto op = it.value().begin(); op != it.value().end(); ++op) {
                if (!reference_op(op.key(), op.value(), value)) return false;
            }
        } else if (!reference_op("$eq", it.value(), value)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// test_compiled_matches_reference - random selectors over random documents
// ============================================================================

void test_compiled_matches_reference() {
    std::cout << "  test_compiled_matches_reference..." << std::flush;

    std::mt19937 gen(42);
    auto pick = [&gen](int n) { return std::uniform_int_distribution<int>(0, n - 1)(gen); };
    const std::vector<std::string> fields = {"a", "b", "c"};
    const std::vector<std::string> ops = {"$eq", "$ne", "$gt", "$gte", "$lt", "$lte", "$in"};

    auto random_value = [&]() -> json {
        switch (pick(4)) {
            case 0: return pick(5);
            case 1: return std::string(1, static_cast<char>('x' + pick(3)));
            case 2: return nullptr;
            default: return pick(5) + 0.5;
        }
    };

    auto random_clause = [&]() -> json {
        const auto& field = fields[pick(3)];
        if (pick(3) == 0) return json{{field, random_value()}};
        const auto& op = ops[pick(static_cast<int>(ops.size()))];
        json operand = op == "$in" ? json::array({random_value(), random_value()}) : random_value();
        return json{{field, {{op, operand}}}};
    };

    std::vector<document> docs;
    for (int i = 0; i < 40; ++i) {
        document doc = {{"_id", std::to_string(i)}};
        for (const auto& f : fields) {
            if (pick(4) != 0) doc[f] = random_value();
        }
        docs.push_back(doc);
    }

    for (int i = 0; i < 200; ++i) {
        json selector;
        switch (pick(4)) {
            case 0: selector = random_clause(); break;
            case 1: selector = {{"$and", {random_clause(), random_clause()}}}; break;
            case 2: selector = {{"$or", {random_clause(), random_clause()}}}; break;
            default: selector = {{"$nor", {random_clause(), random_clause()}}}; break;
        }
        auto compiled = localdoc::compile_selector(selector);
        for (const auto& doc : docs) {
            assert(compiled.matches(doc) == reference_matches(selector, doc));
        }
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_equality_semantics
// ============================================================================

void test_equality_semantics() {
    std::cout << "  test_equality_semantics..." << std::flush;

    document doc = {
        {"_id", "1"},
        {"name", "Ann"},
        {"tags", {"red", "blue"}},
        {"address", {{"city", "Lima"}, {"zip", 15000}}},
        {"visits", {{{"place", "park"}, {"count", 2}}, {{"place", "zoo"}, {"count", 7}}}},
        {"empty", nullptr}
    };

    assert(localdoc::matches_selector({{"name", "Ann"}}, doc));
    assert(!localdoc::matches_selector({{"name", "Bob"}}, doc));

    // Array fields match the whole array or any element
    assert(localdoc::matches_selector({{"tags", "blue"}}, doc));
    assert(localdoc::matches_selector({{"tags", {"red", "blue"}}}, doc));
    assert(!localdoc::matches_selector({{"tags", {"blue", "red"}}}, doc));

    // Dotted paths, branching through arrays of objects
    assert(localdoc::matches_selector({{"address.city", "Lima"}}, doc));
    assert(localdoc::matches_selector({{"visits.place", "zoo"}}, doc));
    assert(localdoc::matches_selector({{"visits.count", {{"$gt", 5}}}}, doc));
    assert(!localdoc::matches_selector({{"visits.count", {{"$gt", 9}}}}, doc));

    // null matches missing or null
    assert(localdoc::matches_selector({{"empty", nullptr}}, doc));
    assert(localdoc::matches_selector({{"nothing", nullptr}}, doc));
    assert(!localdoc::matches_selector({{"name", nullptr}}, doc));

    // String selector is shorthand for _id
    assert(localdoc::matches_selector("1", doc));
    assert(!localdoc::matches_selector("2", doc));

    // Null and empty selectors match everything
    assert(localdoc::matches_selector(json(), doc));
    assert(localdoc::matches_selector(json::object(), doc));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_operators
// ============================================================================

void test_operators() {
    std::cout << "  test_operators..." << std::flush;

    document doc = {
        {"_id", "1"},
        {"n", 7},
        {"s", "Hello World"},
        {"arr", {1, 2, 3}},
        {"items", {{{"k", "a"}, {"v", 1}}, {{"k", "b"}, {"v", 5}}}}
    };

    assert(localdoc::matches_selector({{"n", {{"$gte", 7}, {"$lt", 8}}}}, doc));
    assert(!localdoc::matches_selector({{"n", {{"$gt", "5"}}}}, doc));   // different ranks never compare
    assert(localdoc::matches_selector({{"n", {{"$in", {1, 7}}}}}, doc));
    assert(localdoc::matches_selector({{"n", {{"$nin", {1, 2}}}}}, doc));
    assert(localdoc::matches_selector({{"arr", {{"$all", {3, 1}}}}}, doc));
    assert(!localdoc::matches_selector({{"arr", {{"$all", {3, 4}}}}}, doc));
    assert(localdoc::matches_selector({{"arr", {{"$size", 3}}}}, doc));
    assert(localdoc::matches_selector({{"n", {{"$mod", {4, 3}}}}}, doc));
    assert(localdoc::matches_selector({{"n", {{"$mod", {-1, 0}}}}}, doc));
    document smallest = {{"_id", "min"}, {"n", std::numeric_limits<int64_t>::min()}};
    assert(localdoc::matches_selector({{"n", {{"$mod", {-1, 0}}}}}, smallest));
    assert(!localdoc::matches_selector({{"n", {{"$mod", {-1, 1}}}}}, smallest));
    assert(localdoc::matches_selector({{"n", {{"$exists", true}}}}, doc));
    assert(localdoc::matches_selector({{"zz", {{"$exists", false}}}}, doc));
    assert(localdoc::matches_selector({{"s", {{"$type", "string"}}}}, doc));
    assert(localdoc::matches_selector({{"n", {{"$type", 1}}}}, doc));
    assert(localdoc::matches_selector({{"n", {{"$not", {{"$gt", 10}}}}}}, doc));
    assert(!localdoc::matches_selector({{"n", {{"$not", {{"$gt", 5}}}}}}, doc));
    assert(localdoc::matches_selector({{"arr", {{"$elemMatch", {{"$gt", 2}}}}}}, doc));
    assert(localdoc::matches_selector({{"items", {{"$elemMatch", {{"k", "b"}, {"v", {{"$gt", 4}}}}}}}}, doc));
    assert(!localdoc::matches_selector({{"items", {{"$elemMatch", {{"k", "a"}, {"v", {{"$gt", 4}}}}}}}}, doc));

    // Regex with options
    assert(localdoc::matches_selector({{"s", {{"$regex", "^hello"}, {"$options", "i"}}}}, doc));
    assert(!localdoc::matches_selector({{"s", {{"$regex", "^hello"}}}}, doc));
    assert(localdoc::matches_selector({{"s", {{"$regex", "World$"}}}}, doc));

    // $comment is ignored
    assert(localdoc::matches_selector({{"$comment", "note"}, {"n", 7}}, doc));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_fail_closed - unknown or malformed operators never match, never throw
// ============================================================================

void test_fail_closed() {
    std::cout << "  test_fail_closed..." << std::flush;

    document doc = {{"_id", "1"}, {"n", 7}, {"s", "abc"}};

    assert(!localdoc::matches_selector({{"n", {{"$bogus", 1}}}}, doc));
    assert(!localdoc::matches_selector({{"$where", "true"}}, doc));
    assert(!localdoc::matches_selector({{"n", {{"$in", 7}}}}, doc));
    assert(!localdoc::matches_selector({{"s", {{"$regex", "([unclosed"}}}}, doc));
    assert(!localdoc::matches_selector({{"n", {{"$mod", {0, 1}}}}}, doc));
    assert(!localdoc::matches_selector({{"$or", "nope"}}, doc));
    assert(!localdoc::matches_selector(json(42), doc));

    // Array positions beyond size_t name no element
    document listed = {{"_id", "2"}, {"a", {1, 2, 3}}};
    assert(!localdoc::matches_selector({{"a.99999999999999999999", 1}}, listed));
    assert(localdoc::matches_selector({{"a.99999999999999999999", nullptr}}, listed));
    assert(localdoc::matches_selector({{"a.2", 3}}, listed));

    // The unknown operator fails only its own clause inside $or
    assert(localdoc::matches_selector({{"$or", {{{"n", {{"$bogus", 1}}}}, {{"n", 7}}}}}, doc));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_geo_extraction
// ============================================================================

void test_geo_extraction() {
    std::cout << "  test_geo_extraction..." << std::flush;

    json point = {{"type", "Point"}, {"coordinates", {10.0, 20.0}}};

    auto near = localdoc::compile_selector(
        {{"loc", {{"$near", {{"$geometry", point}, {"$maxDistance", 500}}}}}});
    assert(near.has_near());
    assert(near.near_clause()->path == "loc");
    assert(*near.near_clause()->max_distance == 500);

    // Sibling $maxDistance and legacy coordinate pairs
    auto sibling = localdoc::compile_selector(
        {{"loc", {{"$near", {10.0, 20.0}}, {"$maxDistance", 50}}}});
    assert(*sibling.near_clause()->max_distance == 50);
    assert(sibling.near_clause()->geometry.type == localdoc::geo::geometry_type::point);

    // Geo clauses do not filter in the boolean predicate
    assert(near.matches({{"_id", "x"}}));

    // Inside $and they are still extracted
    json square = {
        {"type", "Polygon"},
        {"coordinates", json::array({json::array({
            json::array({0, 0}), json::array({1, 0}), json::array({1, 1}), json::array({0, 0})})})}
    };
    json clause = {{"loc", {{"$geoIntersects", {{"$geometry", square}}}}}};
    auto anded = localdoc::compile_selector({{"$and", json::array({clause})}});
    assert(anded.geo_clauses().size() == 1);
    assert(anded.geo_clauses()[0].op == localdoc::geo_clause::kind::intersects);

    // Malformed geometry throws at compile time
    bool threw = false;
    try {
        localdoc::compile_selector({{"loc", {{"$near", {{"$geometry", {{"type", "Blob"}}}}}}}});
    } catch (const localdoc::malformed_geometry&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Sort
// ============================================================================

void test_parse_sort() {
    std::cout << "  test_parse_sort..." << std::flush;

    auto spec = localdoc::parse_sort(json::array({"a", json::array({"b", "desc"}), json::array({"c", -1})}));
    assert(spec.size() == 3);
    assert(spec[0] == (localdoc::sort_key{"a", false}));
    assert(spec[1] == (localdoc::sort_key{"b", true}));
    assert(spec[2] == (localdoc::sort_key{"c", true}));

    auto from_object = localdoc::parse_sort({{"a", 1}, {"b", "descending"}});
    assert(from_object.size() == 2);
    assert(from_object[1].descending);

    assert(localdoc::parse_sort("name").front().field == "name");
    assert(localdoc::to_json(spec) == json::array({"a", json::array({"b", "desc"}), json::array({"c", "desc"})}));

    bool threw = false;
    try {
        localdoc::parse_sort({{"a", 2}});
    } catch (const localdoc::validation_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_sort_type_order() {
    std::cout << "  test_sort_type_order..." << std::flush;

    std::vector<document> docs = {
        {{"_id", "bool"}, {"v", true}},
        {{"_id", "arr"}, {"v", json::array({1})}},
        {{"_id", "obj"}, {"v", {{"k", 1}}}},
        {{"_id", "str"}, {"v", "abc"}},
        {{"_id", "num"}, {"v", 3}},
        {{"_id", "null"}, {"v", nullptr}},
        {{"_id", "missing"}},
    };
    localdoc::sort_documents(docs, {{"v", false}});

    std::vector<std::string> order;
    for (const auto& d : docs) order.push_back(d["_id"]);
    // missing and null tie, so they keep input order
    assert((order == std::vector<std::string>{"null", "missing", "num", "str", "obj", "arr", "bool"}));

    localdoc::sort_documents(docs, {{"v", true}});
    assert(docs.front()["_id"] == "bool");

    // An out-of-range position reads as missing, so every key ties
    std::vector<document> lists = {{{"_id", "p"}, {"v", {3, 1}}}, {{"_id", "q"}, {"v", {2}}}};
    localdoc::sort_documents(lists, {{"v.18446744073709551616", false}});
    assert(lists[0]["_id"] == "p" && lists[1]["_id"] == "q");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sort_stable_under_permutation
// ============================================================================

void test_sort_stable_under_permutation() {
    std::cout << "  test_sort_stable_under_permutation..." << std::flush;

    // Total order on (a asc, b desc, _id asc) so every permutation agrees
    std::vector<document> docs;
    for (int i = 0; i < 12; ++i) {
        docs.push_back({{"_id", "d" + std::to_string(i)}, {"a", i % 3}, {"b", i % 4}});
    }
    localdoc::sort_spec spec = {{"a", false}, {"b", true}, {"_id", false}};

    auto expected = docs;
    std::sort(expected.begin(), expected.end(), [](const document& x, const document& y) {
        if (x["a"] != y["a"]) return x["a"].get<int>() < y["a"].get<int>();
        if (x["b"] != y["b"]) return x["b"].get<int>() > y["b"].get<int>();
        return x["_id"].get<std::string>() < y["_id"].get<std::string>();
    });

    std::mt19937 gen(7);
    for (int round = 0; round < 20; ++round) {
        auto shuffled = docs;
        std::shuffle(shuffled.begin(), shuffled.end(), gen);
        localdoc::sort_documents(shuffled, spec);
        assert(shuffled == expected);
    }

    // Ties keep input order
    std::vector<document> ties = {{{"_id", "x"}, {"k", 1}}, {{"_id", "y"}, {"k", 1}}, {{"_id", "z"}, {"k", 0}}};
    localdoc::sort_documents(ties, {{"k", false}});
    assert(ties[0]["_id"] == "z" && ties[1]["_id"] == "x" && ties[2]["_id"] == "y");

    auto cmp = localdoc::compile_sort(spec);
    assert(cmp(expected[0], expected[1]) < 0);
    assert(cmp(expected[1], expected[0]) > 0);
    assert(cmp(expected[0], expected[0]) == 0);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Selector & sort tests" << std::endl;
    test_compiled_matches_reference();
    test_equality_semantics();
    test_operators();
    test_fail_closed();
    test_geo_extraction();
    test_parse_sort();
    test_sort_type_order();
    test_sort_stable_under_permutation();
}

} // namespace selector_tests
