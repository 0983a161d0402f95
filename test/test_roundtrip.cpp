// test_roundtrip.cpp - patch(a, diff(a, b)) == b over mixed documents

#include <catch2/catch_all.hpp>
#include <editscript/patch.h>
#include <editscript/value_diff.h>

#include <utility>
#include <vector>

using namespace editscript;

namespace {

std::vector<std::pair<Value, Value>> sample_pairs() {
    return {
        {Value{1}, Value{2}},
        {Value{}, Value::map({{"a", Value{1}}})},
        {Value::vector({1, 2}), Value{}},
        {Value{"x"}, Value::set({1})},
        {Value::vector({1, 2, 3}), Value::vector({3, 2, 1})},
        {Value::vector({}), Value::vector({1, 2, 3})},
        {Value::vector({"a", "b", "c", "a", "b", "b", "a"}),
         Value::vector({"c", "b", "a", "b", "a", "c"})},
        {Value::list({1, 2, 3, 4}), Value::list({2, 4, 5})},
        {Value::set({1, 2, 3}), Value::set({3, 4})},
        {Value::map({{"a", Value{1}}, {"b", Value{2}}}), Value::map({{"b", Value{3}}, {"c", Value{}}})},
        {Value::map({{"k", Value{}}}), Value::map({})},
        {Value::vector({Value::vector({1, 2}), Value::vector({3})}),
         Value::vector({Value::vector({1}), Value::vector({3, 4}), Value::vector({})})},
        {Value::map({
             {"users", Value::vector({
                 Value::map({{"name", Value{"Alice"}}, {"tags", Value::set({Value::keyword("admin")})}}),
                 Value::map({{"name", Value{"Bob"}}, {"tags", Value::set({})}})
             })},
             {"version", Value{1}}
         }),
         Value::map({
             {"users", Value::vector({
                 Value::map({{"name", Value{"Bob"}}, {"tags", Value::set({Value::keyword("dev")})}}),
                 Value::map({{"name", Value{"Carol"}}, {"tags", Value::list({1})}})
             })},
             {"version", Value{2.0}}
         })},
        {Value::vector({Value::map({{"x", Value{1}}}), Value{2}, Value{3}}),
         Value::vector({Value{2}, Value::map({{"x", Value{2}}}), Value{3}})},
    };
}

} // namespace

TEST_CASE("patch(a, diff(a, b)) reproduces b", "[roundtrip]") {
    const auto pairs = sample_pairs();
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        const auto& [a, b] = pairs[i];
        INFO("pair " << i << ": " << value_to_string(a) << " -> " << value_to_string(b));
        auto script = diff(a, b);
        REQUIRE(patch(a, script) == b);
    }
}

TEST_CASE("diff(a, a) is nullopt", "[roundtrip]") {
    for (const auto& [a, b] : sample_pairs()) {
        (void)b;
        auto same = diff(a, a);
        REQUIRE_FALSE(same.has_value());
    }
}

TEST_CASE("distance matches the log", "[roundtrip]") {
    for (const auto& [a, b] : sample_pairs()) {
        auto script = diff(a, b);
        REQUIRE(script.has_value());
        const auto counts = script->counts();
        REQUIRE(script->distance() == script->edits().size());
        REQUIRE(counts.adds + counts.deletes + counts.replaces == script->size());
    }
}

TEST_CASE("diff between successive versions of a document", "[roundtrip]") {
    auto v1 = Value::map({{"items", Value::vector({1, 2, 3})}, {"meta", Value::map({{"rev", Value{1}}})}});

    // Derive v2 from v1 so the two share structure
    auto items = *v1.at("items").get_if<ValueVector>();
    auto v2_map = *v1.get_if<ValueMap>();
    v2_map = v2_map.set("items", ValueBox{Value{items.push_back(ValueBox{Value{4}})}});
    Value v2{v2_map};

    auto script = diff(v1, v2);
    REQUIRE(script.has_value());
    const auto ops = script->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].path == Path{"items", std::size_t{3}});
    REQUIRE(patch(v1, script) == v2);
}
