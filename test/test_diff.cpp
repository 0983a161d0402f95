// test_diff.cpp - Tests for the structural differ

#include <catch2/catch_all.hpp>
#include <editscript/errors.h>
#include <editscript/value_diff.h>

#include <string>
#include <vector>

using namespace editscript;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value create_state_v1() {
    return Value::map({
        {"name", Value{"Alice"}},
        {"age", Value{30}},
        {"items", Value::vector({1, 2, 3})}
    });
}

Value create_state_v2() {
    return Value::map({
        {"name", Value{"Bob"}},       // Changed
        {"age", Value{30}},            // Same
        {"items", Value::vector({1, 2, 4})},  // Changed
        {"email", Value{"bob@test.com"}}      // Added
    });
}

const Operation* find_op(const std::vector<Operation>& ops, const Path& path) {
    for (const auto& op : ops) {
        if (op.path == path) return &op;
    }
    return nullptr;
}

} // namespace

// ============================================================
// Identity and root handling
// ============================================================

TEST_CASE("diff of identical values is nullopt", "[diff][identity]") {
    auto v = create_state_v1();

    SECTION("same object") {
        REQUIRE_FALSE(diff(v, v).has_value());
    }

    SECTION("shared immer root") {
        Value copy = v;
        REQUIRE_FALSE(diff(v, copy).has_value());
    }

    SECTION("both null") {
        REQUIRE_FALSE(diff(Value{}, Value{}).has_value());
    }

    SECTION("equal scalars") {
        REQUIRE_FALSE(diff(Value{"x"}, Value{"x"}).has_value());
    }
}

TEST_CASE("diff of equal but unshared values is an empty script", "[diff][identity]") {
    auto script = diff(create_state_v1(), create_state_v1());
    REQUIRE(script.has_value());
    REQUIRE(script->empty());
    REQUIRE(script->distance() == 0);
}

TEST_CASE("diff at the root", "[diff][root]") {
    SECTION("scalar change is a root replace") {
        auto script = diff(Value{1}, Value{2});
        REQUIRE(script.has_value());
        const auto ops = script->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Replace);
        REQUIRE(ops[0].path.empty());
        REQUIRE(ops[0].get() == Value{2});
    }

    SECTION("null root is absent: add") {
        auto script = diff(Value{}, Value{5});
        const auto ops = script->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Add);
        REQUIRE(ops[0].path.empty());
        REQUIRE(ops[0].get() == Value{5});
    }

    SECTION("null root is absent: delete") {
        auto script = diff(Value::vector({1}), Value{});
        const auto ops = script->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Delete);
        REQUIRE(ops[0].path.empty());
    }

    SECTION("the script keeps the original") {
        auto script = diff(Value{1}, Value{2});
        REQUIRE(script->original() == Value{1});
    }
}

TEST_CASE("diff across categories replaces wholesale", "[diff][category]") {
    SECTION("number types never match") {
        auto script = diff(Value{1}, Value{1.0});
        REQUIRE(script->replaces_num() == 1);
    }

    SECTION("vector against list") {
        auto script = diff(Value::vector({1, 2}), Value::list({1, 2}));
        const auto ops = script->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Replace);
        REQUIRE(ops[0].get() == Value::list({1, 2}));
    }

    SECTION("map against scalar") {
        auto script = diff(Value::map({{"a", Value{1}}}), Value{"a"});
        REQUIRE(script->edits().size() == 1);
        REQUIRE(script->edits()[0].type == OpType::Replace);
    }
}

// ============================================================
// Maps
// ============================================================

TEST_CASE("diff of maps", "[diff][map]") {
    auto script = diff(create_state_v1(), create_state_v2());
    REQUIRE(script.has_value());
    const auto ops = script->edits();

    REQUIRE(ops.size() == 3);
    REQUIRE(script->counts() == EditCounts{1, 0, 2});

    auto* name = find_op(ops, Path{"name"});
    REQUIRE(name != nullptr);
    REQUIRE(name->type == OpType::Replace);
    REQUIRE(name->get() == Value{"Bob"});

    auto* item = find_op(ops, Path{"items", std::size_t{2}});
    REQUIRE(item != nullptr);
    REQUIRE(item->type == OpType::Replace);
    REQUIRE(item->get() == Value{4});

    auto* email = find_op(ops, Path{"email"});
    REQUIRE(email != nullptr);
    REQUIRE(email->type == OpType::Add);

    REQUIRE(find_op(ops, Path{"age"}) == nullptr);
}

TEST_CASE("diff of maps with an added key", "[diff][map]") {
    auto script = diff(Value::map({{"a", Value{1}}}), Value::map({{"a", Value{1}}, {"b", Value{2}}}));
    const auto ops = script->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].type == OpType::Add);
    REQUIRE(ops[0].path == Path{"b"});
    REQUIRE(ops[0].get() == Value{2});
    REQUIRE(script->distance() == 1);
}

TEST_CASE("diff of maps with removed keys", "[diff][map]") {
    auto a = Value::map({{"keep", Value{1}}, {"drop", Value::vector({1})}});
    auto b = Value::map({{"keep", Value{1}}});
    const auto ops = diff(a, b)->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].type == OpType::Delete);
    REQUIRE(ops[0].path == Path{"drop"});
}

TEST_CASE("diff of maps treats a null entry as present", "[diff][map][null]") {
    SECTION("value set to null is a replace") {
        const auto ops = diff(Value::map({{"a", Value{1}}}), Value::map({{"a", Value{}}}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Replace);
        REQUIRE(ops[0].path == Path{"a"});
        REQUIRE(ops[0].get().is_null());
    }

    SECTION("new key holding null is an add") {
        const auto ops = diff(Value::map({}), Value::map({{"a", Value{}}}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Add);
        REQUIRE(ops[0].get().is_null());
    }

    SECTION("null value replaced by a value") {
        const auto ops = diff(Value::map({{"a", Value{}}}), Value::map({{"a", Value{2}}}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Replace);
        REQUIRE(ops[0].get() == Value{2});
    }

    SECTION("key holding null removed is a delete") {
        const auto ops = diff(Value::map({{"a", Value{}}}), Value::map({}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Delete);
    }
}

TEST_CASE("diff skips shared subtrees", "[diff][identity]") {
    auto big = Value::vector({1, 2, 3, 4, 5});
    auto a = Value::map({{"big", big}, {"n", Value{1}}});
    auto b = Value::map({{"big", big}, {"n", Value{2}}});

    std::size_t visits = 0;
    DiffOptions options;
    options.trace = [&visits](const DiffTraceEvent&) { ++visits; };

    const auto ops = diff(a, b, options)->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].path == Path{"n"});
    // root, .big and .n: the vector itself is never entered
    REQUIRE(visits == 3);
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("diff of vectors", "[diff][sequence]") {
    SECTION("substitution is diffed in place") {
        const auto ops = diff(Value::vector({1, 2, 3}), Value::vector({1, 9, 3}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Replace);
        REQUIRE(ops[0].path == Path{std::size_t{1}});
        REQUIRE(ops[0].get() == Value{9});
    }

    SECTION("prepend is a single add") {
        const auto ops = diff(Value::vector({1, 2, 3}), Value::vector({0, 1, 2, 3}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Add);
        REQUIRE(ops[0].path == Path{std::size_t{0}});
        REQUIRE(ops[0].get() == Value{0});
    }

    SECTION("append") {
        const auto ops = diff(Value::vector({1}), Value::vector({1, 2}))->edits();
        REQUIRE(ops.size() == 1);
        REQUIRE(ops[0].type == OpType::Add);
        REQUIRE(ops[0].path == Path{std::size_t{1}});
    }

    SECTION("deletion indices follow the evolving result") {
        auto a = Value::vector({"a", "b", "c", "d", "e"});
        auto b = Value::vector({"b", "d"});
        const auto ops = diff(a, b)->edits();
        REQUIRE(ops.size() == 3);
        for (const auto& op : ops) REQUIRE(op.type == OpType::Delete);
        REQUIRE(ops[0].path == Path{std::size_t{0}});
        REQUIRE(ops[1].path == Path{std::size_t{1}});
        REQUIRE(ops[2].path == Path{std::size_t{2}});
    }

    SECTION("a run of deletes followed by an insert is not coalesced") {
        const auto ops = diff(Value::vector({1, 2, 3}), Value::vector({1, 9}))->edits();
        REQUIRE(ops.size() == 3);
        REQUIRE(ops[0].type == OpType::Delete);
        REQUIRE(ops[0].path == Path{std::size_t{1}});
        REQUIRE(ops[1].type == OpType::Delete);
        REQUIRE(ops[1].path == Path{std::size_t{1}});
        REQUIRE(ops[2].type == OpType::Add);
        REQUIRE(ops[2].path == Path{std::size_t{1}});
        REQUIRE(ops[2].get() == Value{9});
    }
}

TEST_CASE("diff recurses into replaced sequence elements", "[diff][sequence]") {
    auto a = Value::vector({
        Value::map({{"id", Value{1}}, {"name", Value{"a"}}}),
        Value::map({{"id", Value{2}}, {"name", Value{"b"}}})
    });
    auto b = Value::vector({
        Value::map({{"id", Value{1}}, {"name", Value{"a"}}}),
        Value::map({{"id", Value{2}}, {"name", Value{"B"}}})
    });
    const auto ops = diff(a, b)->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].type == OpType::Replace);
    REQUIRE(ops[0].path == Path{std::size_t{1}, "name"});
    REQUIRE(ops[0].get() == Value{"B"});
}

TEST_CASE("diff of lists", "[diff][list]") {
    const auto ops = diff(Value::list({1, 2, 3}), Value::list({1, 9, 3}))->edits();
    REQUIRE(ops.size() == 1);
    REQUIRE(ops[0].type == OpType::Replace);
    REQUIRE(ops[0].path == Path{std::size_t{1}});
}

// ============================================================
// Sets
// ============================================================

TEST_CASE("diff of sets", "[diff][set]") {
    auto a = Value::set({1, 2, 3});
    auto b = Value::set({2, 3, 4});
    const auto ops = diff(a, b)->edits();

    REQUIRE(ops.size() == 2);
    // deletions come before additions
    REQUIRE(ops[0].type == OpType::Delete);
    Path removed;
    removed.push_back(path_element(Value{1}));
    REQUIRE(ops[0].path == removed);

    REQUIRE(ops[1].type == OpType::Add);
    Path added;
    added.push_back(path_element(Value{4}));
    REQUIRE(ops[1].path == added);
    REQUIRE(ops[1].get() == Value{4});
}

TEST_CASE("diff of sets never replaces", "[diff][set]") {
    auto a = Value::set({Value::map({{"id", Value{1}}})});
    auto b = Value::set({Value::map({{"id", Value{2}}})});
    auto script = diff(a, b);
    REQUIRE(script->counts() == EditCounts{1, 1, 0});
}

// ============================================================
// Options
// ============================================================

TEST_CASE("diff depth limit", "[diff][options]") {
    auto a = Value::map({{"a", Value::map({{"b", Value{1}}})}});
    auto b = Value::map({{"a", Value::map({{"b", Value{2}}})}});

    SECTION("too deep") {
        DiffOptions options;
        options.max_depth = 1;
        REQUIRE_THROWS_AS(diff(a, b, options), DepthLimitError);
    }

    SECTION("deep enough") {
        DiffOptions options;
        options.max_depth = 2;
        REQUIRE(diff(a, b, options)->size() == 1);
    }

    SECTION("error carries the path") {
        DiffOptions options;
        options.max_depth = 1;
        try {
            (void)diff(a, b, options);
            FAIL("expected DepthLimitError");
        } catch (const DepthLimitError& e) {
            REQUIRE(e.path() == Path{"a", "b"});
            REQUIRE(e.max_depth() == 1);
        }
    }
}

TEST_CASE("diff trace hook", "[diff][options]") {
    std::vector<std::string> visited;
    std::vector<std::size_t> depths;
    DiffOptions options;
    options.trace = [&](const DiffTraceEvent& event) {
        visited.push_back(path_to_string(event.path));
        depths.push_back(event.depth);
    };

    auto script = diff(Value::map({{"a", Value{1}}}), Value::map({{"b", Value{2}}}), options);
    REQUIRE(script->size() == 2);
    REQUIRE(visited == std::vector<std::string>{"/", ".a", ".b"});
    REQUIRE(depths == std::vector<std::size_t>{0, 1, 1});
}
