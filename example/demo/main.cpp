// main.cpp - Diff and patch walkthrough

#include <editscript/builders.h>
#include <editscript/errors.h>
#include <editscript/patch.h>
#include <editscript/sequence_aligner.h>
#include <editscript/value_diff.h>

#include <iostream>
#include <string>

using namespace editscript;

// ============================================================
// Sample documents
// ============================================================

Value make_user(const std::string& name, std::initializer_list<Value> tags)
{
    return MapBuilder()
        .set("name", name)
        .set("tags", Value::set(tags))
        .finish();
}

Value create_v1()
{
    return MapBuilder()
        .set("title", "Team")
        .set("users", VectorBuilder()
                          .push_back(make_user("Alice", {Value::keyword("admin")}))
                          .push_back(make_user("Bob", {}))
                          .finish())
        .set("revision", 1)
        .finish();
}

Value create_v2()
{
    return MapBuilder()
        .set("title", "Team")
        .set("users", VectorBuilder()
                          .push_back(make_user("Carol", {}))
                          .push_back(make_user("Alice", {Value::keyword("admin"), Value::keyword("dev")}))
                          .push_back(make_user("Bob", {}))
                          .finish())
        .set("revision", 2)
        .set("archived", Value{})
        .finish();
}

// ============================================================
// Demos
// ============================================================

void demo_diff_and_patch()
{
    std::cout << "\n=== diff / patch ===\n";
    auto v1 = create_v1();
    auto v2 = create_v2();

    std::cout << "v1:\n";
    print_value(v1, "", 1);
    std::cout << "v2:\n";
    print_value(v2, "", 1);

    auto script = diff(v1, v2);
    if (!script) {
        std::cout << "identical\n";
        return;
    }

    std::cout << "edits (distance " << script->distance() << "):\n";
    print_edits(*script);

    auto patched = patch(v1, *script);
    std::cout << "patch(v1, diff(v1, v2)) == v2: " << (patched == v2 ? "yes" : "no") << "\n";

    std::cout << "wire shape: " << value_to_string(script->to_value()) << "\n";
}

void demo_alignment()
{
    std::cout << "\n=== sequence alignment ===\n";
    const std::string a = "kitten";
    const std::string b = "sitting";
    std::cout << a << " -> " << b << "\n";
    std::cout << "  raw:       " << trace_to_string(align(a, b)) << "\n";
    std::cout << "  coalesced: " << trace_to_string(edit_trace(a, b)) << "\n";
}

void demo_trace_hook()
{
    std::cout << "\n=== trace hook ===\n";
    DiffOptions options;
    options.trace = [](const DiffTraceEvent& event) {
        std::cout << "  visit " << path_to_string(event.path)
                  << " depth=" << event.depth
                  << (event.a ? "" : " (added)")
                  << (event.b ? "" : " (removed)") << "\n";
    };
    auto a = Value::map({{"x", Value{1}}, {"y", Value::vector({1, 2})}});
    auto b = Value::map({{"y", Value::vector({1, 3})}, {"z", Value{true}}});
    (void)diff(a, b, options);
}

void demo_patch_error()
{
    std::cout << "\n=== patch error ===\n";
    EditScript script;
    script.record_delete(Path{"users", std::size_t{7}});
    try {
        (void)patch(create_v1(), script);
    } catch (const PatchError& e) {
        std::cout << "  " << e.what() << "\n";
    }
}

int main()
{
    demo_diff_and_patch();
    demo_alignment();
    demo_trace_hook();
    demo_patch_error();
    return 0;
}
