// main.cpp
// Diff / Patch Example - comparing, patching and undoing value graphs
//
// Walks through the public surface of deepdiff:
//
// Part 1: deep equality with the different comparison options
// Part 2: computing a change list and replaying it on a copy
// Part 3: undo / redo through tokens and PatchHistory
// Part 4: traversal and cloning of a cyclic graph

#include <deepdiff/clone.h>
#include <deepdiff/diff.h>
#include <deepdiff/equal.h>
#include <deepdiff/patch_history.h>
#include <deepdiff/traverse.h>

#include <iostream>
#include <string>

using namespace deepdiff;

// ============================================================
// Sample Data
// ============================================================

Value create_profile_v1()
{
    return Value::record({
        {"name", "Alice"},
        {"age", 30},
        {"tags", Value::sequence({"admin", "dev"})},
        {"settings", Value::map({{"theme", "dark"}, {"lang", "en"}})},
        {"joined", Value::timestamp_ms(1700000000000)}
    }, "Profile");
}

Value create_profile_v2()
{
    return Value::record({
        {"name", "Alice"},
        {"age", 31},
        {"tags", Value::sequence({"dev", "admin", "ops"})},
        {"settings", Value::map({{"theme", "light"}, {"lang", "en"}})},
        {"joined", Value::timestamp_ms(1700000000000)},
        {"email", "alice@example.com"}
    }, "Profile");
}

// ============================================================
// Part 1: Equality
// ============================================================

void demo_equality()
{
    std::cout << "\n=== Part 1: Equality ===\n";

    auto a = Value::sequence({1, 2, 3});
    auto b = Value::sequence({3, 2, 1});

    CompareOptions lax;
    lax.lax_array_ordering = true;

    CompareOptions loose;
    loose.loose_equality = true;

    std::cout << "[1,2,3] == [3,2,1]          : " << deep_equal(a, b) << "\n";
    std::cout << "[1,2,3] == [3,2,1] (lax)    : " << deep_equal(a, b, lax) << "\n";
    std::cout << "{n:1} == {n:\"1\"} (loose)   : "
              << deep_equal(Value::record({{"n", 1}}), Value::record({{"n", "1"}}), loose) << "\n";
}

// ============================================================
// Part 2: Diff and replay
// ============================================================

void demo_diff()
{
    std::cout << "\n=== Part 2: Diff ===\n";

    auto v1 = create_profile_v1();
    auto v2 = create_profile_v2();

    auto changes = diff(v1, v2);
    Change::print_changes(changes);

    DiffOptions lax;
    lax.lax_array_ordering = true;
    std::cout << "\nWith lax array ordering:\n";
    Change::print_changes(diff(v1, v2, lax));

    auto copy = clone(v1);
    auto tokens = apply_changes(changes, copy);
    std::cout << "\nReplayed " << tokens.size() << " change(s), copy equals v2: " << deep_equal(copy, v2) << "\n";
}

// ============================================================
// Part 3: Undo / redo
// ============================================================

void demo_history()
{
    std::cout << "\n=== Part 3: Undo / Redo ===\n";

    Value doc = create_profile_v1();
    PatchHistory history{doc};

    history.apply({Change::edit({field_segment("name")}, "Alicia")}, "rename");
    history.apply(diff(doc, create_profile_v2()), "sync with v2");

    std::cout << "After 2 steps : " << value_to_string(doc) << "\n";

    while (history.can_undo()) {
        std::cout << "Undo '" << history.undo_description() << "'\n";
        history.undo();
    }
    std::cout << "Fully undone  : " << value_to_string(doc) << "\n";

    history.redo();
    std::cout << "Redo 'rename' : " << value_to_string(doc) << "\n";
}

// ============================================================
// Part 4: Cyclic graphs
// ============================================================

void demo_cycles()
{
    std::cout << "\n=== Part 4: Cyclic Graphs ===\n";

    auto parent = Value::record({{"name", "parent"}});
    auto child = Value::record({{"name", "child"}, {"parent", parent}});
    parent.as_record().set("children", Value::sequence({child}));

    VisitOptions guarded;
    guarded.guard_circular_refs = true;

    traverse(parent, [](const Node& node) {
        std::cout << std::string(node.depth() * 2, ' ') << kind_name(node.kind());
        if (node.key_name()) std::cout << " ." << *node.key_name();
        std::cout << "\n";
        return VisitAction::descend();
    }, guarded);

    CloneOptions clone_options;
    clone_options.guard_circular_refs = true;
    auto copy = clone(parent, clone_options);

    CompareOptions compare_options;
    compare_options.guard_circular_refs = true;
    std::cout << "Clone equals original: " << deep_equal(copy, parent, compare_options) << "\n";
    std::cout << "Clone: " << value_to_string(copy) << "\n";

    // Break the cycles so the graphs can be released
    child.as_record().erase("parent");
    copy.as_record().find("children")->as_sequence()[0].as_record().erase("parent");
}

int main()
{
    std::cout << std::boolalpha;
    std::cout << "deepdiff example\n";

    demo_equality();
    demo_diff();
    demo_history();
    demo_cycles();

    return 0;
}
