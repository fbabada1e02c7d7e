// test_diff.cpp - Tests for the structural diff
// Change lists, paths, ordering modes and replay against the lhs

#include <catch2/catch_all.hpp>
#include <deepdiff/clone.h>
#include <deepdiff/diff.h>
#include <deepdiff/equal.h>

#include <limits>
#include <string>
#include <vector>

using namespace deepdiff;

// ============================================================
// Helper Functions
// ============================================================

namespace {

std::vector<std::string> paths_of(const std::vector<Change>& changes) {
    std::vector<std::string> paths;
    for (const auto& change : changes) {
        paths.push_back(path_to_string(change.path()));
    }
    return paths;
}

/// Apply diff(lhs, rhs) to a copy of lhs and check it became rhs
bool replays(const Value& lhs, const Value& rhs, const DiffOptions& options = {}) {
    Value target = clone(lhs);
    auto changes = diff(lhs, rhs, options);
    auto tokens = apply_changes(changes, target);
    return deep_equal(target, rhs, options);
}

Value release_plan(bool swapped) {
    auto phase1 = Value::record({
        {"id", "Phase1"},
        {"tasks", Value::sequence({Value::record({{"id", "Task1"}}), Value::record({{"id", "Task2"}})})}
    });
    auto phase2 = Value::record({
        {"id", "Phase2"},
        {"tasks", Value::sequence({Value::record({{"id", "Task3"}})})}
    });
    return Value::record({
        {"id", "Release"},
        {"phases", swapped ? Value::sequence({phase2, phase1}) : Value::sequence({phase1, phase2})}
    });
}

} // namespace

// ============================================================
// Basic scenarios
// ============================================================

TEST_CASE("diff of equal graphs is empty", "[diff][basic]") {
    REQUIRE(diff(Value::record(), Value::record()).empty());
    REQUIRE(diff(Value::record({{"date", Value::null()}}), Value::record({{"date", Value::null()}})).empty());
    REQUIRE(diff(Value::record({{"foo", Value{}}}), Value::record({{"foo", Value{}}})).empty());

    auto doc = release_plan(false);
    REQUIRE(diff(doc, doc).empty());
    REQUIRE(diff(doc, release_plan(false)).empty());
}

TEST_CASE("diff reports added, removed and edited fields", "[diff][record]") {
    SECTION("added property") {
        auto changes = diff(Value::record(), Value::record({{"other", "x"}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Add);
        REQUIRE(path_to_string(changes[0].path()) == ".other");
        REQUIRE(changes[0].value().as<std::string>() == "x");
    }

    SECTION("removed property") {
        auto changes = diff(Value::record({{"one", "x"}}), Value::record());
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Remove);
        REQUIRE(path_to_string(changes[0].path()) == ".one");
    }

    SECTION("null replaced by a value") {
        auto changes = diff(Value::record({{"key", Value::null()}}), Value::record({{"key", "value"}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Edit);
        REQUIRE(changes[0].to_string() == R"(edit .key = "value")");
    }

    SECTION("value replaced by an array") {
        auto changes = diff(Value::record({{"one", "x"}}), Value::record({{"one", Value::sequence({"x"})}}));
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Edit);
        REQUIRE(changes[0].value().kind() == Kind::Sequence);
    }

    SECTION("undefined properties still count") {
        auto removed = diff(Value::record({{"foo", Value{}}}), Value::record());
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0].type() == Change::Type::Remove);

        auto added = diff(Value::record(), Value::record({{"foo", Value{}}}));
        REQUIRE(added.size() == 1);
        REQUIRE(added[0].type() == Change::Type::Add);
        REQUIRE(added[0].value().is_undefined());
        REQUIRE(paths_of(added) == std::vector<std::string>{".foo"});
    }

    SECTION("root of a different kind") {
        auto changes = diff(Value::record(), Value::sequence());
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Edit);
        REQUIRE(changes[0].path().empty());
    }

    SECTION("null against undefined") {
        auto changes = diff(Value::null(), Value{});
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].type() == Change::Type::Remove);
    }
}

TEST_CASE("diff of leaves", "[diff][leaf]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE(diff(Value::record({{"x", nan}}), Value::record({{"x", nan}})).empty());
    REQUIRE(diff(Value::record({{"x", nan}}), Value::record({{"x", 0}})).size() == 1);

    SECTION("timestamps") {
        auto changes = diff(Value::record({{"d", Value::timestamp_ms(1000)}}),
                            Value::record({{"d", Value::timestamp_ms(2000)}}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{".d"});
        REQUIRE(changes[0].type() == Change::Type::Edit);
    }

    SECTION("patterns") {
        auto lhs = Value::pattern("a+");
        auto rhs = Value::pattern("b+", "i");
        auto changes = diff(lhs, rhs);
        REQUIRE(changes.size() == 1);

        Value target = lhs;
        auto token = changes[0].apply(target);
        REQUIRE(target.as_pattern().to_string() == "/b+/i");
        auto redo = token.undo();
        REQUIRE(target.as_pattern().to_string() == "/a+/");
        (void)redo.redo();
        REQUIRE(target.as_pattern().to_string() == "/b+/i");
    }

    SECTION("buffers") {
        REQUIRE(diff(Value::buffer({1, 2}), Value::buffer({1, 2})).empty());
        REQUIRE(diff(Value::buffer({1, 2}), Value::buffer({1, 3})).size() == 1);
    }
}

// ============================================================
// Sequences
// ============================================================

TEST_CASE("diff of sequences in strict order", "[diff][sequence]") {
    SECTION("trailing removals are emitted tail first") {
        auto changes = diff(Value::sequence({1, 2, 3}), Value::sequence({3}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{"[2]", "[1]", "[0]"});
        REQUIRE(changes[0].type() == Change::Type::Remove);
        REQUIRE(changes[2].type() == Change::Type::Edit);
    }

    SECTION("additions carry insert markers") {
        auto changes = diff(Value::sequence({3}), Value::sequence({1, 2, 3}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{"[0]", "[+1]", "[+2]"});
        REQUIRE(replays(Value::sequence({3}), Value::sequence({1, 2, 3})));
    }

    SECTION("trailing additions are emitted head first") {
        auto changes = diff(Value::sequence({1}), Value::sequence({1, 2, 3, 4}));
        REQUIRE(paths_of(changes) == std::vector<std::string>{"[+1]", "[+2]", "[+3]"});
        REQUIRE(replays(Value::sequence({1}), Value::sequence({1, 2, 3, 4})));
    }

    SECTION("additions into an empty sequence keep their order") {
        REQUIRE(replays(Value::sequence(), Value::sequence({"a", "b", "c"})));
        REQUIRE(replays(Value::sequence(),
                        Value::sequence({Value::null(), Value::map({{0, Value::set()}}), 0})));
    }

    SECTION("edits and additions inside a record") {
        auto lhs = Value::record({{"items", Value::sequence({1})}});
        auto rhs = Value::record({{"items", Value::sequence({5, 2, 3, 4})}});
        auto changes = diff(lhs, rhs);
        REQUIRE(paths_of(changes) == std::vector<std::string>{".items[0]", ".items[+1]", ".items[+2]", ".items[+3]"});
        REQUIRE(replays(lhs, rhs));
        REQUIRE(replays(Value::record({{"items", Value::sequence()}}),
                        Value::record({{"items", Value::sequence({"a", "b", "c"})}})));
    }

    SECTION("top level arrays") {
        Value lhs = Value::sequence({"a", "a", "a"});
        for (const auto& change : diff(lhs, Value::sequence({"a"}))) {
            (void)change.apply(lhs);
        }
        REQUIRE(deep_equal(lhs, Value::sequence({"a"})));
    }

    SECTION("nested arrays") {
        auto lhs = release_plan(false);
        auto rhs = release_plan(true);
        auto changes = diff(lhs, rhs);
        REQUIRE(changes.size() == 6);

        for (const auto& change : changes) {
            (void)change.apply(lhs);
        }
        REQUIRE(deep_equal(lhs, rhs));
    }
}

TEST_CASE("diff of sequences in lax order", "[diff][sequence][lax]") {
    DiffOptions lax;
    lax.lax_array_ordering = true;

    REQUIRE(diff(Value::sequence({1, 2, 3}), Value::sequence({1, 3, 2}), lax).empty());
    REQUIRE(diff(Value::sequence({1, 1, 2}), Value::sequence({1, 2, 1}), lax).empty());

    SECTION("complex elements") {
        auto lhs = Value::record({
            {"foo", "bar"},
            {"faz", Value::sequence({1, "pie", Value::record({{"food", "yum"}})})}
        });
        auto rhs = Value::record({
            {"faz", Value::sequence({"pie", Value::record({{"food", "yum"}}), 1})},
            {"foo", "bar"}
        });
        REQUIRE(diff(lhs, rhs, lax).empty());
    }

    SECTION("non-equal arrays replay") {
        auto lhs = Value::sequence({1, 2, 3});
        auto rhs = Value::sequence({2, 2, 3});
        auto changes = diff(lhs, rhs, lax);
        REQUIRE_FALSE(changes.empty());
        REQUIRE(paths_of(changes) == std::vector<std::string>{"[0]", "[+1]"});

        Value target = clone(lhs);
        auto tokens = apply_changes(changes, target);
        REQUIRE(deep_equal(target, rhs));
    }
}

// ============================================================
// Maps and sets
// ============================================================

TEST_CASE("diff of maps and sets", "[diff][map][set]") {
    SECTION("map entries") {
        auto lhs = Value::map({{"a", 1}, {"b", 2}});
        auto rhs = Value::map({{"a", 5}, {"c", 3}});
        auto changes = diff(lhs, rhs);
        REQUIRE(paths_of(changes) == std::vector<std::string>{R"({"b"})", R"({"c"})", R"({"a"})"});
        REQUIRE(replays(lhs, rhs));
    }

    SECTION("set members are keyed by content") {
        auto lhs = Value::set({1, 2});
        auto rhs = Value::set({2, 3});
        auto changes = diff(lhs, rhs);
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[0].type() == Change::Type::Remove);
        REQUIRE(path_to_string(changes[0].path()) == "<" + content_hash(1) + ">");
        REQUIRE(changes[1].type() == Change::Type::Add);
        REQUIRE(replays(lhs, rhs));
    }

    SECTION("strict ordering reports the container") {
        DiffOptions strict;
        strict.strict_map_ordering = true;
        auto changes = diff(Value::record({{"m", Value::map({{"a", 1}, {"b", 2}})}}),
                            Value::record({{"m", Value::map({{"b", 2}, {"a", 1}})}}), strict);
        REQUIRE(paths_of(changes) == std::vector<std::string>{".m"});
        REQUIRE(changes[0].type() == Change::Type::Edit);
    }
}

// ============================================================
// Options
// ============================================================

TEST_CASE("diff options", "[diff][options]") {
    SECTION("filtered keys produce no differences") {
        DiffOptions options;
        options.prop_filter = exclude_keys({"skip"});
        auto lhs = Value::record({{"keep", 1}, {"skip", Value::sequence({1, 2})}});
        auto rhs = Value::record({{"keep", 1}, {"skip", Value::sequence({3})}});
        REQUIRE(diff(lhs, rhs, options).empty());
        REQUIRE_FALSE(diff(lhs, rhs).empty());
    }

    SECTION("clone_values detaches embedded values") {
        auto added = Value::record({{"deep", Value::sequence({1})}});
        DiffOptions options;
        options.clone_values = CloneOptions{};
        auto changes = diff(Value::record(), Value::record({{"o", added}}), options);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].value().identity() != added.identity());
        REQUIRE(deep_equal(changes[0].value(), added));

        auto shared = diff(Value::record(), Value::record({{"o", added}}));
        REQUIRE(shared[0].value().identity() == added.identity());
    }

    SECTION("cyclic graphs with circular guard") {
        DiffOptions options;
        options.guard_circular_refs = true;
        auto a = Value::record({{"name", "a"}});
        auto b = Value::record({{"name", "b"}});
        a.as_record().set("self", a);
        b.as_record().set("self", b);

        auto changes = diff(a, b, options);
        REQUIRE(paths_of(changes) == std::vector<std::string>{".name"});

        a.as_record().erase("self");
        b.as_record().erase("self");
    }
}

// ============================================================
// Replay property
// ============================================================

TEST_CASE("applying a diff turns lhs into rhs", "[diff][replay]") {
    auto lhs = Value::record({
        {"name", "Alice"},
        {"tags", Value::sequence({"a", "b", "c"})},
        {"meta", Value::map({{1, "one"}})},
        {"seen", Value::set({"x"})}
    });
    auto rhs = Value::record({
        {"name", "Bob"},
        {"tags", Value::sequence({"b"})},
        {"meta", Value::map({{1, "uno"}, {2, "dos"}})},
        {"seen", Value::set({"x", "y"})},
        {"email", "bob@test.com"}
    });

    REQUIRE(replays(lhs, rhs));
    REQUIRE(replays(rhs, lhs));
    REQUIRE(replays(Value::record(), lhs));
    REQUIRE(replays(lhs, Value::sequence({1})));
}
