// test_clone.cpp - Tests for deep copy
// Containers, leaves, record shape, instantiation strategy and cycles

#include <catch2/catch_all.hpp>
#include <deepdiff/clone.h>
#include <deepdiff/equal.h>

using namespace deepdiff;

TEST_CASE("clone copies containers deeply", "[clone]") {
    auto original = Value::record({
        {"list", Value::sequence({1, Value::record({{"x", 2}})})},
        {"map", Value::map({{"k", Value::sequence({3})}})},
        {"set", Value::set({"a", "b"})}
    });

    auto copy = clone(original);

    REQUIRE(deep_equal(copy, original));
    REQUIRE(copy.identity() != original.identity());

    const auto& list = *copy.as_record().find("list");
    REQUIRE(list.identity() != original.as_record().find("list")->identity());
    REQUIRE(list.as_sequence()[1].identity() != original.as_record().find("list")->as_sequence()[1].identity());

    SECTION("the copy is independent") {
        copy.as_record().find("list")->as_sequence()[0] = 100;
        REQUIRE(original.as_record().find("list")->as_sequence()[0].as<double>() == 1.0);
    }
}

TEST_CASE("clone keeps record shape", "[clone][record]") {
    auto original = Value::record({{"a", 1}}, "Point");
    original.as_record().set("hidden", 2, false);

    SECTION("type name survives, non-enumerable fields are skipped by default") {
        auto copy = clone(original);
        REQUIRE(copy.as_record().type_name() == "Point");
        REQUIRE_FALSE(copy.as_record().contains("hidden"));
    }

    SECTION("all keys keeps the enumerable flag") {
        CloneOptions options;
        options.properties = all_keys;
        auto copy = clone(original, options);
        REQUIRE(copy.as_record().contains("hidden"));
        REQUIRE(copy.as_record().field("hidden")->enumerable == false);
    }
}

TEST_CASE("clone of leaves", "[clone][leaf]") {
    auto ts = Value::timestamp_ms(5000);
    auto copy = clone(ts);
    REQUIRE(copy.identity() != ts.identity());
    REQUIRE(deep_equal(copy, ts));

    auto pattern = Value::pattern("x+", "g");
    REQUIRE(clone(pattern).as_pattern().to_string() == "/x+/g");

    auto buffer = std::make_shared<ByteBuffer>(ByteBuffer{1, 2, 3, 4});
    auto view = clone(Value::view(buffer, 1, 2));
    REQUIRE(view.as_view().buffer != buffer);
    REQUIRE(view.as_view().offset == 0);
    REQUIRE(deep_equal(view, Value::view(buffer, 1, 2)));

    auto symbol = Value::symbol("s");
    REQUIRE(same_value(clone(symbol), symbol));
}

TEST_CASE("clone with a custom instantiation strategy", "[clone][instantiate]") {
    auto shared = Value::sequence({1, 2});
    auto original = Value::record({{"keep", shared}, {"n", 1}});

    CloneOptions options;
    options.instantiate = [&](const Node& node) -> Value {
        // Sequences are shared rather than copied
        if (node.kind() == Kind::Sequence) return node.value();
        return default_instantiate(node);
    };

    auto copy = clone(original, options);
    REQUIRE(copy.identity() != original.identity());
    REQUIRE(copy.as_record().find("keep")->identity() == shared.identity());
    REQUIRE(shared.as_sequence().size() == 2);
}

TEST_CASE("clone of cyclic graphs", "[clone][circular]") {
    CloneOptions options;
    options.guard_circular_refs = true;

    auto node = Value::record({{"name", "root"}});
    auto child = Value::sequence({node});
    node.as_record().set("children", child);
    node.as_record().set("self", node);

    auto copy = clone(node, options);

    REQUIRE(copy.identity() != node.identity());
    REQUIRE(copy.as_record().find("self")->identity() == copy.identity());
    const auto& copied_children = copy.as_record().find("children")->as_sequence();
    REQUIRE(copied_children[0].identity() == copy.identity());

    CompareOptions compare;
    compare.guard_circular_refs = true;
    REQUIRE(deep_equal(copy, node, compare));

    node.as_record().erase("self");
    node.as_record().erase("children");
    copy.as_record().erase("self");
    copy.as_record().erase("children");
}
