// test_equal.cpp - Tests for deep equality
// Leaf rules, container pairing, options and cyclic graphs

#include <catch2/catch_all.hpp>
#include <deepdiff/equal.h>

#include <limits>

using namespace deepdiff;

namespace {

const double nan_value = std::numeric_limits<double>::quiet_NaN();

/// Equality comparator that counts pairs the circular guard turned away
class CountingEqual : public Comparator<CountingEqual, CompareContext> {
public:
    using Comparator::Comparator;

    Flow revisit(const Node&, CompareContext&)
    {
        ++revisits;
        return Flow::Continue;
    }

    std::size_t revisits = 0;
};

} // namespace

// ============================================================
// Leaves
// ============================================================

TEST_CASE("equal on scalars", "[equal][leaf]") {
    REQUIRE(deep_equal(1, 1));
    REQUIRE_FALSE(deep_equal(1, 2));
    REQUIRE(deep_equal("abc", "abc"));
    REQUIRE_FALSE(deep_equal("abc", "abd"));
    REQUIRE(deep_equal(Value::null(), Value::null()));
    REQUIRE_FALSE(deep_equal(Value::null(), Value{}));
    REQUIRE_FALSE(deep_equal(true, 1));
    REQUIRE(deep_equal(Value::big_int(5), Value::big_int(5)));

    SECTION("identical values report Identical") {
        auto seq = Value::sequence({1});
        REQUIRE(Equal{}.outcome(seq, seq) == Outcome::Identical);
    }

    SECTION("symbols compare by identity") {
        auto s = Value::symbol("tag");
        REQUIRE(deep_equal(s, s));
        REQUIRE_FALSE(deep_equal(s, Value::symbol("tag")));
    }
}

TEST_CASE("equal on numbers", "[equal][number]") {
    SECTION("NaN equals NaN") {
        REQUIRE(deep_equal(nan_value, nan_value));
        REQUIRE(deep_equal(Value::record({{"x", nan_value}}), Value::record({{"x", nan_value}})));
    }

    SECTION("NaN never equals a number") {
        REQUIRE_FALSE(deep_equal(nan_value, 0));
        REQUIRE_FALSE(deep_equal(0, nan_value));
    }

    SECTION("signed zeros are equivalent") {
        REQUIRE(Equal{}.outcome(0.0, -0.0) == Outcome::Equivalent);
    }

    SECTION("epsilon tolerance") {
        REQUIRE(deep_equal(0.1 + 0.2, 0.3));

        CompareOptions exact;
        exact.epsilon = 0.0;
        REQUIRE_FALSE(deep_equal(0.1 + 0.2, 0.3, exact));

        CompareOptions coarse;
        coarse.epsilon = 0.5;
        REQUIRE(deep_equal(1.0, 1.25, coarse));
    }
}

TEST_CASE("equal on opaque leaves", "[equal][leaf]") {
    REQUIRE(deep_equal(Value::timestamp_ms(1000), Value::timestamp_ms(1000)));
    REQUIRE_FALSE(deep_equal(Value::timestamp_ms(1000), Value::timestamp_ms(2000)));

    REQUIRE(deep_equal(Value::pattern("a+", "i"), Value::pattern("a+", "i")));
    REQUIRE_FALSE(deep_equal(Value::pattern("a+", "i"), Value::pattern("a+")));

    REQUIRE(deep_equal(Value::buffer({1, 2, 3}), Value::buffer({1, 2, 3})));
    REQUIRE_FALSE(deep_equal(Value::buffer({1, 2, 3}), Value::buffer({1, 2})));

    SECTION("views compare their windows") {
        auto a = std::make_shared<ByteBuffer>(ByteBuffer{9, 1, 2});
        auto b = std::make_shared<ByteBuffer>(ByteBuffer{1, 2, 9});
        REQUIRE(deep_equal(Value::view(a, 1, 2), Value::view(b, 0, 2)));
        REQUIRE(Equal{}.outcome(Value::view(a, 1, 2), Value::view(a, 1, 2)) == Outcome::Equivalent);
        REQUIRE_FALSE(deep_equal(Value::view(a, 0, 2), Value::view(b, 0, 2)));
    }
}

// ============================================================
// Containers
// ============================================================

TEST_CASE("equal on records", "[equal][record]") {
    auto lhs = Value::record({{"name", "Alice"}, {"age", 30}});

    REQUIRE(deep_equal(lhs, Value::record({{"age", 30}, {"name", "Alice"}})));
    REQUIRE(Equal{}.outcome(lhs, Value::record({{"name", "Alice"}, {"age", 31}})) == Outcome::NotEqual);
    REQUIRE(Equal{}.outcome(lhs, Value::record({{"name", "Alice"}})) == Outcome::MissingRight);
    REQUIRE(Equal{}.outcome(Value::record({{"name", "Alice"}}), lhs) == Outcome::MissingLeft);

    SECTION("an explicit undefined field differs from a missing one") {
        REQUIRE_FALSE(deep_equal(Value::record({{"a", Value{}}}), Value::record()));
    }

    SECTION("non-enumerable fields are ignored by default") {
        auto a = Value::record({{"x", 1}});
        auto b = Value::record({{"x", 1}});
        a.as_record().set("hidden", 1, false);
        b.as_record().set("hidden", 2, false);
        REQUIRE(deep_equal(a, b));

        CompareOptions all;
        all.properties = all_keys;
        REQUIRE_FALSE(deep_equal(a, b, all));
    }

    SECTION("property filter") {
        CompareOptions options;
        options.prop_filter = exclude_prefix("_");
        REQUIRE(deep_equal(Value::record({{"a", 1}, {"_rev", 1}}),
                           Value::record({{"a", 1}, {"_rev", 2}}), options));
    }
}

TEST_CASE("equal on empty containers is undetermined", "[equal][empty]") {
    REQUIRE_FALSE(equal(Value::record(), Value::record()).has_value());
    REQUIRE_FALSE(equal(Value::sequence(), Value::sequence()).has_value());
    REQUIRE(deep_equal(Value::record(), Value::record()));
    REQUIRE_FALSE(deep_equal(Value::record(), Value::sequence()));
}

TEST_CASE("equal on sequences", "[equal][sequence]") {
    auto a = Value::sequence({1, 2, 3});
    auto b = Value::sequence({3, 2, 1});

    REQUIRE(deep_equal(a, Value::sequence({1, 2, 3})));
    REQUIRE_FALSE(deep_equal(a, b));
    REQUIRE_FALSE(deep_equal(a, Value::sequence({1, 2})));

    SECTION("lax ordering ignores positions") {
        CompareOptions lax;
        lax.lax_array_ordering = true;
        REQUIRE(deep_equal(a, b, lax));
        REQUIRE(deep_equal(Value::sequence({Value::record({{"a", 1}}), Value::record({{"b", 2}})}),
                           Value::sequence({Value::record({{"b", 2}}), Value::record({{"a", 1}})}), lax));
        REQUIRE_FALSE(deep_equal(Value::sequence({1, 1, 2}), Value::sequence({1, 2, 2}), lax));
        REQUIRE(deep_equal(Value::sequence({Value::sequence(), 1}), Value::sequence({1, Value::sequence()}), lax));
    }
}

TEST_CASE("equal on maps and sets", "[equal][map][set]") {
    auto m1 = Value::map({{"a", 1}, {"b", 2}});
    auto m2 = Value::map({{"b", 2}, {"a", 1}});
    auto s1 = Value::set({1, 2});
    auto s2 = Value::set({2, 1});

    REQUIRE(deep_equal(m1, m2));
    REQUIRE(deep_equal(s1, s2));
    REQUIRE_FALSE(deep_equal(m1, Value::map({{"a", 1}, {"b", 3}})));
    REQUIRE_FALSE(deep_equal(s1, Value::set({1, 3})));

    SECTION("strict ordering") {
        CompareOptions strict;
        strict.strict_map_ordering = true;
        strict.strict_set_ordering = true;
        REQUIRE_FALSE(deep_equal(m1, m2, strict));
        REQUIRE_FALSE(deep_equal(s1, s2, strict));
        REQUIRE(deep_equal(m1, Value::map({{"a", 1}, {"b", 2}}), strict));
    }
}

// ============================================================
// Kinds and loose equality
// ============================================================

TEST_CASE("equal across kinds", "[equal][loose]") {
    REQUIRE(Equal{}.outcome(Value{}, 1) == Outcome::MissingLeft);
    REQUIRE(Equal{}.outcome(1, Value{}) == Outcome::MissingRight);
    REQUIRE(Equal{}.outcome(1, "1") == Outcome::NotEqual);

    CompareOptions loose;
    loose.loose_equality = true;
    REQUIRE(Equal{loose}.outcome(1, "1") == Outcome::Equivalent);
    REQUIRE(deep_equal(Value::null(), Value{}, loose));
    REQUIRE(deep_equal(Value::record({{"n", "2"}}), Value::record({{"n", 2}}), loose));
}

// ============================================================
// Cyclic graphs
// ============================================================

TEST_CASE("equal on cyclic graphs", "[equal][circular]") {
    CompareOptions options;
    options.guard_circular_refs = true;

    auto a = Value::record({{"name", "node"}});
    auto b = Value::record({{"name", "node"}});
    a.as_record().set("self", a);
    b.as_record().set("self", b);

    REQUIRE(deep_equal(a, b, options));

    b.as_record().set("name", "other");
    REQUIRE_FALSE(deep_equal(a, b, options));

    a.as_record().erase("self");
    b.as_record().erase("self");
}

TEST_CASE("circular guard keys on the node pair", "[equal][circular]") {
    CompareOptions options;
    options.guard_circular_refs = true;

    SECTION("a cycle is entered once") {
        auto a = Value::record({{"name", "node"}});
        auto b = Value::record({{"name", "node"}});
        a.as_record().set("self", a);
        b.as_record().set("self", b);

        CountingEqual counting{options};
        CompareContext ctx;
        Node l{a};
        Node r{b};
        counting.compare(&l, &r, ctx);
        REQUIRE(counting.revisits == 1);
        REQUIRE(ctx.result);
        REQUIRE(is_equal(*ctx.result));

        a.as_record().erase("self");
        b.as_record().erase("self");
    }

    SECTION("a shared lhs node is compared against each counterpart") {
        auto shared = Value::record({{"x", 1}});
        auto lhs = Value::sequence({shared, shared});
        auto rhs = Value::sequence({Value::record({{"x", 1}}), Value::record({{"x", 2}})});
        REQUIRE_FALSE(deep_equal(lhs, rhs, options));
        REQUIRE(deep_equal(lhs, Value::sequence({Value::record({{"x", 1}}), Value::record({{"x", 1}})}), options));
    }
}
