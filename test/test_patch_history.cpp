// test_patch_history.cpp - Tests for the undo/redo history
// Steps, descriptions, bounded history and redo invalidation

#include <catch2/catch_all.hpp>
#include <deepdiff/diff.h>
#include <deepdiff/equal.h>
#include <deepdiff/patch_history.h>

#include <string>

using namespace deepdiff;

namespace {

Value make_doc(const char* name, double score) {
    return Value::record({{"name", name}, {"score", score}});
}

} // namespace

TEST_CASE("PatchHistory undo and redo", "[history]") {
    Value doc = make_doc("Alice", 1);
    PatchHistory history{doc};

    REQUIRE_FALSE(history.can_undo());
    REQUIRE_FALSE(history.can_redo());
    REQUIRE_FALSE(history.undo());
    REQUIRE_FALSE(history.redo());

    history.apply(diff(doc, make_doc("Bob", 1)), "rename");
    history.apply(diff(doc, make_doc("Bob", 5)), "score");

    REQUIRE(history.undo_count() == 2);
    REQUIRE(history.undo_description() == "score");
    REQUIRE(deep_equal(doc, make_doc("Bob", 5)));

    SECTION("undo walks back one step at a time") {
        REQUIRE(history.undo());
        REQUIRE(deep_equal(doc, make_doc("Bob", 1)));
        REQUIRE(history.redo_description() == "score");

        REQUIRE(history.undo());
        REQUIRE(deep_equal(doc, make_doc("Alice", 1)));
        REQUIRE_FALSE(history.can_undo());
        REQUIRE(history.redo_count() == 2);

        REQUIRE(history.redo());
        REQUIRE(history.redo());
        REQUIRE(deep_equal(doc, make_doc("Bob", 5)));
        REQUIRE_FALSE(history.can_redo());
    }

    SECTION("a new step clears the redo stack") {
        REQUIRE(history.undo());
        REQUIRE(history.can_redo());

        history.apply(diff(doc, make_doc("Carol", 1)), "other");
        REQUIRE_FALSE(history.can_redo());
        REQUIRE(history.undo_description() == "other");
    }

    SECTION("empty batches are not recorded") {
        history.apply({}, "nothing");
        REQUIRE(history.undo_count() == 2);
    }

    SECTION("clear forgets everything") {
        history.clear();
        REQUIRE_FALSE(history.can_undo());
        REQUIRE_FALSE(history.can_redo());
        REQUIRE(deep_equal(doc, make_doc("Bob", 5)));
    }
}

TEST_CASE("PatchHistory keeps external edits", "[history]") {
    Value doc = Value::record({{"title", "draft"}, {"views", 0}});
    PatchHistory history{doc};

    history.apply({Change::edit({field_segment("title")}, "final")}, "publish");

    // Not recorded: survives undo
    doc.as_record().set("views", 42);

    REQUIRE(history.undo());
    REQUIRE(doc.as_record().find("title")->as<std::string>() == "draft");
    REQUIRE(doc.as_record().find("views")->as<double>() == 42.0);
}

TEST_CASE("PatchHistory drops the oldest steps", "[history][limit]") {
    Value doc = Value::record({{"n", 0}});
    PatchHistory history{doc, 3};

    for (int i = 1; i <= 5; ++i) {
        history.apply({Change::edit({field_segment("n")}, i)}, "set " + std::to_string(i));
    }

    REQUIRE(history.undo_count() == 3);
    while (history.undo()) {
    }
    REQUIRE(doc.as_record().find("n")->as<double>() == 2.0);
}

TEST_CASE("PatchHistory rolls back a failing batch", "[history][error]") {
    Value doc = Value::record({{"a", 1}});
    PatchHistory history{doc};

    std::vector<Change> changes;
    changes.push_back(Change::edit({field_segment("a")}, 2));
    changes.push_back(Change::remove({field_segment("missing")}));

    REQUIRE_THROWS_AS(history.apply(changes, "broken"), PatchError);
    REQUIRE(doc.as_record().find("a")->as<double>() == 1.0);
    REQUIRE_FALSE(history.can_undo());
}

TEST_CASE("PatchHistory keeps a step whose undo fails", "[history][error]") {
    Value doc = Value::record({{"a", 1}, {"b", 2}});
    PatchHistory history{doc};
    history.apply(diff(doc, Value::record({{"a", 10}, {"b", 20}})), "both");

    doc.as_record().erase("a");
    REQUIRE_THROWS_AS(history.undo(), PatchError);
    REQUIRE(deep_equal(doc, Value::record({{"b", 20}})));
    REQUIRE(history.undo_count() == 1);
    REQUIRE_FALSE(history.can_redo());

    doc.as_record().set("a", 10);
    REQUIRE(history.undo());
    REQUIRE(deep_equal(doc, Value::record({{"a", 1}, {"b", 2}})));
    REQUIRE(history.redo_count() == 1);

    REQUIRE(history.redo());
    REQUIRE(deep_equal(doc, Value::record({{"a", 10}, {"b", 20}})));
}
