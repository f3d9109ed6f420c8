// test_patch.cpp - Tests for applying compact deltas
// Module 6: PatchEngine, patch errors, patch helpers

#include <catch2/catch_all.hpp>
#include <jsondelta/differ.h>
#include <jsondelta/errors.h>
#include <jsondelta/patch.h>

#include <memory>
#include <vector>

using namespace jsondelta;

namespace {

PatchEngine compact_engine(std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH) {
    return PatchEngine{builtin_syntax("compact"), max_depth};
}

Delta position_delta(int levels, const Value& leaf) {
    Delta d{leaf};
    for (int i = 0; i < levels; ++i) {
        d = Delta::object({{"0", d}});
    }
    return d;
}

Value nest(int depth) {
    Value v = 0;
    for (int i = 0; i < depth; ++i) {
        v = Value::vector({v});
    }
    return v;
}

} // namespace

// ============================================================
// Basic application
// ============================================================

TEST_CASE("Patch basics", "[patch]") {
    auto engine = compact_engine();

    SECTION("empty delta returns the base") {
        auto base = Value::map({{"a", 1}});
        REQUIRE(engine.apply(base, Delta{}) == base);
    }

    SECTION("plain value replaces") {
        REQUIRE(engine.apply(Value::map({{"a", 1}}), Delta{Value{"x"}}) == Value{"x"});
        REQUIRE(engine.apply(1, Delta{Value::vector({1})}) == Value::vector({1}));
    }

    SECTION("replace marker") {
        auto b = Value::map({{"z", 0}});
        REQUIRE(engine.apply(Value::vector({1}), Delta::object({{Marker::Replace, b}})) == b);
    }

    SECTION("map merge adds and updates keys") {
        auto base = Value::map({{"a", 1}, {"b", 2}});
        auto d = Delta::object({{"b", Value{3}}, {"c", Value{4}}});
        REQUIRE(engine.apply(base, d) == Value::map({{"a", 1}, {"b", 3}, {"c", 4}}));
    }

    SECTION("map delete") {
        auto base = Value::map({{"a", 1}, {"b", 2}});
        auto d = Delta::object({{Marker::Delete, Value::vector({"b"})}});
        REQUIRE(engine.apply(base, d) == Value::map({{"a", 1}}));
    }

    SECTION("sequence delete then insert") {
        auto base = Value::vector({"a", "b", "c"});
        auto d = Delta::object({
            {Marker::Delete, Value::vector({1})},
            {Marker::Insert, Value::vector({Value::vector({3, "y"}), Value::vector({0, "x"})})}
        });
        // [a, c] -> inserts applied in ascending position order
        REQUIRE(engine.apply(base, d) == Value::vector({"x", "a", "c", "y"}));
    }

    SECTION("sequence change by position") {
        auto base = Value::array({Value::map({{"k", 1}}), 2});
        auto d = Delta::object({{"0", Delta::object({{"k", Value{5}}})}});
        auto result = engine.apply(base, d);
        REQUIRE(result.is_array());
        REQUIRE(result == Value::array({Value::map({{"k", 5}}), 2}));
    }

    SECTION("set discard and add") {
        auto base = Value::set({1, 2});
        auto d = Delta::object({
            {Marker::Discard, Value::vector({1})},
            {Marker::Add, Value::vector({3})}
        });
        REQUIRE(engine.apply(base, d) == Value::set({2, 3}));
    }

    SECTION("structured delta on a scalar base becomes the value") {
        REQUIRE(engine.apply(5, Delta::object({{"a", Value{1}}})) == Value::map({{"a", 1}}));
    }

    SECTION("inputs are not modified") {
        auto base = Value::map({{"a", Value::vector({1, 2})}});
        auto copy = base;
        (void)engine.apply(base, Delta::object({{"a", Delta::object({{Marker::Delete, Value::vector({0})}})}}));
        REQUIRE(base == copy);
    }
}

// ============================================================
// Errors
// ============================================================

TEST_CASE("Patch errors", "[patch][errors]") {
    auto engine = compact_engine();

    SECTION("deleting a missing key") {
        auto base = Value::map({{"a", 1}});
        auto d = Delta::object({{Marker::Delete, Value::vector({"b"})}});
        REQUIRE_THROWS_AS(engine.apply(base, d), MissingKeyError);
        try {
            (void)engine.apply(base, d);
        } catch (const MissingKeyError& e) {
            REQUIRE(e.key() == "b");
        }
    }

    SECTION("nested edit under a missing key") {
        auto base = Value::map({{"a", 1}});
        auto d = Delta::object({{"b", Delta::object({{Marker::Delete, Value::vector({"x"})}})}});
        REQUIRE_THROWS_AS(engine.apply(base, d), MissingKeyError);
        try {
            (void)engine.apply(base, d);
        } catch (const MissingKeyError& e) {
            REQUIRE(e.key() == "b");
        }

        // Markers deeper down count too
        auto deep = Delta::object({{"b", Delta::object({{"c", Delta::object({{Marker::Insert,
                        Value::vector({Value::vector({0, 1})})}})}})}});
        REQUIRE_THROWS_AS(engine.apply(base, deep), MissingKeyError);

        // A marker-free map under a new key is a plain addition
        auto added = Delta::object({{"b", Value::map({{"c", Value::map({{"d", 2}})}})}});
        REQUIRE(engine.apply(base, added) ==
                Value::map({{"a", 1}, {"b", Value::map({{"c", Value::map({{"d", 2}})}})}}));
    }

    SECTION("insert past the end") {
        auto d = Delta::object({{Marker::Insert, Value::vector({Value::vector({5, 9})})}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1, 2}), d), OutOfRangeError);
    }

    SECTION("delete past the end") {
        auto d = Delta::object({{Marker::Delete, Value::vector({4})}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1, 2}), d), OutOfRangeError);
    }

    SECTION("change past the end") {
        auto d = Delta::object({{"5", Value{1}}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1}), d), OutOfRangeError);
    }

    SECTION("duplicate deletes") {
        auto d = Delta::object({{Marker::Delete, Value::vector({0, 0})}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1, 2}), d), InvalidDeltaError);
    }

    SECTION("set delta on a sequence") {
        auto d = Delta::object({{Marker::Add, Value::vector({3})}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1, 2}), d), InvalidDeltaError);
    }

    SECTION("non-position key on a sequence") {
        auto d = Delta::object({{"name", Value{1}}});
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1}), d), InvalidDeltaError);
    }

    SECTION("sequence marker on a set") {
        auto d = Delta::object({{Marker::Insert, Value::vector({Value::vector({0, 1})})}});
        REQUIRE_THROWS_AS(engine.apply(Value::set({1}), d), InvalidDeltaError);
    }

    SECTION("set marker on a map") {
        auto d = Delta::object({{Marker::Add, Value::vector({1})}});
        REQUIRE_THROWS_AS(engine.apply(Value::map({{"a", 1}}), d), InvalidDeltaError);
    }

    SECTION("malformed payloads") {
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1}), Delta::object({{Marker::Delete, Value{0}}})),
                          InvalidDeltaError);
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1}), Delta::object({{Marker::Delete, Value::vector({-1})}})),
                          InvalidDeltaError);
        REQUIRE_THROWS_AS(engine.apply(Value::vector({1}), Delta::object({{Marker::Insert, Value::vector({0})}})),
                          InvalidDeltaError);
        REQUIRE_THROWS_AS(engine.apply(Value::map({}), Delta::object({{Marker::Delete, Value::vector({1})}})),
                          InvalidDeltaError);
    }

    SECTION("markers left in a value position") {
        auto d = Delta::object({{"a", Delta::object({{Marker::Delete, Value::vector({"x"})}})}});
        REQUIRE_THROWS_AS(engine.apply(5, d), InvalidDeltaError);
    }

    SECTION("every error is a DeltaError") {
        auto d = Delta::object({{Marker::Delete, Value::vector({"b"})}});
        REQUIRE_THROWS_AS(engine.apply(Value::map({}), d), DeltaError);
    }
}

TEST_CASE("PatchEngine configuration and depth", "[patch]") {
    SECTION("a syntax is required") {
        REQUIRE_THROWS_AS(PatchEngine(nullptr), ConfigError);
    }

    SECTION("depth limit") {
        auto base = nest(5);
        auto d = position_delta(4, Value{7});
        REQUIRE_NOTHROW(compact_engine(4).apply(base, d));
        REQUIRE_THROWS_AS(compact_engine(3).apply(base, d), DepthLimitError);
    }

    SECTION("syntax accessor") {
        REQUIRE(compact_engine().syntax().name() == "compact");
    }
}

// ============================================================
// Helpers
// ============================================================

TEST_CASE("Patch helpers", "[patch][detail]") {
    SECTION("positioned entries are sorted and keep payload order on ties") {
        auto payload = Delta{Value::vector({
            Value::vector({2, "c"}),
            Value::vector({0, "a"}),
            Value::vector({2, "d"})
        })};
        auto entries = detail::positioned_entries(payload, "insert");
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].first == 0);
        REQUIRE(entries[1].second == Value{"c"});
        REQUIRE(entries[2].second == Value{"d"});
    }

    SECTION("erase positions works high to low") {
        auto items = detail::sequence_items(Value::vector({0, 1, 2, 3}));
        detail::erase_positions(items, {0, 2}, "test");
        REQUIRE(detail::rebuild_sequence(Value::vector({}), items) == Value::vector({1, 3}));
    }

    SECTION("insert at the end is allowed") {
        auto items = detail::sequence_items(Value::array({1}));
        detail::insert_entries(items, {{1, Value{2}}}, "test");
        REQUIRE(detail::rebuild_sequence(Value::array({}), items) == Value::array({1, 2}));
    }

    SECTION("key positions") {
        REQUIRE(detail::key_position(DeltaKey{"3"}, "test") == 3);
        REQUIRE_THROWS_AS(detail::key_position(DeltaKey{Marker::Add}, "test"), InvalidDeltaError);
        REQUIRE_THROWS_AS(detail::key_position(DeltaKey{"x"}, "test"), InvalidDeltaError);
    }

    SECTION("payload positions") {
        REQUIRE(detail::payload_position(Value{4}, "test") == 4);
        REQUIRE_THROWS_AS(detail::payload_position(Value{1.5}, "test"), InvalidDeltaError);
        REQUIRE_THROWS_AS(detail::payload_position(Value{"1"}, "test"), InvalidDeltaError);
    }
}

// ============================================================
// Round trips
// ============================================================

TEST_CASE("Patch reproduces the target", "[patch][roundtrip]") {
    JsonDiffer differ;

    auto a = Value::map({
        {"title", "draft"},
        {"rows", Value::vector({
            Value::vector({1, 2, 3}),
            Value::vector({4, 5}),
            Value::vector({6})
        })},
        {"flags", Value::set({"a", "b"})},
        {"meta", Value::map({{"rev", 1}, {"owner", "x"}})}
    });
    auto b = Value::map({
        {"title", "final"},
        {"rows", Value::vector({
            Value::vector({1, 2, 3, 4}),
            Value::vector({6, 7})
        })},
        {"flags", Value::set({"b", "c"})},
        {"meta", Value::map({{"rev", 2}})}
    });

    REQUIRE(differ.patch(a, differ.diff(a, b)) == b);
    REQUIRE(differ.patch(b, differ.diff(b, a)) == a);
}
