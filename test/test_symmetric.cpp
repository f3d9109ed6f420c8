// test_symmetric.cpp - Tests for the reversible delta syntax and unpatch
// Module 5: syntax selection, symmetric emit, unpatch round trips

#include <catch2/catch_all.hpp>
#include <jsondelta/differ.h>
#include <jsondelta/errors.h>

#include <vector>

using namespace jsondelta;

namespace {

JsonDiffer symmetric_differ() {
    DifferOptions opts;
    opts.syntax = builtin_syntax("symmetric");
    return JsonDiffer{opts};
}

} // namespace

// ============================================================
// Syntax registry
// ============================================================

TEST_CASE("Built-in syntaxes", "[syntax]") {
    REQUIRE(builtin_syntax("compact")->name() == "compact");
    REQUIRE(builtin_syntax("symmetric")->name() == "symmetric");
    REQUIRE(builtin_syntax("compact") == builtin_syntax("compact"));
    REQUIRE_THROWS_AS(builtin_syntax("explicit"), ConfigError);
    REQUIRE_THROWS_AS(builtin_syntax(""), ConfigError);
}

// ============================================================
// Emitted shape
// ============================================================

TEST_CASE("Symmetric delta shape", "[syntax][symmetric]") {
    auto differ = symmetric_differ();

    SECTION("replacements carry both sides") {
        REQUIRE(differ.diff(1, 2) == Delta{Value::vector({1, 2})});
        REQUIRE(differ.diff(Value::map({{"a", 1}}), Value::map({{"b", 1}})) ==
                Delta{Value::vector({Value::map({{"a", 1}}), Value::map({{"b", 1}})})});
    }

    SECTION("map changes, insertions and deletions are kept apart") {
        auto a = Value::map({{"a", 1}, {"b", 2}, {"c", 3}});
        auto b = Value::map({{"a", 1}, {"b", 5}, {"d", 4}});
        auto expected = Delta::object({
            {"b", Value::vector({2, 5})},
            {Marker::Insert, Value::map({{"d", 4}})},
            {Marker::Delete, Value::map({{"c", 3}})}
        });
        REQUIRE(differ.diff(a, b) == expected);
    }

    SECTION("sequence insertions and deletions carry values") {
        auto a = Value::vector({1, 2, 3});
        auto b = Value::vector({1, 3, 4});
        auto expected = Delta::object({
            {Marker::Insert, Value::vector({Value::vector({2, 4})})},
            {Marker::Delete, Value::vector({Value::vector({1, 2})})}
        });
        REQUIRE(differ.diff(a, b) == expected);
    }

    SECTION("deletions are listed high to low") {
        auto d = differ.diff(Value::vector({"a", "b", "c"}), Value::vector({"b"}));
        REQUIRE(d == Delta::object({
            {Marker::Delete, Value::vector({Value::vector({2, "c"}), Value::vector({0, "a"})})}
        }));
    }

    SECTION("sets use add and discard") {
        auto d = differ.diff(Value::set({1, 2, 3}), Value::set({2, 3, 4}));
        REQUIRE(d == Delta::object({
            {Marker::Discard, Value::vector({1})},
            {Marker::Add, Value::vector({4})}
        }));
    }

    SECTION("similarity does not depend on the syntax") {
        JsonDiffer compact;
        auto a = Value::map({{"x", Value::vector({1, 2, 3})}, {"y", "z"}});
        auto b = Value::map({{"x", Value::vector({2, 3})}, {"w", 0}});
        REQUIRE(differ.similarity(a, b) == Catch::Approx(compact.similarity(a, b)));
    }
}

// ============================================================
// Unpatch
// ============================================================

TEST_CASE("Symmetric unpatch restores the base", "[syntax][symmetric][unpatch]") {
    auto differ = symmetric_differ();

    const std::vector<std::pair<Value, Value>> cases = {
        {1, 2},
        {"foo", Value::map({{"k", "v"}})},
        {Value::map({{"a", 1}, {"b", 2}, {"c", 3}}), Value::map({{"a", 1}, {"b", 5}, {"d", 4}})},
        {Value::vector({1, 2, 3}), Value::vector({1, 3, 4})},
        {Value::vector({"a", "b", "c", "d", "e"}), Value::vector({"e", "c", "x", "a"})},
        {Value::array({1, 2}), Value::array({2, 1, 0})},
        {Value::set({1, 2, 3}), Value::set({2, 3, 4})},
        {Value::vector({Value::map({{"id", 1}, {"v", 1}}), Value::map({{"id", 2}})}),
         Value::vector({Value::map({{"id", 0}}), Value::map({{"id", 1}, {"v", 2}})})},
        {Value::map({{"nested", Value::map({{"list", Value::vector({1, 2})}, {"s", Value::set({"a"})}})}}),
         Value::map({{"nested", Value::map({{"list", Value::vector({2, 3})}, {"s", Value::set({"a", "b"})}})}})},
    };

    for (const auto& [a, b] : cases) {
        CAPTURE(a, b);
        auto d = differ.diff(a, b);
        REQUIRE(differ.patch(a, d) == b);
        REQUIRE(differ.unpatch(b, d) == a);
    }
}

TEST_CASE("Symmetric patch errors", "[syntax][symmetric][errors]") {
    auto differ = symmetric_differ();

    SECTION("replacement must be a pair") {
        REQUIRE_THROWS_AS(differ.patch(1, Delta{Value{2}}), InvalidDeltaError);
        REQUIRE_THROWS_AS(differ.unpatch(1, Delta{Value::vector({1, 2, 3})}), InvalidDeltaError);
    }

    SECTION("changed key must exist") {
        auto d = Delta::object({{"b", Value::vector({1, 2})}});
        REQUIRE_THROWS_AS(differ.patch(Value::map({{"a", 1}}), d), MissingKeyError);
        REQUIRE_THROWS_AS(differ.unpatch(Value::map({{"a", 1}}), d), MissingKeyError);
    }

    SECTION("reverting an insertion requires the key") {
        auto d = Delta::object({{Marker::Insert, Value::map({{"k", 1}})}});
        REQUIRE_THROWS_AS(differ.unpatch(Value::map({}), d), MissingKeyError);
    }

    SECTION("structured delta on a scalar") {
        auto d = Delta::object({{"a", Value::vector({1, 2})}});
        REQUIRE_THROWS_AS(differ.patch(5, d), InvalidDeltaError);
    }
}

// ============================================================
// Compact unpatch
// ============================================================

TEST_CASE("Compact unpatch", "[syntax][compact][unpatch]") {
    JsonDiffer differ;

    SECTION("empty delta") {
        auto v = Value::map({{"a", 1}});
        REQUIRE(differ.unpatch(v, Delta{}) == v);
    }

    SECTION("set deltas are invertible") {
        auto a = Value::set({1, 2, 3});
        auto b = Value::set({2, 3, 4});
        REQUIRE(differ.unpatch(b, differ.diff(a, b)) == a);
    }

    SECTION("everything else is irreversible") {
        auto a = Value::map({{"a", 1}, {"b", 2}});
        auto b = Value::map({{"a", 1}});
        REQUIRE_THROWS_AS(differ.unpatch(b, differ.diff(a, b)), IrreversibleDeltaError);
        REQUIRE_THROWS_AS(differ.unpatch(2, differ.diff(1, 2)), IrreversibleDeltaError);
        REQUIRE_THROWS_AS(differ.unpatch(Value::vector({1}), differ.diff(Value::vector({1, 2}), Value::vector({1}))),
                          IrreversibleDeltaError);
    }

    SECTION("irreversible is an invalid delta") {
        REQUIRE_THROWS_AS(differ.unpatch(2, differ.diff(1, 2)), InvalidDeltaError);
    }
}
