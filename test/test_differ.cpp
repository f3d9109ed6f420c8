// test_differ.cpp - Tests for the configured entry point
// Module 9: JsonDiffer options, text boundary, marshaled patch, shortcuts

#include <catch2/catch_all.hpp>
#include <jsondelta/differ.h>
#include <jsondelta/errors.h>

#include <memory>
#include <string>

using namespace jsondelta;

namespace {

// Wraps output so that tests can tell the dumper was used
class TaggedDumper final : public Dumper {
public:
    [[nodiscard]] std::string dump(const Value& value) const override {
        return "<" + to_json(value, true, true) + ">";
    }
};

// Accepts "int:N" in addition to JSON
class PrefixLoader final : public Loader {
public:
    [[nodiscard]] Value load(std::string_view text) const override {
        if (text.starts_with("int:")) {
            return Value{std::stoll(std::string(text.substr(4)))};
        }
        return JsonLoader{}.load(text);
    }
};

Value nest(int depth) {
    Value v = 0;
    for (int i = 0; i < depth; ++i) {
        v = Value::map({{"n", v}});
    }
    return v;
}

} // namespace

// ============================================================
// Configuration
// ============================================================

TEST_CASE("JsonDiffer defaults", "[differ][config]") {
    JsonDiffer differ;
    REQUIRE(differ.syntax().name() == "compact");
    REQUIRE(differ.options().escape_str == "$");
    REQUIRE(differ.options().max_depth == JSONDELTA_DEFAULT_MAX_DEPTH);
    REQUIRE(differ.options().loader != nullptr);
    REQUIRE(differ.options().dumper != nullptr);
}

TEST_CASE("JsonDiffer rejects bad options", "[differ][config]") {
    SECTION("empty escape") {
        DifferOptions opts;
        opts.escape_str = "";
        REQUIRE_THROWS_AS(JsonDiffer{opts}, ConfigError);
    }

    SECTION("zero depth") {
        DifferOptions opts;
        opts.max_depth = 0;
        REQUIRE_THROWS_AS(JsonDiffer{opts}, ConfigError);
    }

    SECTION("escape that starts a marker label") {
        DifferOptions opts;
        opts.escape_str = "d";
        REQUIRE_THROWS_AS(JsonDiffer{opts}, ConfigError);
    }
}

TEST_CASE("JsonDiffer depth limit", "[differ][config]") {
    DifferOptions opts;
    opts.max_depth = 4;
    JsonDiffer differ{opts};

    REQUIRE_NOTHROW(differ.diff(nest(3), nest(4)));
    REQUIRE_THROWS_AS(differ.diff(nest(10), nest(10)), DepthLimitError);
    REQUIRE_THROWS_AS(differ.similarity(nest(10), nest(10)), DepthLimitError);

    // Patch is limited by the depth of the delta
    JsonDiffer unlimited;
    auto d = unlimited.diff(nest(10), Value::map({{"n", nest(9)}, {"extra", 1}}));
    REQUIRE_NOTHROW(differ.patch(nest(10), d));

    auto deep = Delta{Value{1}};
    for (int i = 0; i < 6; ++i) deep = Delta::object({{"n", deep}});
    REQUIRE_THROWS_AS(differ.patch(nest(10), deep), DepthLimitError);

    // The default loader parses with the same limit
    REQUIRE_NOTHROW(differ.diff_text("[[[1]]]", "[[[2]]]"));
    REQUIRE_THROWS_AS(differ.diff_text("[[[[[[1]]]]]]", "[]"), ParseError);
    REQUIRE_THROWS_AS(unlimited.diff_text(std::string(10000, '[') + std::string(10000, ']'), "[]"),
                      ParseError);
}

// ============================================================
// Marshaled forms
// ============================================================

TEST_CASE("Marshaled diff and patch", "[differ][marshal]") {
    JsonDiffer differ;
    auto a = Value::map({{"a", 1}, {"b", 2}});
    auto b = Value::map({{"a", 1}});

    SECTION("diff_marshaled escapes markers") {
        REQUIRE(differ.diff_marshaled(a, b) == Value::map({{"$delete", Value::vector({"b"})}}));
    }

    SECTION("patch accepts the wire form") {
        auto wire = Value::map({{"$delete", Value::vector({"b"})}});
        REQUIRE(differ.patch_marshaled(a, wire) == b);
        REQUIRE_THROWS_AS(differ.patch_marshaled(b, wire), MissingKeyError);
    }

    SECTION("wire form is only unmarshaled by the marshaled overloads") {
        auto wire = Value::map({{"$delete", Value::vector({"b"})}});
        // As a plain Delta the marker token is just another key to add
        auto literal = Value::map({{"a", 1}, {"b", 2}, {"$delete", Value::vector({"b"})}});
        REQUIRE(differ.patch(a, Delta{wire}) == literal);
        REQUIRE(patch(a, Delta{wire}) == literal);
        REQUIRE(differ.patch(a, differ.unmarshal(wire)) == b);
    }

    SECTION("unpatch_marshaled") {
        DifferOptions opts;
        opts.syntax = builtin_syntax("symmetric");
        JsonDiffer symmetric{opts};
        auto wire = symmetric.diff_marshaled(a, b);
        REQUIRE(symmetric.unpatch_marshaled(b, wire) == a);
    }

    SECTION("escaped keys survive the round trip") {
        auto x = Value::map({{"$price", 1}});
        auto y = Value::map({{"$price", 2}});
        auto wire = differ.diff_marshaled(x, y);
        REQUIRE(wire == Value::map({{"$$price", 2}}));
        REQUIRE(differ.patch_marshaled(x, wire) == y);
    }

    SECTION("custom escape token") {
        DifferOptions opts;
        opts.escape_str = "@";
        JsonDiffer custom{opts};
        REQUIRE(custom.diff_marshaled(a, b) == Value::map({{"@delete", Value::vector({"b"})}}));
        REQUIRE(custom.unmarshal(custom.marshal(custom.diff(a, b))) == custom.diff(a, b));
    }
}

// ============================================================
// Text boundary
// ============================================================

TEST_CASE("Text operations", "[differ][text]") {
    JsonDiffer differ;

    SECTION("diff_text") {
        REQUIRE(differ.diff_text(R"({"x":[1,2]})", R"({"x":[1]})") == R"({"x":{"$delete":[1]}})");
        REQUIRE(differ.diff_text("[1,2]", "[1,2]") == "{}");
        REQUIRE(differ.diff_text(R"("foo")", R"("bar")") == R"("bar")");
    }

    SECTION("patch_text") {
        auto out = differ.patch_text(R"({"a":1,"b":2})", R"({"b":3})");
        REQUIRE(from_json(out) == Value::map({{"a", 1}, {"b", 3}}));
    }

    SECTION("similarity_text") {
        REQUIRE(differ.similarity_text("[1,2,3]", "[1,3,4]") == Catch::Approx(0.5));
    }

    SECTION("malformed input") {
        REQUIRE_THROWS_AS(differ.diff_text("{", "{}"), ParseError);
        REQUIRE_THROWS_AS(differ.patch_text("{}", "[1,"), ParseError);
    }

    SECTION("unpatch_text through the symmetric syntax") {
        DifferOptions opts;
        opts.syntax = builtin_syntax("symmetric");
        JsonDiffer symmetric{opts};
        auto wire = symmetric.diff_text(R"({"a":1,"b":2})", R"({"a":1,"b":3})");
        REQUIRE(wire == R"({"b":[2,3]})");
        REQUIRE(from_json(symmetric.unpatch_text(R"({"a":1,"b":3})", wire)) ==
                Value::map({{"a", 1}, {"b", 2}}));
    }

    SECTION("custom loader and dumper") {
        DifferOptions opts;
        opts.loader = std::make_shared<PrefixLoader>();
        opts.dumper = std::make_shared<TaggedDumper>();
        JsonDiffer custom{opts};
        REQUIRE(custom.diff_text("int:1", "int:2") == "<2>");
        REQUIRE(custom.patch_text(R"({"k":0})", R"({"k":"int:5"})") == R"(<{"k":"int:5"}>)");
        REQUIRE(custom.similarity_text("int:7", "7") == 1.0);
    }
}

// ============================================================
// Shortcuts
// ============================================================

TEST_CASE("Free functions", "[differ]") {
    auto a = Value::vector({"a", "b"});
    auto b = Value::vector({"a", "c"});
    auto d = diff(a, b);
    REQUIRE(patch(a, d) == b);
    // "a" matched, "b" deleted, "c" inserted
    REQUIRE(similarity(a, b) == Catch::Approx(1.0 / 3.0));
    REQUIRE(JsonDiffer{}.diff(a, b) == d);
}
