// test_serialization.cpp - Tests for JSON text encoding
// Module 8: to_json, from_json, JsonLoader, JsonDumper

#include <catch2/catch_all.hpp>
#include <jsondelta/errors.h>
#include <jsondelta/serialization.h>

#include <cmath>
#include <limits>
#include <string>

using namespace jsondelta;

// ============================================================
// Writing
// ============================================================

TEST_CASE("to_json scalars", "[serialization]") {
    REQUIRE(to_json(Value{}, true) == "null");
    REQUIRE(to_json(Value{true}, true) == "true");
    REQUIRE(to_json(Value{-12}, true) == "-12");
    REQUIRE(to_json(Value{2.5}, true) == "2.5");
    REQUIRE(to_json(Value{2.0}, true) == "2.0");
    REQUIRE(to_json(Value{std::numeric_limits<double>::infinity()}, true) == "null");
    REQUIRE(to_json(Value{"a\"b\\c\n"}, true) == R"("a\"b\\c\n")");
    REQUIRE(to_json(Value{std::string("\x01")}, true) == R"("\u0001")");
}

TEST_CASE("to_json containers", "[serialization]") {
    SECTION("compact with sorted keys") {
        auto v = Value::map({{"b", Value::vector({1, 2})}, {"a", Value::map({})}, {"c", Value::vector({})}});
        REQUIRE(to_json(v, true, true) == R"({"a":{},"b":[1,2],"c":[]})");
    }

    SECTION("pretty printing") {
        auto v = Value::map({{"k", Value::vector({1})}});
        REQUIRE(to_json(v) == "{\n  \"k\": [\n    1\n  ]\n}");
    }

    SECTION("arrays and sets are written as JSON arrays") {
        REQUIRE(to_json(Value::array({1, 2}), true) == "[1,2]");
        REQUIRE(to_json(Value::set({7}), true) == "[7]");
    }
}

// ============================================================
// Parsing
// ============================================================

TEST_CASE("from_json", "[serialization]") {
    SECTION("numbers") {
        REQUIRE(from_json("42").is<std::int64_t>());
        REQUIRE(from_json("-0.5").is<double>());
        REQUIRE(from_json("1e3").is<double>());
        REQUIRE(from_json("1e3") == Value{1000});
        // Too large for int64
        REQUIRE(from_json("123456789012345678901234567890").is<double>());
    }

    SECTION("number grammar") {
        REQUIRE(from_json("0") == Value{0});
        REQUIRE(from_json("-0").is<std::int64_t>());
        REQUIRE(from_json("0.25") == Value{0.25});
        REQUIRE(from_json("1E+2") == Value{100.0});
        REQUIRE(from_json("[0,10]") == Value::vector({0, 10}));

        for (const char* bad : {"01", "-01", "1.", "1.e5", ".5", "1e", "1e+", "-", "-a", "+1", "0x10"}) {
            CAPTURE(bad);
            std::string error;
            REQUIRE(from_json(bad, &error).is_null());
            REQUIRE_FALSE(error.empty());
        }
    }

    SECTION("strings") {
        REQUIRE(from_json(R"("tab\there")") == Value{"tab\there"});
        REQUIRE(from_json(R"("\u00e9")") == Value{"\xC3\xA9"});
        REQUIRE(from_json(R"("\ud83d\ude00")") == Value{"\xF0\x9F\x98\x80"});
    }

    SECTION("unpaired surrogates are rejected") {
        for (const char* bad : {R"("\ud83d")", R"("\ud83dx")", R"("\ude00")", R"("a\udfffb")",
                                R"("\ud83dA")", R"("\ud83d\ud83d")"}) {
            CAPTURE(bad);
            std::string error;
            REQUIRE(from_json(bad, &error).is_null());
            REQUIRE_FALSE(error.empty());
        }
        // Code points on either side of the surrogate range still decode
        REQUIRE(from_json(R"("\ud7ff")") == Value{"\xED\x9F\xBF"});
        REQUIRE(from_json(R"("\ue000")") == Value{"\xEE\x80\x80"});
    }

    SECTION("containers") {
        auto v = from_json(R"({"a": [1, {"b": null}], "c": true})");
        REQUIRE(v == Value::map({{"a", Value::vector({1, Value::map({{"b", Value{}}})})}, {"c", true}}));
        REQUIRE(from_json("[]").is_vector());
        REQUIRE(from_json("{}").is_map());
    }

    SECTION("errors") {
        std::string error;
        REQUIRE(from_json("{\"a\":}", &error).is_null());
        REQUIRE_FALSE(error.empty());

        error.clear();
        (void)from_json("[1] x", &error);
        REQUIRE_FALSE(error.empty());

        error.clear();
        (void)from_json("", &error);
        REQUIRE_FALSE(error.empty());
    }

    SECTION("text round trip keeps number kinds") {
        auto v = Value::map({{"i", 3}, {"d", 3.0}, {"s", "x"}, {"l", Value::vector({Value{}, false})}});
        auto back = from_json(to_json(v, true));
        REQUIRE(back == v);
        REQUIRE(back.at("i").is<std::int64_t>());
        REQUIRE(back.at("d").is<double>());
    }
}

TEST_CASE("from_json nesting limit", "[serialization]") {
    auto nested_arrays = [](std::size_t depth) {
        return std::string(depth, '[') + std::string(depth, ']');
    };

    SECTION("deeply nested input fails cleanly") {
        std::string error;
        REQUIRE(from_json(nested_arrays(10000), &error).is_null());
        REQUIRE(error.find("max depth") != std::string::npos);
        REQUIRE_THROWS_AS(JsonLoader{}.load(nested_arrays(10000)), ParseError);

        std::string objects;
        for (int i = 0; i < 10000; ++i) objects += R"({"k":)";
        objects += "1";
        objects += std::string(10000, '}');
        REQUIRE_THROWS_AS(JsonLoader{}.load(objects), ParseError);
    }

    SECTION("limit counts containers") {
        REQUIRE(from_json(nested_arrays(JSONDELTA_DEFAULT_MAX_DEPTH)).is_vector());

        JsonLoader shallow{3};
        REQUIRE(shallow.load("[[[1]]]") == Value::vector({Value::vector({Value::vector({1})})}));
        REQUIRE(shallow.load(R"({"a":[{"b":1}]})").is_map());
        REQUIRE_THROWS_AS(shallow.load("[[[[1]]]]"), ParseError);
        REQUIRE_THROWS_AS(shallow.load(R"({"a":[{"b":[]}]})"), ParseError);
        // Siblings do not add up
        REQUIRE(shallow.load("[[[1]],[[2]],[[3]]]").is_vector());
    }
}

// ============================================================
// Loader / Dumper
// ============================================================

TEST_CASE("JsonLoader and JsonDumper", "[serialization]") {
    JsonLoader loader;

    SECTION("loader throws on malformed input") {
        REQUIRE(loader.load("[1, 2]") == Value::vector({1, 2}));
        REQUIRE_THROWS_AS(loader.load("[1, 2"), ParseError);
        REQUIRE_THROWS_AS(loader.load(""), ParseError);
        REQUIRE_THROWS_AS(loader.load("nul"), ParseError);
        REQUIRE_THROWS_AS(loader.load("[01]"), ParseError);
    }

    SECTION("dumper defaults to compact output") {
        JsonDumper dumper;
        REQUIRE(dumper.dump(Value::vector({1, "a"})) == R"([1,"a"])");
    }

    SECTION("dumper options") {
        JsonDumper sorted{true, true};
        REQUIRE(sorted.dump(Value::map({{"z", 1}, {"a", 2}})) == R"({"a":2,"z":1})");
        JsonDumper pretty{false};
        REQUIRE(pretty.dump(Value::vector({})) == "[]");
    }

    SECTION("used through the base classes") {
        const Loader& l = loader;
        JsonDumper dumper;
        const Dumper& d = dumper;
        REQUIRE(d.dump(l.load(R"({"x":1})")) == R"({"x":1})");
    }
}
