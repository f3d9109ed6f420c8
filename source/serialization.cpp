// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// serialization.cpp - JSON text encoding and the built-in loader / dumper

#include <jsondelta/serialization.h>
#include <jsondelta/builders.h>
#include <jsondelta/errors.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace jsondelta {

namespace {

// ============================================================
// Writer
// ============================================================

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// Shortest text that reads back to the same double; always marked as a
// floating-point number so that 2.0 does not come back as int64 2
void write_double(double d, std::ostringstream& oss)
{
    if (!std::isfinite(d)) {
        oss << "null";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text(buf, static_cast<std::size_t>(ptr - buf));
    oss << text;
    if (text.find_first_of(".eE") == std::string_view::npos) {
        oss << ".0";
    }
}

struct WriteOptions {
    bool compact;
    bool sort_keys;
};

void to_json_impl(const Value& val, std::ostringstream& oss, const WriteOptions& opts, int indent_level);

template <typename Range>
void write_elements(const Range& elements, std::ostringstream& oss, const WriteOptions& opts, int indent_level)
{
    const std::string indent = opts.compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = opts.compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = opts.compact ? "" : "\n";

    if (elements.size() == 0) {
        oss << "[]";
        return;
    }
    oss << "[" << newline;
    bool first = true;
    for (const auto& v : elements) {
        if (!first) oss << "," << newline;
        first = false;
        oss << child_indent;
        to_json_impl(v.get(), oss, opts, indent_level + 1);
    }
    oss << newline << indent << "]";
}

void write_map(const ValueMap& map, std::ostringstream& oss, const WriteOptions& opts, int indent_level)
{
    const std::string indent = opts.compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = opts.compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = opts.compact ? "" : "\n";
    const std::string space_after_colon = opts.compact ? "" : " ";

    if (map.size() == 0) {
        oss << "{}";
        return;
    }

    std::vector<const std::string*> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) keys.push_back(&k);
    if (opts.sort_keys) {
        std::sort(keys.begin(), keys.end(),
                  [](const std::string* l, const std::string* r) { return *l < *r; });
    }

    oss << "{" << newline;
    bool first = true;
    for (const auto* k : keys) {
        if (!first) oss << "," << newline;
        first = false;
        oss << child_indent << "\"" << json_escape_string(*k) << "\":" << space_after_colon;
        to_json_impl(map.find(*k)->get(), oss, opts, indent_level + 1);
    }
    oss << newline << indent << "}";
}

void to_json_impl(const Value& val, std::ostringstream& oss, const WriteOptions& opts, int indent_level)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            write_double(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            write_map(arg, oss, opts, indent_level);
        } else {
            // ValueVector, ValueArray and ValueSet all become JSON arrays
            write_elements(arg, oss, opts, indent_level);
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    JsonParser(std::string_view json, std::size_t max_depth)
        : json_(json), pos_(0), depth_(0), max_depth_(max_depth) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing characters at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_;
    std::size_t max_depth_;

    // Tracks container nesting for one parse_object / parse_array call
    class DepthGuard {
    public:
        explicit DepthGuard(JsonParser& parser) : parser_(parser) {
            if (parser_.depth_ >= parser_.max_depth_) {
                throw std::runtime_error("Nesting exceeds max depth " + std::to_string(parser_.max_depth_) +
                                         " at position " + std::to_string(parser_.pos_));
            }
            ++parser_.depth_;
        }
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        JsonParser& parser_;
    };

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object() {
        DepthGuard guard(*this);
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        MapBuilder builder;
        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            builder.set(key, parse_value());

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }
        return builder.finish();
    }

    Value parse_array() {
        DepthGuard guard(*this);
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        VectorBuilder builder;
        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }
        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, codepoint, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return codepoint;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Unexpected end of string escape");
            }
            char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned codepoint = parse_hex4();
                    if (codepoint >= 0xDC00 && codepoint < 0xE000) {
                        throw std::runtime_error("Unpaired low surrogate at position " + std::to_string(pos_));
                    }
                    if (codepoint >= 0xD800 && codepoint < 0xDC00) {
                        if (json_.substr(pos_, 2) != "\\u") {
                            throw std::runtime_error("Unpaired high surrogate at position " + std::to_string(pos_));
                        }
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        if (low < 0xDC00 || low >= 0xE000) {
                            throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    bool at_digit() const {
        return std::isdigit(static_cast<unsigned char>(peek())) != 0;
    }

    void consume_digits() {
        while (at_digit()) consume();
    }

    // -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
    Value parse_number() {
        const std::size_t start = pos_;
        auto invalid = [&]() {
            return std::runtime_error("Invalid number '" + std::string(json_.substr(start, pos_ - start + 1)) +
                                      "' at position " + std::to_string(start));
        };

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
            if (at_digit()) throw invalid();
        } else if (at_digit()) {
            consume_digits();
        } else {
            throw invalid();
        }

        bool has_fraction = false;
        if (peek() == '.') {
            has_fraction = true;
            consume();
            if (!at_digit()) throw invalid();
            consume_digits();
        }

        bool has_exponent = false;
        if (peek() == 'e' || peek() == 'E') {
            has_exponent = true;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!at_digit()) throw invalid();
            consume_digits();
        }

        std::string num_str(json_.substr(start, pos_ - start));

        if (!has_fraction && !has_exponent) {
            std::int64_t val = 0;
            auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), val);
            if (ec == std::errc{} && ptr == num_str.data() + num_str.size()) {
                return Value{val};
            }
        }
        // Integers beyond int64 and all fractional forms
        return Value{std::stod(num_str)};
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact, bool sort_keys)
{
    std::ostringstream oss;
    to_json_impl(val, oss, WriteOptions{compact, sort_keys}, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out, std::size_t max_depth)
{
    JsonParser parser(json_str, max_depth);
    return parser.parse(error_out);
}

// ============================================================
// JsonLoader / JsonDumper
// ============================================================

Value JsonLoader::load(std::string_view text) const
{
    std::string error;
    Value result = from_json(text, &error, max_depth_);
    if (!error.empty()) {
        detail::log_access_error("JsonLoader::load", error);
        throw ParseError("invalid JSON: " + error);
    }
    return result;
}

std::string JsonDumper::dump(const Value& value) const
{
    return to_json(value, compact_, sort_keys_);
}

} // namespace jsondelta
