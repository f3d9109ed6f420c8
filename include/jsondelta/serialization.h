// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text encoding of Values, and the Loader / Dumper capabilities.
///
/// Usage:
/// @code
///   #include <jsondelta/serialization.h>
///
///   Value data = Value::map({{"key", "value"}});
///   std::string json = to_json(data, false);  // pretty-printed
///   Value parsed = from_json(json);
///
///   JsonLoader loader;
///   Value v = loader.load("[1, 2.5, \"x\"]");  // throws ParseError on bad input
/// @endcode
///
/// Mapping:
/// - null, true/false, strings: as is
/// - integers without fraction or exponent: int64 (double if out of range)
/// - other numbers: double
/// - objects: ValueMap, arrays: ValueVector
/// - ValueArray and ValueSet are written as JSON arrays
///
/// Parsing follows the RFC 8259 grammar: numbers such as "01", "1." and
/// "1e" are rejected, as are unpaired UTF-16 surrogates in "\u" escapes and
/// nesting deeper than the configured depth.
///
/// Limitations:
/// - NaN and infinities have no JSON form and are written as null

#pragma once

#include "api.h"
#include "value.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace jsondelta {

// ============================================================
// JSON text
// ============================================================

/// Convert a Value to JSON text
/// @param val       The Value to convert
/// @param compact   true: no whitespace; false: two-space indentation
/// @param sort_keys write map keys in lexicographic order
JSONDELTA_API std::string to_json(const Value& val, bool compact = false, bool sort_keys = false);

/// Parse JSON text to a Value
/// @param json_str  The JSON text to parse
/// @param error_out If provided, receives the error message on failure
/// @param max_depth Deepest allowed object / array nesting
/// @return Parsed Value, or null Value on parse error
JSONDELTA_API Value from_json(std::string_view json_str, std::string* error_out = nullptr,
                              std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH);

// ============================================================
// Injectable codec capabilities
// ============================================================

/// Turns boundary text into a Value
class JSONDELTA_API Loader {
public:
    virtual ~Loader() = default;

    /// @throws ParseError (or any DeltaError) on malformed input
    [[nodiscard]] virtual Value load(std::string_view text) const = 0;
};

/// Turns a Value into boundary text
class JSONDELTA_API Dumper {
public:
    virtual ~Dumper() = default;

    [[nodiscard]] virtual std::string dump(const Value& value) const = 0;
};

class JSONDELTA_API JsonLoader final : public Loader {
public:
    /// @param max_depth Inputs nested deeper than this are rejected with ParseError
    explicit JsonLoader(std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH) noexcept
        : max_depth_(max_depth) {}

    [[nodiscard]] Value load(std::string_view text) const override;

private:
    std::size_t max_depth_;
};

class JSONDELTA_API JsonDumper final : public Dumper {
public:
    explicit JsonDumper(bool compact = true, bool sort_keys = false) noexcept
        : compact_(compact), sort_keys_(sort_keys) {}

    [[nodiscard]] std::string dump(const Value& value) const override;

private:
    bool compact_;
    bool sort_keys_;
};

} // namespace jsondelta
