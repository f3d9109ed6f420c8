// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief The JSON value model diffed and patched by jsondelta.
///
/// A Value is one of:
/// - Scalars: null (std::monostate), bool, int64, double, string
/// - Containers (immer persistent containers, so copies are O(1)):
///   - ValueMap:    string keys, iteration order not significant
///   - ValueVector: ordered sequence, duplicates allowed
///   - ValueArray:  fixed-length ordered sequence (tuple-like)
///   - ValueSet:    unordered, elements hashed with ValueHash
///
/// int64 and double compare numerically (1 == 1.0), and hash accordingly.
/// A ValueVector never equals a ValueArray, even with the same elements.

#pragma once

#include "jsondelta_config.h"
#include "api.h"
#include "concepts.h"

#include <immer/array.hpp>
#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/set.hpp>
#include <immer/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// ============================================================
// Verbose Logging Configuration
//
// When JSONDELTA_VERBOSE_LOG is non-zero, failed lookups and rejected
// patches are reported on stderr before the error is raised.
//
// Enabled by default in debug builds, disabled with NDEBUG.
// ============================================================

#ifndef JSONDELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSONDELTA_VERBOSE_LOG 0
#  else
#    define JSONDELTA_VERBOSE_LOG 1
#  endif
#endif

namespace jsondelta {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONDELTA_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// ============================================================
// Memory Policy
// ============================================================

#if JSONDELTA_SINGLE_THREADED
/// Non-atomic refcount + no locks (see jsondelta_config.h)
using memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;
#else
/// Atomic refcount + spinlock-protected free list
using memory_policy = immer::default_memory_policy;
#endif

// Forward declaration
struct Value;

using ValueBox = immer::box<Value, memory_policy>;

/// Hash consistent with Value equality (numbers by numeric value,
/// maps and sets independent of iteration order)
struct JSONDELTA_API ValueHash {
    [[nodiscard]] std::size_t operator()(const Value& val) const noexcept;
    [[nodiscard]] std::size_t operator()(const ValueBox& box) const noexcept;
};

using ValueMap = immer::map<std::string,
                            ValueBox,
                            std::hash<std::string>,
                            std::equal_to<std::string>,
                            memory_policy>;

using ValueVector = immer::vector<ValueBox, memory_policy>;

using ValueArray = immer::array<ValueBox, memory_policy>;

using ValueSet = immer::set<ValueBox,
                            ValueHash,
                            std::equal_to<ValueBox>,
                            memory_policy>;

struct JSONDELTA_API Value
{
    std::variant<bool,
                 std::int64_t,
                 double,
                 std::string,
                 ValueMap,
                 ValueVector,
                 ValueArray,
                 ValueSet,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}

    template <IntegerType T>
    Value(T v) noexcept : data(static_cast<std::int64_t>(v)) {}

    template <FloatingType T>
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueArray v) : data(std::move(v)) {}
    Value(ValueSet v) : data(std::move(v)) {}

    // Factory functions for container types
    [[nodiscard]] static Value map(std::initializer_list<std::pair<std::string, Value>> init);
    [[nodiscard]] static Value vector(std::initializer_list<Value> init);
    [[nodiscard]] static Value array(std::initializer_list<Value> init);
    [[nodiscard]] static Value set(std::initializer_list<Value> init);

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<ValueMap>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueArray>(); }
    [[nodiscard]] bool is_set() const noexcept { return is<ValueSet>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<std::int64_t>() || is<double>(); }
    [[nodiscard]] bool is_sequence() const noexcept { return is_vector() || is_array(); }

    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value at(std::size_t index) const;

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<std::int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) return m->count(key) > 0;
        return false;
    }

    /// Element count for containers, 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;
};

// ============================================================
// Comparison and hashing
// ============================================================

JSONDELTA_API bool operator==(const Value& a, const Value& b);

inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

[[nodiscard]] JSONDELTA_API std::size_t hash_value(const Value& val) noexcept;

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable form used in diagnostics ("{map:3}", "\"abc\"", ...)
[[nodiscard]] JSONDELTA_API std::string value_to_string(const Value& val);

/// Shape name used in error messages ("map", "vector", "array", "set", "scalar")
[[nodiscard]] JSONDELTA_API std::string_view shape_name(const Value& val) noexcept;

JSONDELTA_API std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace jsondelta
