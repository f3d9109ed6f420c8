// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file delta.h
/// @brief Reserved markers and the Delta tree produced by diff.
///
/// A Delta is either:
/// - a plain Value: a verbatim replacement of whatever it is applied to, or
/// - a DeltaMap: keys are user strings (map keys, or sequence positions
///   written as decimal strings) or reserved Markers; values are nested
///   Deltas.
///
/// Canonical form: a Value that is itself a map is always lifted into a
/// DeltaMap with string keys, so that a delta keeps the shape of the plain
/// JSON it is marshaled to. to_value() lowers it back.
///
/// The empty DeltaMap means "no change".

#pragma once

#include "value.h"

#include <immer/map_transient.hpp>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondelta {

// ============================================================
// Markers
// ============================================================

/// Reserved delta-structuring symbols. Never equal to any user value and
/// never produced by loading user data; the marshaling layer is the only
/// place they turn into strings.
enum class Marker : std::uint8_t {
    Add,
    Delete,
    Discard,
    Insert,
    Replace,
    Missing  ///< comparison-only sentinel, never emitted
};

inline constexpr std::array<Marker, 6> all_markers = {
    Marker::Add, Marker::Delete, Marker::Discard,
    Marker::Insert, Marker::Replace, Marker::Missing
};

[[nodiscard]] constexpr std::string_view marker_label(Marker m) noexcept
{
    switch (m) {
        case Marker::Add:     return "add";
        case Marker::Delete:  return "delete";
        case Marker::Discard: return "discard";
        case Marker::Insert:  return "insert";
        case Marker::Replace: return "replace";
        case Marker::Missing: return "missing";
    }
    return "missing";
}

// ============================================================
// Delta tree
// ============================================================

using DeltaKey = std::variant<Marker, std::string>;

// Forward declaration
struct Delta;

using DeltaBox = immer::box<Delta, memory_policy>;

using DeltaMap = immer::map<DeltaKey,
                            DeltaBox,
                            std::hash<DeltaKey>,
                            std::equal_to<DeltaKey>,
                            memory_policy>;

struct JSONDELTA_API Delta
{
    std::variant<DeltaMap, Value> data;

    /// The empty delta ("no change")
    Delta() : data(DeltaMap{}) {}
    Delta(DeltaMap m) : data(std::move(m)) {}

    /// Wraps a plain value; a map value is lifted into a DeltaMap
    Delta(const Value& v);

    /// Build a DeltaMap from key/delta pairs
    /// @code
    ///   Delta d = Delta::object({{"b", Value{3}}, {Marker::Delete, Value::vector({"c"})}});
    /// @endcode
    [[nodiscard]] static Delta object(std::initializer_list<std::pair<DeltaKey, Delta>> init);

    [[nodiscard]] bool is_map() const noexcept { return std::holds_alternative<DeltaMap>(data); }
    [[nodiscard]] bool is_value() const noexcept { return std::holds_alternative<Value>(data); }

    /// True for the "no change" delta
    [[nodiscard]] bool is_empty() const noexcept {
        auto* m = std::get_if<DeltaMap>(&data);
        return m && m->empty();
    }

    [[nodiscard]] const DeltaMap* as_map() const noexcept { return std::get_if<DeltaMap>(&data); }
    [[nodiscard]] const Value* as_value() const noexcept { return std::get_if<Value>(&data); }

    [[nodiscard]] const Delta* find(const DeltaKey& key) const;
    [[nodiscard]] bool contains(Marker m) const { return find(DeltaKey{m}) != nullptr; }

    /// True if any key of the top-level map is a marker
    [[nodiscard]] bool has_markers() const;

    /// Lower the delta back into a plain Value.
    /// @throws InvalidDeltaError if a marker key is found at any depth
    [[nodiscard]] Value to_value() const;
};

JSONDELTA_API bool operator==(const Delta& a, const Delta& b);

inline bool operator!=(const Delta& a, const Delta& b) { return !(a == b); }

/// Builder for DeltaMap using immer's transient API
class DeltaMapBuilder {
public:
    DeltaMapBuilder() : transient_(DeltaMap{}.transient()) {}

    DeltaMapBuilder(DeltaMapBuilder&&) noexcept = default;
    DeltaMapBuilder& operator=(DeltaMapBuilder&&) noexcept = default;
    DeltaMapBuilder(const DeltaMapBuilder&) = delete;
    DeltaMapBuilder& operator=(const DeltaMapBuilder&) = delete;

    DeltaMapBuilder& set(DeltaKey key, Delta val) {
        transient_.set(std::move(key), DeltaBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool empty() const { return transient_.size() == 0; }

    [[nodiscard]] Delta finish() { return Delta{transient_.persistent()}; }

private:
    DeltaMap::transient_type transient_;
};

// ============================================================
// Sequence positions
// ============================================================

/// Sequence positions are written as decimal string keys, as on the wire
[[nodiscard]] JSONDELTA_API std::string position_key(std::size_t pos);

/// Parse a decimal position key; nullopt if it is not a plain non-negative integer
[[nodiscard]] JSONDELTA_API std::optional<std::size_t> parse_position(std::string_view key) noexcept;

/// Readable text form for diagnostics; markers print as <label>
[[nodiscard]] JSONDELTA_API std::string delta_to_string(const Delta& delta);

JSONDELTA_API std::ostream& operator<<(std::ostream& os, const Delta& delta);

} // namespace jsondelta
