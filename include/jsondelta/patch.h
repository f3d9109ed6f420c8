// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief Applies and reverts deltas through a DeltaSyntax.
///
/// PatchEngine is the entry point used by JsonDiffer: it owns the depth
/// guard and forwards to the syntax, which recurses on its own through
/// PatchContext::nested().
///
/// Patching never mutates its inputs: every container is rebuilt, so a
/// failed patch leaves nothing half-applied.
///
/// The detail:: helpers decode the building blocks that the built-in
/// syntaxes share (position lists, insert entries, sequence rebuilding).

#pragma once

#include "delta_syntax.h"

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace jsondelta {

class JSONDELTA_API PatchEngine {
public:
    explicit PatchEngine(std::shared_ptr<const DeltaSyntax> syntax,
                         std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH);

    /// base + delta -> target
    [[nodiscard]] Value apply(const Value& base, const Delta& delta) const;

    /// target - delta -> base
    [[nodiscard]] Value revert(const Value& target, const Delta& delta) const;

    [[nodiscard]] const DeltaSyntax& syntax() const noexcept { return *syntax_; }

private:
    std::shared_ptr<const DeltaSyntax> syntax_;
    std::size_t max_depth_;
};

namespace detail {

/// Elements of a sequence payload (a delta holding a vector or array value).
/// @throws InvalidDeltaError if the payload is anything else
[[nodiscard]] JSONDELTA_API std::vector<Value> payload_list(const Delta& payload, std::string_view what);

/// A non-negative integer position taken from a payload element
/// @throws InvalidDeltaError if @p v is not one
[[nodiscard]] JSONDELTA_API std::size_t payload_position(const Value& v, std::string_view what);

/// A sequence position taken from a delta key
/// @throws InvalidDeltaError on marker keys and non-numeric strings
[[nodiscard]] JSONDELTA_API std::size_t key_position(const DeltaKey& key, std::string_view what);

/// Decode a list of [position, value] pairs, sorted by position (stable)
[[nodiscard]] JSONDELTA_API std::vector<std::pair<std::size_t, Value>>
positioned_entries(const Delta& payload, std::string_view what);

/// Remove @p positions (indices into @p items as given) from @p items.
/// @throws OutOfRangeError past the end, InvalidDeltaError on duplicates
JSONDELTA_API void erase_positions(std::vector<ValueBox>& items, std::vector<std::size_t> positions,
                                   std::string_view what);

/// Insert entries in ascending position order.
/// @throws OutOfRangeError when a position is past the current end
JSONDELTA_API void insert_entries(std::vector<ValueBox>& items,
                                  const std::vector<std::pair<std::size_t, Value>>& entries,
                                  std::string_view what);

/// Elements of a vector or array
[[nodiscard]] JSONDELTA_API std::vector<ValueBox> sequence_items(const Value& seq);

/// Rebuild a sequence of the same kind (vector / array) as @p like
[[nodiscard]] JSONDELTA_API Value rebuild_sequence(const Value& like, const std::vector<ValueBox>& items);

/// Remove then add elements of a set
[[nodiscard]] JSONDELTA_API Value edit_set(const Value& base,
                                           const std::vector<Value>& remove,
                                           const std::vector<Value>& add);

/// Log and throw InvalidDeltaError
[[noreturn]] JSONDELTA_API void reject_delta(std::string_view func, const std::string& message);

} // namespace detail

} // namespace jsondelta
