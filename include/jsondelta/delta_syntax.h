// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file delta_syntax.h
/// @brief Pluggable policy that shapes diff results into deltas and applies them.
///
/// The comparator computes *what* changed (SetChanges, SequenceChanges,
/// MapChanges plus a similarity score); a DeltaSyntax decides how that is
/// written down, and is the only component that can read it back.
///
/// Built-in syntaxes:
/// - "compact"   (CompactSyntax, default): smallest delta; patch only.
/// - "symmetric" (SymmetricSyntax): records both sides of every change so
///   that unpatch can rebuild the left-hand value.
///
/// Custom syntaxes derive from DeltaSyntax and are passed to JsonDiffer
/// through DifferOptions::syntax.

#pragma once

#include "delta.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsondelta {

// ============================================================
// Change sets handed to the emit_* hooks
// ============================================================

struct SetChanges {
    std::vector<Value> added;    ///< B - A
    std::vector<Value> removed;  ///< A - B
};

struct SequenceChanges {
    /// (target position, value), ascending
    std::vector<std::pair<std::size_t, Value>> inserted;
    /// (target position, nested delta) for matched pairs with s < 1, ascending
    std::vector<std::pair<std::size_t, Delta>> changed;
    /// (source position, value), ascending
    std::vector<std::pair<std::size_t, Value>> deleted;
};

struct MapChanges {
    std::vector<std::pair<std::string, Value>> added;
    std::vector<std::pair<std::string, Delta>> changed;
    std::vector<std::pair<std::string, Value>> removed;
};

// ============================================================
// PatchContext
// ============================================================

/// Recursion bookkeeping for patch / unpatch.
class JSONDELTA_API PatchContext {
public:
    explicit PatchContext(std::size_t max_depth) noexcept : max_depth_(max_depth) {}

    /// Context for one level deeper.
    /// @throws DepthLimitError when the limit would be exceeded
    [[nodiscard]] PatchContext nested() const;

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    PatchContext(std::size_t depth, std::size_t max_depth) noexcept
        : depth_(depth), max_depth_(max_depth) {}

    std::size_t depth_ = 0;
    std::size_t max_depth_;
};

// ============================================================
// DeltaSyntax
// ============================================================

class JSONDELTA_API DeltaSyntax {
public:
    virtual ~DeltaSyntax() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual Delta emit_set_diff(const Value& a, const Value& b, double s,
                                const SetChanges& changes) const = 0;

    virtual Delta emit_list_diff(const Value& a, const Value& b, double s,
                                 const SequenceChanges& changes) const = 0;

    virtual Delta emit_dict_diff(const Value& a, const Value& b, double s,
                                 const MapChanges& changes) const = 0;

    virtual Delta emit_value_diff(const Value& a, const Value& b, double s) const = 0;

    /// Apply @p delta to @p base and return the new value
    virtual Value patch(const PatchContext& ctx, const Value& base, const Delta& delta) const = 0;

    /// Reconstruct the base from @p target and the delta that produced it
    /// @throws IrreversibleDeltaError if the syntax did not record enough
    virtual Value unpatch(const PatchContext& ctx, const Value& target, const Delta& delta) const = 0;
};

/// Minimal delta: full replacements carry only the new value, removed
/// values are dropped, added map keys are merged with changed ones.
class JSONDELTA_API CompactSyntax final : public DeltaSyntax {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "compact"; }

    Delta emit_set_diff(const Value& a, const Value& b, double s,
                        const SetChanges& changes) const override;
    Delta emit_list_diff(const Value& a, const Value& b, double s,
                         const SequenceChanges& changes) const override;
    Delta emit_dict_diff(const Value& a, const Value& b, double s,
                         const MapChanges& changes) const override;
    Delta emit_value_diff(const Value& a, const Value& b, double s) const override;

    Value patch(const PatchContext& ctx, const Value& base, const Delta& delta) const override;

    /// Only the empty delta and set deltas can be inverted
    Value unpatch(const PatchContext& ctx, const Value& target, const Delta& delta) const override;
};

/// Reversible delta: replacements are [old, new], insertions and deletions
/// carry their values, map insertions are kept apart from changes.
class JSONDELTA_API SymmetricSyntax final : public DeltaSyntax {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "symmetric"; }

    Delta emit_set_diff(const Value& a, const Value& b, double s,
                        const SetChanges& changes) const override;
    Delta emit_list_diff(const Value& a, const Value& b, double s,
                         const SequenceChanges& changes) const override;
    Delta emit_dict_diff(const Value& a, const Value& b, double s,
                         const MapChanges& changes) const override;
    Delta emit_value_diff(const Value& a, const Value& b, double s) const override;

    Value patch(const PatchContext& ctx, const Value& base, const Delta& delta) const override;
    Value unpatch(const PatchContext& ctx, const Value& target, const Delta& delta) const override;
};

/// Look up a built-in syntax by name ("compact" or "symmetric").
/// @throws ConfigError for any other name
[[nodiscard]] JSONDELTA_API std::shared_ptr<const DeltaSyntax> builtin_syntax(std::string_view name);

} // namespace jsondelta
