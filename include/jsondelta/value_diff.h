// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Shape-dispatching structural comparison of two Values.
///
/// ValueComparator walks both operands together and picks an algorithm by
/// their runtime shape:
///
/// | a \ b         | rule                                         |
/// |---------------|----------------------------------------------|
/// | same object   | no change, s = 1                             |
/// | map, map      | per-key diff, matched keys weigh 0.5 + 0.5*s |
/// | vector,vector | weighted LCS (SequenceAligner)               |
/// | array, array  | weighted LCS (SequenceAligner)               |
/// | set, set      | greedy matching (SetMatcher)                 |
/// | anything else | equal: s = 1, else replacement with s = 0    |
///
/// The resulting change sets are handed to a DeltaSyntax, which builds the
/// actual Delta. similarity() runs the same walk but never builds deltas.

#pragma once

#include "delta_syntax.h"

#include <cstddef>

namespace jsondelta {

struct Comparison {
    Delta delta;
    double similarity = 1.0;
};

class JSONDELTA_API ValueComparator {
public:
    /// @param syntax    shapes the emitted deltas; must outlive the comparator
    /// @param max_depth nesting limit, DepthLimitError beyond it
    explicit ValueComparator(const DeltaSyntax& syntax,
                             std::size_t max_depth = JSONDELTA_DEFAULT_MAX_DEPTH) noexcept
        : syntax_(syntax), max_depth_(max_depth) {}

    [[nodiscard]] Comparison compare(const Value& a, const Value& b) const;

    [[nodiscard]] double similarity(const Value& a, const Value& b) const;

private:
    Comparison compare_impl(const Value& a, const Value& b, std::size_t depth, bool emit) const;

    Comparison compare_maps(const Value& a, const Value& b, std::size_t depth, bool emit) const;

    template <typename Seq>
    Comparison compare_sequences(const Value& a, const Value& b, std::size_t depth, bool emit) const;

    Comparison compare_sets(const Value& a, const Value& b, std::size_t depth, bool emit) const;

    Comparison compare_scalars(const Value& a, const Value& b, bool emit) const;

    const DeltaSyntax& syntax_;
    std::size_t max_depth_;
};

} // namespace jsondelta
