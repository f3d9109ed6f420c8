// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_diff.cpp - ValueComparator: map, sequence, set and scalar diff

#include <jsondelta/value_diff.h>
#include <jsondelta/errors.h>
#include <jsondelta/sequence_aligner.h>
#include <jsondelta/set_matcher.h>

#include <string>
#include <vector>

namespace jsondelta {

Comparison ValueComparator::compare(const Value& a, const Value& b) const
{
    return compare_impl(a, b, 0, true);
}

double ValueComparator::similarity(const Value& a, const Value& b) const
{
    return compare_impl(a, b, 0, false).similarity;
}

Comparison ValueComparator::compare_impl(const Value& a, const Value& b,
                                         std::size_t depth, bool emit) const
{
    if (depth > max_depth_) {
        detail::log_access_error("ValueComparator::compare",
                                 "nesting exceeds max depth " + std::to_string(max_depth_));
        throw DepthLimitError(max_depth_);
    }

    // Fast path: the same object (this includes elements shared between
    // two containers through the same immer box)
    if (&a == &b) {
        return Comparison{emit ? syntax_.emit_value_diff(a, b, 1.0) : Delta{}, 1.0};
    }

    if (a.is_map() && b.is_map()) {
        return compare_maps(a, b, depth, emit);
    }
    if (a.is_vector() && b.is_vector()) {
        return compare_sequences<ValueVector>(a, b, depth, emit);
    }
    if (a.is_array() && b.is_array()) {
        return compare_sequences<ValueArray>(a, b, depth, emit);
    }
    if (a.is_set() && b.is_set()) {
        return compare_sets(a, b, depth, emit);
    }
    return compare_scalars(a, b, emit);
}

// ============================================================
// Maps
// ============================================================

Comparison ValueComparator::compare_maps(const Value& a, const Value& b,
                                         std::size_t depth, bool emit) const
{
    const auto& lhs = std::get<ValueMap>(a.data);
    const auto& rhs = std::get<ValueMap>(b.data);

    MapChanges changes;
    std::size_t n_removed = 0;
    std::size_t n_matched = 0;
    std::size_t n_added = 0;
    double s_matched = 0.0;

    for (const auto& [k, v] : lhs) {
        auto* other = rhs.find(k);
        if (!other) {
            ++n_removed;
            if (emit) changes.removed.emplace_back(k, v.get());
            continue;
        }
        ++n_matched;
        auto child = compare_impl(v.get(), other->get(), depth + 1, emit);
        if (emit && child.similarity < 1.0) {
            changes.changed.emplace_back(k, std::move(child.delta));
        }
        s_matched += 0.5 + 0.5 * child.similarity;
    }

    for (const auto& [k, v] : rhs) {
        if (!lhs.count(k)) {
            ++n_added;
            if (emit) changes.added.emplace_back(k, v.get());
        }
    }

    const std::size_t n_total = n_removed + n_matched + n_added;
    const double s = n_total == 0 ? 1.0 : s_matched / static_cast<double>(n_total);
    return Comparison{emit ? syntax_.emit_dict_diff(a, b, s, changes) : Delta{}, s};
}

// ============================================================
// Sequences
// ============================================================

template <typename Seq>
Comparison ValueComparator::compare_sequences(const Value& a, const Value& b,
                                              std::size_t depth, bool emit) const
{
    const auto& x = std::get<Seq>(a.data);
    const auto& y = std::get<Seq>(b.data);

    auto sim = [this, depth](const ValueBox& l, const ValueBox& r) {
        return compare_impl(l.get(), r.get(), depth + 1, false).similarity;
    };
    const auto script = SequenceAligner::align(x, y, sim);

    SequenceChanges changes;
    std::size_t n_inserted = 0;
    double s_total = 0.0;

    for (const auto& edit : script) {
        switch (edit.op) {
            case EditOp::Insert:
                ++n_inserted;
                if (emit) changes.inserted.emplace_back(edit.target_pos, y[edit.target_pos].get());
                break;
            case EditOp::Delete:
                if (emit) changes.deleted.emplace_back(edit.source_pos, x[edit.source_pos].get());
                break;
            case EditOp::Match:
                s_total += edit.similarity;
                if (emit && edit.similarity < 1.0) {
                    // Keyed by target position: patch applies positional
                    // changes after deletions and insertions
                    auto child = compare_impl(x[edit.source_pos].get(), y[edit.target_pos].get(),
                                              depth + 1, true);
                    changes.changed.emplace_back(edit.target_pos, std::move(child.delta));
                }
                break;
        }
    }

    const std::size_t n_total = x.size() + n_inserted;
    const double s = n_total == 0 ? 1.0 : s_total / static_cast<double>(n_total);
    return Comparison{emit ? syntax_.emit_list_diff(a, b, s, changes) : Delta{}, s};
}

// ============================================================
// Sets
// ============================================================

Comparison ValueComparator::compare_sets(const Value& a, const Value& b,
                                         std::size_t depth, bool emit) const
{
    const auto& lhs = std::get<ValueSet>(a.data);
    const auto& rhs = std::get<ValueSet>(b.data);

    SetChanges changes;
    for (const auto& v : lhs) {
        if (!rhs.count(v)) changes.removed.push_back(v.get());
    }
    for (const auto& v : rhs) {
        if (!lhs.count(v)) changes.added.push_back(v.get());
    }

    if (changes.removed.empty() && changes.added.empty()) {
        return Comparison{Delta{}, 1.0};
    }

    auto sim = [this, depth](const Value& l, const Value& r) {
        return compare_impl(l, r, depth + 1, false).similarity;
    };
    const auto match = SetMatcher::match(lhs.size(), changes.removed, changes.added, sim);

    return Comparison{emit ? syntax_.emit_set_diff(a, b, match.similarity, changes) : Delta{},
                      match.similarity};
}

// ============================================================
// Scalars and mixed shapes
// ============================================================

Comparison ValueComparator::compare_scalars(const Value& a, const Value& b, bool emit) const
{
    const double s = (a == b) ? 1.0 : 0.0;
    return Comparison{emit ? syntax_.emit_value_diff(a, b, s) : Delta{}, s};
}

} // namespace jsondelta
