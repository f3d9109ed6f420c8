// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file set_matcher.h
/// @brief Greedy pairing of removed and added set elements.
///
/// Every (removed, added) pair is ranked by similarity, best first, and
/// pairs are committed greedily while both of their elements are still
/// free. The result is not an optimal assignment and depends on the order
/// of the inputs, so similarity(a, b) may differ from similarity(b, a).

#pragma once

#include "concepts.h"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace jsondelta {

struct SetMatch {
    /// (index into removed, index into added) for every committed pair
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    /// Sum of the similarities of the committed pairs
    double greedy_score = 0.0;
    /// (n_common + greedy_score) / (|A| + |added|)
    double similarity = 1.0;
};

class SetMatcher {
public:
    /// @param source_size |A|, the size of the left-hand set
    /// @param removed     elements of A not in B, in iteration order
    /// @param added       elements of B not in A, in iteration order
    template <typename Elem, typename Fn>
        requires SimilarityFunction<Fn, Elem>
    [[nodiscard]] static SetMatch match(std::size_t source_size,
                                        const std::vector<Elem>& removed,
                                        const std::vector<Elem>& added,
                                        Fn&& sim)
    {
        SetMatch result;
        if (removed.empty() && added.empty()) {
            return result;
        }

        struct Candidate {
            double s;
            std::size_t x;
            std::size_t y;
        };

        std::vector<Candidate> ranking;
        ranking.reserve(removed.size() * added.size());
        for (std::size_t x = 0; x < removed.size(); ++x) {
            for (std::size_t y = 0; y < added.size(); ++y) {
                ranking.push_back({static_cast<double>(sim(removed[x], added[y])), x, y});
            }
        }
        // Ties keep generation order
        std::stable_sort(ranking.begin(), ranking.end(),
                         [](const Candidate& l, const Candidate& r) { return l.s > r.s; });

        std::vector<bool> x_taken(removed.size(), false);
        std::vector<bool> y_taken(added.size(), false);
        std::size_t x_left = removed.size();
        std::size_t y_left = added.size();

        for (const auto& c : ranking) {
            if (x_left == 0 || y_left == 0) break;
            if (x_taken[c.x] || y_taken[c.y]) continue;
            x_taken[c.x] = true;
            y_taken[c.y] = true;
            --x_left;
            --y_left;
            result.pairs.emplace_back(c.x, c.y);
            result.greedy_score += c.s;
        }

        const std::size_t n_common = source_size - removed.size();
        const std::size_t n_total = source_size + added.size();
        result.similarity = n_total == 0
            ? 1.0
            : (static_cast<double>(n_common) + result.greedy_score) / static_cast<double>(n_total);
        return result;
    }
};

} // namespace jsondelta
