// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sequence_aligner.h
/// @brief Weighted LCS alignment of two ordered sequences.
///
/// The aligner fills the table
///
///   C[i][j] = max(C[i][j-1], C[i-1][j], C[i-1][j-1] + sim(X[i-1], Y[j-1]))
///
/// and backtracks from (m, n) into an edit script of matches, insertions
/// and deletions that covers every element of X and Y exactly once.
/// A pair is only matched when its similarity is strictly positive.
///
/// Usage:
/// @code
///   auto sim = [](int a, int b) { return a == b ? 1.0 : 0.0; };
///   std::vector<int> x{1, 2, 3}, y{1, 3, 4};
///   auto script = SequenceAligner::align(x, y, sim);
///   // Match(0,0) Delete(1) Match(2,1) Insert(2)
/// @endcode

#pragma once

#include "concepts.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace jsondelta {

enum class EditOp : std::uint8_t {
    Match,   ///< X[source_pos] aligned with Y[target_pos]
    Insert,  ///< Y[target_pos] has no counterpart in X
    Delete   ///< X[source_pos] has no counterpart in Y
};

struct Edit {
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    EditOp op;
    std::size_t source_pos = npos;  ///< npos for Insert
    std::size_t target_pos = npos;  ///< npos for Delete
    double similarity = 0.0;        ///< 0 for Insert / Delete
};

class SequenceAligner {
public:
    /// Align two random-access sequences.
    /// @param x     source sequence (size(), operator[])
    /// @param y     target sequence
    /// @param sim   pairwise similarity in [0,1]; called once per (i, j) pair
    /// @return edit script in forward order
    template <typename Seq, typename Fn>
        requires SimilarityFunction<Fn, typename Seq::value_type>
    [[nodiscard]] static std::vector<Edit> align(const Seq& x, const Seq& y, Fn&& sim)
    {
        const std::size_t m = x.size();
        const std::size_t n = y.size();

        // Pairwise similarities, reused by the backtrack
        std::vector<double> pair(m * n, 0.0);
        auto s_at = [&](std::size_t i, std::size_t j) -> double& { return pair[i * n + j]; };

        // (m+1) x (n+1), row 0 and column 0 stay zero
        std::vector<double> table((m + 1) * (n + 1), 0.0);
        auto c_at = [&](std::size_t i, std::size_t j) -> double& { return table[i * (n + 1) + j]; };

        for (std::size_t i = 1; i <= m; ++i) {
            for (std::size_t j = 1; j <= n; ++j) {
                const double s = static_cast<double>(sim(x[i - 1], y[j - 1]));
                s_at(i - 1, j - 1) = s;
                double best = c_at(i, j - 1);
                if (c_at(i - 1, j) > best) best = c_at(i - 1, j);
                if (c_at(i - 1, j - 1) + s > best) best = c_at(i - 1, j - 1) + s;
                c_at(i, j) = best;
            }
        }

        std::vector<Edit> script;
        script.reserve(m + n);

        std::size_t i = m;
        std::size_t j = n;
        while (i > 0 || j > 0) {
            if (i > 0 && j > 0) {
                const double s = s_at(i - 1, j - 1);
                if (s > 0.0 && c_at(i, j) == c_at(i - 1, j - 1) + s) {
                    script.push_back(Edit{EditOp::Match, i - 1, j - 1, s});
                    --i;
                    --j;
                    continue;
                }
            }
            if (j > 0 && (i == 0 || c_at(i, j - 1) >= c_at(i - 1, j))) {
                script.push_back(Edit{EditOp::Insert, Edit::npos, j - 1, 0.0});
                --j;
                continue;
            }
            script.push_back(Edit{EditOp::Delete, i - 1, Edit::npos, 0.0});
            --i;
        }

        return {script.rbegin(), script.rend()};
    }
};

} // namespace jsondelta
