// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in jsondelta.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace jsondelta {

// ============================================================
// Scalar Type Concepts
// ============================================================

/// Integral types stored as int64 (bool and character types excluded)
template<typename T>
concept IntegerType = std::integral<std::decay_t<T>> &&
                      !std::is_same_v<std::decay_t<T>, bool> &&
                      !std::is_same_v<std::decay_t<T>, char> &&
                      !std::is_same_v<std::decay_t<T>, char8_t> &&
                      !std::is_same_v<std::decay_t<T>, char16_t> &&
                      !std::is_same_v<std::decay_t<T>, char32_t>;

/// Floating-point types stored as double
template<typename T>
concept FloatingType = std::floating_point<std::decay_t<T>>;

// ============================================================
// Callable Concepts
// ============================================================

/// Pairwise similarity between two elements, a score in [0,1]
template<typename Fn, typename Elem>
concept SimilarityFunction = std::invocable<Fn&, const Elem&, const Elem&> &&
                             std::convertible_to<std::invoke_result_t<Fn&, const Elem&, const Elem&>, double>;

} // namespace jsondelta
