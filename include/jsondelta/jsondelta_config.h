// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file jsondelta_config.h
/// @brief Compile-time configuration for jsondelta and immer.
///
/// Every public jsondelta header includes this file first so that immer is
/// always configured the same way in every translation unit.
///
/// @warning Include jsondelta headers before any direct immer include.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSONDELTA_CONFIGURED)
#error "immer headers were included before jsondelta/jsondelta_config.h. " \
       "Please include jsondelta headers before any direct immer includes."
#endif

#define JSONDELTA_CONFIGURED 1

// ============================================================
// Threading model
// ============================================================

/// @brief Select the Value memory policy.
///
/// 0 (default): atomic reference counts. Values and deltas may be shared
///              between threads, which lets one JsonDiffer serve concurrent
///              callers handing it independent or shared inputs.
/// 1:           non-atomic reference counts and no free-list locking.
///              Faster, but a Value tree must stay on the thread that built it.
#ifndef JSONDELTA_SINGLE_THREADED
#define JSONDELTA_SINGLE_THREADED 0
#endif

#if JSONDELTA_SINGLE_THREADED && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer settings
// ============================================================

/// @brief Drop the per-node type tags used only by immer's assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Recursion limit
// ============================================================

/// @brief Default nesting limit for diff and patch.
///
/// Both walk the input recursively; the limit turns adversarially deep input
/// into a DepthLimitError instead of a stack overflow. Overridable per
/// JsonDiffer through DifferOptions::max_depth.
#ifndef JSONDELTA_DEFAULT_MAX_DEPTH
#define JSONDELTA_DEFAULT_MAX_DEPTH 512
#endif

#ifdef JSONDELTA_CONFIG_VERBOSE
#if JSONDELTA_SINGLE_THREADED
#pragma message("jsondelta: single-threaded memory policy")
#else
#pragma message("jsondelta: thread-safe memory policy")
#endif
#endif
