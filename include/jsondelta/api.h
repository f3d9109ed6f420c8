// api.h - Symbol visibility macros for jsondelta

#pragma once

/// @file api.h
/// @brief Export/import decoration for the jsondelta library.
///
/// The build defines JSONDELTA_SHARED (public) and JSONDELTA_EXPORTS (private)
/// when jsondelta is built as a shared library. In a static build neither is
/// defined and JSONDELTA_API expands to nothing.
///
/// @code
/// class JSONDELTA_API JsonDiffer { ... };
/// JSONDELTA_API Delta diff(const Value& a, const Value& b);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSONDELTA_SHARED
        #ifdef JSONDELTA_EXPORTS
            #define JSONDELTA_API __declspec(dllexport)
        #else
            #define JSONDELTA_API __declspec(dllimport)
        #endif
    #else
        #define JSONDELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // Sources are compiled with -fvisibility=hidden in shared builds
    #if defined(JSONDELTA_SHARED) && defined(JSONDELTA_EXPORTS)
        #define JSONDELTA_API __attribute__((visibility("default")))
    #else
        #define JSONDELTA_API
    #endif
#else
    #define JSONDELTA_API
#endif
