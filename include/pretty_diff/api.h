// api.h - DLL export/import macros for pretty_diff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the pretty_diff library.
///
/// Usage:
/// - When building pretty_diff as a SHARED library:
///   - CMake defines PRETTY_DIFF_EXPORTS (private) and PRETTY_DIFF_SHARED (public)
///   - Functions/classes marked with PRETTY_DIFF_API will be exported
///
/// - When using pretty_diff as a SHARED library:
///   - Link against the pretty_diff target (CMake propagates PRETTY_DIFF_SHARED)
///   - Functions/classes marked with PRETTY_DIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, PRETTY_DIFF_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PRETTY_DIFF_SHARED
        #ifdef PRETTY_DIFF_EXPORTS
            #define PRETTY_DIFF_API __declspec(dllexport)
        #else
            #define PRETTY_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define PRETTY_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(PRETTY_DIFF_SHARED) && defined(PRETTY_DIFF_EXPORTS)
        #define PRETTY_DIFF_API __attribute__((visibility("default")))
    #else
        #define PRETTY_DIFF_API
    #endif
#else
    #define PRETTY_DIFF_API
#endif
