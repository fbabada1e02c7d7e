// api.h - DLL export/import macros for deepdiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the deepdiff library.
///
/// Usage:
/// - When building deepdiff as a SHARED library:
///   - CMake defines DEEPDIFF_EXPORTS (private) and DEEPDIFF_SHARED (public)
///   - Functions/classes marked with DEEPDIFF_API will be exported
///
/// - When using deepdiff as a SHARED library:
///   - Link against the deepdiff target (CMake propagates DEEPDIFF_SHARED)
///   - Functions/classes marked with DEEPDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DEEPDIFF_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DEEPDIFF_SHARED
        #ifdef DEEPDIFF_EXPORTS
            #define DEEPDIFF_API __declspec(dllexport)
        #else
            #define DEEPDIFF_API __declspec(dllimport)
        #endif
    #else
        #define DEEPDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DEEPDIFF_SHARED) && defined(DEEPDIFF_EXPORTS)
        #define DEEPDIFF_API __attribute__((visibility("default")))
    #else
        #define DEEPDIFF_API
    #endif
#else
    #define DEEPDIFF_API
#endif
