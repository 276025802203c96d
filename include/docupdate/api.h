// api.h - DLL export/import macros for docupdate

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the docupdate library.
///
/// Usage:
/// - When building docupdate as a SHARED library:
///   - CMake defines DOCUPDATE_EXPORTS (private) and DOCUPDATE_SHARED (public)
///   - Functions/classes marked with DOCUPDATE_API will be exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, DOCUPDATE_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DOCUPDATE_SHARED
        #ifdef DOCUPDATE_EXPORTS
            #define DOCUPDATE_API __declspec(dllexport)
        #else
            #define DOCUPDATE_API __declspec(dllimport)
        #endif
    #else
        #define DOCUPDATE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DOCUPDATE_SHARED) && defined(DOCUPDATE_EXPORTS)
        #define DOCUPDATE_API __attribute__((visibility("default")))
    #else
        #define DOCUPDATE_API
    #endif
#else
    #define DOCUPDATE_API
#endif
