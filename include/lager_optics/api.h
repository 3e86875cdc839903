// api.h - DLL export/import macros for lager_optics

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for lager_optics library.
///
/// Usage:
/// - When building lager_optics as a SHARED library:
///   - CMake defines LAGER_OPTICS_EXPORTS (private) and LAGER_OPTICS_SHARED (public)
///   - Functions/classes marked with LAGER_OPTICS_API will be exported
///
/// - When building/using as a STATIC library (the default):
///   - No macros defined, LAGER_OPTICS_API expands to nothing
///
/// Most of lager_optics is header-only templates; only the non-template
/// helpers (nexus diagnostics, law reporting, the university data layer)
/// carry the export decoration.

#if defined(_WIN32) || defined(_WIN64)
    #ifdef LAGER_OPTICS_SHARED
        #ifdef LAGER_OPTICS_EXPORTS
            #define LAGER_OPTICS_API __declspec(dllexport)
        #else
            #define LAGER_OPTICS_API __declspec(dllimport)
        #endif
    #else
        #define LAGER_OPTICS_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LAGER_OPTICS_SHARED) && defined(LAGER_OPTICS_EXPORTS)
        #define LAGER_OPTICS_API __attribute__((visibility("default")))
    #else
        #define LAGER_OPTICS_API
    #endif
#else
    #define LAGER_OPTICS_API
#endif
