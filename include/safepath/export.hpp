#ifndef SAFEPATH_EXPORT_HPP
#define SAFEPATH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building safepath as a shared library:
 * - Define SAFEPATH_SHARED when using the library
 * - SAFEPATH_BUILDING_SHARED is defined automatically during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SAFEPATH_BUILDING_SHARED
        #define SAFEPATH_API __declspec(dllexport)
    #elif defined(SAFEPATH_SHARED)
        #define SAFEPATH_API __declspec(dllimport)
    #else
        #define SAFEPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef SAFEPATH_BUILDING_SHARED
        #define SAFEPATH_API __attribute__((visibility("default")))
    #else
        #define SAFEPATH_API
    #endif
#else
    #define SAFEPATH_API
#endif

#endif // SAFEPATH_EXPORT_HPP
