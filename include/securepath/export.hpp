#ifndef SECUREPATH_EXPORT_HPP
#define SECUREPATH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building securepath as a shared library:
 * - Define SECUREPATH_SHARED when using the library
 * - SECUREPATH_BUILDING_SHARED is defined automatically during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef SECUREPATH_BUILDING_SHARED
        #define SECUREPATH_API __declspec(dllexport)
    #elif defined(SECUREPATH_SHARED)
        #define SECUREPATH_API __declspec(dllimport)
    #else
        #define SECUREPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef SECUREPATH_BUILDING_SHARED
        #define SECUREPATH_API __attribute__((visibility("default")))
    #else
        #define SECUREPATH_API
    #endif
#else
    #define SECUREPATH_API
#endif

#endif // SECUREPATH_EXPORT_HPP
