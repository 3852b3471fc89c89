/**
 * @file export.hpp
 * @brief Symbol visibility macros for the huedisc_utils library.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(HUEDISC_UTILS_BUILD)
        #define HUEDISC_UTILS_API __declspec(dllexport)
    #else
        #define HUEDISC_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(HUEDISC_UTILS_BUILD)
        #define HUEDISC_UTILS_API __attribute__((visibility("default")))
    #else
        #define HUEDISC_UTILS_API
    #endif
#else
    #define HUEDISC_UTILS_API
#endif
