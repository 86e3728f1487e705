/**
 * @file export.hpp
 * @brief Symbol visibility macros for the lanscope_utils library.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LANSCOPE_UTILS_BUILD)
        #define LANSCOPE_UTILS_API __declspec(dllexport)
    #else
        #define LANSCOPE_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LANSCOPE_UTILS_BUILD)
        #define LANSCOPE_UTILS_API __attribute__((visibility("default")))
    #else
        #define LANSCOPE_UTILS_API
    #endif
#else
    #define LANSCOPE_UTILS_API
#endif
