/**
 * @file export.hpp
 * @brief Symbol visibility macros for the lanscope_services library.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LANSCOPE_SERVICES_BUILD)
        #define LANSCOPE_SERVICES_API __declspec(dllexport)
    #else
        #define LANSCOPE_SERVICES_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LANSCOPE_SERVICES_BUILD)
        #define LANSCOPE_SERVICES_API __attribute__((visibility("default")))
    #else
        #define LANSCOPE_SERVICES_API
    #endif
#else
    #define LANSCOPE_SERVICES_API
#endif
