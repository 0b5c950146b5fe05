/**
 * @file export.hpp
 * @brief Symbol visibility macros for the ingestd_core library.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#if defined(INGESTD_STATIC)
    #define INGESTD_CORE_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(INGESTD_CORE_BUILD)
        #define INGESTD_CORE_API __declspec(dllexport)
    #else
        #define INGESTD_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(INGESTD_CORE_BUILD)
        #define INGESTD_CORE_API __attribute__((visibility("default")))
    #else
        #define INGESTD_CORE_API
    #endif
#else
    #define INGESTD_CORE_API
#endif
