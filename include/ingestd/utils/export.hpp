/**
 * @file export.hpp
 * @brief Symbol visibility macros for the ingestd_utils library.
 *
 * This header provides the INGESTD_UTILS_API macro for cross-platform
 * shared library symbol export/import. Static builds define INGESTD_STATIC.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#if defined(INGESTD_STATIC)
    #define INGESTD_UTILS_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(INGESTD_UTILS_BUILD)
        #define INGESTD_UTILS_API __declspec(dllexport)
    #else
        #define INGESTD_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(INGESTD_UTILS_BUILD)
        #define INGESTD_UTILS_API __attribute__((visibility("default")))
    #else
        #define INGESTD_UTILS_API
    #endif
#else
    #define INGESTD_UTILS_API
#endif
