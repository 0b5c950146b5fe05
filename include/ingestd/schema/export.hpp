/**
 * @file export.hpp
 * @brief Symbol visibility macros for the ingestd_schema library.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#if defined(INGESTD_STATIC)
    #define INGESTD_SCHEMA_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(INGESTD_SCHEMA_BUILD)
        #define INGESTD_SCHEMA_API __declspec(dllexport)
    #else
        #define INGESTD_SCHEMA_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(INGESTD_SCHEMA_BUILD)
        #define INGESTD_SCHEMA_API __attribute__((visibility("default")))
    #else
        #define INGESTD_SCHEMA_API
    #endif
#else
    #define INGESTD_SCHEMA_API
#endif
