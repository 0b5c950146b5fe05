/**
 * @file export.hpp
 * @brief Symbol visibility macros for the ingestd_services library.
 *
 * @copyright Copyright (c) 2024 ingestd Contributors
 * @license MIT License
 */

#pragma once

#if defined(INGESTD_STATIC)
    #define INGESTD_SERVICES_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(INGESTD_SERVICES_BUILD)
        #define INGESTD_SERVICES_API __declspec(dllexport)
    #else
        #define INGESTD_SERVICES_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(INGESTD_SERVICES_BUILD)
        #define INGESTD_SERVICES_API __attribute__((visibility("default")))
    #else
        #define INGESTD_SERVICES_API
    #endif
#else
    #define INGESTD_SERVICES_API
#endif
