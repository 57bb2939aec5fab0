// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for transfer_engine_system
 *
 * Central entry point for feature detection and integration flags.
 * Include this header to get access to the TRANSFER_ENGINE_HAS_* and
 * KCENON_WITH_* macros.
 *
 * Feature categories:
 * - TRANSFER_ENGINE_HAS_*  : Local feature availability
 * - KCENON_WITH_*          : System integration flags (set by CMake or
 *                            inherited from common_system)
 *
 * @code
 * #include <kcenon/transfer_engine/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_transfer_adapter::create_default(4);
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define TRANSFER_ENGINE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define TRANSFER_ENGINE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for the task executor)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system requires common_system for its result types, so both have
 * to be present.
 */
#ifndef TRANSFER_ENGINE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define TRANSFER_ENGINE_USE_LOGGER_SYSTEM 1
    #else
        #define TRANSFER_ENGINE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef TRANSFER_ENGINE_PRINT_FEATURE_SUMMARY

#pragma message("=== Transfer Engine Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async workers)")
#endif

#if TRANSFER_ENGINE_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr output)")
#endif

#pragma message("=======================================")

#endif  // TRANSFER_ENGINE_PRINT_FEATURE_SUMMARY
