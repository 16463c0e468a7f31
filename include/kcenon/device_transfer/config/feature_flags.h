// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for device_transfer
 *
 * Central entry point for the system integration flags used by the
 * device_transfer library. Include this header to get the KCENON_WITH_*
 * macros and the DEVICE_TRANSFER_USE_* helpers derived from them.
 *
 * Usage:
 * @code
 * #include <kcenon/device_transfer/config/feature_flags.h>
 *
 * #if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define DEVICE_TRANSFER_HAS_COMMON_FEATURE_FLAGS 1
#else
#define DEVICE_TRANSFER_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for keep-alive tasks)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (asynchronous console logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in device_transfer
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef DEVICE_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DEVICE_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define DEVICE_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Unified flag for thread_system usage in device_transfer
 */
#ifndef DEVICE_TRANSFER_USE_THREAD_SYSTEM
    #if KCENON_WITH_THREAD_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DEVICE_TRANSFER_USE_THREAD_SYSTEM 1
    #else
        #define DEVICE_TRANSFER_USE_THREAD_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef DEVICE_TRANSFER_PRINT_FEATURE_SUMMARY

#pragma message("=== Device Transfer Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if DEVICE_TRANSFER_USE_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if DEVICE_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=======================================")

#endif // DEVICE_TRANSFER_PRINT_FEATURE_SUMMARY
