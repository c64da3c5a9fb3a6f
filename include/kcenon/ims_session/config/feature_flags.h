// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for ims_session_system
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - IMS_SESSION_HAS_*    : Local feature availability (libcurl, checksum)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/ims_session/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = thread_system_worker_pool::create_default();
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define IMS_SESSION_HAS_COMMON_FEATURE_FLAGS 1
#else
#define IMS_SESSION_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Session System Feature Flags
//==============================================================================

/**
 * @brief libcurl HTTP adapter
 *
 * Set via the CMake option IMS_SESSION_ENABLE_CURL (on by default).
 */
#ifndef IMS_SESSION_HAS_CURL
    #if defined(IMS_SESSION_ENABLE_CURL)
        #define IMS_SESSION_HAS_CURL 1
    #else
        #define IMS_SESSION_HAS_CURL 0
    #endif
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

// thread_system integration (worker pool for session workers)
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

// network_system integration (HTTP client)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system requires common_system, so both must be enabled.
 */
#ifndef IMS_SESSION_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define IMS_SESSION_USE_LOGGER_SYSTEM 1
    #else
        #define IMS_SESSION_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef IMS_SESSION_PRINT_FEATURE_SUMMARY

#pragma message("=== IMS Session System Feature Summary ===")

#if IMS_SESSION_HAS_CURL
    #pragma message("  libcurl HTTP adapter: Enabled")
#else
    #pragma message("  libcurl HTTP adapter: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system worker pool: Enabled")
#else
    #pragma message("  thread_system worker pool: Disabled")
#endif

#if IMS_SESSION_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system HTTP adapter: Enabled")
#else
    #pragma message("  network_system HTTP adapter: Disabled")
#endif

#endif // IMS_SESSION_PRINT_FEATURE_SUMMARY
