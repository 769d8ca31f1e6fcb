// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for blob_upload_system
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - BLOB_HAS_*     : Local feature availability (TLS transport, etc.)
 * - KCENON_WITH_*  : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/blob/config/feature_flags.h>
 *
 * #if BLOB_HAS_TLS
 *     stream.handshake(ssl::stream_base::client);
 * #endif
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool->enqueue(std::move(job));
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
#define BLOB_HAS_COMMON_FEATURE_FLAGS 1
#else
#define BLOB_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Blob Upload System Feature Flags
//==============================================================================

/**
 * @brief TLS Support (OpenSSL)
 *
 * When enabled, the asio transport can talk to https:// endpoints.
 * Set via CMake option BLOB_ENABLE_TLS.
 */
#ifndef BLOB_HAS_TLS
    #if defined(BLOB_ENABLE_TLS)
        #define BLOB_HAS_TLS 1
    #else
        #define BLOB_HAS_TLS 0
    #endif
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

// thread_system integration (worker pool for part uploads)
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

// network_system integration (alternative HTTP transport)
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
 * logger_system requires common_system, so both must be present.
 */
#ifndef BLOB_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define BLOB_USE_LOGGER_SYSTEM 1
    #else
        #define BLOB_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef BLOB_PRINT_FEATURE_SUMMARY

#pragma message("=== Blob Upload System Feature Summary ===")

#if BLOB_HAS_TLS
    #pragma message("  TLS (OpenSSL): Enabled")
#else
    #pragma message("  TLS (OpenSSL): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("==========================================")

#endif // BLOB_PRINT_FEATURE_SUMMARY
