// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for omics_transfer
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - OMICS_TRANS_*   : Local options of this library
 * - KCENON_WITH_*   : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/omics_transfer/config/feature_flags.h>
 *
 * #if OMICS_TRANSFER_USE_LOGGER_SYSTEM
 *     logger_->log(level, message);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define OMICS_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define OMICS_TRANS_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pools of the transfer manager)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
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
 * @brief Unified flag for logger_system usage in omics_transfer
 *
 * logger_system requires common_system, so both must be enabled.
 */
#ifndef OMICS_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define OMICS_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define OMICS_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Local Options
//==============================================================================

/**
 * @brief Part count ceiling of the remote multipart upload API
 */
#ifndef OMICS_TRANS_MAX_UPLOAD_PARTS
    #define OMICS_TRANS_MAX_UPLOAD_PARTS 10000
#endif

#ifdef OMICS_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Omics Transfer Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system pools: Enabled")
#else
    #pragma message("  thread_system pools: Disabled (std::thread workers)")
#endif

#if OMICS_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system backend: Enabled")
#else
    #pragma message("  logger_system backend: Disabled (stderr)")
#endif

#pragma message("======================================")

#endif // OMICS_TRANS_PRINT_FEATURE_SUMMARY
