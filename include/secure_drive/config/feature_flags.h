// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Compile-time integration flags for secure_drive
 *
 * Feature categories:
 * - SECURE_DRIVE_HAS_*   : Local feature availability
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * @code
 * #include <secure_drive/config/feature_flags.h>
 *
 * #if SECURE_DRIVE_USE_LOGGER_SYSTEM
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
#define SECURE_DRIVE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define SECURE_DRIVE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Local features
//==============================================================================

/**
 * @brief AES-256-CBC containers (OpenSSL); always built
 */
#ifndef SECURE_DRIVE_HAS_ENCRYPTION
    #define SECURE_DRIVE_HAS_ENCRYPTION 1
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
 * @brief Whether transfer_logger forwards to logger_system
 *
 * logger_system requires common_system; without both the logger writes to
 * stderr.
 */
#ifndef SECURE_DRIVE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define SECURE_DRIVE_USE_LOGGER_SYSTEM 1
    #else
        #define SECURE_DRIVE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef SECURE_DRIVE_PRINT_FEATURE_SUMMARY

#pragma message("=== secure_drive Feature Summary ===")

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
    #pragma message("  Logger: logger_system")
#else
    #pragma message("  Logger: stderr")
#endif

#endif  // SECURE_DRIVE_PRINT_FEATURE_SUMMARY
