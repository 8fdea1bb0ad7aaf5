// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for cube_client_system
 *
 * This is the central entry point for all system integration flags in the
 * cube_client_system library. Include this header to get access to the
 * KCENON_WITH_* and CUBE_USE_* feature macros.
 *
 * Feature categories:
 * - KCENON_WITH_*   : System integration flags (inherited from common_system)
 * - CUBE_USE_*      : Derived switches used inside the cube client
 *
 * Usage:
 * @code
 * #include <kcenon/cube/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto response = http_client->get(url, query, headers);
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
#define CUBE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CUBE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

/**
 * @brief Ensure KCENON_WITH_* flags are always available
 *
 * These flags are set via CMake compile definitions (BUILD_WITH_*) when the
 * corresponding kcenon system is found, and may already be defined by
 * common_system's feature_flags.h.
 */

// common_system integration (result types shared by thread_system jobs)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool behind the transfer executor)
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

// network_system integration (HTTP client used by network_http_transport)
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
 * @brief Unified flag for logger_system usage in the cube client
 *
 * logger_system requires common_system, so both integrations must be active.
 */
#ifndef CUBE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CUBE_USE_LOGGER_SYSTEM 1
    #else
        #define CUBE_USE_LOGGER_SYSTEM 0
    #endif
#endif
