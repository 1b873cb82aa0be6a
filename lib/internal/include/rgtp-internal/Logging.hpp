// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for RGTP internal diagnostics
 *
 * Thin wrapper around spdlog for all RGTP internal logging.
 * - All macros wrap log calls in try/catch so logging never takes the caller down
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the RGTP_LOG_LEVEL environment variable
 *   (see initLogging())
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>
#include <rgtp/platform.h>

/**
 * RGTP_TRACE: per-chunk activity (expose, pull, slot hand-over).
 * Only compiled in debug builds.
 */
#define RGTP_TRACE(...)                \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_TRACE(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * RGTP_DEBUG: development diagnostics.
 * Only compiled in debug builds.
 */
#define RGTP_DEBUG(...)                \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_DEBUG(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * RGTP_INFO: surface lifecycle, completion.
 */
#define RGTP_INFO(...)                \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_INFO(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * RGTP_WARN: recoverable conditions worth an operator's attention (pool exhaustion).
 */
#define RGTP_WARN(...)                \
    do                                \
    {                                 \
        try                           \
        {                             \
            SPDLOG_WARN(__VA_ARGS__); \
        }                             \
        catch (...)                   \
        {}                            \
    }                                 \
    while (false)

/**
 * RGTP_ERROR: operation failures (rejected manifests, allocation failures).
 */
#define RGTP_ERROR(...)                \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_ERROR(__VA_ARGS__); \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * RGTP_CRITICAL: unrecoverable failures.
 */
#define RGTP_CRITICAL(...)                \
    do                                    \
    {                                     \
        try                               \
        {                                 \
            SPDLOG_CRITICAL(__VA_ARGS__); \
        }                                 \
        catch (...)                       \
        {}                                \
    }                                     \
    while (false)

namespace rgtp::lib
{
    /**
     * Apply the RGTP_LOG_LEVEL environment variable to spdlog.
     *
     * Accepts the spdlog level syntax ("debug", "warn", "off,rgtp=trace", ...).
     * Runs once per process; later calls are no-ops.
     */
    RGTP_EXPORT
    void initLogging() noexcept;
}
