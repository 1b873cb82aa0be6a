// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file rgtp.h
 * @brief Core RGTP SDK entry point -- status codes and versioning.
 *
 * This is the first header most consumers will include.  It defines:
 *
 *   1. **rgtpStatus**      -- The error/success codes returned by every RGTP function.
 *   2. **rgtpVersionType** -- Semantic version of the SDK at runtime.
 *
 * The exposure surface itself is declared in <rgtp/surface.h> and the
 * manifest that describes a data set in <rgtp/manifest.h>.
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <rgtp/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /* ======================================================================
     * Status codes
     * ==================================================================== */

    /**
     * Universal return-code enum for the RGTP SDK.
     *
     * Any value other than RGTP_STATUS_OK means the operation did not take
     * effect and that [out] parameters, unless documented otherwise, should be
     * considered uninitialised.
     *
     * Front ends are expected to map the codes as follows:
     *   - RGTP_ERR_CHUNK_NOT_READY                           -> "try again"
     *   - RGTP_ERR_INVALID_ARG, RGTP_ERR_CHUNK_OUT_OF_RANGE,
     *     RGTP_ERR_CHUNK_TOO_LARGE, RGTP_ERR_BUFFER_TOO_SMALL -> client error
     *   - RGTP_ERR_ALLOCATION_FAILURE, RGTP_ERR_SURFACE_EXHAUSTED -> server capacity error
     */
    typedef enum rgtpStatus
    {
        RGTP_STATUS_OK,               /**< Success.                                                                  */
        RGTP_ERR_UNKNOWN,             /**< An unexpected internal error occurred.                                    */
        RGTP_ERR_INVALID_ARG,         /**< A NULL handle/pointer, a malformed manifest or malformed options.         */
        RGTP_ERR_ALLOCATION_FAILURE,  /**< The chunk pool could not be reserved when creating a surface.             */
        RGTP_ERR_CHUNK_OUT_OF_RANGE,  /**< The chunk id is greater than or equal to the manifest's chunk count.      */
        RGTP_ERR_CHUNK_TOO_LARGE,     /**< The payload exceeds the capacity declared for the chunk.                  */
        RGTP_ERR_CHUNK_NOT_READY,     /**< The chunk has not been exposed yet. Retriable, not a failure.             */
        RGTP_ERR_SURFACE_EXHAUSTED,   /**< No free pool slot is available for a recovery re-exposure. Retriable.     */
        RGTP_ERR_BUFFER_TOO_SMALL,    /**< The destination buffer cannot hold the chunk payload. Nothing was copied. */
    } rgtpStatus;

    /* ======================================================================
     * SDK version
     * ==================================================================== */

    /**
     * Semantic-versioning information for the RGTP SDK.
     *
     * The `full` string is owned by the library and must NOT be freed.
     */
    typedef struct rgtpVersionType
    {
        uint16_t    major;
        uint16_t    minor;
        uint16_t    bugfix;
        uint16_t    build;
        char const* full;
    } rgtpVersionType;

    /**
     * Retrieve the version of the RGTP SDK that is currently linked.
     *
     * @param[out] out_version  Structure filled with the version information.
     * @return RGTP_STATUS_OK on success, RGTP_ERR_INVALID_ARG if \p out_version is NULL.
     */
    RGTP_EXPORT
    rgtpStatus rgtpGetVersion(rgtpVersionType* out_version);

    /**
     * Human readable name of a status code ("RGTP_ERR_CHUNK_NOT_READY", ...).
     * The returned string is static and must not be freed.
     */
    RGTP_EXPORT
    char const* rgtpStatusString(rgtpStatus status);

#ifdef __cplusplus
}
#endif
