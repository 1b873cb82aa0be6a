// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file manifest.h
 * @brief The manifest: immutable description of a data set's chunking plan and identity.
 *
 * A manifest is produced by whoever owns the data set and handed to
 * rgtpCreateSurface().  Consumers receive it out of band (the transport layer
 * ships it ahead of the chunks) and use it to size their receive buffers.
 *
 * Invariants checked by rgtpCreateSurface() and rgtpManifestInit():
 *   - totalSize > 0
 *   - 0 < chunkSize <= RGTP_MAX_CHUNK_SIZE
 *   - totalChunks == ceil(totalSize / chunkSize)
 *   - fileId is NUL terminated within its 64 bytes
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <rgtp/platform.h>
#include <rgtp/rgtp.h>

#define RGTP_MAX_CHUNK_SIZE       65536U
#define RGTP_FILE_ID_SIZE         64U
#define RGTP_FINGERPRINT_SIZE     32U

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * Boundary layout of a manifest.
     *
     * Integer byte order is whatever the host uses.  Converting to a wire
     * representation is the job of the transport collaborator.
     */
    typedef struct rgtpManifest
    {
        /** NUL terminated identifier of the data set. */
        char fileId[RGTP_FILE_ID_SIZE];
        /** Size in bytes of the complete logical stream. */
        uint64_t totalSize;
        /** Capacity of every chunk but the last one. */
        uint32_t chunkSize;
        /** Opaque payload encoding tag, carried but not interpreted. */
        uint16_t encodingType;
        /** Hint to consumers: how often the producer expects to expose a chunk. */
        uint32_t exposureCadenceMs;
        /** Number of chunks, ceil(totalSize / chunkSize). */
        uint32_t totalChunks;
        /** Fingerprint of the complete data set, supplied by the producer. */
        uint8_t fingerprint[RGTP_FINGERPRINT_SIZE];
    } rgtpManifest;

    /**
     * Fill a manifest for a data set of \p in_totalSize bytes cut in chunks
     * of \p in_chunkSize bytes.  The chunk count is computed, the encoding
     * tag, cadence and fingerprint are zeroed.
     *
     * @param[in]  in_fileId     NUL terminated identifier, at most 63 characters.
     * @param[in]  in_totalSize  Size of the data set in bytes.
     * @param[in]  in_chunkSize  Chunk capacity in bytes.
     * @param[out] out_manifest  Manifest to fill.
     * @return RGTP_STATUS_OK or RGTP_ERR_INVALID_ARG.
     */
    RGTP_EXPORT
    rgtpStatus rgtpManifestInit(char const* in_fileId, uint64_t in_totalSize, uint32_t in_chunkSize, rgtpManifest* out_manifest);

    /**
     * Parse a manifest from its JSON definition.
     *
     * Example:
     * @code
     * {
     *   "fileId": "video-42",
     *   "totalSize": 1048576,
     *   "chunkSize": 65536,
     *   "encodingType": 0,
     *   "exposureCadenceMs": 5,
     *   "fingerprint": "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08"
     * }
     * @endcode
     *
     * @param[in]  in_definition  NUL terminated JSON text.
     * @param[out] out_manifest   Manifest to fill.
     * @return RGTP_STATUS_OK or RGTP_ERR_INVALID_ARG.
     */
    RGTP_EXPORT
    rgtpStatus rgtpManifestFromJson(char const* in_definition, rgtpManifest* out_manifest);

#ifdef __cplusplus
}
#endif
