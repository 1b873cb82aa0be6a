// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file surface.h
 * @brief The exposure surface: an in-process chunk store producers expose into and consumers pull from.
 *
 * Typical producer:
 * @code
 *     rgtpManifest manifest;
 *     rgtpManifestInit("video-42", size, 65536, &manifest);
 *
 *     rgtpSurface surface;
 *     if (rgtpCreateSurface(&manifest, NULL, &surface) != RGTP_STATUS_OK) { ... }
 *
 *     for (uint32_t i = 0; i < manifest.totalChunks; ++i)
 *         rgtpExposeChunk(surface, i, data + i * 65536, chunkLength(i));
 * @endcode
 *
 * Typical consumer (any thread, any order, any number of times):
 * @code
 *     uint32_t size;
 *     switch (rgtpPullChunk(surface, id, buffer, sizeof buffer, &size))
 *     {
 *         case RGTP_STATUS_OK:            consume(buffer, size); break;
 *         case RGTP_ERR_CHUNK_NOT_READY:  retryLater(id);        break;
 *         default:                        fail();                break;
 *     }
 * @endcode
 *
 * None of the functions in this header block.  Every function except
 * rgtpCreateSurface() and rgtpDestroySurface() may be called concurrently
 * from any number of threads on the same surface.
 */

#pragma once

#ifdef __cplusplus
#   include <cstddef>
#   include <cstdint>
#else
#   include <stdbool.h>
#   include <stddef.h>
#   include <stdint.h>
#endif

#include <rgtp/manifest.h>
#include <rgtp/platform.h>
#include <rgtp/rgtp.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /** Opaque handle to an exposure surface.  Created by rgtpCreateSurface(). */
    typedef struct rgtpSurface_t* rgtpSurface;

    /**
     * Snapshot of a chunk record, returned by rgtpPeekChunk().
     */
    typedef struct rgtpChunkInfo
    {
        /** Sequence id, equal to the index in the chunk table. */
        uint32_t sequenceId;
        /** Largest payload the chunk accepts. */
        uint32_t capacity;
        /** Size of the exposed payload, 0 while unpublished. */
        uint32_t dataSize;
        /** Offset of the chunk within the logical stream. */
        uint64_t offset;
        /** Integrity digest of the exposed payload (0 when the digest policy is "none"). */
        uint32_t digest;
        /** Number of successful pulls. */
        uint32_t pullCount;
        /** Number of recovery re-exposures applied to the chunk. */
        uint32_t generation;
        /** Monotonic time of the last (re-)exposure, in nanoseconds. */
        uint64_t exposureTime;
        /** Non-zero once the chunk can be pulled. */
        uint8_t published;
    } rgtpChunkInfo;

    /**
     * Read-only statistics snapshot, returned by rgtpGetSurfaceStats().
     */
    typedef struct rgtpSurfaceStats
    {
        /** Milliseconds since the surface was created. */
        uint64_t elapsedMs;
        /** Sum of the sizes of all currently published payloads. */
        uint64_t totalBytes;
        /** totalBytes / elapsed seconds, 0 when no time has elapsed. */
        double throughput;
        /** Number of published chunks. */
        uint32_t exposedCount;
        /** Number of chunks in the manifest. */
        uint32_t chunkCount;
        /** Number of successful recovery re-exposures. */
        uint32_t reexposureCount;
        /** Number of re-exposures rejected because the pool had no free slot. */
        uint32_t exhaustedCount;
        /** Non-zero once the completion signal is raised. */
        uint8_t complete;
    } rgtpSurfaceStats;

    /**
     * Create a surface for the data set described by \p in_manifest.
     *
     * @param[in]  in_manifest  A valid manifest (see <rgtp/manifest.h>).
     * @param[in]  in_options   NULL, an empty string, or a JSON object with the optional fields
     *                          "recoveryMode" (bool), "recoverySlots" (number >= 1) and
     *                          "digest" ("fnv1a", "poly31" or "none").
     * @param[out] out_surface  The new surface.  Untouched on failure.
     * @return RGTP_STATUS_OK, RGTP_ERR_INVALID_ARG for a malformed manifest or options,
     *         RGTP_ERR_ALLOCATION_FAILURE if the chunk pool cannot be reserved.
     */
    RGTP_EXPORT
    rgtpStatus rgtpCreateSurface(rgtpManifest const* in_manifest, char const* in_options, rgtpSurface* out_surface);

    /**
     * Release the surface, its chunk table and its pool.  A NULL surface is a no-op.
     * No other call may be in progress or follow on the same handle.
     */
    RGTP_EXPORT
    rgtpStatus rgtpDestroySurface(rgtpSurface in_surface);

    /**
     * Expose the payload of chunk \p in_chunkId.
     *
     * Exposing an already published chunk succeeds without effect, unless the surface was
     * created in recovery mode, in which case the payload replaces the published one.
     *
     * @return RGTP_STATUS_OK, RGTP_ERR_INVALID_ARG, RGTP_ERR_CHUNK_OUT_OF_RANGE,
     *         RGTP_ERR_CHUNK_TOO_LARGE or RGTP_ERR_SURFACE_EXHAUSTED.
     */
    RGTP_EXPORT
    rgtpStatus rgtpExposeChunk(rgtpSurface in_surface, uint32_t in_chunkId, void const* in_payload, uint32_t in_size);

    /**
     * Expose \p in_count payloads to the contiguous ids starting at \p in_startId.
     *
     * Invalid entries (NULL payload, id out of range, oversized payload) are skipped; the
     * remaining entries are still exposed.  \p out_exposed receives the number of entries
     * that ended up published.
     */
    RGTP_EXPORT
    rgtpStatus rgtpExposeBatch(rgtpSurface in_surface, uint32_t in_startId, void const* const* in_payloads, uint32_t const* in_sizes,
        uint32_t in_count, uint32_t* out_exposed);

    /**
     * Raise the completion signal: no further chunks will be exposed.  Idempotent.
     */
    RGTP_EXPORT
    rgtpStatus rgtpRaiseCompletion(rgtpSurface in_surface);

    /**
     * Copy the metadata of chunk \p in_chunkId.
     * @return RGTP_STATUS_OK, RGTP_ERR_INVALID_ARG or RGTP_ERR_CHUNK_OUT_OF_RANGE.
     */
    RGTP_EXPORT
    rgtpStatus rgtpPeekChunk(rgtpSurface in_surface, uint32_t in_chunkId, rgtpChunkInfo* out_info);

    /**
     * Copy the payload of chunk \p in_chunkId into \p out_buffer.
     *
     * @param[out] out_buffer  Destination, left untouched unless RGTP_STATUS_OK is returned.
     * @param[in]  in_bufferSize  Size of \p out_buffer in bytes.
     * @param[out] out_size    Number of bytes copied.  On RGTP_ERR_BUFFER_TOO_SMALL, the required size.
     * @return RGTP_STATUS_OK, RGTP_ERR_CHUNK_NOT_READY, RGTP_ERR_CHUNK_OUT_OF_RANGE,
     *         RGTP_ERR_BUFFER_TOO_SMALL or RGTP_ERR_INVALID_ARG.
     */
    RGTP_EXPORT
    rgtpStatus rgtpPullChunk(rgtpSurface in_surface, uint32_t in_chunkId, void* out_buffer, uint32_t in_bufferSize, uint32_t* out_size);

    /**
     * Pull \p in_count chunks.  Per-chunk outcomes are written to \p out_results and the copied
     * sizes to \p out_sizes; the function itself only fails on invalid arguments.
     */
    RGTP_EXPORT
    rgtpStatus rgtpPullBatch(rgtpSurface in_surface, uint32_t const* in_chunkIds, void* const* out_buffers, uint32_t const* in_bufferSizes,
        uint32_t in_count, rgtpStatus* out_results, uint32_t* out_sizes);

    /**
     * Recompute the digest of the stored payload and compare it with the recorded one.
     *
     * @param[out] out_intact  true if the stored bytes still match their digest.
     * @return RGTP_STATUS_OK, RGTP_ERR_CHUNK_NOT_READY, RGTP_ERR_CHUNK_OUT_OF_RANGE or RGTP_ERR_INVALID_ARG.
     */
    RGTP_EXPORT
    rgtpStatus rgtpVerifyChunk(rgtpSurface in_surface, uint32_t in_chunkId, bool* out_intact);

    /**
     * Lock-free read of the completion signal.  A NULL surface is never complete.
     */
    RGTP_EXPORT
    bool rgtpIsComplete(rgtpSurface in_surface);

    /**
     * Take a statistics snapshot.
     */
    RGTP_EXPORT
    rgtpStatus rgtpGetSurfaceStats(rgtpSurface in_surface, rgtpSurfaceStats* out_stats);

    /**
     * Copy the manifest the surface was created from.
     */
    RGTP_EXPORT
    rgtpStatus rgtpGetManifest(rgtpSurface in_surface, rgtpManifest* out_manifest);

#ifdef __cplusplus
}
#endif
