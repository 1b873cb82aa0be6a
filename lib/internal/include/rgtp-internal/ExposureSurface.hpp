// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ExposureSurface.hpp
 * @brief Concurrent in-memory store of the chunks of one data set
 *
 * A producer exposes chunks by sequence id, in any order, from any number of
 * threads.  Consumers peek and pull chunks by id at the same time.  Pulling a
 * chunk that has not been exposed yet is a normal, retriable outcome.
 *
 * Nothing on the exposure or pull paths allocates, blocks or suspends.  The
 * only lock is the free slot list of the pool, taken by recovery re-exposures.
 *
 * Lifecycle:
 *
 *   createSurface() -> expose()* -> [all chunks exposed | raiseCompletion()] -> destruction
 *
 * The surface must outlive every call made on it.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <gsl/span>
#include <rgtp/manifest.h>
#include <rgtp/platform.h>
#include "ChunkTable.hpp"
#include "MemoryPool.hpp"
#include "Result.hpp"
#include "SurfaceOptionsParser.hpp"
#include "Timing.hpp"

namespace rgtp::lib
{
    /**
     * Metadata snapshot of one chunk.
     */
    struct ChunkView
    {
        std::uint32_t sequenceId;
        std::uint32_t capacity;
        /** Size of the exposed payload, 0 while unpublished. */
        std::uint32_t size;
        std::uint64_t offset;
        std::uint32_t digest;
        bool published;
        /** Monotonic time of the last (re-)exposure. */
        Timepoint exposureTime;
        std::uint32_t pullCount;
        /** Number of recovery re-exposures applied to the chunk. */
        std::uint32_t generation;
    };

    struct SurfaceStats
    {
        Duration elapsed;
        std::uint64_t totalBytes;
        /** Bytes per second since creation, 0 if no time elapsed. */
        double throughput;
        std::uint32_t exposedCount;
        std::uint32_t chunkCount;
        std::uint32_t reexposureCount;
        std::uint32_t exhaustedCount;
        bool complete;
    };

    class RGTP_EXPORT ExposureSurface
    {
    public:
        /**
         * Build a surface for a validated manifest.  Prefer createSurface().
         *
         * @throws std::invalid_argument if the manifest is invalid.
         * @throws std::bad_alloc if the pool or the chunk table cannot be allocated.
         */
        ExposureSurface(rgtpManifest const& manifest, SurfaceOptions const& options);

        ExposureSurface(ExposureSurface const&) = delete;
        ExposureSurface& operator=(ExposureSurface const&) = delete;

        ~ExposureSurface();

        [[nodiscard]]
        rgtpManifest const& manifest() const noexcept;

        [[nodiscard]]
        SurfaceOptions const& options() const noexcept;

        [[nodiscard]]
        std::uint32_t chunkCount() const noexcept;

        /**
         * Expose the payload of chunk \p id.
         *
         * The first exposure copies the payload into the chunk's slot and
         * publishes it.  Later exposures report AlreadyExposed and leave the
         * chunk untouched, unless the surface is in recovery mode, in which case
         * the payload replaces the published one.  AlreadyExposed is also
         * returned while a concurrent exposure of the same chunk is still
         * writing it, so the chunk may not be readable yet when this returns.
         *
         * Fails with ChunkOutOfRange or ChunkTooLarge without side effects, and
         * with SurfaceExhausted when a re-exposure finds no free slot.
         */
        ExposeResult expose(std::uint32_t id, gsl::span<std::uint8_t const> payload);

        /**
         * Expose payloads[i] as chunk startId + i, in order.  Failing entries are
         * skipped.
         *
         * @return The number of entries that succeeded: chunks this call
         *         published, or chunks already published or claimed by a
         *         concurrent exposure.
         */
        std::uint32_t exposeBatch(std::uint32_t startId, std::vector<gsl::span<std::uint8_t const>> const& payloads);

        /** Signal that no further chunks will be exposed.  Idempotent. */
        void raiseCompletion() noexcept;

        /** @return The chunk metadata, or nullopt if the id is out of range. */
        [[nodiscard]]
        std::optional<ChunkView> peek(std::uint32_t id) const noexcept;

        /**
         * Copy the payload of chunk \p id into \p dest.
         *
         * \p dest is written only when Pulled is returned.
         */
        PullResult pull(std::uint32_t id, gsl::span<std::uint8_t> dest) noexcept;

        /**
         * pull() for every (ids[i], dests[i]) pair.
         * @throws std::invalid_argument if the spans differ in length.
         */
        std::vector<PullResult> pullBatch(gsl::span<std::uint32_t const> ids, gsl::span<gsl::span<std::uint8_t> const> dests);

        /**
         * Recompute the digest of the stored payload of chunk \p id and compare
         * it with the one recorded at exposure time.
         */
        [[nodiscard]]
        VerifyResult verify(std::uint32_t id) const noexcept;

        /**
         * Zero-copy view of the stored payload of chunk \p id.
         *
         * The view stays valid as long as the surface lives, except in recovery
         * mode, where a re-exposure of the chunk may recycle the slot it
         * refers to.  Use pull() there.
         *
         * @return nullopt if the id is out of range or the chunk is not published.
         */
        [[nodiscard]]
        std::optional<gsl::span<std::uint8_t const>> payloadView(std::uint32_t id) const noexcept;

        /**
         * Pull every chunk, in id order, into \p dest at the chunk's offset.
         * \p dest must hold the total size of the data set.
         */
        AssembleResult assemble(gsl::span<std::uint8_t> dest) noexcept;

        [[nodiscard]]
        bool isComplete() const noexcept;

        [[nodiscard]]
        std::uint32_t exposedCount() const noexcept;

        /** Side-effect free snapshot of the surface counters. */
        [[nodiscard]]
        SurfaceStats stats() const noexcept;

    private:
        Exposure publish(ChunkRecord& record, gsl::span<std::uint8_t const> payload) noexcept;
        ExposeResult republish(ChunkRecord& record, gsl::span<std::uint8_t const> payload);

        /** Copy the payload and its metadata into an exclusively owned slot. */
        void fillSlot(MemoryPool::SlotIndex slot, gsl::span<std::uint8_t const> payload) noexcept;

        /** Whether no re-exposure completed since \p generation was read. */
        static bool isStable(ChunkRecord const& record, std::uint32_t generation) noexcept;

    private:
        rgtpManifest const _manifest;
        SurfaceOptions const _options;
        Timepoint const _createdAt;

        MemoryPool _pool;
        ChunkTable _table;

        std::atomic<std::uint32_t> _exposedCount;
        std::atomic<std::uint64_t> _totalBytes;
        std::atomic<std::uint32_t> _reexposureCount;
        std::atomic<std::uint32_t> _exhaustedCount;
        std::atomic<bool> _complete;
    };

    using SurfaceResult = std::variant<std::unique_ptr<ExposureSurface>, Error>;

    /**
     * Create a surface.  Never returns a partially built surface.
     *
     * @return The surface, InvalidParameter for an invalid manifest, or
     *         AllocationFailure if the pool cannot be reserved.
     */
    RGTP_EXPORT
    SurfaceResult createSurface(rgtpManifest const& manifest, SurfaceOptions const& options = {}) noexcept;

    /**
     * Create a surface from JSON options (see SurfaceOptionsParser).
     * Malformed options yield InvalidParameter.
     */
    RGTP_EXPORT
    SurfaceResult createSurface(rgtpManifest const& manifest, std::string const& options) noexcept;

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    inline rgtpManifest const& ExposureSurface::manifest() const noexcept
    {
        return _manifest;
    }

    inline SurfaceOptions const& ExposureSurface::options() const noexcept
    {
        return _options;
    }

    inline std::uint32_t ExposureSurface::chunkCount() const noexcept
    {
        return _table.size();
    }

    inline bool ExposureSurface::isComplete() const noexcept
    {
        return _complete.load(std::memory_order_acquire);
    }

    inline std::uint32_t ExposureSurface::exposedCount() const noexcept
    {
        return _exposedCount.load(std::memory_order_acquire);
    }

    inline void ExposureSurface::raiseCompletion() noexcept
    {
        _complete.store(true, std::memory_order_release);
    }
}
