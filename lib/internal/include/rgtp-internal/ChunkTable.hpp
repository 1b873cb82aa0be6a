// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ChunkTable.hpp
 * @brief Dense table of chunk records, indexed by sequence id
 *
 * Publication protocol of a chunk record:
 *
 *   Unpublished --CAS--> Writing --release--> Published
 *   Published --CAS--> Republishing --release--> Published   (recovery mode only)
 *
 * A record references its payload by pool slot index.  The payload size,
 * digest and timestamp live in the slot descriptor, so swapping the slot
 * index replaces payload and metadata at once.  The generation counter is
 * bumped after each swap and lets readers detect that the slot they copied
 * from was replaced under them.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <rgtp/manifest.h>
#include "Manifest.hpp"

namespace rgtp::lib
{
    enum class ChunkState : std::uint8_t
    {
        Unpublished,
        Writing,
        Published,
        Republishing,
    };

    /** Whether a reader may copy the payload of a chunk in this state. */
    constexpr bool isReadable(ChunkState state) noexcept
    {
        return (state == ChunkState::Published) || (state == ChunkState::Republishing);
    }

    struct ChunkRecord
    {
        // Fixed when the table is built.
        std::uint32_t sequenceId{0};
        std::uint32_t capacity{0};
        std::uint64_t offset{0};

        std::atomic<ChunkState> state{ChunkState::Unpublished};
        std::atomic<std::uint32_t> slot{0};
        std::atomic<std::uint32_t> generation{0};
        std::atomic<std::uint32_t> pullCount{0};
    };

    class ChunkTable
    {
    public:
        /**
         * Build one record per chunk of \p manifest, chunk i referencing slot i.
         * @throws std::bad_alloc
         */
        explicit ChunkTable(rgtpManifest const& manifest);

        ChunkTable(ChunkTable const&) = delete;
        ChunkTable& operator=(ChunkTable const&) = delete;

        [[nodiscard]]
        std::uint32_t size() const noexcept;

        /** @return The record of chunk \p id, or nullptr if the id is out of range. */
        [[nodiscard]]
        ChunkRecord* at(std::uint32_t id) noexcept;

        [[nodiscard]]
        ChunkRecord const* at(std::uint32_t id) const noexcept;

    private:
        std::uint32_t _size;
        std::unique_ptr<ChunkRecord[]> _records;
    };

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    inline ChunkTable::ChunkTable(rgtpManifest const& manifest)
        : _size{manifest.totalChunks}
        , _records{std::make_unique<ChunkRecord[]>(manifest.totalChunks)}
    {
        for (auto id = std::uint32_t{0}; id < _size; ++id)
        {
            auto& record = _records[id];
            record.sequenceId = id;
            record.capacity = chunkCapacity(manifest, id);
            record.offset = chunkOffset(manifest, id);
            record.slot.store(id, std::memory_order_relaxed);
        }
    }

    inline std::uint32_t ChunkTable::size() const noexcept
    {
        return _size;
    }

    inline ChunkRecord* ChunkTable::at(std::uint32_t id) noexcept
    {
        return (id < _size) ? &_records[id] : nullptr;
    }

    inline ChunkRecord const* ChunkTable::at(std::uint32_t id) const noexcept
    {
        return (id < _size) ? &_records[id] : nullptr;
    }
}
