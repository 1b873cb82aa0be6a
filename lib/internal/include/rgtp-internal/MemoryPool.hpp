// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file MemoryPool.hpp
 * @brief Fixed set of equally sized payload slots carved out of one MemoryArena
 *
 * Slot layout:
 *
 *   [ home 0 | home 1 | ... | home N-1 | spare 0 | ... | spare S-1 ]
 *
 * Chunk i initially owns home slot i.  Spare slots only exist on surfaces
 * created with recovery enabled.  A re-exposure takes a slot from the free
 * list, fills it, swaps it into the chunk and hands the slot it replaced back
 * to the free list, so the number of free slots is constant over time.
 *
 * Every slot carries a descriptor with the metadata of the payload it holds.
 * The descriptor is written only while the slot is owned by a single writer.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <gsl/span>
#include <rgtp/platform.h>
#include "MemoryArena.hpp"

namespace rgtp::lib
{
    /**
     * Metadata of the payload stored in a slot.
     * Fields are relaxed atomics; publication is ordered by the chunk record.
     */
    struct SlotDescriptor
    {
        std::atomic<std::uint32_t> size{0};
        std::atomic<std::uint32_t> digest{0};
        std::atomic<std::int64_t> exposureTime{0};
    };

    class RGTP_EXPORT MemoryPool
    {
    public:
        using SlotIndex = std::uint32_t;

        /**
         * Reserve homeSlots + spareSlots slots of slotSize bytes each.
         *
         * @throws std::invalid_argument if the slot geometry is empty or overflows
         * @throws std::bad_alloc if the memory cannot be reserved
         */
        MemoryPool(std::uint32_t homeSlots, std::uint32_t spareSlots, std::uint32_t slotSize);

        MemoryPool(MemoryPool const&) = delete;
        MemoryPool& operator=(MemoryPool const&) = delete;

        [[nodiscard]]
        std::uint32_t slotSize() const noexcept;

        [[nodiscard]]
        std::uint32_t slotCount() const noexcept;

        [[nodiscard]]
        std::uint32_t spareSlotCount() const noexcept;

        /** Byte range of a slot.  The index must be valid. */
        [[nodiscard]]
        gsl::span<std::uint8_t> slot(SlotIndex index) noexcept;

        [[nodiscard]]
        gsl::span<std::uint8_t const> slot(SlotIndex index) const noexcept;

        [[nodiscard]]
        SlotDescriptor& descriptor(SlotIndex index) noexcept;

        [[nodiscard]]
        SlotDescriptor const& descriptor(SlotIndex index) const noexcept;

        /**
         * Take a free spare slot.
         * @return The slot index, or nullopt if every spare slot is in use.
         */
        [[nodiscard]]
        std::optional<SlotIndex> acquire();

        /** Return a slot displaced by a re-exposure to the free list. */
        void release(SlotIndex index);

        [[nodiscard]]
        std::size_t freeSlotCount() const;

    private:
        MemoryArena _arena;
        std::uint32_t _slotSize;
        std::uint32_t _slotCount;
        std::uint32_t _spareSlotCount;
        std::unique_ptr<SlotDescriptor[]> _descriptors;

        mutable std::mutex _freeSlotsMutex;
        std::vector<SlotIndex> _freeSlots;
    };

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    inline std::uint32_t MemoryPool::slotSize() const noexcept
    {
        return _slotSize;
    }

    inline std::uint32_t MemoryPool::slotCount() const noexcept
    {
        return _slotCount;
    }

    inline std::uint32_t MemoryPool::spareSlotCount() const noexcept
    {
        return _spareSlotCount;
    }

    inline gsl::span<std::uint8_t> MemoryPool::slot(SlotIndex index) noexcept
    {
        return {_arena.data() + (static_cast<std::size_t>(index) * _slotSize), _slotSize};
    }

    inline gsl::span<std::uint8_t const> MemoryPool::slot(SlotIndex index) const noexcept
    {
        return {_arena.data() + (static_cast<std::size_t>(index) * _slotSize), _slotSize};
    }

    inline SlotDescriptor& MemoryPool::descriptor(SlotIndex index) noexcept
    {
        return _descriptors[index];
    }

    inline SlotDescriptor const& MemoryPool::descriptor(SlotIndex index) const noexcept
    {
        return _descriptors[index];
    }
}
