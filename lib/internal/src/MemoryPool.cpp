// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/MemoryPool.hpp"
#include <limits>
#include <stdexcept>
#include "rgtp-internal/Logging.hpp"

namespace rgtp::lib
{
    namespace
    {
        std::uint32_t totalSlots(std::uint32_t homeSlots, std::uint32_t spareSlots)
        {
            if ((homeSlots == 0U) || (spareSlots > (std::numeric_limits<std::uint32_t>::max() - homeSlots)))
            {
                throw std::invalid_argument{"Invalid memory pool slot count."};
            }
            return homeSlots + spareSlots;
        }

        std::size_t arenaSize(std::uint32_t slotCount, std::uint32_t slotSize)
        {
            if (slotSize == 0U)
            {
                throw std::invalid_argument{"Invalid memory pool slot size."};
            }
            auto const slots = static_cast<std::size_t>(slotCount);
            if (slots > (std::numeric_limits<std::size_t>::max() / slotSize))
            {
                throw std::bad_alloc{};
            }
            return slots * slotSize;
        }
    }

    MemoryPool::MemoryPool(std::uint32_t homeSlots, std::uint32_t spareSlots, std::uint32_t slotSize)
        : _arena{}
        , _slotSize{slotSize}
        , _slotCount{totalSlots(homeSlots, spareSlots)}
        , _spareSlotCount{spareSlots}
        , _descriptors{}
        , _freeSlotsMutex{}
        , _freeSlots{}
    {
        _arena = MemoryArena{arenaSize(_slotCount, _slotSize)};
        _descriptors = std::make_unique<SlotDescriptor[]>(_slotCount);

        _freeSlots.reserve(spareSlots);
        for (auto index = homeSlots; index < _slotCount; ++index)
        {
            _freeSlots.push_back(index);
        }

        RGTP_DEBUG("Reserved {} slots of {} bytes ({} spare).", _slotCount, _slotSize, _spareSlotCount);
    }

    std::optional<MemoryPool::SlotIndex> MemoryPool::acquire()
    {
        auto const lock = std::lock_guard{_freeSlotsMutex};
        if (_freeSlots.empty())
        {
            return std::nullopt;
        }
        auto const index = _freeSlots.back();
        _freeSlots.pop_back();
        return index;
    }

    void MemoryPool::release(SlotIndex index)
    {
        if (index >= _slotCount)
        {
            throw std::out_of_range{"Slot index does not belong to this pool."};
        }
        auto const lock = std::lock_guard{_freeSlotsMutex};
        _freeSlots.push_back(index);
    }

    std::size_t MemoryPool::freeSlotCount() const
    {
        auto const lock = std::lock_guard{_freeSlotsMutex};
        return _freeSlots.size();
    }
}
