// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file MemoryArena.hpp
 * @brief One contiguous, page-backed region holding every chunk slot of a surface
 *
 * The arena is reserved once, when the surface is created, and released when
 * the surface is destroyed.  Nothing is allocated on the exposure or pull paths.
 *
 * The region is an anonymous private mapping subject to the kernel's
 * overcommit accounting when it is created.  A pool the system refuses to
 * back fails here with std::bad_alloc instead of on a later exposure.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <rgtp/platform.h>

namespace rgtp::lib
{
    /**
     * Move-only owner of an anonymous memory mapping.
     */
    class RGTP_EXPORT MemoryArena
    {
    public:
        /** Creates an empty, invalid arena. */
        constexpr MemoryArena() noexcept;

        /**
         * Map \p size bytes of zero-filled memory.
         *
         * @throws std::invalid_argument if size is 0
         * @throws std::bad_alloc if the mapping cannot be established
         */
        explicit MemoryArena(std::size_t size);

        constexpr MemoryArena(MemoryArena&& other) noexcept;
        MemoryArena(MemoryArena const& other) = delete;

        MemoryArena& operator=(MemoryArena other) noexcept;

        ~MemoryArena();

        constexpr bool isValid() const noexcept;
        constexpr explicit operator bool() const noexcept;

        /** Size of the mapping in bytes, as requested. */
        constexpr std::size_t size() const noexcept;

        constexpr std::uint8_t* data() noexcept;
        constexpr std::uint8_t const* data() const noexcept;

        constexpr void swap(MemoryArena& other) noexcept;

    private:
        void* _data;
        std::size_t _size;
    };

    constexpr void swap(MemoryArena& lhs, MemoryArena& rhs) noexcept;

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    constexpr MemoryArena::MemoryArena() noexcept
        : _data{nullptr}
        , _size{0}
    {}

    constexpr MemoryArena::MemoryArena(MemoryArena&& other) noexcept
        : MemoryArena{}
    {
        swap(other);
    }

    inline MemoryArena& MemoryArena::operator=(MemoryArena other) noexcept
    {
        swap(other);
        return *this;
    }

    constexpr bool MemoryArena::isValid() const noexcept
    {
        return (_data != nullptr);
    }

    constexpr MemoryArena::operator bool() const noexcept
    {
        return isValid();
    }

    constexpr std::size_t MemoryArena::size() const noexcept
    {
        return _size;
    }

    constexpr std::uint8_t* MemoryArena::data() noexcept
    {
        return static_cast<std::uint8_t*>(_data);
    }

    constexpr std::uint8_t const* MemoryArena::data() const noexcept
    {
        return static_cast<std::uint8_t const*>(_data);
    }

    constexpr void MemoryArena::swap(MemoryArena& other) noexcept
    {
        // Workaround for std::swap not being declared constexpr in libstdc++ v10
        constexpr auto const cx_swap = [](auto& lhs, auto& rhs) constexpr noexcept
        {
            auto temp = lhs;
            lhs = rhs;
            rhs = temp;
        };

        cx_swap(_data, other._data);
        cx_swap(_size, other._size);
    }

    constexpr void swap(MemoryArena& lhs, MemoryArena& rhs) noexcept
    {
        lhs.swap(rhs);
    }
}
