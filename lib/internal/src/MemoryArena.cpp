// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/MemoryArena.hpp"
#include <cerrno>
#include <cstring>
#include <new>
#include <stdexcept>
#include <sys/mman.h>
#include "rgtp-internal/Logging.hpp"

namespace rgtp::lib
{
    MemoryArena::MemoryArena(std::size_t size)
        : MemoryArena{}
    {
        if (size == 0U)
        {
            throw std::invalid_argument{"Cannot map an empty memory arena."};
        }

        auto const data = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (data == MAP_FAILED)
        {
            auto const error = errno;
            RGTP_ERROR("Failed to map {} bytes for the chunk pool: {}", size, std::strerror(error));
            throw std::bad_alloc{};
        }

        _data = data;
        _size = size;
    }

    MemoryArena::~MemoryArena()
    {
        if (_data != nullptr)
        {
            if (::munmap(_data, _size) != 0)
            {
                auto const error = errno;
                RGTP_WARN("Failed to unmap the chunk pool: {}", std::strerror(error));
            }
        }
    }
}
