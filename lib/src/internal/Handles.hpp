// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Handles.hpp
 * @brief Conversions between the C ABI and the C++ engine
 */

#pragma once

#include <rgtp/rgtp.h>
#include <rgtp/surface.h>
#include "rgtp-internal/ExposureSurface.hpp"
#include "rgtp-internal/Result.hpp"

namespace rgtp::lib
{
    inline ExposureSurface* to_ExposureSurface(rgtpSurface surface) noexcept
    {
        return reinterpret_cast<ExposureSurface*>(surface);
    }

    inline rgtpSurface to_rgtpSurface(ExposureSurface* surface) noexcept
    {
        return reinterpret_cast<rgtpSurface>(surface);
    }

    constexpr rgtpStatus toStatus(Error error) noexcept
    {
        switch (error)
        {
            case Error::InvalidParameter:  return RGTP_ERR_INVALID_ARG;
            case Error::AllocationFailure: return RGTP_ERR_ALLOCATION_FAILURE;
            case Error::ChunkOutOfRange:   return RGTP_ERR_CHUNK_OUT_OF_RANGE;
            case Error::ChunkTooLarge:     return RGTP_ERR_CHUNK_TOO_LARGE;
            case Error::ChunkNotReady:     return RGTP_ERR_CHUNK_NOT_READY;
            case Error::SurfaceExhausted:  return RGTP_ERR_SURFACE_EXHAUSTED;
        }
        return RGTP_ERR_UNKNOWN;
    }

    /** Status of a pull, with the copied (or required) size in \p size. */
    inline rgtpStatus toStatus(PullResult const& result, std::uint32_t& size) noexcept
    {
        return std::visit(
            overloaded{
                [&](Pulled const& pulled)
                {
                    size = pulled.size;
                    return RGTP_STATUS_OK;
                },
                [&](NotReady)
                {
                    size = 0U;
                    return RGTP_ERR_CHUNK_NOT_READY;
                },
                [&](NotFound)
                {
                    size = 0U;
                    return RGTP_ERR_CHUNK_OUT_OF_RANGE;
                },
                [&](DestinationTooSmall const& tooSmall)
                {
                    size = static_cast<std::uint32_t>(tooSmall.required);
                    return RGTP_ERR_BUFFER_TOO_SMALL;
                },
            },
            result);
    }
}
