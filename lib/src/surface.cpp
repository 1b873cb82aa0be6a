// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp/surface.h"
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <variant>
#include "internal/Handles.hpp"
#include "rgtp-internal/ExposureSurface.hpp"

using namespace rgtp::lib;

namespace
{
    gsl::span<std::uint8_t const> asPayload(void const* data, std::uint32_t size) noexcept
    {
        return {static_cast<std::uint8_t const*>(data), size};
    }

    gsl::span<std::uint8_t> asBuffer(void* data, std::uint32_t size) noexcept
    {
        return {static_cast<std::uint8_t*>(data), size};
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpCreateSurface(rgtpManifest const* in_manifest, char const* in_options, rgtpSurface* out_surface)
{
    if ((in_manifest == nullptr) || (out_surface == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    try
    {
        auto result = createSurface(*in_manifest, (in_options != nullptr) ? std::string{in_options} : std::string{});
        if (auto const error = std::get_if<Error>(&result); error != nullptr)
        {
            return toStatus(*error);
        }

        *out_surface = to_rgtpSurface(std::get<std::unique_ptr<ExposureSurface>>(result).release());
        return RGTP_STATUS_OK;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpDestroySurface(rgtpSurface in_surface)
{
    try
    {
        delete to_ExposureSurface(in_surface);
        return RGTP_STATUS_OK;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpExposeChunk(rgtpSurface in_surface, uint32_t in_chunkId, void const* in_payload, uint32_t in_size)
{
    try
    {
        if (auto const surface = to_ExposureSurface(in_surface); (surface != nullptr) && ((in_payload != nullptr) || (in_size == 0U)))
        {
            auto const result = surface->expose(in_chunkId, asPayload(in_payload, in_size));
            if (auto const error = std::get_if<Error>(&result); error != nullptr)
            {
                return toStatus(*error);
            }
            return RGTP_STATUS_OK;
        }
        return RGTP_ERR_INVALID_ARG;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpExposeBatch(rgtpSurface in_surface, uint32_t in_startId, void const* const* in_payloads, uint32_t const* in_sizes, uint32_t in_count,
    uint32_t* out_exposed)
{
    try
    {
        auto const surface = to_ExposureSurface(in_surface);
        if ((surface == nullptr) || (out_exposed == nullptr) || ((in_count != 0U) && ((in_payloads == nullptr) || (in_sizes == nullptr))))
        {
            return RGTP_ERR_INVALID_ARG;
        }

        auto exposed = std::uint32_t{0};
        for (auto i = std::uint32_t{0}; i < in_count; ++i)
        {
            auto const id = static_cast<std::uint64_t>(in_startId) + i;
            // A NULL payload is an invalid entry, skipped like any other.
            if ((id <= std::numeric_limits<std::uint32_t>::max()) && ((in_payloads[i] != nullptr) || (in_sizes[i] == 0U)) &&
                succeeded(surface->expose(static_cast<std::uint32_t>(id), asPayload(in_payloads[i], in_sizes[i]))))
            {
                ++exposed;
            }
        }
        *out_exposed = exposed;
        return RGTP_STATUS_OK;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpRaiseCompletion(rgtpSurface in_surface)
{
    if (auto const surface = to_ExposureSurface(in_surface); surface != nullptr)
    {
        surface->raiseCompletion();
        return RGTP_STATUS_OK;
    }
    return RGTP_ERR_INVALID_ARG;
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpPeekChunk(rgtpSurface in_surface, uint32_t in_chunkId, rgtpChunkInfo* out_info)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) || (out_info == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    auto const view = surface->peek(in_chunkId);
    if (!view)
    {
        return RGTP_ERR_CHUNK_OUT_OF_RANGE;
    }

    out_info->sequenceId = view->sequenceId;
    out_info->capacity = view->capacity;
    out_info->dataSize = view->size;
    out_info->offset = view->offset;
    out_info->digest = view->digest;
    out_info->pullCount = view->pullCount;
    out_info->generation = view->generation;
    out_info->exposureTime = static_cast<std::uint64_t>(view->exposureTime.value);
    out_info->published = view->published ? 1U : 0U;
    return RGTP_STATUS_OK;
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpPullChunk(rgtpSurface in_surface, uint32_t in_chunkId, void* out_buffer, uint32_t in_bufferSize, uint32_t* out_size)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) || (out_size == nullptr) || ((out_buffer == nullptr) && (in_bufferSize != 0U)))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    return toStatus(surface->pull(in_chunkId, asBuffer(out_buffer, in_bufferSize)), *out_size);
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpPullBatch(rgtpSurface in_surface, uint32_t const* in_chunkIds, void* const* out_buffers, uint32_t const* in_bufferSizes,
    uint32_t in_count, rgtpStatus* out_results, uint32_t* out_sizes)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) ||
        ((in_count != 0U) &&
            ((in_chunkIds == nullptr) || (out_buffers == nullptr) || (in_bufferSizes == nullptr) || (out_results == nullptr) || (out_sizes == nullptr))))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    for (auto i = std::uint32_t{0}; i < in_count; ++i)
    {
        if ((out_buffers[i] == nullptr) && (in_bufferSizes[i] != 0U))
        {
            out_results[i] = RGTP_ERR_INVALID_ARG;
            out_sizes[i] = 0U;
            continue;
        }
        out_results[i] = toStatus(surface->pull(in_chunkIds[i], asBuffer(out_buffers[i], in_bufferSizes[i])), out_sizes[i]);
    }
    return RGTP_STATUS_OK;
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpVerifyChunk(rgtpSurface in_surface, uint32_t in_chunkId, bool* out_intact)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) || (out_intact == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    return std::visit(
        overloaded{
            [&](Integrity integrity)
            {
                *out_intact = (integrity == Integrity::Intact);
                return RGTP_STATUS_OK;
            },
            [](NotReady) { return RGTP_ERR_CHUNK_NOT_READY; },
            [](NotFound) { return RGTP_ERR_CHUNK_OUT_OF_RANGE; },
        },
        surface->verify(in_chunkId));
}

extern "C"
RGTP_EXPORT
bool rgtpIsComplete(rgtpSurface in_surface)
{
    auto const surface = to_ExposureSurface(in_surface);
    return (surface != nullptr) && surface->isComplete();
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpGetSurfaceStats(rgtpSurface in_surface, rgtpSurfaceStats* out_stats)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) || (out_stats == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    auto const stats = surface->stats();
    out_stats->elapsedMs = static_cast<std::uint64_t>(inMilliSeconds(stats.elapsed));
    out_stats->totalBytes = stats.totalBytes;
    out_stats->throughput = stats.throughput;
    out_stats->exposedCount = stats.exposedCount;
    out_stats->chunkCount = stats.chunkCount;
    out_stats->reexposureCount = stats.reexposureCount;
    out_stats->exhaustedCount = stats.exhaustedCount;
    out_stats->complete = stats.complete ? 1U : 0U;
    return RGTP_STATUS_OK;
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpGetManifest(rgtpSurface in_surface, rgtpManifest* out_manifest)
{
    auto const surface = to_ExposureSurface(in_surface);
    if ((surface == nullptr) || (out_manifest == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    *out_manifest = surface->manifest();
    return RGTP_STATUS_OK;
}
