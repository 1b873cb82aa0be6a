// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <stdexcept>
#include <variant>
#include <fmt/format.h>
#include "rgtp-internal/Manifest.hpp"

namespace rgtp::tests
{
    std::vector<std::uint8_t> makePayload(std::uint32_t id, std::size_t size, std::uint8_t salt)
    {
        auto payload = std::vector<std::uint8_t>(size);
        for (auto i = std::size_t{0}; i < size; ++i)
        {
            // Little endian id first, then a pattern.
            payload[i] = (i < sizeof id) ? static_cast<std::uint8_t>(id >> (8U * i)) : static_cast<std::uint8_t>((id * 131U) + (i * 7U) + salt);
        }
        return payload;
    }

    std::unique_ptr<lib::ExposureSurface> makeSurface(rgtpManifest const& manifest, lib::SurfaceOptions const& options)
    {
        auto result = lib::createSurface(manifest, options);
        if (auto const error = std::get_if<lib::Error>(&result); error != nullptr)
        {
            throw std::runtime_error{fmt::format("Failed to create surface: {}", lib::toString(*error))};
        }
        return std::move(std::get<std::unique_ptr<lib::ExposureSurface>>(result));
    }

    std::vector<std::vector<std::uint8_t>> makeDataSet(rgtpManifest const& manifest, std::uint8_t salt)
    {
        auto chunks = std::vector<std::vector<std::uint8_t>>{};
        chunks.reserve(manifest.totalChunks);
        for (auto id = std::uint32_t{0}; id < manifest.totalChunks; ++id)
        {
            chunks.push_back(makePayload(id, lib::chunkCapacity(manifest, id), salt));
        }
        return chunks;
    }
}
