// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/Manifest.hpp"
#include <cstring>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <fmt/format.h>

namespace rgtp::lib
{
    std::uint32_t chunkCountFor(std::uint64_t totalSize, std::uint32_t chunkSize)
    {
        if (chunkSize == 0U)
        {
            throw std::invalid_argument{"Chunk size must be greater than 0."};
        }

        auto const count = (totalSize / chunkSize) + (((totalSize % chunkSize) != 0U) ? 1U : 0U);
        if (count > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument{fmt::format("{} bytes in chunks of {} bytes exceed the maximum chunk count.", totalSize, chunkSize)};
        }
        return static_cast<std::uint32_t>(count);
    }

    std::uint32_t chunkCapacity(rgtpManifest const& manifest, std::uint32_t id) noexcept
    {
        if ((id + 1U) == manifest.totalChunks)
        {
            auto const remainder = static_cast<std::uint32_t>(manifest.totalSize % manifest.chunkSize);
            return (remainder != 0U) ? remainder : manifest.chunkSize;
        }
        return manifest.chunkSize;
    }

    void validateManifest(rgtpManifest const& manifest)
    {
        if (::memchr(manifest.fileId, '\0', sizeof manifest.fileId) == nullptr)
        {
            throw std::invalid_argument{fmt::format("File id is not terminated within {} bytes.", sizeof manifest.fileId)};
        }
        if ((manifest.chunkSize == 0U) || (manifest.chunkSize > RGTP_MAX_CHUNK_SIZE))
        {
            throw std::invalid_argument{fmt::format("Chunk size {} is not within [1, {}].", manifest.chunkSize, RGTP_MAX_CHUNK_SIZE)};
        }
        if (manifest.totalSize == 0U)
        {
            throw std::invalid_argument{"Total size must be greater than 0."};
        }

        auto const expected = chunkCountFor(manifest.totalSize, manifest.chunkSize);
        if (manifest.totalChunks != expected)
        {
            throw std::invalid_argument{fmt::format(
                "Chunk count {} does not match {} bytes in chunks of {} bytes (expected {}).",
                manifest.totalChunks,
                manifest.totalSize,
                manifest.chunkSize,
                expected)};
        }
    }

    rgtpManifest makeManifest(std::string_view fileId, std::uint64_t totalSize, std::uint32_t chunkSize)
    {
        auto manifest = rgtpManifest{};
        if (fileId.size() >= sizeof manifest.fileId)
        {
            throw std::invalid_argument{fmt::format("File id '{}' is longer than {} characters.", fileId, sizeof manifest.fileId - 1U)};
        }
        fileId.copy(manifest.fileId, fileId.size());
        manifest.totalSize = totalSize;
        manifest.chunkSize = chunkSize;
        if (chunkSize != 0U)
        {
            manifest.totalChunks = chunkCountFor(totalSize, chunkSize);
        }

        validateManifest(manifest);
        return manifest;
    }

    std::string fileIdOf(rgtpManifest const& manifest)
    {
        auto const end = static_cast<char const*>(::memchr(manifest.fileId, '\0', sizeof manifest.fileId));
        auto const length = (end != nullptr) ? static_cast<std::size_t>(end - manifest.fileId) : sizeof manifest.fileId;
        return {manifest.fileId, length};
    }

    std::string fingerprintOf(rgtpManifest const& manifest)
    {
        auto result = std::string{};
        result.reserve(2U * sizeof manifest.fingerprint);
        for (auto const byte : manifest.fingerprint)
        {
            result += fmt::format("{:02x}", byte);
        }
        return result;
    }
}

std::ostream& operator<<(std::ostream& os, rgtpManifest const& manifest)
{
    os << "- Manifest [" << rgtp::lib::fileIdOf(manifest) << ']' << '\n'
       << '\t' << fmt::format("{: >18}: {}", "Total size", manifest.totalSize) << '\n'
       << '\t' << fmt::format("{: >18}: {}", "Chunk size", manifest.chunkSize) << '\n'
       << '\t' << fmt::format("{: >18}: {}", "Chunk count", manifest.totalChunks) << '\n'
       << '\t' << fmt::format("{: >18}: {}", "Encoding type", manifest.encodingType) << '\n'
       << '\t' << fmt::format("{: >18}: {} ms", "Exposure cadence", manifest.exposureCadenceMs) << '\n'
       << '\t' << fmt::format("{: >18}: {}", "Fingerprint", rgtp::lib::fingerprintOf(manifest)) << '\n';
    return os;
}
