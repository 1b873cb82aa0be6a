// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Manifest.hpp
 * @brief Validation and chunk geometry of rgtpManifest
 *
 * The manifest is used as a plain value type throughout the library; these
 * helpers derive the chunk plan from it.  Chunk i covers the byte range
 * [i * chunkSize, i * chunkSize + capacity(i)) of the logical stream, where
 * every chunk has a capacity of chunkSize except the last one, which holds
 * the remainder.
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <rgtp/manifest.h>
#include <rgtp/platform.h>

namespace rgtp::lib
{
    /**
     * Number of chunks needed to cover \p totalSize bytes, ceil(totalSize / chunkSize).
     * @throws std::invalid_argument if chunkSize is 0 or the count does not fit 32 bits.
     */
    [[nodiscard]]
    RGTP_EXPORT
    std::uint32_t chunkCountFor(std::uint64_t totalSize, std::uint32_t chunkSize);

    /**
     * Capacity of chunk \p id.  The id must be below the manifest's chunk count.
     */
    [[nodiscard]]
    RGTP_EXPORT
    std::uint32_t chunkCapacity(rgtpManifest const& manifest, std::uint32_t id) noexcept;

    /** Byte offset of chunk \p id in the logical stream. */
    [[nodiscard]]
    constexpr std::uint64_t chunkOffset(rgtpManifest const& manifest, std::uint32_t id) noexcept
    {
        return static_cast<std::uint64_t>(id) * manifest.chunkSize;
    }

    /**
     * Check every manifest invariant:
     *   - the identifier is NUL terminated within its field,
     *   - 0 < chunkSize <= RGTP_MAX_CHUNK_SIZE,
     *   - totalSize > 0,
     *   - totalChunks == ceil(totalSize / chunkSize).
     *
     * @throws std::invalid_argument describing the first violated rule.
     */
    RGTP_EXPORT
    void validateManifest(rgtpManifest const& manifest);

    /**
     * Build a validated manifest, computing the chunk count.
     * @throws std::invalid_argument if the resulting manifest is invalid.
     */
    [[nodiscard]]
    RGTP_EXPORT
    rgtpManifest makeManifest(std::string_view fileId, std::uint64_t totalSize, std::uint32_t chunkSize);

    /** The identifier as a string, stopping at the terminator or the end of the field. */
    [[nodiscard]]
    RGTP_EXPORT
    std::string fileIdOf(rgtpManifest const& manifest);

    /** Lower case hex spelling of the fingerprint. */
    [[nodiscard]]
    RGTP_EXPORT
    std::string fingerprintOf(rgtpManifest const& manifest);
}

/** Multi-line, human readable description of a manifest. */
RGTP_EXPORT
std::ostream& operator<<(std::ostream& os, rgtpManifest const& manifest);
