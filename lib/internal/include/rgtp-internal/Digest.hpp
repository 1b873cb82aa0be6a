// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Digest.hpp
 * @brief Fast 32-bit integrity digests for chunk payloads
 *
 * The digest is a corruption detector, not a cryptographic hash.  Which
 * algorithm a surface uses is chosen at creation through the "digest" option.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <gsl/span>

namespace rgtp::lib
{
    enum class DigestAlgorithm
    {
        Fnv1a,  // 32-bit FNV-1a.
        Poly31, // h = h * 31 + byte, seeded with 0.
        None,   // No digest; the digest field stays 0.
    };

    /**
     * Compute the digest of \p data with \p algorithm.
     */
    [[nodiscard]]
    std::uint32_t computeDigest(DigestAlgorithm algorithm, gsl::span<std::uint8_t const> data) noexcept;

    /** Option spelling of an algorithm ("fnv1a", "poly31", "none"). */
    [[nodiscard]]
    constexpr char const* toString(DigestAlgorithm algorithm) noexcept
    {
        switch (algorithm)
        {
            case DigestAlgorithm::Fnv1a:  return "fnv1a";
            case DigestAlgorithm::Poly31: return "poly31";
            case DigestAlgorithm::None:   return "none";
        }
        return "UNKNOWN";
    }

    /** Parse the option spelling of an algorithm. */
    [[nodiscard]]
    std::optional<DigestAlgorithm> digestAlgorithmFromString(std::string_view name) noexcept;
}
