// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/Digest.hpp"

namespace rgtp::lib
{
    namespace
    {
        constexpr auto FNV1A_OFFSET_BASIS = std::uint32_t{0x811C9DC5U};
        constexpr auto FNV1A_PRIME = std::uint32_t{0x01000193U};

        std::uint32_t fnv1a(gsl::span<std::uint8_t const> data) noexcept
        {
            auto hash = FNV1A_OFFSET_BASIS;
            for (auto const byte : data)
            {
                hash ^= byte;
                hash *= FNV1A_PRIME;
            }
            return hash;
        }

        std::uint32_t poly31(gsl::span<std::uint8_t const> data) noexcept
        {
            auto hash = std::uint32_t{0};
            for (auto const byte : data)
            {
                hash = (hash * 31U) + byte;
            }
            return hash;
        }
    }

    std::uint32_t computeDigest(DigestAlgorithm algorithm, gsl::span<std::uint8_t const> data) noexcept
    {
        switch (algorithm)
        {
            case DigestAlgorithm::Fnv1a:  return fnv1a(data);
            case DigestAlgorithm::Poly31: return poly31(data);
            case DigestAlgorithm::None:   return 0U;
        }
        return 0U;
    }

    std::optional<DigestAlgorithm> digestAlgorithmFromString(std::string_view name) noexcept
    {
        for (auto const algorithm : {DigestAlgorithm::Fnv1a, DigestAlgorithm::Poly31, DigestAlgorithm::None})
        {
            if (name == toString(algorithm))
            {
                return algorithm;
            }
        }
        return std::nullopt;
    }
}
