// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SurfaceOptionsParser.hpp
 * @brief Parse the operational options of an exposure surface
 *
 * Example options JSON:
 * {
 *   "recoveryMode": true,   // Exposing a published chunk replaces its payload
 *   "recoverySlots": 4,     // Spare pool slots available to re-exposures
 *   "digest": "poly31"      // "fnv1a" (default), "poly31" or "none"
 * }
 *
 * Every field is optional; an empty string means "all defaults".
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <picojson/picojson.h>
#include <rgtp/platform.h>
#include "Digest.hpp"

namespace rgtp::lib
{
    /**
     * Resolved surface options.
     */
    struct SurfaceOptions
    {
        bool recoveryMode{false};
        /** Spare slots reserved for re-exposures.  Ignored unless recoveryMode is set. */
        std::uint32_t recoverySlots{1};
        DigestAlgorithm digest{DigestAlgorithm::Fnv1a};
    };

    class RGTP_EXPORT SurfaceOptionsParser
    {
    public:
        /** No options: every getter returns nullopt. */
        SurfaceOptionsParser() = default;

        /**
         * @throws std::invalid_argument if the JSON is malformed or a value is invalid.
         */
        explicit SurfaceOptionsParser(std::string const& in_options);

        [[nodiscard]]
        std::optional<bool> getRecoveryMode() const;

        [[nodiscard]]
        std::optional<std::uint32_t> getRecoverySlots() const;

        [[nodiscard]]
        std::optional<DigestAlgorithm> getDigestAlgorithm() const;

        /** Parsed values, with defaults filled in. */
        [[nodiscard]]
        SurfaceOptions getOptions() const;

        /**
         * Generic accessor for arbitrary JSON fields.
         * @throws std::invalid_argument if the field is not present.
         */
        template<typename T>
        [[nodiscard]]
        T get(std::string const& field) const;

    private:
        std::optional<bool> _recoveryMode;
        std::optional<std::uint32_t> _recoverySlots;
        std::optional<DigestAlgorithm> _digest;

        picojson::object _root;
    };

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    template<typename T>
    inline T SurfaceOptionsParser::get(std::string const& field) const
    {
        if (auto const it = _root.find(field); it != _root.end())
        {
            return it->second.get<T>();
        }
        else
        {
            auto msg = std::string{"Required '"} + field + "' not found.";
            throw std::invalid_argument{std::move(msg)};
        }
    }
}
