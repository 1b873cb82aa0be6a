// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ManifestParser.hpp
 * @brief Parse a JSON manifest definition into an rgtpManifest
 *
 * Example definition:
 * {
 *   "fileId": "video-42",
 *   "totalSize": 1048576,
 *   "chunkSize": 65536,
 *   "encodingType": 0,
 *   "exposureCadenceMs": 5,
 *   "totalChunks": 16,
 *   "fingerprint": "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08"
 * }
 *
 * fileId, totalSize and chunkSize are required.  totalChunks is computed when
 * absent and checked when present.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <picojson/picojson.h>
#include <rgtp/manifest.h>
#include <rgtp/platform.h>

namespace rgtp::lib
{
    class RGTP_EXPORT ManifestParser
    {
    public:
        /**
         * Parse and validate a manifest definition.
         * @throws std::invalid_argument if the JSON is malformed or the manifest is invalid.
         */
        explicit ManifestParser(std::string const& in_definition);

        /** The validated manifest. */
        [[nodiscard]]
        rgtpManifest const& getManifest() const noexcept;

        /**
         * Generic accessor for arbitrary JSON fields.
         * @throws std::invalid_argument if the field is not present.
         */
        template<typename T>
        [[nodiscard]]
        T get(std::string const& field) const;

    private:
        rgtpManifest _manifest;
        picojson::object _root;
    };

    /**************************************************************************/
    /* Inline implementation.                                                 */
    /**************************************************************************/

    inline rgtpManifest const& ManifestParser::getManifest() const noexcept
    {
        return _manifest;
    }

    template<typename T>
    inline T ManifestParser::get(std::string const& field) const
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
