// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/ManifestParser.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>
#include "rgtp-internal/Manifest.hpp"

namespace rgtp::lib
{
    namespace
    {
        /**
         * Fetch a required or optional non-negative integral field.
         * picojson stores numbers as double, so values beyond 2^53 are rejected.
         */
        template<typename T>
        std::optional<T> readUnsigned(picojson::object const& root, char const* field, bool required)
        {
            auto const it = root.find(field);
            if (it == root.end())
            {
                if (required)
                {
                    throw std::invalid_argument{fmt::format("Required '{}' not found.", field)};
                }
                return std::nullopt;
            }
            if (!it->second.is<double>())
            {
                throw std::invalid_argument{fmt::format("'{}' must be a number.", field)};
            }

            auto const v = it->second.get<double>();
            constexpr auto maxExact = 9007199254740992.0; // 2^53
            auto const limit = std::min(static_cast<double>(std::numeric_limits<T>::max()), maxExact);
            if ((v < 0.0) || (v > limit) || (std::floor(v) != v))
            {
                throw std::invalid_argument{fmt::format("'{}' must be an integer in [0, {}].", field, limit)};
            }
            return static_cast<T>(v);
        }

        int hexValue(char c)
        {
            if ((c >= '0') && (c <= '9'))
            {
                return c - '0';
            }
            if ((c >= 'a') && (c <= 'f'))
            {
                return c - 'a' + 10;
            }
            if ((c >= 'A') && (c <= 'F'))
            {
                return c - 'A' + 10;
            }
            throw std::invalid_argument{fmt::format("Invalid hex digit '{}' in fingerprint.", c)};
        }

        void parseFingerprint(std::string_view hex, rgtpManifest& manifest)
        {
            if (hex.size() != (2U * sizeof manifest.fingerprint))
            {
                throw std::invalid_argument{fmt::format("Fingerprint must be {} hex digits.", 2U * sizeof manifest.fingerprint)};
            }
            for (auto i = std::size_t{0}; i < sizeof manifest.fingerprint; ++i)
            {
                manifest.fingerprint[i] = static_cast<std::uint8_t>((hexValue(hex[2U * i]) << 4) | hexValue(hex[(2U * i) + 1U]));
            }
        }
    }

    ManifestParser::ManifestParser(std::string const& in_definition)
        : _manifest{}
        , _root{}
    {
        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_definition);
        if (!err.empty())
        {
            throw std::invalid_argument{"Invalid JSON manifest. " + err};
        }
        if (!jsonValue.is<picojson::object>())
        {
            throw std::invalid_argument{"Expected a JSON object"};
        }
        _root = jsonValue.get<picojson::object>();

        auto const fileIdIt = _root.find("fileId");
        if (fileIdIt == _root.end())
        {
            throw std::invalid_argument{"Required 'fileId' not found."};
        }
        if (!fileIdIt->second.is<std::string>())
        {
            throw std::invalid_argument{"'fileId' must be a string."};
        }

        auto const totalSize = *readUnsigned<std::uint64_t>(_root, "totalSize", true);
        auto const chunkSize = *readUnsigned<std::uint32_t>(_root, "chunkSize", true);

        // Computes totalChunks and checks the common rules.
        _manifest = makeManifest(fileIdIt->second.get<std::string>(), totalSize, chunkSize);

        _manifest.encodingType = readUnsigned<std::uint16_t>(_root, "encodingType", false).value_or(0U);
        _manifest.exposureCadenceMs = readUnsigned<std::uint32_t>(_root, "exposureCadenceMs", false).value_or(0U);

        if (auto const totalChunks = readUnsigned<std::uint32_t>(_root, "totalChunks", false); totalChunks && (*totalChunks != _manifest.totalChunks))
        {
            throw std::invalid_argument{
                fmt::format("'totalChunks' is {} but {} bytes in chunks of {} bytes need {}.", *totalChunks, totalSize, chunkSize, _manifest.totalChunks)};
        }

        if (auto const fingerprintIt = _root.find("fingerprint"); fingerprintIt != _root.end())
        {
            if (!fingerprintIt->second.is<std::string>())
            {
                throw std::invalid_argument{"'fingerprint' must be a string."};
            }
            parseFingerprint(fingerprintIt->second.get<std::string>(), _manifest);
        }
    }
}
