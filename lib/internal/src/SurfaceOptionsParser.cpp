// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/SurfaceOptionsParser.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <fmt/format.h>

namespace rgtp::lib
{
    SurfaceOptionsParser::SurfaceOptionsParser(std::string const& in_options)
    {
        if (in_options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_options);
        if (!err.empty())
        {
            throw std::invalid_argument{"Invalid JSON options. " + err};
        }

        if (jsonValue.is<picojson::null>())
        {
            return;
        }
        if (!jsonValue.is<picojson::object>())
        {
            throw std::invalid_argument{"Expected a JSON object"};
        }
        _root = jsonValue.get<picojson::object>();

        //
        // recoveryMode
        //
        if (auto const it = _root.find("recoveryMode"); it != _root.end())
        {
            if (!it->second.is<bool>())
            {
                throw std::invalid_argument{"recoveryMode must be a boolean."};
            }
            _recoveryMode = it->second.get<bool>();
        }

        //
        // recoverySlots
        //
        if (auto const it = _root.find("recoverySlots"); it != _root.end())
        {
            if (!it->second.is<double>())
            {
                throw std::invalid_argument{"recoverySlots must be a number."};
            }

            auto const v = it->second.get<double>();
            if ((v < 1) || (v > std::numeric_limits<std::uint32_t>::max()) || (std::floor(v) != v))
            {
                throw std::invalid_argument{"recoverySlots must be an integer greater or equal to 1."};
            }
            _recoverySlots = static_cast<std::uint32_t>(v);
        }

        //
        // digest
        //
        if (auto const it = _root.find("digest"); it != _root.end())
        {
            if (!it->second.is<std::string>())
            {
                throw std::invalid_argument{"digest must be a string."};
            }

            auto const& name = it->second.get<std::string>();
            _digest = digestAlgorithmFromString(name);
            if (!_digest)
            {
                throw std::invalid_argument{fmt::format("Unknown digest algorithm '{}'.", name)};
            }
        }
    }

    std::optional<bool> SurfaceOptionsParser::getRecoveryMode() const
    {
        return _recoveryMode;
    }

    std::optional<std::uint32_t> SurfaceOptionsParser::getRecoverySlots() const
    {
        return _recoverySlots;
    }

    std::optional<DigestAlgorithm> SurfaceOptionsParser::getDigestAlgorithm() const
    {
        return _digest;
    }

    SurfaceOptions SurfaceOptionsParser::getOptions() const
    {
        auto options = SurfaceOptions{};
        options.recoveryMode = _recoveryMode.value_or(options.recoveryMode);
        options.recoverySlots = _recoverySlots.value_or(options.recoverySlots);
        options.digest = _digest.value_or(options.digest);
        return options;
    }
}
