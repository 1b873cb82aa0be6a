// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime configuration of the RGTP logging macros
 *
 * The macros themselves live in Logging.hpp.  This translation unit applies
 * the RGTP_LOG_LEVEL environment variable to spdlog, once per process, the
 * first time a surface is created.
 */

#include "rgtp-internal/Logging.hpp"
#include <cstdlib>
#include <exception>
#include <mutex>
#include <spdlog/cfg/helpers.h>

namespace rgtp::lib
{
    void initLogging() noexcept
    {
        static auto once = std::once_flag{};
        try
        {
            std::call_once(once,
                []()
                {
                    if (auto const level = std::getenv("RGTP_LOG_LEVEL"); (level != nullptr) && (*level != '\0'))
                    {
                        spdlog::cfg::helpers::load_levels(level);
                    }
                });
        }
        catch (std::exception const& e)
        {
            // A malformed level string keeps spdlog's defaults.
            RGTP_WARN("Ignoring RGTP_LOG_LEVEL: {}", e.what());
        }
    }
}
