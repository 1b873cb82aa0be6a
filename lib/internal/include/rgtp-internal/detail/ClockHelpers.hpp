// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ClockHelpers.hpp
 * @brief Mapping of the RGTP Clock enum to POSIX clock ids
 *
 * CLOCK_MONOTONIC_RAW is preferred over CLOCK_MONOTONIC because NTP frequency
 * slewing would otherwise leak into the throughput figures.
 */

#pragma once

#include <ctime>
#include "../Timing.hpp"

namespace rgtp::lib::detail
{
    constexpr clockid_t clockToId(Clock clock) noexcept
    {
        switch (clock)
        {
            case Clock::Monotonic:
#if defined(CLOCK_MONOTONIC_RAW)
                return CLOCK_MONOTONIC_RAW;
#else
                return CLOCK_MONOTONIC;
#endif
            default: return CLOCK_REALTIME;
        }
    }
}
