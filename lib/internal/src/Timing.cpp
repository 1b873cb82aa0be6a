// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/Timing.hpp"
#include <ctime>
#include "rgtp-internal/detail/ClockHelpers.hpp"

namespace rgtp::lib
{
    Timepoint currentTime(Clock clock) noexcept
    {
        auto ts = std::timespec{};
        if (::clock_gettime(detail::clockToId(clock), &ts) == 0)
        {
            return asTimepoint(ts);
        }
        return Timepoint{};
    }
}
