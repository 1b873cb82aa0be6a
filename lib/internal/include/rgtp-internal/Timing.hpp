// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Timing.hpp
 * @brief Time primitives for RGTP: Timepoint, Duration, and Clock
 *
 * Timepoint and Duration are trivially copyable wrappers around int64_t
 * nanoseconds, so they can be stored in atomics next to the chunk records.
 * Surfaces use Clock::Monotonic for their start time and chunk timestamps so
 * that throughput figures are immune to wall-clock adjustments.
 */

#pragma once

#include <cstdint>
#include <ctime>

namespace rgtp::lib
{
    /**
     * The system clocks RGTP reads from.
     */
    enum class Clock
    {
        Monotonic, // Unaffected by system time changes, used for elapsed time.
        Realtime,  // Wall-clock time (UTC).
    };

    /**
     * A point in time, in nanoseconds since the epoch of the Clock it was taken from.
     */
    struct Timepoint
    {
        using value_type = std::int64_t;

        value_type value;

        constexpr Timepoint() noexcept
            : value{}
        {}

        constexpr explicit Timepoint(value_type v) noexcept
            : value{v}
        {}

        /** A zero timepoint means "never". */
        constexpr explicit operator bool() const noexcept
        {
            return (value != 0);
        }
    };

    /**
     * The signed difference between two Timepoints, in nanoseconds.
     */
    struct Duration
    {
        using value_type = std::int64_t;

        value_type value;

        constexpr Duration() noexcept
            : value{}
        {}

        constexpr explicit Duration(value_type v) noexcept
            : value{v}
        {}

        constexpr explicit operator bool() const noexcept
        {
            return (value != 0);
        }
    };

    /**
     * Get the current time from the specified clock.
     * Returns a zero Timepoint if the clock cannot be read.
     */
    [[nodiscard]]
    Timepoint currentTime(Clock clock) noexcept;

    [[nodiscard]]
    constexpr bool operator==(Timepoint lhs, Timepoint rhs) noexcept
    {
        return (lhs.value == rhs.value);
    }

    [[nodiscard]]
    constexpr bool operator!=(Timepoint lhs, Timepoint rhs) noexcept
    {
        return (lhs.value != rhs.value);
    }

    [[nodiscard]]
    constexpr bool operator<(Timepoint lhs, Timepoint rhs) noexcept
    {
        return (lhs.value < rhs.value);
    }

    [[nodiscard]]
    constexpr bool operator<=(Timepoint lhs, Timepoint rhs) noexcept
    {
        return (lhs.value <= rhs.value);
    }

    [[nodiscard]]
    constexpr bool operator==(Duration lhs, Duration rhs) noexcept
    {
        return (lhs.value == rhs.value);
    }

    [[nodiscard]]
    constexpr bool operator<(Duration lhs, Duration rhs) noexcept
    {
        return (lhs.value < rhs.value);
    }

    [[nodiscard]]
    constexpr Duration operator-(Timepoint lhs, Timepoint rhs) noexcept
    {
        return Duration{lhs.value - rhs.value};
    }

    /**
     * Add a Duration to a Timepoint.  Clamped to zero.
     */
    [[nodiscard]]
    constexpr Timepoint operator+(Timepoint lhs, Duration rhs) noexcept
    {
        auto const sum = lhs.value + rhs.value;
        return Timepoint{(sum >= 0) ? sum : Timepoint::value_type{0}};
    }

    [[nodiscard]]
    constexpr double inSeconds(Duration duration) noexcept
    {
        return static_cast<double>(duration.value) / 1'000'000'000.0;
    }

    [[nodiscard]]
    constexpr double inMilliSeconds(Duration duration) noexcept
    {
        return static_cast<double>(duration.value) / 1'000'000.0;
    }

    [[nodiscard]]
    constexpr Duration fromMilliSeconds(double duration) noexcept
    {
        return Duration{static_cast<Duration::value_type>(duration * 1'000'000.0)};
    }

    [[nodiscard]]
    constexpr Timepoint asTimepoint(std::timespec const& timepoint) noexcept
    {
        return Timepoint{(timepoint.tv_sec * 1'000'000'000LL) + timepoint.tv_nsec};
    }
}
