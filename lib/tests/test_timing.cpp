// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_timing.cpp
 * @brief Timepoint and Duration arithmetic and clock reads
 */

#include <chrono>
#include <ctime>
#include <thread>
#include <catch2/catch_test_macros.hpp>
#include "rgtp-internal/Timing.hpp"

using namespace rgtp::lib;

TEST_CASE("Timepoint arithmetic", "[time]")
{
    auto const start = Timepoint{1'000'000'000};
    auto const later = start + fromMilliSeconds(2.5);

    REQUIRE(later.value == 1'002'500'000);
    REQUIRE(start < later);
    REQUIRE(start <= start);
    REQUIRE(later != start);
    REQUIRE((later - start) == Duration{2'500'000});
    REQUIRE(inMilliSeconds(later - start) == 2.5);
    REQUIRE(inSeconds(Duration{1'500'000'000}) == 1.5);

    // Moving before the epoch clamps to zero.
    REQUIRE((start + Duration{-2'000'000'000}).value == 0);
    REQUIRE_FALSE(static_cast<bool>(Timepoint{}));
    REQUIRE(static_cast<bool>(start));
}

TEST_CASE("Timespec conversion", "[time]")
{
    auto const ts = std::timespec{3, 250};
    REQUIRE(asTimepoint(ts).value == 3'000'000'250);
}

TEST_CASE("Monotonic clock", "[time]")
{
    auto const first = currentTime(Clock::Monotonic);
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    auto const second = currentTime(Clock::Monotonic);

    REQUIRE(static_cast<bool>(first));
    REQUIRE(first < second);
    REQUIRE(static_cast<bool>(currentTime(Clock::Realtime)));
}
