// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_concurrency.cpp
 * @brief Producers and consumers sharing one surface
 *
 * These tests run real threads.  They check the outcomes every interleaving
 * must satisfy rather than a particular schedule.
 */

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <thread>
#include <variant>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <gsl/span>
#include "Utils.hpp"
#include "rgtp-internal/ExposureSurface.hpp"
#include "rgtp-internal/Manifest.hpp"

using namespace rgtp::lib;
using namespace rgtp::tests;

/**
 * N threads pulling the same published chunk all get its bytes and leave the pull counter at N.
 */
TEST_CASE("Concurrent pulls of one chunk", "[concurrency]")
{
    constexpr auto THREADS = 8U;
    constexpr auto PULLS_PER_THREAD = 500U;

    auto const surface = makeSurface(makeManifest("concurrent-pulls", 4096U, 4096U));
    auto const payload = makePayload(0U, 4096U);
    REQUIRE(succeeded(surface->expose(0U, asSpan(payload))));

    auto mismatches = std::atomic<std::uint32_t>{0};
    auto threads = std::vector<std::thread>{};
    for (auto t = 0U; t < THREADS; ++t)
    {
        threads.emplace_back(
            [&]
            {
                auto buffer = std::vector<std::uint8_t>(4096U);
                for (auto i = 0U; i < PULLS_PER_THREAD; ++i)
                {
                    auto const result = surface->pull(0U, asSpan(buffer));
                    if (!std::holds_alternative<Pulled>(result) || (buffer != payload))
                    {
                        mismatches.fetch_add(1U);
                    }
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(mismatches.load() == 0U);
    REQUIRE(surface->peek(0U)->pullCount == THREADS * PULLS_PER_THREAD);
}

/**
 * Racing first exposures of the same chunk publish it exactly once.
 */
TEST_CASE("Racing first exposures", "[concurrency]")
{
    constexpr auto THREADS = 8U;

    for (auto attempt = 0; attempt < 20; ++attempt)
    {
        auto const surface = makeSurface(makeManifest("race", 1024U, 1024U));

        auto published = std::atomic<std::uint32_t>{0};
        auto alreadyExposed = std::atomic<std::uint32_t>{0};
        auto threads = std::vector<std::thread>{};
        for (auto t = 0U; t < THREADS; ++t)
        {
            threads.emplace_back(
                [&, t]
                {
                    auto const payload = makePayload(0U, 1024U, static_cast<std::uint8_t>(t));
                    auto const result = surface->expose(0U, asSpan(payload));
                    if (std::holds_alternative<Exposure>(result))
                    {
                        auto& counter = (std::get<Exposure>(result) == Exposure::Published) ? published : alreadyExposed;
                        counter.fetch_add(1U);
                    }
                });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }

        REQUIRE(published.load() == 1U);
        REQUIRE(alreadyExposed.load() == THREADS - 1U);
        REQUIRE(surface->exposedCount() == 1U);
        REQUIRE(surface->isComplete());
        REQUIRE(surface->stats().totalBytes == 1024U);
        REQUIRE(std::get<Integrity>(surface->verify(0U)) == Integrity::Intact);
    }
}

/**
 * Batches racing over the same range count every entry, including chunks another
 * batch claimed first; once all of them return, every chunk is published exactly once.
 */
TEST_CASE("Racing batch exposures", "[concurrency]")
{
    constexpr auto THREADS = 4U;

    auto const manifest = makeManifest("racing-batches", 64U * 256U, 256U);
    auto const surface = makeSurface(manifest);
    auto const chunks = makeDataSet(manifest);

    auto payloads = std::vector<gsl::span<std::uint8_t const>>{};
    for (auto const& chunk : chunks)
    {
        payloads.push_back(asSpan(chunk));
    }

    auto counts = std::vector<std::uint32_t>(THREADS, 0U);
    auto threads = std::vector<std::thread>{};
    for (auto t = 0U; t < THREADS; ++t)
    {
        threads.emplace_back([&, t] { counts[t] = surface->exposeBatch(0U, payloads); });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    for (auto const count : counts)
    {
        REQUIRE(count == manifest.totalChunks);
    }
    REQUIRE(surface->exposedCount() == manifest.totalChunks);
    REQUIRE(surface->stats().totalBytes == manifest.totalSize);
    for (auto id = std::uint32_t{0}; id < manifest.totalChunks; ++id)
    {
        REQUIRE(surface->peek(id)->published);
    }
}

/**
 * 1 MiB in 1 KiB chunks: four producers expose disjoint ranges in reverse order while
 * four consumers poll every chunk until they have all of them.
 */
TEST_CASE("Producers and consumers over 1024 chunks", "[concurrency][scenario]")
{
    constexpr auto PRODUCERS = 4U;
    constexpr auto CONSUMERS = 4U;

    auto const manifest = makeManifest("producers-consumers", 1024U * 1024U, 1024U);
    auto const surface = makeSurface(manifest);
    auto const chunks = makeDataSet(manifest);
    auto const perProducer = manifest.totalChunks / PRODUCERS;

    auto consumerFailures = std::atomic<std::uint32_t>{0};
    auto threads = std::vector<std::thread>{};

    for (auto c = 0U; c < CONSUMERS; ++c)
    {
        threads.emplace_back(
            [&]
            {
                auto received = std::vector<bool>(manifest.totalChunks, false);
                auto remaining = manifest.totalChunks;
                auto buffer = std::vector<std::uint8_t>(manifest.chunkSize);
                while (remaining > 0U)
                {
                    for (auto id = std::uint32_t{0}; id < manifest.totalChunks; ++id)
                    {
                        if (received[id])
                        {
                            continue;
                        }
                        auto const result = surface->pull(id, asSpan(buffer));
                        if (auto const pulled = std::get_if<Pulled>(&result); pulled != nullptr)
                        {
                            if ((pulled->size != chunks[id].size()) || !std::equal(chunks[id].begin(), chunks[id].end(), buffer.begin()))
                            {
                                consumerFailures.fetch_add(1U);
                            }
                            received[id] = true;
                            --remaining;
                        }
                        else if (!std::holds_alternative<NotReady>(result))
                        {
                            consumerFailures.fetch_add(1U);
                            received[id] = true;
                            --remaining;
                        }
                    }
                }
            });
    }

    for (auto p = 0U; p < PRODUCERS; ++p)
    {
        threads.emplace_back(
            [&, p]
            {
                auto const first = p * perProducer;
                for (auto id = first + perProducer; id-- > first;)
                {
                    if (!succeeded(surface->expose(id, asSpan(chunks[id]))))
                    {
                        consumerFailures.fetch_add(1U);
                    }
                }
            });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(consumerFailures.load() == 0U);
    REQUIRE(surface->isComplete());

    auto const stats = surface->stats();
    REQUIRE(stats.exposedCount == 1024U);
    REQUIRE(stats.totalBytes == manifest.totalSize);
    for (auto id = std::uint32_t{0}; id < manifest.totalChunks; ++id)
    {
        REQUIRE(surface->peek(id)->pullCount == CONSUMERS);
    }
}

/**
 * Readers racing re-exposures of the same chunk only ever see complete payloads.
 * Every payload is a single repeated byte, so a torn copy would mix two values.
 */
TEST_CASE("Pulls racing re-exposures never tear", "[concurrency][recovery]")
{
    constexpr auto READERS = 4U;
    constexpr auto REEXPOSURES = 2000U;

    auto options = SurfaceOptions{};
    options.recoveryMode = true;
    options.recoverySlots = 2U;

    auto const surface = makeSurface(makeManifest("torn", 2U * 8192U, 8192U), options);
    REQUIRE(succeeded(surface->expose(0U, asSpan(std::vector<std::uint8_t>(8192U, 0U)))));

    auto done = std::atomic<bool>{false};
    auto torn = std::atomic<std::uint32_t>{0};
    auto threads = std::vector<std::thread>{};
    for (auto r = 0U; r < READERS; ++r)
    {
        threads.emplace_back(
            [&]
            {
                auto buffer = std::vector<std::uint8_t>(8192U);
                while (!done.load())
                {
                    auto const result = surface->pull(0U, asSpan(buffer));
                    auto const pulled = std::get_if<Pulled>(&result);
                    if ((pulled == nullptr) || (pulled->size != 8192U) ||
                        !std::all_of(buffer.begin(), buffer.end(), [&](auto b) { return b == buffer.front(); }))
                    {
                        torn.fetch_add(1U);
                    }
                }
            });
    }

    auto exhausted = 0U;
    for (auto i = 1U; i <= REEXPOSURES; ++i)
    {
        auto const payload = std::vector<std::uint8_t>(8192U, static_cast<std::uint8_t>(i));
        auto const result = surface->expose(0U, asSpan(payload));
        if (std::holds_alternative<Error>(result))
        {
            REQUIRE(std::get<Error>(result) == Error::SurfaceExhausted);
            ++exhausted;
        }
    }
    done.store(true);
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(torn.load() == 0U);
    auto const stats = surface->stats();
    REQUIRE(stats.reexposureCount + stats.exhaustedCount == REEXPOSURES);
    REQUIRE(stats.exhaustedCount == exhausted);
    REQUIRE(stats.exposedCount == 1U);
    REQUIRE(stats.totalBytes == 8192U);
}

/**
 * Concurrent re-exposures of distinct chunks either succeed or report SurfaceExhausted;
 * every attempt is accounted for and the pool keeps its spare slots.
 */
TEST_CASE("Concurrent re-exposures and pool exhaustion", "[concurrency][recovery]")
{
    constexpr auto THREADS = 8U;
    constexpr auto ROUNDS = 200U;

    auto options = SurfaceOptions{};
    options.recoveryMode = true;
    options.recoverySlots = 1U;

    auto const manifest = makeManifest("exhaustion", THREADS * 4096U, 4096U);
    auto const surface = makeSurface(manifest, options);
    auto const chunks = makeDataSet(manifest);
    REQUIRE(surface->exposeBatch(0U, {asSpan(chunks[0]), asSpan(chunks[1]), asSpan(chunks[2]), asSpan(chunks[3]),
                                         asSpan(chunks[4]), asSpan(chunks[5]), asSpan(chunks[6]), asSpan(chunks[7])}) == THREADS);

    auto republished = std::atomic<std::uint32_t>{0};
    auto exhausted = std::atomic<std::uint32_t>{0};
    auto unexpected = std::atomic<std::uint32_t>{0};
    auto threads = std::vector<std::thread>{};
    for (auto t = 0U; t < THREADS; ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                for (auto round = 0U; round < ROUNDS; ++round)
                {
                    auto const payload = makePayload(t, 4096U, static_cast<std::uint8_t>(round));
                    auto const result = surface->expose(t, asSpan(payload));
                    if (std::holds_alternative<Exposure>(result) && (std::get<Exposure>(result) == Exposure::Republished))
                    {
                        republished.fetch_add(1U);
                    }
                    else if (std::holds_alternative<Error>(result) && (std::get<Error>(result) == Error::SurfaceExhausted))
                    {
                        exhausted.fetch_add(1U);
                    }
                    else
                    {
                        unexpected.fetch_add(1U);
                    }
                }
            });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(unexpected.load() == 0U);
    REQUIRE(republished.load() + exhausted.load() == THREADS * ROUNDS);

    auto const stats = surface->stats();
    REQUIRE(stats.reexposureCount == republished.load());
    REQUIRE(stats.exhaustedCount == exhausted.load());
    REQUIRE(stats.exposedCount == THREADS);
    REQUIRE(stats.totalBytes == manifest.totalSize);

    // Whatever the interleaving, every chunk is intact and the spare slot is back: one more
    // sequential re-exposure succeeds.
    for (auto id = std::uint32_t{0}; id < THREADS; ++id)
    {
        REQUIRE(std::get<Integrity>(surface->verify(id)) == Integrity::Intact);
    }
    REQUIRE(std::get<Exposure>(surface->expose(0U, asSpan(chunks[0]))) == Exposure::Republished);
}
