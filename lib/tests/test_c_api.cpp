// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_c_api.cpp
 * @brief The C entry points of the library, used the way a foreign caller would
 */

#include <cstdint>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <rgtp/manifest.h>
#include <rgtp/rgtp.h>
#include <rgtp/surface.h>
#include "Utils.hpp"

using namespace rgtp::tests;

namespace
{
    rgtpManifest makeCManifest(char const* fileId, std::uint64_t totalSize, std::uint32_t chunkSize)
    {
        auto manifest = rgtpManifest{};
        REQUIRE(rgtpManifestInit(fileId, totalSize, chunkSize, &manifest) == RGTP_STATUS_OK);
        return manifest;
    }
}

TEST_CASE("Library version", "[c-api]")
{
    auto version = rgtpVersionType{};
    REQUIRE(rgtpGetVersion(&version) == RGTP_STATUS_OK);
    REQUIRE(version.full != nullptr);
    REQUIRE(std::string{version.full}.find(std::to_string(version.major)) == 0U);
    REQUIRE(rgtpGetVersion(nullptr) == RGTP_ERR_INVALID_ARG);
}

TEST_CASE("Status strings", "[c-api]")
{
    REQUIRE(std::string{rgtpStatusString(RGTP_STATUS_OK)} == "RGTP_STATUS_OK");
    REQUIRE(std::string{rgtpStatusString(RGTP_ERR_SURFACE_EXHAUSTED)} == "RGTP_ERR_SURFACE_EXHAUSTED");
    REQUIRE(std::string{rgtpStatusString(RGTP_ERR_BUFFER_TOO_SMALL)} == "RGTP_ERR_BUFFER_TOO_SMALL");
    REQUIRE(std::string{rgtpStatusString(static_cast<rgtpStatus>(1000))} == "UNKNOWN");
}

/**
 * Creating a surface validates its arguments; destroying NULL is a no-op.
 */
TEST_CASE("Surface lifetime through the C API", "[c-api]")
{
    auto const manifest = makeCManifest("c-lifetime", 4096U, 1024U);
    auto surface = rgtpSurface{nullptr};

    REQUIRE(rgtpCreateSurface(nullptr, nullptr, &surface) == RGTP_ERR_INVALID_ARG);
    REQUIRE(rgtpCreateSurface(&manifest, nullptr, nullptr) == RGTP_ERR_INVALID_ARG);
    REQUIRE(rgtpCreateSurface(&manifest, "{not json", &surface) == RGTP_ERR_INVALID_ARG);
    REQUIRE(rgtpCreateSurface(&manifest, R"({"recoverySlots": 0})", &surface) == RGTP_ERR_INVALID_ARG);
    REQUIRE(surface == nullptr);

    auto broken = manifest;
    broken.totalChunks = 7U;
    REQUIRE(rgtpCreateSurface(&broken, nullptr, &surface) == RGTP_ERR_INVALID_ARG);

    REQUIRE(rgtpCreateSurface(&manifest, R"({"recoveryMode": true, "digest": "poly31"})", &surface) == RGTP_STATUS_OK);
    REQUIRE(surface != nullptr);

    auto copy = rgtpManifest{};
    REQUIRE(rgtpGetManifest(surface, &copy) == RGTP_STATUS_OK);
    REQUIRE(std::string{copy.fileId} == "c-lifetime");
    REQUIRE(copy.totalChunks == 4U);
    REQUIRE(rgtpGetManifest(surface, nullptr) == RGTP_ERR_INVALID_ARG);

    REQUIRE(rgtpDestroySurface(surface) == RGTP_STATUS_OK);
    REQUIRE(rgtpDestroySurface(nullptr) == RGTP_STATUS_OK);
}

/**
 * A pool that cannot be mapped fails creation and leaves the output handle alone.
 */
TEST_CASE("Unreservable surface through the C API", "[c-api]")
{
    auto const manifest = makeCManifest("c-unreservable", RGTP_MAX_CHUNK_SIZE, RGTP_MAX_CHUNK_SIZE);
    auto const untouched = reinterpret_cast<rgtpSurface>(std::uintptr_t{0x10});
    auto surface = untouched;

    REQUIRE(rgtpCreateSurface(&manifest, R"({"recoveryMode": true, "recoverySlots": 4294967294})", &surface) == RGTP_ERR_ALLOCATION_FAILURE);
    REQUIRE(surface == untouched);
}

/**
 * Exposure and pull statuses map one to one onto the engine's outcomes.
 */
TEST_CASE("Exposing and pulling through the C API", "[c-api]")
{
    auto const manifest = makeCManifest("c-pull", 2500U, 1000U);
    auto surface = rgtpSurface{nullptr};
    REQUIRE(rgtpCreateSurface(&manifest, nullptr, &surface) == RGTP_STATUS_OK);

    auto const payload = makePayload(0U, 1000U);
    auto buffer = std::vector<std::uint8_t>(1000U);
    auto size = std::uint32_t{1234};

    SECTION("Not ready before exposure")
    {
        REQUIRE(rgtpPullChunk(surface, 0U, buffer.data(), 1000U, &size) == RGTP_ERR_CHUNK_NOT_READY);
        REQUIRE(size == 0U);
    }

    SECTION("Round trip")
    {
        REQUIRE(rgtpExposeChunk(surface, 0U, payload.data(), 1000U) == RGTP_STATUS_OK);
        REQUIRE(rgtpPullChunk(surface, 0U, buffer.data(), 1000U, &size) == RGTP_STATUS_OK);
        REQUIRE(size == 1000U);
        REQUIRE(buffer == payload);

        // A repeat exposure is not an error.
        REQUIRE(rgtpExposeChunk(surface, 0U, payload.data(), 1000U) == RGTP_STATUS_OK);
    }

    SECTION("Exposure errors")
    {
        auto const tooLarge = makePayload(2U, 501U);
        REQUIRE(rgtpExposeChunk(surface, 2U, tooLarge.data(), 501U) == RGTP_ERR_CHUNK_TOO_LARGE);
        REQUIRE(rgtpExposeChunk(surface, 3U, payload.data(), 10U) == RGTP_ERR_CHUNK_OUT_OF_RANGE);
        REQUIRE(rgtpExposeChunk(surface, 0U, nullptr, 10U) == RGTP_ERR_INVALID_ARG);
        REQUIRE(rgtpExposeChunk(nullptr, 0U, payload.data(), 10U) == RGTP_ERR_INVALID_ARG);
    }

    SECTION("Buffer too small reports the required size")
    {
        REQUIRE(rgtpExposeChunk(surface, 0U, payload.data(), 1000U) == RGTP_STATUS_OK);
        auto small = std::vector<std::uint8_t>(999U, 0xEEU);
        REQUIRE(rgtpPullChunk(surface, 0U, small.data(), 999U, &size) == RGTP_ERR_BUFFER_TOO_SMALL);
        REQUIRE(size == 1000U);
        REQUIRE(small == std::vector<std::uint8_t>(999U, 0xEEU));
    }

    SECTION("Invalid pull arguments")
    {
        REQUIRE(rgtpPullChunk(surface, 5U, buffer.data(), 1000U, &size) == RGTP_ERR_CHUNK_OUT_OF_RANGE);
        REQUIRE(rgtpPullChunk(surface, 0U, nullptr, 1000U, &size) == RGTP_ERR_INVALID_ARG);
        REQUIRE(rgtpPullChunk(surface, 0U, buffer.data(), 1000U, nullptr) == RGTP_ERR_INVALID_ARG);
        REQUIRE(rgtpPullChunk(nullptr, 0U, buffer.data(), 1000U, &size) == RGTP_ERR_INVALID_ARG);
    }

    REQUIRE(rgtpDestroySurface(surface) == RGTP_STATUS_OK);
}

/**
 * Batch calls report per-entry outcomes and never fail as a whole for a bad entry.
 */
TEST_CASE("Batches through the C API", "[c-api]")
{
    auto const manifest = makeCManifest("c-batch", 4U * 256U, 256U);
    auto surface = rgtpSurface{nullptr};
    REQUIRE(rgtpCreateSurface(&manifest, nullptr, &surface) == RGTP_STATUS_OK);

    auto const first = makePayload(2U, 256U);
    auto const second = makePayload(3U, 256U);
    auto const oversized = makePayload(4U, 300U);

    void const* payloads[] = {first.data(), second.data(), oversized.data()};
    std::uint32_t const sizes[] = {256U, 256U, 300U};
    auto exposed = std::uint32_t{0};

    REQUIRE(rgtpExposeBatch(surface, 2U, payloads, sizes, 3U, &exposed) == RGTP_STATUS_OK);
    REQUIRE(exposed == 2U);
    REQUIRE(rgtpExposeBatch(surface, 0U, nullptr, nullptr, 0U, &exposed) == RGTP_STATUS_OK);
    REQUIRE(exposed == 0U);
    REQUIRE(rgtpExposeBatch(surface, 0U, nullptr, sizes, 1U, &exposed) == RGTP_ERR_INVALID_ARG);

    auto bufferA = std::vector<std::uint8_t>(256U);
    auto bufferB = std::vector<std::uint8_t>(256U);
    auto bufferC = std::vector<std::uint8_t>(10U);

    std::uint32_t const ids[] = {2U, 0U, 3U, 9U};
    void* const buffers[] = {bufferA.data(), bufferB.data(), bufferC.data(), nullptr};
    std::uint32_t const bufferSizes[] = {256U, 256U, 10U, 0U};
    rgtpStatus results[4] = {};
    std::uint32_t pulledSizes[4] = {};

    REQUIRE(rgtpPullBatch(surface, ids, buffers, bufferSizes, 4U, results, pulledSizes) == RGTP_STATUS_OK);
    REQUIRE(results[0] == RGTP_STATUS_OK);
    REQUIRE(pulledSizes[0] == 256U);
    REQUIRE(bufferA == first);
    REQUIRE(results[1] == RGTP_ERR_CHUNK_NOT_READY);
    REQUIRE(results[2] == RGTP_ERR_BUFFER_TOO_SMALL);
    REQUIRE(pulledSizes[2] == 256U);
    REQUIRE(results[3] == RGTP_ERR_CHUNK_OUT_OF_RANGE);

    REQUIRE(rgtpDestroySurface(surface) == RGTP_STATUS_OK);
}

/**
 * Peek, verify, completion and statistics through the C API.
 */
TEST_CASE("Inspecting a surface through the C API", "[c-api]")
{
    auto const manifest = makeCManifest("c-inspect", 2U * 512U, 512U);
    auto surface = rgtpSurface{nullptr};
    REQUIRE(rgtpCreateSurface(&manifest, R"({"recoveryMode": true})", &surface) == RGTP_STATUS_OK);

    auto info = rgtpChunkInfo{};
    REQUIRE(rgtpPeekChunk(surface, 1U, &info) == RGTP_STATUS_OK);
    REQUIRE(info.sequenceId == 1U);
    REQUIRE(info.capacity == 512U);
    REQUIRE(info.offset == 512U);
    REQUIRE(info.published == 0U);
    REQUIRE(rgtpPeekChunk(surface, 2U, &info) == RGTP_ERR_CHUNK_OUT_OF_RANGE);
    REQUIRE(rgtpPeekChunk(surface, 0U, nullptr) == RGTP_ERR_INVALID_ARG);

    auto intact = false;
    REQUIRE(rgtpVerifyChunk(surface, 0U, &intact) == RGTP_ERR_CHUNK_NOT_READY);
    REQUIRE(rgtpVerifyChunk(surface, 7U, &intact) == RGTP_ERR_CHUNK_OUT_OF_RANGE);

    auto const payload = makePayload(0U, 512U);
    REQUIRE(rgtpExposeChunk(surface, 0U, payload.data(), 512U) == RGTP_STATUS_OK);
    REQUIRE(rgtpExposeChunk(surface, 0U, payload.data(), 512U) == RGTP_STATUS_OK);
    REQUIRE(rgtpVerifyChunk(surface, 0U, &intact) == RGTP_STATUS_OK);
    REQUIRE(intact);

    REQUIRE(rgtpPeekChunk(surface, 0U, &info) == RGTP_STATUS_OK);
    REQUIRE(info.published == 1U);
    REQUIRE(info.dataSize == 512U);
    REQUIRE(info.generation == 1U);
    REQUIRE(info.exposureTime != 0U);

    REQUIRE_FALSE(rgtpIsComplete(surface));
    REQUIRE_FALSE(rgtpIsComplete(nullptr));
    REQUIRE(rgtpRaiseCompletion(surface) == RGTP_STATUS_OK);
    REQUIRE(rgtpRaiseCompletion(nullptr) == RGTP_ERR_INVALID_ARG);
    REQUIRE(rgtpIsComplete(surface));

    auto stats = rgtpSurfaceStats{};
    REQUIRE(rgtpGetSurfaceStats(surface, &stats) == RGTP_STATUS_OK);
    REQUIRE(stats.totalBytes == 512U);
    REQUIRE(stats.exposedCount == 1U);
    REQUIRE(stats.chunkCount == 2U);
    REQUIRE(stats.reexposureCount == 1U);
    REQUIRE(stats.exhaustedCount == 0U);
    REQUIRE(stats.complete == 1U);
    REQUIRE(rgtpGetSurfaceStats(surface, nullptr) == RGTP_ERR_INVALID_ARG);

    REQUIRE(rgtpDestroySurface(surface) == RGTP_STATUS_OK);
}
