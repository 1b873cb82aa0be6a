// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file rgtp-bench/main.cpp
 * @brief Exposure surface exercise and throughput utility
 *
 * Creates an exposure surface for a synthetic data set or the contents of a
 * file, exposes every chunk from a number of producer threads while consumer
 * threads pull them back, then checks that every consumer reassembled the
 * original bytes.
 *
 * Usage examples:
 *   - 64 MiB synthetic data set:         rgtp-bench --size 67108864
 *   - File, 4 producers, 8 consumers:    rgtp-bench --file video.bin -p 4 -c 8
 *   - Recovery mode with re-exposures:   rgtp-bench --recovery --reexpose 100
 */

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <rgtp/manifest.h>
#include <rgtp/rgtp.h>
#include <rgtp/surface.h>

namespace
{
    /**
     * Owns an rgtpSurface for the lifetime of the benchmark.
     */
    class ScopedSurface
    {
    public:
        /**
         * @throws std::runtime_error if the surface cannot be created.
         */
        ScopedSurface(::rgtpManifest const& manifest, std::string const& options)
            : _surface{nullptr}
        {
            if (auto const status = ::rgtpCreateSurface(&manifest, options.c_str(), &_surface); status != RGTP_STATUS_OK)
            {
                throw std::runtime_error{fmt::format("Failed to create surface: {}", ::rgtpStatusString(status))};
            }
        }

        ScopedSurface(ScopedSurface&&) = delete;
        ScopedSurface(ScopedSurface const&) = delete;

        ScopedSurface& operator=(ScopedSurface&&) = delete;
        ScopedSurface& operator=(ScopedSurface const&) = delete;

        ~ScopedSurface()
        {
            ::rgtpDestroySurface(_surface);
        }

        constexpr operator ::rgtpSurface() const noexcept
        {
            return _surface;
        }

    private:
        ::rgtpSurface _surface;
    };

    std::vector<std::uint8_t> readFile(std::string const& path)
    {
        auto file = std::ifstream{path, std::ios::binary};
        if (!file)
        {
            throw std::runtime_error{fmt::format("Failed to open '{}'.", path)};
        }
        return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    std::vector<std::uint8_t> makeSyntheticData(std::uint64_t size)
    {
        auto data = std::vector<std::uint8_t>(size);
        auto state = std::uint32_t{0x2545F491U};
        for (auto& byte : data)
        {
            state ^= state << 13;
            state ^= state >> 17;
            state ^= state << 5;
            byte = static_cast<std::uint8_t>(state);
        }
        return data;
    }

    struct BenchConfig
    {
        std::uint32_t producers;
        std::uint32_t consumers;
        std::uint32_t reexposures;
    };

    /**
     * Expose chunk ids [first, last) of data, most significant first to
     * exercise out of order delivery.
     */
    void produce(::rgtpSurface surface, ::rgtpManifest const& manifest, std::vector<std::uint8_t> const& data, std::uint32_t first,
        std::uint32_t last, std::atomic<std::uint32_t>& failures)
    {
        for (auto id = last; id-- > first;)
        {
            auto const offset = static_cast<std::uint64_t>(id) * manifest.chunkSize;
            auto const size = static_cast<std::uint32_t>(std::min<std::uint64_t>(manifest.chunkSize, manifest.totalSize - offset));
            if (auto const status = ::rgtpExposeChunk(surface, id, data.data() + offset, size); status != RGTP_STATUS_OK)
            {
                std::cerr << "ERROR: " << fmt::format("Failed to expose chunk {}: {}", id, ::rgtpStatusString(status)) << std::endl;
                failures.fetch_add(1U);
            }
        }
    }

    /**
     * Poll every chunk until all of them have been pulled into a private copy
     * of the data set, then compare it with the original.  Once completion is
     * raised, a full pass that still finds chunks not ready ends the polling:
     * those chunks will never be exposed.
     */
    void consume(::rgtpSurface surface, ::rgtpManifest const& manifest, std::vector<std::uint8_t> const& data, std::atomic<std::uint32_t>& failures)
    {
        auto copy = std::vector<std::uint8_t>(manifest.totalSize);
        auto pending = std::vector<bool>(manifest.totalChunks, true);
        auto remaining = manifest.totalChunks;

        while (remaining > 0U)
        {
            auto const lastPass = ::rgtpIsComplete(surface);
            for (auto id = std::uint32_t{0}; id < manifest.totalChunks; ++id)
            {
                if (!pending[id])
                {
                    continue;
                }

                auto const offset = static_cast<std::uint64_t>(id) * manifest.chunkSize;
                auto const capacity = static_cast<std::uint32_t>(std::min<std::uint64_t>(manifest.chunkSize, manifest.totalSize - offset));
                auto size = std::uint32_t{0};
                switch (auto const status = ::rgtpPullChunk(surface, id, copy.data() + offset, capacity, &size); status)
                {
                    case RGTP_STATUS_OK:
                        pending[id] = false;
                        --remaining;
                        break;

                    case RGTP_ERR_CHUNK_NOT_READY: break;

                    default:
                        std::cerr << "ERROR: " << fmt::format("Failed to pull chunk {}: {}", id, ::rgtpStatusString(status)) << std::endl;
                        failures.fetch_add(1U);
                        pending[id] = false;
                        --remaining;
                        break;
                }
            }
            if ((remaining > 0U) && lastPass)
            {
                std::cerr << "ERROR: " << fmt::format("{} chunk(s) never exposed.", remaining) << std::endl;
                failures.fetch_add(1U);
                return;
            }
            if (remaining > 0U)
            {
                std::this_thread::yield();
            }
        }

        if (copy != data)
        {
            std::cerr << "ERROR: Reassembled data does not match the source." << std::endl;
            failures.fetch_add(1U);
        }
    }

    /**
     * Re-expose chunks round robin with their original payload.  Exhausted
     * attempts are counted by the surface and are not failures.
     */
    void reexpose(::rgtpSurface surface, ::rgtpManifest const& manifest, std::vector<std::uint8_t> const& data, std::uint32_t count,
        std::atomic<std::uint32_t>& failures)
    {
        for (auto i = std::uint32_t{0}; i < count; ++i)
        {
            auto const id = i % manifest.totalChunks;
            auto const offset = static_cast<std::uint64_t>(id) * manifest.chunkSize;
            auto const size = static_cast<std::uint32_t>(std::min<std::uint64_t>(manifest.chunkSize, manifest.totalSize - offset));
            if (auto const status = ::rgtpExposeChunk(surface, id, data.data() + offset, size);
                (status != RGTP_STATUS_OK) && (status != RGTP_ERR_SURFACE_EXHAUSTED))
            {
                std::cerr << "ERROR: " << fmt::format("Failed to re-expose chunk {}: {}", id, ::rgtpStatusString(status)) << std::endl;
                failures.fetch_add(1U);
            }
        }
    }

    void printStats(::rgtpSurfaceStats const& stats)
    {
        std::cout << "- Surface statistics\n"
                  << '\t' << fmt::format("{: >18}: {}", "Elapsed (ms)", stats.elapsedMs) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Total bytes", stats.totalBytes) << '\n'
                  << '\t' << fmt::format("{: >18}: {:.2f} MiB/s", "Throughput", stats.throughput / (1024.0 * 1024.0)) << '\n'
                  << '\t' << fmt::format("{: >18}: {}/{}", "Exposed chunks", stats.exposedCount, stats.chunkCount) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Re-exposures", stats.reexposureCount) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Exhausted", stats.exhaustedCount) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Complete", stats.complete != 0U) << std::endl;
    }

    int run(::rgtpManifest const& manifest, std::vector<std::uint8_t> const& data, std::string const& options, BenchConfig const& config)
    {
        auto const scopedSurface = ScopedSurface{manifest, options};
        ::rgtpSurface const surface = scopedSurface;
        auto failures = std::atomic<std::uint32_t>{0};

        auto consumers = std::vector<std::thread>{};
        for (auto c = std::uint32_t{0}; c < config.consumers; ++c)
        {
            consumers.emplace_back(consume, surface, std::cref(manifest), std::cref(data), std::ref(failures));
        }

        auto threads = std::vector<std::thread>{};

        auto const perProducer = (manifest.totalChunks + config.producers - 1U) / config.producers;
        for (auto p = std::uint32_t{0}; p < config.producers; ++p)
        {
            auto const first = std::min(manifest.totalChunks, p * perProducer);
            auto const last = std::min(manifest.totalChunks, first + perProducer);
            threads.emplace_back(produce, surface, std::cref(manifest), std::cref(data), first, last, std::ref(failures));
        }

        if (config.reexposures > 0U)
        {
            threads.emplace_back(reexpose, surface, std::cref(manifest), std::cref(data), config.reexposures, std::ref(failures));
        }

        for (auto& thread : threads)
        {
            thread.join();
        }

        // Chunks whose exposure failed are never published: release the consumers waiting for them.
        if (auto const status = ::rgtpRaiseCompletion(surface); status != RGTP_STATUS_OK)
        {
            std::cerr << "ERROR: " << "Failed to raise completion: " << ::rgtpStatusString(status) << std::endl;
            failures.fetch_add(1U);
        }
        for (auto& consumer : consumers)
        {
            consumer.join();
        }

        auto stats = ::rgtpSurfaceStats{};
        if (auto const status = ::rgtpGetSurfaceStats(surface, &stats); status != RGTP_STATUS_OK)
        {
            std::cerr << "ERROR: " << "Failed to get surface statistics: " << ::rgtpStatusString(status) << std::endl;
            return EXIT_FAILURE;
        }
        printStats(stats);

        if (failures.load() != 0U)
        {
            std::cerr << "ERROR: " << failures.load() << " failure(s) detected." << std::endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
}

int main(int argc, char** argv)
{
    auto app = CLI::App{"rgtp-bench"};

    auto version = ::rgtpVersionType{};
    ::rgtpGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto path = std::string{};
    app.add_option("-f,--file", path, "Expose the contents of this file instead of synthetic data")->check(CLI::ExistingFile);

    auto totalSize = std::uint64_t{16U * 1024U * 1024U};
    app.add_option("-s,--size", totalSize, "Size of the synthetic data set in bytes")->check(CLI::PositiveNumber);

    auto chunkSize = std::uint32_t{64U * 1024U};
    app.add_option("--chunk-size", chunkSize, "Chunk size in bytes")->check(CLI::Range(1U, RGTP_MAX_CHUNK_SIZE));

    auto config = BenchConfig{1U, 1U, 0U};
    app.add_option("-p,--producers", config.producers, "Number of producer threads")->check(CLI::Range(1U, 256U));
    app.add_option("-c,--consumers", config.consumers, "Number of consumer threads")->check(CLI::Range(1U, 256U));

    auto recovery = false;
    app.add_flag("-r,--recovery", recovery, "Create the surface in recovery mode");
    auto recoverySlots = std::uint32_t{1U};
    app.add_option("--recovery-slots", recoverySlots, "Spare pool slots for re-exposures")->check(CLI::PositiveNumber);
    app.add_option("--reexpose", config.reexposures, "Number of re-exposures to perform during the transfer (requires --recovery)");

    auto digest = std::string{"fnv1a"};
    app.add_option("-d,--digest", digest, "Integrity digest algorithm")->check(CLI::IsMember({"fnv1a", "poly31", "none"}));

    CLI11_PARSE(app, argc, argv);

    if ((config.reexposures > 0U) && !recovery)
    {
        std::cerr << "ERROR: --reexpose requires --recovery." << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        auto const data = path.empty() ? makeSyntheticData(totalSize) : readFile(path);
        if (data.empty())
        {
            std::cerr << "ERROR: Nothing to expose." << std::endl;
            return EXIT_FAILURE;
        }

        auto const fileId = path.empty() ? std::string{"synthetic"} : path.substr(path.find_last_of('/') + 1U).substr(0, RGTP_FILE_ID_SIZE - 1U);
        auto manifest = ::rgtpManifest{};
        if (auto const status = ::rgtpManifestInit(fileId.c_str(), data.size(), chunkSize, &manifest); status != RGTP_STATUS_OK)
        {
            std::cerr << "ERROR: " << "Invalid manifest: " << ::rgtpStatusString(status) << std::endl;
            return EXIT_FAILURE;
        }

        std::cout << "- Manifest [" << manifest.fileId << "]\n"
                  << '\t' << fmt::format("{: >18}: {}", "Total size", manifest.totalSize) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Chunk size", manifest.chunkSize) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Chunk count", manifest.totalChunks) << '\n'
                  << '\t' << fmt::format("{: >18}: {}/{}", "Producers/consumers", config.producers, config.consumers) << '\n';

        auto const options = fmt::format(R"({{"recoveryMode": {}, "recoverySlots": {}, "digest": "{}"}})", recovery, recoverySlots, digest);
        return run(manifest, data, options, config);
    }
    catch (std::exception const& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
