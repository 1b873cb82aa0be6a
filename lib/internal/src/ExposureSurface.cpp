// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp-internal/ExposureSurface.hpp"
#include <algorithm>
#include <exception>
#include <limits>
#include <new>
#include <stdexcept>
#include <fmt/format.h>
#include "rgtp-internal/Digest.hpp"
#include "rgtp-internal/Logging.hpp"
#include "rgtp-internal/Manifest.hpp"

namespace rgtp::lib
{
    namespace
    {
        rgtpManifest const& validated(rgtpManifest const& manifest)
        {
            validateManifest(manifest);
            return manifest;
        }

        std::uint32_t spareSlotsFor(SurfaceOptions const& options)
        {
            if (!options.recoveryMode)
            {
                return 0U;
            }
            if (options.recoverySlots == 0U)
            {
                throw std::invalid_argument{"recoverySlots must be greater or equal to 1."};
            }
            return options.recoverySlots;
        }
    }

    ExposureSurface::ExposureSurface(rgtpManifest const& manifest, SurfaceOptions const& options)
        : _manifest{validated(manifest)}
        , _options{options}
        , _createdAt{currentTime(Clock::Monotonic)}
        , _pool{manifest.totalChunks, spareSlotsFor(options), manifest.chunkSize}
        , _table{manifest}
        , _exposedCount{0}
        , _totalBytes{0}
        , _reexposureCount{0}
        , _exhaustedCount{0}
        , _complete{false}
    {
        RGTP_INFO("Created surface for '{}': {} chunks of {} bytes, {} bytes total, recovery {}, digest {}.",
            fileIdOf(_manifest),
            _manifest.totalChunks,
            _manifest.chunkSize,
            _manifest.totalSize,
            _options.recoveryMode ? fmt::format("on ({} spare slots)", _pool.spareSlotCount()) : std::string{"off"},
            toString(_options.digest));
    }

    ExposureSurface::~ExposureSurface()
    {
        RGTP_INFO("Destroying surface for '{}': {}/{} chunks exposed, {} re-exposures.",
            fileIdOf(_manifest),
            _exposedCount.load(std::memory_order_relaxed),
            _table.size(),
            _reexposureCount.load(std::memory_order_relaxed));
    }

    ExposeResult ExposureSurface::expose(std::uint32_t id, gsl::span<std::uint8_t const> payload)
    {
        auto const record = _table.at(id);
        if (record == nullptr)
        {
            RGTP_TRACE("Rejected exposure of chunk {}: out of range ({} chunks).", id, _table.size());
            return Error::ChunkOutOfRange;
        }
        if (payload.size() > record->capacity)
        {
            RGTP_TRACE("Rejected exposure of chunk {}: {} bytes exceed its capacity of {}.", id, payload.size(), record->capacity);
            return Error::ChunkTooLarge;
        }

        auto expected = ChunkState::Unpublished;
        if (record->state.compare_exchange_strong(expected, ChunkState::Writing, std::memory_order_acquire, std::memory_order_acquire))
        {
            return publish(*record, payload);
        }

        if (_options.recoveryMode && (expected == ChunkState::Published))
        {
            return republish(*record, payload);
        }

        // Published, or claimed by a concurrent exposure.
        return Exposure::AlreadyExposed;
    }

    Exposure ExposureSurface::publish(ChunkRecord& record, gsl::span<std::uint8_t const> payload) noexcept
    {
        // The home slot is owned by the claiming thread until publication.
        fillSlot(record.slot.load(std::memory_order_relaxed), payload);
        record.state.store(ChunkState::Published, std::memory_order_release);

        _totalBytes.fetch_add(payload.size(), std::memory_order_relaxed);
        auto const exposed = _exposedCount.fetch_add(1U, std::memory_order_acq_rel) + 1U;
        RGTP_TRACE("Exposed chunk {} ({} bytes), {}/{}.", record.sequenceId, payload.size(), exposed, _table.size());

        if (exposed == _table.size())
        {
            _complete.store(true, std::memory_order_release);
            RGTP_DEBUG("All {} chunks of '{}' exposed.", exposed, fileIdOf(_manifest));
        }
        return Exposure::Published;
    }

    ExposeResult ExposureSurface::republish(ChunkRecord& record, gsl::span<std::uint8_t const> payload)
    {
        auto expected = ChunkState::Published;
        if (!record.state.compare_exchange_strong(expected, ChunkState::Republishing, std::memory_order_acquire, std::memory_order_relaxed))
        {
            // Another re-exposure of the same chunk is in flight.
            return Exposure::AlreadyExposed;
        }

        auto const spare = _pool.acquire();
        if (!spare)
        {
            record.state.store(ChunkState::Published, std::memory_order_release);
            auto const exhausted = _exhaustedCount.fetch_add(1U, std::memory_order_relaxed) + 1U;
            RGTP_WARN("No free slot to re-expose chunk {} of '{}' ({} exhausted attempts).", record.sequenceId, fileIdOf(_manifest), exhausted);
            return Error::SurfaceExhausted;
        }

        fillSlot(*spare, payload);

        auto const previous = record.slot.exchange(*spare, std::memory_order_acq_rel);
        record.generation.fetch_add(1U, std::memory_order_release);

        auto const previousSize = _pool.descriptor(previous).size.load(std::memory_order_relaxed);
        if (payload.size() >= previousSize)
        {
            _totalBytes.fetch_add(payload.size() - previousSize, std::memory_order_relaxed);
        }
        else
        {
            _totalBytes.fetch_sub(previousSize - payload.size(), std::memory_order_relaxed);
        }

        // Readers still copying from the previous slot see the generation change and retry.
        _pool.release(previous);
        record.state.store(ChunkState::Published, std::memory_order_release);

        _reexposureCount.fetch_add(1U, std::memory_order_relaxed);
        RGTP_TRACE("Re-exposed chunk {} ({} bytes) in slot {}, slot {} released.", record.sequenceId, payload.size(), *spare, previous);
        return Exposure::Republished;
    }

    void ExposureSurface::fillSlot(MemoryPool::SlotIndex slot, gsl::span<std::uint8_t const> payload) noexcept
    {
        std::copy(payload.begin(), payload.end(), _pool.slot(slot).begin());

        auto& descriptor = _pool.descriptor(slot);
        descriptor.size.store(static_cast<std::uint32_t>(payload.size()), std::memory_order_relaxed);
        descriptor.digest.store(computeDigest(_options.digest, payload), std::memory_order_relaxed);
        descriptor.exposureTime.store(currentTime(Clock::Monotonic).value, std::memory_order_relaxed);
    }

    std::uint32_t ExposureSurface::exposeBatch(std::uint32_t startId, std::vector<gsl::span<std::uint8_t const>> const& payloads)
    {
        auto successes = std::uint32_t{0};
        auto id = std::uint64_t{startId};
        for (auto const& payload : payloads)
        {
            // Ids past the 32-bit range are out of range, not wrapped.
            if ((id <= std::numeric_limits<std::uint32_t>::max()) && succeeded(expose(static_cast<std::uint32_t>(id), payload)))
            {
                ++successes;
            }
            ++id;
        }
        return successes;
    }

    bool ExposureSurface::isStable(ChunkRecord const& record, std::uint32_t generation) noexcept
    {
        std::atomic_thread_fence(std::memory_order_acquire);
        return record.generation.load(std::memory_order_relaxed) == generation;
    }

    std::optional<ChunkView> ExposureSurface::peek(std::uint32_t id) const noexcept
    {
        auto const record = _table.at(id);
        if (record == nullptr)
        {
            return std::nullopt;
        }

        for (;;)
        {
            auto view = ChunkView{};
            view.sequenceId = record->sequenceId;
            view.capacity = record->capacity;
            view.offset = record->offset;

            view.generation = record->generation.load(std::memory_order_acquire);
            view.published = isReadable(record->state.load(std::memory_order_acquire));
            if (view.published)
            {
                auto const& descriptor = _pool.descriptor(record->slot.load(std::memory_order_acquire));
                view.size = descriptor.size.load(std::memory_order_relaxed);
                view.digest = descriptor.digest.load(std::memory_order_relaxed);
                view.exposureTime = Timepoint{descriptor.exposureTime.load(std::memory_order_relaxed)};
            }
            view.pullCount = record->pullCount.load(std::memory_order_relaxed);

            if (isStable(*record, view.generation))
            {
                return view;
            }
        }
    }

    PullResult ExposureSurface::pull(std::uint32_t id, gsl::span<std::uint8_t> dest) noexcept
    {
        auto const record = _table.at(id);
        if (record == nullptr)
        {
            return NotFound{};
        }

        for (;;)
        {
            auto const generation = record->generation.load(std::memory_order_acquire);
            if (!isReadable(record->state.load(std::memory_order_acquire)))
            {
                return NotReady{};
            }

            auto const slot = record->slot.load(std::memory_order_acquire);
            auto const size = _pool.descriptor(slot).size.load(std::memory_order_relaxed);
            if (dest.size() < size)
            {
                if (isStable(*record, generation))
                {
                    return DestinationTooSmall{size};
                }
                continue;
            }

            auto const source = _pool.slot(slot);
            std::copy_n(source.begin(), size, dest.begin());
            if (isStable(*record, generation))
            {
                record->pullCount.fetch_add(1U, std::memory_order_relaxed);
                RGTP_TRACE("Pulled chunk {} ({} bytes).", id, size);
                return Pulled{size};
            }
        }
    }

    std::vector<PullResult> ExposureSurface::pullBatch(gsl::span<std::uint32_t const> ids, gsl::span<gsl::span<std::uint8_t> const> dests)
    {
        if (ids.size() != dests.size())
        {
            throw std::invalid_argument{"Every chunk id needs a destination."};
        }

        auto results = std::vector<PullResult>{};
        results.reserve(ids.size());
        for (auto i = std::size_t{0}; i < ids.size(); ++i)
        {
            results.push_back(pull(ids[i], dests[i]));
        }
        return results;
    }

    VerifyResult ExposureSurface::verify(std::uint32_t id) const noexcept
    {
        auto const record = _table.at(id);
        if (record == nullptr)
        {
            return NotFound{};
        }

        for (;;)
        {
            auto const generation = record->generation.load(std::memory_order_acquire);
            if (!isReadable(record->state.load(std::memory_order_acquire)))
            {
                return NotReady{};
            }
            if (_options.digest == DigestAlgorithm::None)
            {
                return Integrity::Intact;
            }

            auto const slot = record->slot.load(std::memory_order_acquire);
            auto const& descriptor = _pool.descriptor(slot);
            auto const size = descriptor.size.load(std::memory_order_relaxed);
            auto const recorded = descriptor.digest.load(std::memory_order_relaxed);
            auto const actual = computeDigest(_options.digest, _pool.slot(slot).first(size));

            if (isStable(*record, generation))
            {
                if (actual != recorded)
                {
                    RGTP_WARN("Chunk {} of '{}' is corrupted: digest {:08x}, expected {:08x}.", id, fileIdOf(_manifest), actual, recorded);
                    return Integrity::Corrupted;
                }
                return Integrity::Intact;
            }
        }
    }

    std::optional<gsl::span<std::uint8_t const>> ExposureSurface::payloadView(std::uint32_t id) const noexcept
    {
        auto const record = _table.at(id);
        if ((record == nullptr) || !isReadable(record->state.load(std::memory_order_acquire)))
        {
            return std::nullopt;
        }

        auto const slot = record->slot.load(std::memory_order_acquire);
        return _pool.slot(slot).first(_pool.descriptor(slot).size.load(std::memory_order_relaxed));
    }

    AssembleResult ExposureSurface::assemble(gsl::span<std::uint8_t> dest) noexcept
    {
        if (dest.size() < _manifest.totalSize)
        {
            return DestinationTooSmall{_manifest.totalSize};
        }

        auto assembled = std::uint64_t{0};
        for (auto id = std::uint32_t{0}; id < _table.size(); ++id)
        {
            auto const record = _table.at(id);
            auto const result = pull(id, dest.subspan(record->offset, record->capacity));
            if (auto const pulled = std::get_if<Pulled>(&result); pulled != nullptr)
            {
                assembled += pulled->size;
            }
            else
            {
                return Incomplete{id};
            }
        }
        return Assembled{assembled};
    }

    SurfaceStats ExposureSurface::stats() const noexcept
    {
        auto result = SurfaceStats{};
        result.elapsed = currentTime(Clock::Monotonic) - _createdAt;
        result.totalBytes = _totalBytes.load(std::memory_order_relaxed);
        result.exposedCount = _exposedCount.load(std::memory_order_acquire);
        result.chunkCount = _table.size();
        result.reexposureCount = _reexposureCount.load(std::memory_order_relaxed);
        result.exhaustedCount = _exhaustedCount.load(std::memory_order_relaxed);
        result.complete = _complete.load(std::memory_order_acquire);

        auto const seconds = inSeconds(result.elapsed);
        result.throughput = (seconds > 0.0) ? (static_cast<double>(result.totalBytes) / seconds) : 0.0;
        return result;
    }

    SurfaceResult createSurface(rgtpManifest const& manifest, SurfaceOptions const& options) noexcept
    {
        initLogging();

        try
        {
            return std::make_unique<ExposureSurface>(manifest, options);
        }
        catch (std::invalid_argument const& e)
        {
            RGTP_ERROR("Rejected surface creation: {}", e.what());
            return Error::InvalidParameter;
        }
        catch (std::bad_alloc const&)
        {
            RGTP_ERROR("Failed to allocate a surface of {} chunks of {} bytes.", manifest.totalChunks, manifest.chunkSize);
            return Error::AllocationFailure;
        }
        catch (std::exception const& e)
        {
            RGTP_ERROR("Failed to create surface: {}", e.what());
            return Error::AllocationFailure;
        }
    }

    SurfaceResult createSurface(rgtpManifest const& manifest, std::string const& options) noexcept
    {
        initLogging();

        try
        {
            return createSurface(manifest, SurfaceOptionsParser{options}.getOptions());
        }
        catch (std::exception const& e)
        {
            RGTP_ERROR("Rejected surface options: {}", e.what());
            return Error::InvalidParameter;
        }
    }
}
