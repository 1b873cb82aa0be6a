// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Result.hpp
 * @brief Error taxonomy and result sum types of the exposure surface
 *
 * Every outcome of a surface operation is a value.  Callers are expected to
 * handle them exhaustively with std::visit, typically through overloaded{}:
 *
 * @code
 * std::visit(overloaded{
 *     [&](Pulled const& p)              { consume(buffer, p.size); },
 *     [&](NotReady)                     { retryLater(id); },
 *     [&](NotFound)                     { reject(id); },
 *     [&](DestinationTooSmall const& d) { grow(buffer, d.required); },
 * }, surface.pull(id, buffer));
 * @endcode
 */

#pragma once

#include <cstdint>
#include <variant>

namespace rgtp::lib
{
    /**
     * Failure conditions reported by the surface.
     */
    enum class Error
    {
        InvalidParameter,  // Absent or malformed manifest, options or arguments.
        AllocationFailure, // The chunk pool could not be reserved at creation.
        ChunkOutOfRange,   // id >= chunk count.
        ChunkTooLarge,     // Payload larger than the chunk's capacity.
        ChunkNotReady,     // Chunk not exposed yet. Expected and retriable.
        SurfaceExhausted,  // No free pool slot for a recovery re-exposure. Retriable.
    };

    /**
     * What a successful exposure did.
     */
    enum class Exposure
    {
        Published,      // First exposure of the chunk; counters were incremented.
        AlreadyExposed, // Another exposure claimed the chunk first; nothing changed.
        Republished,    // Recovery re-exposure replaced the payload.
    };

    using ExposeResult = std::variant<Exposure, Error>;

    struct Pulled
    {
        std::uint32_t size;
    };

    struct NotReady
    {};

    struct NotFound
    {};

    struct DestinationTooSmall
    {
        std::uint64_t required;
    };

    using PullResult = std::variant<Pulled, NotReady, NotFound, DestinationTooSmall>;

    enum class Integrity
    {
        Intact,
        Corrupted,
    };

    using VerifyResult = std::variant<Integrity, NotReady, NotFound>;

    struct Assembled
    {
        std::uint64_t size;
    };

    struct Incomplete
    {
        std::uint32_t firstMissing;
    };

    using AssembleResult = std::variant<Assembled, Incomplete, DestinationTooSmall>;

    /**
     * Inline visitor built from a set of lambdas.
     */
    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    /** Whether an exposure left the chunk published. */
    [[nodiscard]]
    constexpr bool succeeded(ExposeResult const& result) noexcept
    {
        return std::holds_alternative<Exposure>(result);
    }

    [[nodiscard]]
    constexpr char const* toString(Error error) noexcept
    {
        switch (error)
        {
            case Error::InvalidParameter:  return "InvalidParameter";
            case Error::AllocationFailure: return "AllocationFailure";
            case Error::ChunkOutOfRange:   return "ChunkOutOfRange";
            case Error::ChunkTooLarge:     return "ChunkTooLarge";
            case Error::ChunkNotReady:     return "ChunkNotReady";
            case Error::SurfaceExhausted:  return "SurfaceExhausted";
        }
        return "UNKNOWN";
    }
}
