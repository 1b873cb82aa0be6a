// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <gsl/span>
#include <rgtp/manifest.h>
#include "rgtp-internal/ExposureSurface.hpp"

namespace rgtp::tests
{
    // Deterministic payload for chunk 'id', starting with the id itself when it fits.
    std::vector<std::uint8_t> makePayload(std::uint32_t id, std::size_t size, std::uint8_t salt = 0);

    // Create a surface, throwing std::runtime_error if the factory reports an error.
    std::unique_ptr<lib::ExposureSurface> makeSurface(rgtpManifest const& manifest, lib::SurfaceOptions const& options = {});

    // The payload of every chunk of 'manifest', in id order.
    std::vector<std::vector<std::uint8_t>> makeDataSet(rgtpManifest const& manifest, std::uint8_t salt = 0);

    inline gsl::span<std::uint8_t const> asSpan(std::vector<std::uint8_t> const& bytes)
    {
        return {bytes.data(), bytes.size()};
    }

    inline gsl::span<std::uint8_t> asSpan(std::vector<std::uint8_t>& bytes)
    {
        return {bytes.data(), bytes.size()};
    }

} // namespace rgtp::tests
