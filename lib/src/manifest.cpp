// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp/manifest.h"
#include <stdexcept>
#include "rgtp-internal/Logging.hpp"
#include "rgtp-internal/Manifest.hpp"
#include "rgtp-internal/ManifestParser.hpp"

using namespace rgtp::lib;

extern "C"
RGTP_EXPORT
rgtpStatus rgtpManifestInit(char const* in_fileId, uint64_t in_totalSize, uint32_t in_chunkSize, rgtpManifest* out_manifest)
{
    if ((in_fileId == nullptr) || (out_manifest == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    try
    {
        *out_manifest = makeManifest(in_fileId, in_totalSize, in_chunkSize);
        return RGTP_STATUS_OK;
    }
    catch (std::invalid_argument const& e)
    {
        RGTP_ERROR("Invalid manifest: {}", e.what());
        return RGTP_ERR_INVALID_ARG;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpManifestFromJson(char const* in_definition, rgtpManifest* out_manifest)
{
    if ((in_definition == nullptr) || (out_manifest == nullptr))
    {
        return RGTP_ERR_INVALID_ARG;
    }

    try
    {
        *out_manifest = ManifestParser{in_definition}.getManifest();
        return RGTP_STATUS_OK;
    }
    catch (std::exception const& e)
    {
        RGTP_ERROR("Invalid manifest definition: {}", e.what());
        return RGTP_ERR_INVALID_ARG;
    }
    catch (...)
    {
        return RGTP_ERR_UNKNOWN;
    }
}
