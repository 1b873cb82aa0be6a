// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

#include "rgtp/rgtp.h"

#ifndef RGTP_VERSION_MAJOR
#   error "RGTP_VERSION_MAJOR must be defined by the build system."
#endif

namespace
{
    constexpr auto const VERSION = rgtpVersionType{
        RGTP_VERSION_MAJOR,
        RGTP_VERSION_MINOR,
        RGTP_VERSION_PATCH,
        RGTP_VERSION_BUILD,
        RGTP_VERSION_FULL,
    };
}

extern "C"
RGTP_EXPORT
rgtpStatus rgtpGetVersion(rgtpVersionType* out_version)
{
    if (out_version != nullptr)
    {
        *out_version = VERSION;
        return RGTP_STATUS_OK;
    }
    return RGTP_ERR_INVALID_ARG;
}

extern "C"
RGTP_EXPORT
char const* rgtpStatusString(rgtpStatus status)
{
    switch (status)
    {
        case RGTP_STATUS_OK:              return "RGTP_STATUS_OK";
        case RGTP_ERR_UNKNOWN:            return "RGTP_ERR_UNKNOWN";
        case RGTP_ERR_INVALID_ARG:        return "RGTP_ERR_INVALID_ARG";
        case RGTP_ERR_ALLOCATION_FAILURE: return "RGTP_ERR_ALLOCATION_FAILURE";
        case RGTP_ERR_CHUNK_OUT_OF_RANGE: return "RGTP_ERR_CHUNK_OUT_OF_RANGE";
        case RGTP_ERR_CHUNK_TOO_LARGE:    return "RGTP_ERR_CHUNK_TOO_LARGE";
        case RGTP_ERR_CHUNK_NOT_READY:    return "RGTP_ERR_CHUNK_NOT_READY";
        case RGTP_ERR_SURFACE_EXHAUSTED:  return "RGTP_ERR_SURFACE_EXHAUSTED";
        case RGTP_ERR_BUFFER_TOO_SMALL:   return "RGTP_ERR_BUFFER_TOO_SMALL";
    }
    return "UNKNOWN";
}
