// SPDX-FileCopyrightText: 2025 Contributors to the Red Giant Transport Protocol project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Compiler portability macros shared by every public RGTP header.
 *
 * Macros defined here:
 *   - RGTP_EXPORT      : Marks a symbol for export from the shared library.
 *   - RGTP_NODISCARD   : Warns callers if they discard the return value.
 *   - RGTP_CONSTEXPR   : Maps to `constexpr` in C++ and `inline` in C.
 */

#pragma once

/*
 * On GCC and Clang the "default" visibility attribute exports the symbol from
 * the shared object. Other compilers get an empty macro.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define RGTP_EXPORT __attribute__((visibility("default")))
#else
#   define RGTP_EXPORT
#endif

#ifdef __cplusplus
#   define RGTP_NODISCARD [[nodiscard]]
#   define RGTP_CONSTEXPR constexpr
#else
#   define RGTP_NODISCARD
#   define RGTP_CONSTEXPR inline
#endif
