// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <edidkit/types.hpp>

namespace edidkit {

/**
 * @brief Error information from a failed decode
 *
 * Contains the context needed to diagnose a malformed block: the error code,
 * the number of bytes consumed when decoding stopped, and the name of the
 * field being decoded.
 *
 * This is a trivially copyable type (context is a static string).
 */
struct DecodeError {
    DecodeErrorCode code;          ///< The error that occurred
    std::size_t offset{0};         ///< Bytes consumed from the source when decoding stopped
    const char* context{"block"};  ///< Field being decoded (static string)

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return decode_error_string(code); }
};

} // namespace edidkit
