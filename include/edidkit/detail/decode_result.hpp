// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include "../expected.hpp"
#include "decode_error.hpp"

namespace edidkit {

/**
 * @brief Result type for decode operations
 *
 * Alias for expected<T, DecodeError>. Holds either the decoded value or a
 * DecodeError describing why decoding stopped.
 *
 * Usage:
 * @code
 *   auto result = edidkit::decode(bytes);
 *   if (result.has_value()) {
 *       auto name = edidkit::monitor_name(*result);
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully decoded value
 */
template <typename T>
using DecodeResult = expected<T, DecodeError>;

/**
 * @brief Factory function for creating decode errors
 *
 * Usage:
 * @code
 *   return make_decode_error(DecodeErrorCode::malformed_descriptor,
 *                            cursor.offset(), "monitor name padding");
 * @endcode
 *
 * @param code The error code
 * @param offset Bytes consumed when the error was detected
 * @param context Static string naming the field being decoded
 * @return unexpected<DecodeError> suitable for returning from decode functions
 */
inline auto make_decode_error(DecodeErrorCode code, std::size_t offset,
                              const char* context) noexcept {
    return unexpected(DecodeError{.code = code, .offset = offset, .context = context});
}

} // namespace edidkit
