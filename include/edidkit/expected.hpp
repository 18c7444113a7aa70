#pragma once

// Result type used throughout edidkit.
//
// tl::expected stands in for C++23 std::expected. Every decode step returns
// expected<T, DecodeError> (see DecodeResult) and the first error is passed
// straight up to the caller:
//
//   auto display = detail::decode_display_parameters(cursor);
//   if (!display) {
//       return unexpected(display.error());
//   }

#include <tl/expected.hpp>

namespace edidkit {

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

} // namespace edidkit
