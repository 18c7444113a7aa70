// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file edidkit.hpp
 * @brief Main header for the EDID base block decoder
 *
 * Primary API:
 * - decode(): Decode a 128-byte base block from any ByteSource or a byte span
 * - DisplayRecord: Immutable decoded record with const accessors
 * - DecodeResult / DecodeError: Fail-fast error reporting
 * - monitor_name(), serial_number_string(), range_limits(): Descriptor lookups
 *
 * Example:
 * @code
 * auto record = edidkit::decode(std::span<const uint8_t>(bytes));
 * if (!record) {
 *     std::cerr << record.error().message() << " at byte " << record.error().offset << "\n";
 *     return;
 * }
 * const auto& preferred = record->timings().detailed.front();
 * @endcode
 */

#include "edidkit/byte_source.hpp"
#include "edidkit/detail/color_characteristics.hpp"
#include "edidkit/detail/decode_error.hpp"
#include "edidkit/detail/decode_result.hpp"
#include "edidkit/detail/descriptor.hpp"
#include "edidkit/detail/detailed_timing.hpp"
#include "edidkit/detail/display_parameters.hpp"
#include "edidkit/detail/product_info.hpp"
#include "edidkit/detail/record_decoder.hpp"
#include "edidkit/detail/timing_tables.hpp"
#include "edidkit/expected.hpp"
#include "edidkit/types.hpp"
#include "edidkit/utils/memory_source.hpp"
