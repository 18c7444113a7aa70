// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

namespace edidkit {

/**
 * Byte source capability consumed by the decoder.
 *
 * A source fills a caller-provided buffer and reports how many bytes it
 * wrote, or std::nullopt when the underlying read failed. Returning 0 means
 * the source has no more data. There is no seeking and no peeking.
 *
 * Sources for memory, standard streams and files live in edidkit/utils.
 * Hosts without a standard library implement fill() over whatever transport
 * they have (DDC, a static buffer, ...).
 *
 * Example:
 * @code
 * struct DdcSource {
 *     std::optional<std::size_t> fill(std::span<uint8_t> buffer) {
 *         int n = i2c_read(bus, 0x50, buffer.data(), buffer.size());
 *         if (n < 0) return std::nullopt;
 *         return static_cast<std::size_t>(n);
 *     }
 * };
 * @endcode
 */
template <typename T>
concept ByteSource = requires(T& source, std::span<uint8_t> buffer) {
    { source.fill(buffer) } -> std::same_as<std::optional<std::size_t>>;
};

} // namespace edidkit
