// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../detail/record_decoder.hpp"

namespace edidkit::utils {

/**
 * @brief Byte source over a caller-owned buffer
 *
 * Copies as many bytes as fit per fill() and returns 0 once the buffer is
 * exhausted. Never fails. The buffer must outlive the source.
 */
class MemorySource {
public:
    explicit MemorySource(std::span<const uint8_t> data) noexcept : data_(data) {}

    std::optional<std::size_t> fill(std::span<uint8_t> buffer) noexcept {
        const std::size_t count = std::min(buffer.size(), data_.size() - position_);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), count,
                    buffer.begin());
        position_ += count;
        return count;
    }

    /// Bytes not yet handed out
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - position_; }

private:
    std::span<const uint8_t> data_;
    std::size_t position_{0};
};

} // namespace edidkit::utils

namespace edidkit {

/**
 * @brief Decode a base block held in memory
 *
 * @param bytes At least 127 bytes; anything past the base block is ignored
 */
inline DecodeResult<DisplayRecord> decode(std::span<const uint8_t> bytes) {
    utils::MemorySource source(bytes);
    return decode(source);
}

} // namespace edidkit
