// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../byte_source.hpp"
#include "../types.hpp"
#include "decode_result.hpp"

namespace edidkit::detail {

/**
 * @brief Buffered sequential reader over a ByteSource
 *
 * Pulls up to ChunkSize bytes per fill() and hands them out one at a time.
 * Multi-byte reads are little-endian and composed from next_byte(), so a
 * source may deliver the block in chunks of any size.
 *
 * A fill() returning 0 is UnexpectedEndOfData (the block is fixed-size, so
 * running dry is never a successful end of stream). A fill() returning
 * std::nullopt, or claiming more bytes than the buffer holds, is a source
 * failure.
 *
 * The cursor references the source; the source must outlive the cursor.
 *
 * @tparam Source Byte source type
 * @tparam ChunkSize Internal buffer size (default: one 128-byte block)
 */
template <ByteSource Source, std::size_t ChunkSize = block_size>
class ByteCursor {
    static_assert(ChunkSize > 0, "ChunkSize must be positive");

public:
    explicit ByteCursor(Source& source) noexcept : source_(source) {}

    ByteCursor(const ByteCursor&) = delete;
    ByteCursor& operator=(const ByteCursor&) = delete;

    /**
     * @brief Read the next byte, refilling the buffer when exhausted
     */
    DecodeResult<uint8_t> next_byte() {
        if (position_ == length_) {
            auto filled = source_.fill(std::span<uint8_t>(buffer_));
            if (!filled.has_value() || *filled > buffer_.size()) {
                return make_decode_error(DecodeErrorCode::source_failure, consumed_, context_);
            }
            if (*filled == 0) {
                return make_decode_error(DecodeErrorCode::unexpected_end_of_data, consumed_,
                                         context_);
            }
            position_ = 0;
            length_ = *filled;
        }

        ++consumed_;
        return buffer_[position_++];
    }

    DecodeResult<uint16_t> next_u16_le() {
        auto low = next_byte();
        if (!low) {
            return unexpected(low.error());
        }
        auto high = next_byte();
        if (!high) {
            return unexpected(high.error());
        }
        return static_cast<uint16_t>(*low | (*high << 8));
    }

    DecodeResult<uint32_t> next_u32_le() {
        auto low = next_u16_le();
        if (!low) {
            return unexpected(low.error());
        }
        auto high = next_u16_le();
        if (!high) {
            return unexpected(high.error());
        }
        return static_cast<uint32_t>(*low) | (static_cast<uint32_t>(*high) << 16);
    }

    /**
     * @brief Read a fixed-size group of bytes
     *
     * Used for packed groups (chromaticity, timing geometry, descriptor
     * payloads) that are decoded as a unit once fully read.
     */
    template <std::size_t N>
    DecodeResult<std::array<uint8_t, N>> next_bytes() {
        std::array<uint8_t, N> out{};
        for (auto& byte : out) {
            auto b = next_byte();
            if (!b) {
                return unexpected(b.error());
            }
            byte = *b;
        }
        return out;
    }

    /// Bytes consumed so far
    [[nodiscard]] std::size_t offset() const noexcept { return consumed_; }

    /**
     * @brief Name the field being decoded
     *
     * The context string is attached to errors raised by the cursor itself
     * (end of data, source failure). Must be a static string.
     */
    void set_context(const char* context) noexcept { context_ = context; }

    [[nodiscard]] const char* context() const noexcept { return context_; }

    /// Build an error at the current offset with the current context
    [[nodiscard]] auto fail(DecodeErrorCode code) const noexcept {
        return make_decode_error(code, consumed_, context_);
    }

private:
    Source& source_;
    std::array<uint8_t, ChunkSize> buffer_{};
    std::size_t position_{0};
    std::size_t length_{0};
    std::size_t consumed_{0};
    const char* context_{"header"};
};

} // namespace edidkit::detail
