// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>

namespace edidkit {

// ============================================================================
// Block geometry (VESA E-EDID 1.4 base block)
// ============================================================================

inline constexpr std::size_t block_size = 128;    ///< Base block and extension block size
inline constexpr std::size_t header_size = 8;     ///< Fixed header pattern length
inline constexpr std::size_t slot_size = 18;      ///< Detailed timing / descriptor slot
inline constexpr std::size_t slot_count = 4;      ///< Slots in the base block
inline constexpr std::size_t descriptor_payload_size = 13; ///< Bytes after the descriptor tag
inline constexpr std::size_t base_standard_timing_count = 8;
inline constexpr std::size_t descriptor_standard_timing_count = 6;
inline constexpr std::size_t descriptor_white_point_count = 2;

// Header pattern 00 FF FF FF FF FF FF 00, read as two little-endian words
inline constexpr uint32_t header_word_0 = 0xFFFFFF00;
inline constexpr uint32_t header_word_1 = 0x00FFFFFF;

// ============================================================================
// Decode errors
// ============================================================================

/**
 * @brief Reason a decode was aborted
 *
 * Every error is terminal for the call. The first error encountered is
 * reported and no partial record is produced.
 */
enum class DecodeErrorCode : uint8_t {
    header_invalid,            ///< First 8 bytes are not the fixed header pattern
    unexpected_end_of_data,    ///< Byte source returned zero bytes before the block ended
    missing_preferred_timing,  ///< Slot 0 has a zero pixel clock
    malformed_timing_geometry, ///< Blanking shorter than front porch + sync width
    malformed_descriptor,      ///< Terminator, padding or guard byte mismatch
    source_failure             ///< Byte source reported a read failure
};

/**
 * @brief Get human-readable string for a decode error code
 * @return Static string, never null
 */
[[nodiscard]] constexpr const char* decode_error_string(DecodeErrorCode code) noexcept {
    switch (code) {
        case DecodeErrorCode::header_invalid:
            return "Invalid header";
        case DecodeErrorCode::unexpected_end_of_data:
            return "Unexpected end of data";
        case DecodeErrorCode::missing_preferred_timing:
            return "Missing preferred detailed timing";
        case DecodeErrorCode::malformed_timing_geometry:
            return "Malformed detailed timing geometry";
        case DecodeErrorCode::malformed_descriptor:
            return "Malformed display descriptor";
        case DecodeErrorCode::source_failure:
            return "Byte source read failure";
    }
    return "Unknown decode error";
}

// ============================================================================
// Enumerations decoded from closed bit selectors
// ============================================================================

/// Display color type (feature support byte, bits 4-3)
enum class DisplayType : uint8_t {
    monochrome = 0,
    rgb_color = 1,
    other_color = 2,
    undefined = 3
};

/// Standard timing aspect ratio (second byte, bits 7-6)
enum class AspectRatio : uint8_t {
    ratio_16_10 = 0,
    ratio_4_3 = 1,
    ratio_5_4 = 2,
    ratio_16_9 = 3
};

/**
 * VESA established timings I & II plus the manufacturer 1152x870 bit.
 *
 * Enumerator order is the catalogue order used for storage.
 */
enum class EstablishedTiming : uint8_t {
    h720_v400_f70,
    h720_v400_f88,
    h640_v480_f60,
    h640_v480_f67,
    h640_v480_f72,
    h640_v480_f75,
    h800_v600_f56,
    h800_v600_f60,
    h800_v600_f72,
    h800_v600_f75,
    h832_v624_f75,
    h1024_v768_f87,
    h1024_v768_f60,
    h1024_v768_f70,
    h1024_v768_f75,
    h1280_v1024_f75,
    h1152_v870_f75
};

inline constexpr std::size_t established_timing_count = 17;

/// Stereo viewing support (detailed timing flags, bits 6, 5 and 0)
enum class StereoMode : uint8_t {
    none,
    field_sequential_right,
    field_sequential_left,
    interleaved_right_even,
    interleaved_left_even,
    interleaved_four_way,
    side_by_side
};

/// Sync pulse polarity
enum class SyncPolarity : uint8_t { negative, positive };

} // namespace edidkit
