// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <optional>
#include <span>
#include <vector>

#include <cstdint>

#include "../types.hpp"
#include "bitfield.hpp"
#include "decode_result.hpp"

namespace edidkit {

/// Resolution and refresh of an established timing
struct EstablishedTimingInfo {
    uint16_t width;
    uint16_t height;
    uint8_t refresh_hz;
    bool interlaced;
    const char* name;
};

/**
 * Standard timing entry (2 bytes)
 *
 * Byte 0: (horizontal active / 8) - 31
 * Byte 1: Aspect ratio [7:6] | Refresh rate - 60 [5:0]
 */
struct StandardTiming {
    uint16_t horizontal_resolution{0};
    AspectRatio aspect_ratio{AspectRatio::ratio_16_10};
    uint8_t refresh_rate{0}; ///< Hz

    /// Width divided by height
    [[nodiscard]] constexpr double aspect_ratio_value() const noexcept {
        switch (aspect_ratio) {
            case AspectRatio::ratio_16_10:
                return 16.0 / 10.0;
            case AspectRatio::ratio_4_3:
                return 4.0 / 3.0;
            case AspectRatio::ratio_5_4:
                return 5.0 / 4.0;
            case AspectRatio::ratio_16_9:
                return 16.0 / 9.0;
        }
        return 0.0;
    }

    /// Vertical active lines implied by the aspect ratio
    [[nodiscard]] constexpr uint16_t vertical_resolution() const noexcept {
        const uint32_t w = horizontal_resolution;
        switch (aspect_ratio) {
            case AspectRatio::ratio_16_10:
                return static_cast<uint16_t>(w * 10 / 16);
            case AspectRatio::ratio_4_3:
                return static_cast<uint16_t>(w * 3 / 4);
            case AspectRatio::ratio_5_4:
                return static_cast<uint16_t>(w * 4 / 5);
            case AspectRatio::ratio_16_9:
                return static_cast<uint16_t>(w * 9 / 16);
        }
        return 0;
    }

    bool operator==(const StandardTiming&) const = default;
};

namespace detail {

struct EstablishedTimingEntry {
    EstablishedTiming timing;
    uint8_t bit; ///< Bit position in (byte0 | byte1 << 8 | byte2 << 16)
    EstablishedTimingInfo info;
};

// Catalogue order. Bytes 0x23 and 0x24 list their modes from bit 7 down to
// bit 0; byte 0x25 bit 7 is the 1152x870 manufacturer timing.
inline constexpr std::array<EstablishedTimingEntry, established_timing_count>
    established_timing_table{{
        {EstablishedTiming::h720_v400_f70, 7, {720, 400, 70, false, "720x400@70"}},
        {EstablishedTiming::h720_v400_f88, 6, {720, 400, 88, false, "720x400@88"}},
        {EstablishedTiming::h640_v480_f60, 5, {640, 480, 60, false, "640x480@60"}},
        {EstablishedTiming::h640_v480_f67, 4, {640, 480, 67, false, "640x480@67"}},
        {EstablishedTiming::h640_v480_f72, 3, {640, 480, 72, false, "640x480@72"}},
        {EstablishedTiming::h640_v480_f75, 2, {640, 480, 75, false, "640x480@75"}},
        {EstablishedTiming::h800_v600_f56, 1, {800, 600, 56, false, "800x600@56"}},
        {EstablishedTiming::h800_v600_f60, 0, {800, 600, 60, false, "800x600@60"}},
        {EstablishedTiming::h800_v600_f72, 15, {800, 600, 72, false, "800x600@72"}},
        {EstablishedTiming::h800_v600_f75, 14, {800, 600, 75, false, "800x600@75"}},
        {EstablishedTiming::h832_v624_f75, 13, {832, 624, 75, false, "832x624@75"}},
        {EstablishedTiming::h1024_v768_f87, 12, {1024, 768, 87, true, "1024x768@87i"}},
        {EstablishedTiming::h1024_v768_f60, 11, {1024, 768, 60, false, "1024x768@60"}},
        {EstablishedTiming::h1024_v768_f70, 10, {1024, 768, 70, false, "1024x768@70"}},
        {EstablishedTiming::h1024_v768_f75, 9, {1024, 768, 75, false, "1024x768@75"}},
        {EstablishedTiming::h1280_v1024_f75, 8, {1280, 1024, 75, false, "1280x1024@75"}},
        {EstablishedTiming::h1152_v870_f75, 23, {1152, 870, 75, false, "1152x870@75"}},
    }};

} // namespace detail

[[nodiscard]] constexpr const EstablishedTimingInfo&
established_timing_info(EstablishedTiming timing) noexcept {
    return detail::established_timing_table[static_cast<std::size_t>(timing)].info;
}

[[nodiscard]] constexpr const char* established_timing_name(EstablishedTiming timing) noexcept {
    return established_timing_info(timing).name;
}

namespace detail {

struct StandardTimingLayout {
    struct AspectRatioField : EnumBitField<AspectRatio, uint8_t, 6, 2, 1> {};
    struct RefreshField : BitField<uint8_t, 0, 6, 1> {};

    using Layout = BitFieldLayout<AspectRatioField, RefreshField>;
    static_assert(Layout::required_bytes == 2);

    static constexpr uint8_t unused_byte = 0x01;
    static constexpr uint16_t resolution_offset = 31;
    static constexpr uint16_t resolution_scale = 8;
    static constexpr uint8_t refresh_offset = 60;
};

/**
 * Decode one standard timing entry.
 *
 * @return std::nullopt for the unused-entry pattern (0x01, 0x01)
 */
[[nodiscard]] constexpr std::optional<StandardTiming> decode_standard_timing(uint8_t byte0,
                                                                             uint8_t byte1) noexcept {
    using L = StandardTimingLayout;
    if (byte0 == L::unused_byte && byte1 == L::unused_byte) {
        return std::nullopt;
    }
    return StandardTiming{
        .horizontal_resolution =
            static_cast<uint16_t>((byte0 + L::resolution_offset) * L::resolution_scale),
        .aspect_ratio = L::AspectRatioField::decode(byte1),
        .refresh_rate = static_cast<uint8_t>(L::RefreshField::extract(byte1) + L::refresh_offset)};
}

/// Append decoded entries from consecutive byte pairs, skipping unused ones
inline void append_standard_timings(std::span<const uint8_t> bytes,
                                    std::vector<StandardTiming>& out) {
    for (std::size_t i = 0; i + 1 < bytes.size(); i += 2) {
        if (auto timing = decode_standard_timing(bytes[i], bytes[i + 1])) {
            out.push_back(*timing);
        }
    }
}

/// Decode the 24-bit established timing bitmap into catalogue order
[[nodiscard]] inline std::vector<EstablishedTiming> decode_established_timings(uint32_t bitmap) {
    std::vector<EstablishedTiming> out;
    for (const auto& entry : established_timing_table) {
        if ((bitmap >> entry.bit) & 1U) {
            out.push_back(entry.timing);
        }
    }
    return out;
}

/// Established and standard timings from the base block (bytes 0x23-0x35)
struct TimingTables {
    std::vector<EstablishedTiming> established;
    std::vector<StandardTiming> standard;
};

template <typename Cursor>
DecodeResult<TimingTables> decode_timing_tables(Cursor& cursor) {
    cursor.set_context("established timings");
    auto word = cursor.next_u16_le();
    if (!word) {
        return unexpected(word.error());
    }
    auto manufacturer_byte = cursor.next_byte();
    if (!manufacturer_byte) {
        return unexpected(manufacturer_byte.error());
    }

    cursor.set_context("standard timings");
    auto standard_bytes = cursor.template next_bytes<base_standard_timing_count * 2>();
    if (!standard_bytes) {
        return unexpected(standard_bytes.error());
    }

    TimingTables tables;
    tables.established = decode_established_timings(
        static_cast<uint32_t>(*word) | (static_cast<uint32_t>(*manufacturer_byte) << 16));
    append_standard_timings(*standard_bytes, tables.standard);
    return tables;
}

} // namespace detail

} // namespace edidkit
