// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstdint>

#include "../types.hpp"
#include "bitfield.hpp"
#include "color_characteristics.hpp"
#include "decode_result.hpp"
#include "display_parameters.hpp"
#include "timing_tables.hpp"

namespace edidkit {

/// Raw descriptor payload following the tag
using DescriptorPayload = std::array<uint8_t, descriptor_payload_size>;

/// Display serial number text (tag 0xFF)
struct SerialNumberDescriptor {
    std::string text;

    bool operator==(const SerialNumberDescriptor&) const = default;
};

/// Alphanumeric data string (tag 0xFE)
struct OtherStringDescriptor {
    std::string text;

    bool operator==(const OtherStringDescriptor&) const = default;
};

/// Display product name (tag 0xFC)
struct MonitorNameDescriptor {
    std::string text;

    bool operator==(const MonitorNameDescriptor&) const = default;
};

struct NoSecondaryTiming {
    bool operator==(const NoSecondaryTiming&) const = default;
};

/// Secondary GTF curve parameters (range limits selector 0x02)
struct GtfSecondaryTiming {
    uint32_t start_horizontal_freq{0}; ///< Hz
    double c{0.0};
    double m{0.0};
    double k{0.0};
    double j{0.0};

    bool operator==(const GtfSecondaryTiming&) const = default;
};

/// Unrecognised range limits selector with its remaining bytes
struct OpaqueSecondaryTiming {
    uint8_t selector{0};
    std::array<uint8_t, 7> data{};

    bool operator==(const OpaqueSecondaryTiming&) const = default;
};

using SecondaryTiming = std::variant<NoSecondaryTiming, GtfSecondaryTiming, OpaqueSecondaryTiming>;

/// Display range limits (tag 0xFD)
struct RangeLimitsDescriptor {
    uint8_t min_vertical_rate{0};    ///< Hz
    uint8_t max_vertical_rate{0};    ///< Hz
    uint32_t min_horizontal_rate{0}; ///< Hz
    uint32_t max_horizontal_rate{0}; ///< Hz
    uint32_t max_pixel_clock{0};     ///< Hz
    SecondaryTiming secondary_timing;

    bool operator==(const RangeLimitsDescriptor&) const = default;
};

/// Manufacturer-specified data (tags 0x00-0x0F), kept verbatim
struct ManufacturerDescriptor {
    uint8_t tag{0};
    DescriptorPayload data{};

    bool operator==(const ManufacturerDescriptor&) const = default;
};

/// Tag without a defined format (0x11-0xF9), kept verbatim
struct UndefinedDescriptor {
    uint8_t tag{0};
    DescriptorPayload data{};

    bool operator==(const UndefinedDescriptor&) const = default;
};

using Descriptor =
    std::variant<SerialNumberDescriptor, OtherStringDescriptor, MonitorNameDescriptor,
                 RangeLimitsDescriptor, ManufacturerDescriptor, UndefinedDescriptor>;

namespace descriptor_tags {
inline constexpr uint8_t manufacturer_last = 0x0F;
inline constexpr uint8_t dummy = 0x10;
inline constexpr uint8_t undefined_last = 0xF9;
inline constexpr uint8_t standard_timings = 0xFA;
inline constexpr uint8_t color_point = 0xFB;
inline constexpr uint8_t monitor_name = 0xFC;
inline constexpr uint8_t range_limits = 0xFD;
inline constexpr uint8_t other_string = 0xFE;
inline constexpr uint8_t serial_number = 0xFF;
} // namespace descriptor_tags

/// Wire tag of a decoded descriptor
[[nodiscard]] inline uint8_t descriptor_tag(const Descriptor& descriptor) noexcept {
    return std::visit(
        [](const auto& d) -> uint8_t {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, SerialNumberDescriptor>) {
                return descriptor_tags::serial_number;
            } else if constexpr (std::is_same_v<T, OtherStringDescriptor>) {
                return descriptor_tags::other_string;
            } else if constexpr (std::is_same_v<T, MonitorNameDescriptor>) {
                return descriptor_tags::monitor_name;
            } else if constexpr (std::is_same_v<T, RangeLimitsDescriptor>) {
                return descriptor_tags::range_limits;
            } else {
                return d.tag;
            }
        },
        descriptor);
}

namespace detail {

inline constexpr uint8_t descriptor_terminator = 0x0A;
inline constexpr uint8_t descriptor_pad = 0x20;

/// Everything a descriptor slot can contribute to the record
struct DescriptorAccumulator {
    std::vector<Descriptor> descriptors;
    std::vector<StandardTiming> standard_timings;
    std::vector<WhitePoint> white_points;
};

// ============================================================================
// Text descriptors (0xFC, 0xFE, 0xFF)
// ============================================================================

/**
 * Decode a text payload: characters up to 0x0A, then 0x20 padding.
 *
 * @return The text, or std::nullopt when a byte after the terminator is not 0x20
 */
[[nodiscard]] inline std::optional<std::string> decode_text(const DescriptorPayload& payload) {
    std::string text;
    std::size_t i = 0;
    for (; i < payload.size() && payload[i] != descriptor_terminator; ++i) {
        text.push_back(static_cast<char>(payload[i]));
    }
    // Skip the terminator when present
    for (++i; i < payload.size(); ++i) {
        if (payload[i] != descriptor_pad) {
            return std::nullopt;
        }
    }
    return text;
}

// ============================================================================
// Color point descriptor (0xFB)
// ============================================================================

/**
 * White point entry (5 bytes)
 *
 * Byte 0: Index (0 = unused)
 * Byte 1: Reserved [7:4] | White x [1:0] [3:2] | White y [1:0] [1:0]
 * Byte 2: White x [9:2]    Byte 3: White y [9:2]
 * Byte 4: Gamma (value + 100) / 100
 */
struct WhitePointLayout {
    struct IndexField : BitField<uint8_t, 0, 8, 0> {};
    struct XLow : BitField<uint8_t, 2, 2, 1> {};
    struct YLow : BitField<uint8_t, 0, 2, 1> {};
    struct XHigh : BitField<uint8_t, 0, 8, 2> {};
    struct YHigh : BitField<uint8_t, 0, 8, 3> {};
    struct GammaField : BitField<uint8_t, 0, 8, 4> {};

    using Layout = BitFieldLayout<IndexField, XLow, YLow, XHigh, YHigh, GammaField>;
    static_assert(Layout::required_bytes == 5);

    static constexpr std::size_t size_bytes = 5;
};

[[nodiscard]] inline WhitePoint decode_white_point(std::span<const uint8_t, 5> entry) noexcept {
    using L = WhitePointLayout;
    return WhitePoint{
        .index = entry[L::IndexField::byte_index],
        .point = chromaticity_pair<L::XLow, L::YLow>(entry[L::XLow::byte_index],
                                                     entry[L::XHigh::byte_index],
                                                     entry[L::YHigh::byte_index]),
        .gamma = decode_gamma_value(entry[L::GammaField::byte_index])};
}

// ============================================================================
// Range limits descriptor (0xFD)
// ============================================================================

struct RangeLimitsLayout {
    static constexpr std::size_t min_vertical = 0;
    static constexpr std::size_t max_vertical = 1;
    static constexpr std::size_t min_horizontal = 2;
    static constexpr std::size_t max_horizontal = 3;
    static constexpr std::size_t max_pixel_clock = 4;
    static constexpr std::size_t selector = 5;
    static constexpr std::size_t secondary = 6; // 7 bytes of secondary timing data

    static constexpr uint32_t horizontal_scale = 1'000;         // Hz per unit
    static constexpr uint32_t pixel_clock_scale = 10'000'000;   // Hz per unit
    static constexpr uint32_t gtf_start_scale = 2'000;          // Hz per unit

    static constexpr uint8_t selector_none = 0x00;
    static constexpr uint8_t selector_gtf = 0x02;
};

/**
 * Decode the secondary timing selector and its 7 trailing bytes.
 *
 * @return std::nullopt when a terminator or guard byte is wrong
 */
[[nodiscard]] inline std::optional<SecondaryTiming>
decode_secondary_timing(uint8_t selector, std::span<const uint8_t, 7> data) noexcept {
    using L = RangeLimitsLayout;
    switch (selector) {
        case L::selector_none:
            if (data[0] != descriptor_terminator) {
                return std::nullopt;
            }
            for (std::size_t i = 1; i < data.size(); ++i) {
                if (data[i] != descriptor_pad) {
                    return std::nullopt;
                }
            }
            return SecondaryTiming{NoSecondaryTiming{}};
        case L::selector_gtf:
            if (data[0] != 0x00) {
                return std::nullopt;
            }
            return SecondaryTiming{GtfSecondaryTiming{
                .start_horizontal_freq = static_cast<uint32_t>(data[1]) * L::gtf_start_scale,
                .c = static_cast<double>(data[2]) / 2.0,
                .m = static_cast<double>(static_cast<uint16_t>(data[3] | (data[4] << 8))),
                .k = static_cast<double>(data[5]),
                .j = static_cast<double>(data[6]) / 2.0}};
        default: {
            OpaqueSecondaryTiming opaque{.selector = selector, .data = {}};
            std::copy(data.begin(), data.end(), opaque.data.begin());
            return SecondaryTiming{opaque};
        }
    }
}

[[nodiscard]] inline std::optional<RangeLimitsDescriptor>
decode_range_limits(const DescriptorPayload& payload) noexcept {
    using L = RangeLimitsLayout;
    auto secondary = decode_secondary_timing(
        payload[L::selector], std::span<const uint8_t, 7>(payload.data() + L::secondary, 7));
    if (!secondary) {
        return std::nullopt;
    }
    return RangeLimitsDescriptor{
        .min_vertical_rate = payload[L::min_vertical],
        .max_vertical_rate = payload[L::max_vertical],
        .min_horizontal_rate = static_cast<uint32_t>(payload[L::min_horizontal]) * L::horizontal_scale,
        .max_horizontal_rate = static_cast<uint32_t>(payload[L::max_horizontal]) * L::horizontal_scale,
        .max_pixel_clock = static_cast<uint32_t>(payload[L::max_pixel_clock]) * L::pixel_clock_scale,
        .secondary_timing = *secondary};
}

// ============================================================================
// Descriptor dispatch
// ============================================================================

/**
 * Decode the remainder of a slot whose pixel clock was zero.
 *
 * Consumes the reserved byte, the tag and a second reserved byte, then the
 * 13 payload bytes. A padding tag (0x10) stops after its 3-byte header and
 * appends nothing; the next slot starts at the following byte. Decoded
 * content is appended to the accumulator.
 */
template <typename Cursor>
DecodeResult<void> decode_descriptor(Cursor& cursor, DescriptorAccumulator& out) {
    cursor.set_context("descriptor header");
    auto header = cursor.template next_bytes<3>();
    if (!header) {
        return unexpected(header.error());
    }
    const uint8_t tag = (*header)[1];
    if (tag == descriptor_tags::dummy) {
        return {};
    }

    cursor.set_context("descriptor payload");
    auto payload_result = cursor.template next_bytes<descriptor_payload_size>();
    if (!payload_result) {
        return unexpected(payload_result.error());
    }
    const DescriptorPayload& payload = *payload_result;
    const std::size_t end = cursor.offset();

    if (tag <= descriptor_tags::manufacturer_last) {
        out.descriptors.emplace_back(ManufacturerDescriptor{.tag = tag, .data = payload});
        return {};
    }
    if (tag <= descriptor_tags::undefined_last) {
        out.descriptors.emplace_back(UndefinedDescriptor{.tag = tag, .data = payload});
        return {};
    }

    switch (tag) {
        case descriptor_tags::standard_timings: {
            constexpr std::size_t timing_bytes = descriptor_standard_timing_count * 2;
            if (payload[timing_bytes] != descriptor_terminator) {
                return make_decode_error(DecodeErrorCode::malformed_descriptor, end,
                                         "standard timing descriptor terminator");
            }
            append_standard_timings(std::span<const uint8_t>(payload.data(), timing_bytes),
                                    out.standard_timings);
            return {};
        }
        case descriptor_tags::color_point: {
            constexpr std::size_t entry_size = WhitePointLayout::size_bytes;
            constexpr std::size_t entries_bytes = descriptor_white_point_count * entry_size;
            if (payload[entries_bytes] != descriptor_terminator) {
                return make_decode_error(DecodeErrorCode::malformed_descriptor, end,
                                         "color point descriptor terminator");
            }
            if (payload[entries_bytes + 1] != descriptor_pad ||
                payload[entries_bytes + 2] != descriptor_pad) {
                return make_decode_error(DecodeErrorCode::malformed_descriptor, end,
                                         "color point descriptor padding");
            }
            for (std::size_t i = 0; i < descriptor_white_point_count; ++i) {
                auto point = decode_white_point(
                    std::span<const uint8_t, entry_size>(payload.data() + i * entry_size,
                                                         entry_size));
                out.white_points.push_back(point);
                // An index 0 entry is kept and ends the list; the rest is filler
                if (point.index == 0) {
                    break;
                }
            }
            return {};
        }
        case descriptor_tags::monitor_name:
        case descriptor_tags::other_string:
        case descriptor_tags::serial_number: {
            auto text = decode_text(payload);
            if (!text) {
                return make_decode_error(DecodeErrorCode::malformed_descriptor, end,
                                         "text descriptor padding");
            }
            if (tag == descriptor_tags::monitor_name) {
                out.descriptors.emplace_back(MonitorNameDescriptor{.text = std::move(*text)});
            } else if (tag == descriptor_tags::other_string) {
                out.descriptors.emplace_back(OtherStringDescriptor{.text = std::move(*text)});
            } else {
                out.descriptors.emplace_back(SerialNumberDescriptor{.text = std::move(*text)});
            }
            return {};
        }
        default: {
            // Only 0xFD remains after the range checks above
            auto limits = decode_range_limits(payload);
            if (!limits) {
                return make_decode_error(DecodeErrorCode::malformed_descriptor, end,
                                         "range limits secondary timing");
            }
            out.descriptors.emplace_back(std::move(*limits));
            return {};
        }
    }
}

} // namespace detail

} // namespace edidkit
