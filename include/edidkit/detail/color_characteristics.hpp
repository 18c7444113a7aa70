// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <vector>

#include <cstdint>

#include "bitfield.hpp"
#include "decode_result.hpp"
#include "fixed_point.hpp"

namespace edidkit {

/// CIE 1931 (x, y) chromaticity coordinate, each in [0, 1)
struct Chromaticity {
    double x{0.0};
    double y{0.0};

    bool operator==(const Chromaticity&) const = default;
};

/// Additional white point from a color point descriptor (tag 0xFB)
struct WhitePoint {
    uint8_t index{0};
    Chromaticity point;
    double gamma{0.0};

    bool operator==(const WhitePoint&) const = default;
};

/// Chromaticity block (bytes 0x19-0x22) plus descriptor white points
struct ColorCharacteristics {
    Chromaticity red;
    Chromaticity green;
    Chromaticity blue;
    Chromaticity white;
    std::vector<WhitePoint> white_points; ///< Descriptor encounter order

    bool operator==(const ColorCharacteristics&) const = default;
};

namespace detail {

/**
 * Chromaticity block layout (10 bytes)
 *
 * Byte 0: Red x [7:6] | Red y [5:4] | Green x [3:2] | Green y [1:0]  (low bits)
 * Byte 1: Blue x [7:6] | Blue y [5:4] | White x [3:2] | White y [1:0] (low bits)
 * Bytes 2-9: Red x, Red y, Green x, Green y, Blue x, Blue y, White x, White y (bits 9-2)
 */
struct ChromaticityLayout {
    struct RedXLow : BitField<uint8_t, 6, 2, 0> {};
    struct RedYLow : BitField<uint8_t, 4, 2, 0> {};
    struct GreenXLow : BitField<uint8_t, 2, 2, 0> {};
    struct GreenYLow : BitField<uint8_t, 0, 2, 0> {};
    struct BlueXLow : BitField<uint8_t, 6, 2, 1> {};
    struct BlueYLow : BitField<uint8_t, 4, 2, 1> {};
    struct WhiteXLow : BitField<uint8_t, 2, 2, 1> {};
    struct WhiteYLow : BitField<uint8_t, 0, 2, 1> {};

    static constexpr std::size_t red_x_high = 2;
    static constexpr std::size_t red_y_high = 3;
    static constexpr std::size_t green_x_high = 4;
    static constexpr std::size_t green_y_high = 5;
    static constexpr std::size_t blue_x_high = 6;
    static constexpr std::size_t blue_y_high = 7;
    static constexpr std::size_t white_x_high = 8;
    static constexpr std::size_t white_y_high = 9;

    using Layout = BitFieldLayout<RedXLow, RedYLow, GreenXLow, GreenYLow, BlueXLow, BlueYLow,
                                  WhiteXLow, WhiteYLow>;
    static_assert(Layout::required_bytes == 2);

    static constexpr std::size_t size_bytes = 10;
};

/**
 * Assemble a 10-bit chromaticity coordinate.
 *
 * @param high Bits 9-2 of the coordinate
 * @param low2 Bits 1-0 of the coordinate
 */
[[nodiscard]] inline double chromaticity_coordinate(uint8_t high, uint8_t low2) noexcept {
    return ChromaticityFixed::to_double(join_bits<2>(high, low2));
}

/**
 * Assemble one (x, y) pair from a low-bits byte and its two high bytes.
 *
 * @tparam XLow Field holding bits 1-0 of x
 * @tparam YLow Field holding bits 1-0 of y
 */
template <typename XLow, typename YLow>
[[nodiscard]] inline Chromaticity chromaticity_pair(uint8_t low_bits, uint8_t x_high,
                                                    uint8_t y_high) noexcept {
    return Chromaticity{.x = chromaticity_coordinate(x_high, XLow::extract(low_bits)),
                        .y = chromaticity_coordinate(y_high, YLow::extract(low_bits))};
}

template <typename Cursor>
DecodeResult<ColorCharacteristics> decode_color_characteristics(Cursor& cursor) {
    using L = ChromaticityLayout;

    cursor.set_context("chromaticity");
    auto bytes = cursor.template next_bytes<L::size_bytes>();
    if (!bytes) {
        return unexpected(bytes.error());
    }
    const auto& b = *bytes;
    const uint8_t rg_low = b[L::RedXLow::byte_index];
    const uint8_t bw_low = b[L::BlueXLow::byte_index];

    return ColorCharacteristics{
        .red = chromaticity_pair<L::RedXLow, L::RedYLow>(rg_low, b[L::red_x_high],
                                                        b[L::red_y_high]),
        .green = chromaticity_pair<L::GreenXLow, L::GreenYLow>(rg_low, b[L::green_x_high],
                                                              b[L::green_y_high]),
        .blue = chromaticity_pair<L::BlueXLow, L::BlueYLow>(bw_low, b[L::blue_x_high],
                                                           b[L::blue_y_high]),
        .white = chromaticity_pair<L::WhiteXLow, L::WhiteYLow>(bw_low, b[L::white_x_high],
                                                              b[L::white_y_high]),
        .white_points = {}};
}

} // namespace detail

} // namespace edidkit
