// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <optional>
#include <variant>

#include <cstdint>

#include "../types.hpp"
#include "bitfield.hpp"
#include "decode_result.hpp"
#include "display_parameters.hpp"

namespace edidkit {

/// Horizontal (pixels) and vertical (lines) pair
struct AxisPair {
    uint16_t horizontal{0};
    uint16_t vertical{0};

    bool operator==(const AxisPair&) const = default;
};

struct SyncOnGreen {
    bool operator==(const SyncOnGreen&) const = default;
};

struct SyncOnRgb {
    bool operator==(const SyncOnRgb&) const = default;
};

struct DigitalSyncLine {
    SyncPolarity polarity{SyncPolarity::negative};

    bool operator==(const DigitalSyncLine&) const = default;
};

/// Line carrying a composite sync signal
using SyncLine = std::variant<SyncOnGreen, SyncOnRgb, DigitalSyncLine>;

/// Single composite sync signal
struct CompositeSync {
    bool serrated{false}; ///< HSync serration during VSync
    SyncLine line;

    bool operator==(const CompositeSync&) const = default;
};

/// Separate horizontal and vertical sync signals
struct SeparateSync {
    SyncPolarity horizontal{SyncPolarity::negative};
    SyncPolarity vertical{SyncPolarity::negative};

    bool operator==(const SeparateSync&) const = default;
};

using SyncType = std::variant<CompositeSync, SeparateSync>;

/**
 * Detailed timing descriptor (18-byte slot with non-zero pixel clock)
 *
 * Back porch is not stored on the wire; it is derived as
 * blanking - sync width - front porch for each axis.
 */
struct DetailedTiming {
    uint32_t pixel_clock{0}; ///< Hz
    AxisPair active;
    AxisPair blanking;
    AxisPair front_porch;
    AxisPair sync_width;
    AxisPair back_porch;
    ImageSize image_size; ///< Centimetres
    AxisPair border;
    bool interlaced{false};
    StereoMode stereo{StereoMode::none};
    SyncType sync;

    /// Active plus blanking for each axis
    [[nodiscard]] constexpr AxisPair total() const noexcept {
        return AxisPair{
            .horizontal = static_cast<uint16_t>(active.horizontal + blanking.horizontal),
            .vertical = static_cast<uint16_t>(active.vertical + blanking.vertical)};
    }

    /// Frame (or field, when interlaced) rate implied by the geometry
    [[nodiscard]] constexpr std::optional<double> refresh_rate_hz() const noexcept {
        const auto t = total();
        if (t.horizontal == 0 || t.vertical == 0) {
            return std::nullopt;
        }
        return static_cast<double>(pixel_clock) /
               (static_cast<double>(t.horizontal) * static_cast<double>(t.vertical));
    }

    bool operator==(const DetailedTiming&) const = default;
};

namespace detail {

/**
 * Detailed timing slot layout (18 bytes, offsets relative to slot start)
 *
 * Bytes 0-1: Pixel clock / 10 kHz (little-endian, 0 = descriptor)
 * Byte 2:  H active [7:0]      Byte 3: H blanking [7:0]
 * Byte 4:  H active [11:8] [7:4] | H blanking [11:8] [3:0]
 * Byte 5:  V active [7:0]      Byte 6: V blanking [7:0]
 * Byte 7:  V active [11:8] [7:4] | V blanking [11:8] [3:0]
 * Byte 8:  H front porch [7:0] Byte 9: H sync width [7:0]
 * Byte 10: V front porch [3:0] [7:4] | V sync width [3:0] [3:0]
 * Byte 11: H fp [9:8] [7:6] | H sw [9:8] [5:4] | V fp [5:4] [3:2] | V sw [5:4] [1:0]
 * Byte 12: H image size mm [7:0] Byte 13: V image size mm [7:0]
 * Byte 14: H image size [11:8] [7:4] | V image size [11:8] [3:0]
 * Byte 15: H border            Byte 16: V border
 * Byte 17: flags (interlace, stereo, sync)
 */
struct DetailedTimingLayout {
    struct HActiveLow : BitField<uint8_t, 0, 8, 2> {};
    struct HBlankingLow : BitField<uint8_t, 0, 8, 3> {};
    struct HActiveHigh : BitField<uint8_t, 4, 4, 4> {};
    struct HBlankingHigh : BitField<uint8_t, 0, 4, 4> {};
    struct VActiveLow : BitField<uint8_t, 0, 8, 5> {};
    struct VBlankingLow : BitField<uint8_t, 0, 8, 6> {};
    struct VActiveHigh : BitField<uint8_t, 4, 4, 7> {};
    struct VBlankingHigh : BitField<uint8_t, 0, 4, 7> {};
    struct HFrontPorchLow : BitField<uint8_t, 0, 8, 8> {};
    struct HSyncWidthLow : BitField<uint8_t, 0, 8, 9> {};
    struct VFrontPorchLow : BitField<uint8_t, 4, 4, 10> {};
    struct VSyncWidthLow : BitField<uint8_t, 0, 4, 10> {};
    struct HFrontPorchHigh : BitField<uint8_t, 6, 2, 11> {};
    struct HSyncWidthHigh : BitField<uint8_t, 4, 2, 11> {};
    struct VFrontPorchHigh : BitField<uint8_t, 2, 2, 11> {};
    struct VSyncWidthHigh : BitField<uint8_t, 0, 2, 11> {};
    struct HImageSizeLow : BitField<uint8_t, 0, 8, 12> {};
    struct VImageSizeLow : BitField<uint8_t, 0, 8, 13> {};
    struct HImageSizeHigh : BitField<uint8_t, 4, 4, 14> {};
    struct VImageSizeHigh : BitField<uint8_t, 0, 4, 14> {};
    struct HBorder : BitField<uint8_t, 0, 8, 15> {};
    struct VBorder : BitField<uint8_t, 0, 8, 16> {};
    struct InterlacedFlag : BitFlag<7, 17> {};
    struct StereoHighFlag : BitFlag<6, 17> {};
    struct StereoMidFlag : BitFlag<5, 17> {};
    struct SyncKindField : BitField<uint8_t, 3, 2, 17> {};
    struct SyncBit2Flag : BitFlag<2, 17> {}; // serration, or vertical polarity when separate
    struct SyncBit1Flag : BitFlag<1, 17> {}; // RGB line / digital polarity / horizontal polarity
    struct StereoLowFlag : BitFlag<0, 17> {};

    using Layout =
        BitFieldLayout<HActiveLow, HBlankingLow, HActiveHigh, HBlankingHigh, VActiveLow,
                       VBlankingLow, VActiveHigh, VBlankingHigh, HFrontPorchLow, HSyncWidthLow,
                       VFrontPorchLow, VSyncWidthLow, HFrontPorchHigh, HSyncWidthHigh,
                       VFrontPorchHigh, VSyncWidthHigh, HImageSizeLow, VImageSizeLow,
                       HImageSizeHigh, VImageSizeHigh, HBorder, VBorder, InterlacedFlag,
                       StereoHighFlag, StereoMidFlag, SyncKindField, SyncBit2Flag, SyncBit1Flag,
                       StereoLowFlag>;
    static_assert(Layout::required_bytes == slot_size);

    static constexpr uint32_t pixel_clock_scale = 10'000; // Hz per unit
};

template <typename Field>
[[nodiscard]] constexpr auto slot_field(const std::array<uint8_t, slot_size>& slot) noexcept {
    return Field::extract(slot[Field::byte_index]);
}

// Indexed by (bit6 << 2) | (bit5 << 1) | bit0
inline constexpr std::array<StereoMode, 8> stereo_modes{{
    StereoMode::none,
    StereoMode::none,
    StereoMode::field_sequential_right,
    StereoMode::interleaved_right_even,
    StereoMode::field_sequential_left,
    StereoMode::interleaved_left_even,
    StereoMode::interleaved_four_way,
    StereoMode::side_by_side,
}};

[[nodiscard]] constexpr StereoMode decode_stereo_mode(uint8_t flags) noexcept {
    using L = DetailedTimingLayout;
    const unsigned index = (static_cast<unsigned>(L::StereoHighFlag::extract(flags)) << 2) |
                           (static_cast<unsigned>(L::StereoMidFlag::extract(flags)) << 1) |
                           static_cast<unsigned>(L::StereoLowFlag::extract(flags));
    return stereo_modes[index];
}

[[nodiscard]] constexpr SyncPolarity polarity_from_bit(bool bit) noexcept {
    return bit ? SyncPolarity::positive : SyncPolarity::negative;
}

[[nodiscard]] constexpr SyncType decode_sync_type(uint8_t flags) noexcept {
    using L = DetailedTimingLayout;
    const bool bit2 = L::SyncBit2Flag::extract(flags);
    const bool bit1 = L::SyncBit1Flag::extract(flags);

    switch (L::SyncKindField::extract(flags)) {
        case 0:
        case 1:
            return CompositeSync{.serrated = bit2,
                                 .line = bit1 ? SyncLine{SyncOnRgb{}} : SyncLine{SyncOnGreen{}}};
        case 2:
            return CompositeSync{.serrated = bit2,
                                 .line = DigitalSyncLine{.polarity = polarity_from_bit(bit1)}};
        default:
            // 2-bit field: only 3 remains
            return SeparateSync{.horizontal = polarity_from_bit(bit1),
                                .vertical = polarity_from_bit(bit2)};
    }
}

/**
 * Derive the back porch for one axis.
 *
 * @return std::nullopt when front porch + sync width exceed blanking
 */
[[nodiscard]] constexpr std::optional<uint16_t>
derive_back_porch(uint16_t blanking, uint16_t sync_width, uint16_t front_porch) noexcept {
    const uint32_t used = static_cast<uint32_t>(sync_width) + front_porch;
    if (used > blanking) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(blanking - used);
}

/**
 * Decode the geometry of a slot whose pixel clock is non-zero.
 *
 * @param slot The full 18-byte slot (bytes 0-1 hold the pixel clock)
 * @param offset Bytes consumed at the end of the slot, for error reporting
 */
[[nodiscard]] inline DecodeResult<DetailedTiming>
decode_detailed_timing(const std::array<uint8_t, slot_size>& slot, std::size_t offset) noexcept {
    using L = DetailedTimingLayout;

    const auto pixel_clock_raw =
        static_cast<uint16_t>(slot[0] | (static_cast<uint16_t>(slot[1]) << 8));

    const AxisPair active{.horizontal = join_bits<8>(slot_field<L::HActiveHigh>(slot),
                                                     slot_field<L::HActiveLow>(slot)),
                          .vertical = join_bits<8>(slot_field<L::VActiveHigh>(slot),
                                                   slot_field<L::VActiveLow>(slot))};
    const AxisPair blanking{.horizontal = join_bits<8>(slot_field<L::HBlankingHigh>(slot),
                                                       slot_field<L::HBlankingLow>(slot)),
                            .vertical = join_bits<8>(slot_field<L::VBlankingHigh>(slot),
                                                     slot_field<L::VBlankingLow>(slot))};
    const AxisPair front_porch{.horizontal = join_bits<8>(slot_field<L::HFrontPorchHigh>(slot),
                                                          slot_field<L::HFrontPorchLow>(slot)),
                               .vertical = join_bits<4>(slot_field<L::VFrontPorchHigh>(slot),
                                                        slot_field<L::VFrontPorchLow>(slot))};
    const AxisPair sync_width{.horizontal = join_bits<8>(slot_field<L::HSyncWidthHigh>(slot),
                                                         slot_field<L::HSyncWidthLow>(slot)),
                              .vertical = join_bits<4>(slot_field<L::VSyncWidthHigh>(slot),
                                                       slot_field<L::VSyncWidthLow>(slot))};

    const auto h_back =
        derive_back_porch(blanking.horizontal, sync_width.horizontal, front_porch.horizontal);
    if (!h_back) {
        return make_decode_error(DecodeErrorCode::malformed_timing_geometry, offset,
                                 "horizontal back porch");
    }
    const auto v_back =
        derive_back_porch(blanking.vertical, sync_width.vertical, front_porch.vertical);
    if (!v_back) {
        return make_decode_error(DecodeErrorCode::malformed_timing_geometry, offset,
                                 "vertical back porch");
    }

    const uint16_t h_size_mm =
        join_bits<8>(slot_field<L::HImageSizeHigh>(slot), slot_field<L::HImageSizeLow>(slot));
    const uint16_t v_size_mm =
        join_bits<8>(slot_field<L::VImageSizeHigh>(slot), slot_field<L::VImageSizeLow>(slot));
    const uint8_t flags = slot[L::InterlacedFlag::byte_index];

    return DetailedTiming{
        .pixel_clock = static_cast<uint32_t>(pixel_clock_raw) * L::pixel_clock_scale,
        .active = active,
        .blanking = blanking,
        .front_porch = front_porch,
        .sync_width = sync_width,
        .back_porch = AxisPair{.horizontal = *h_back, .vertical = *v_back},
        .image_size = ImageSize{.width_cm = static_cast<double>(h_size_mm) / 10.0,
                                .height_cm = static_cast<double>(v_size_mm) / 10.0},
        .border = AxisPair{.horizontal = slot_field<L::HBorder>(slot),
                           .vertical = slot_field<L::VBorder>(slot)},
        .interlaced = L::InterlacedFlag::extract(flags),
        .stereo = decode_stereo_mode(flags),
        .sync = decode_sync_type(flags)};
}

} // namespace detail

} // namespace edidkit
