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

namespace edidkit {

/// Video white and sync voltage levels relative to blank, in volts
struct SignalLevel {
    double high{0.0};
    double low{0.0};

    bool operator==(const SignalLevel&) const = default;
};

/// Sync schemes accepted on an analog input
struct SupportedSync {
    bool serrated_vsync{false}; ///< HSync serration during VSync
    bool sync_on_green{false};
    bool composite_sync{false}; ///< Composite sync on the HSync line
    bool separate_sync{false};

    bool operator==(const SupportedSync&) const = default;
};

struct AnalogInput {
    SignalLevel signal_level;
    bool setup_expected{false}; ///< Blank-to-black setup (pedestal) expected
    SupportedSync supported_sync;

    bool operator==(const AnalogInput&) const = default;
};

struct DigitalInput {
    bool dfp_compatible{false}; ///< VESA DFP 1.x compatible

    bool operator==(const DigitalInput&) const = default;
};

/// Video input definition (byte 0x14); exactly one alternative is active
using VideoInput = std::variant<AnalogInput, DigitalInput>;

/// Physical size in centimetres
struct ImageSize {
    double width_cm{0.0};
    double height_cm{0.0};

    bool operator==(const ImageSize&) const = default;
};

/// Feature support byte (0x18)
struct DpmsFeatures {
    bool standby_supported{false};
    bool suspend_supported{false};
    bool low_power_supported{false};
    DisplayType display_type{DisplayType::monochrome};
    bool default_srgb{false};
    bool preferred_timing_mode{false}; ///< Preferred timing is in the first detailed slot
    bool default_gtf_supported{false};

    bool operator==(const DpmsFeatures&) const = default;
};

/// Basic display parameters (bytes 0x14-0x18)
struct DisplayParameters {
    VideoInput input;
    std::optional<ImageSize> max_size; ///< Absent when either dimension is 0
    std::optional<double> gamma;       ///< Absent when the byte is 0xFF
    DpmsFeatures dpms;

    bool operator==(const DisplayParameters&) const = default;
};

namespace detail {

// ============================================================================
// Video input byte (0x14)
// ============================================================================
struct VideoInputLayout {
    struct DigitalFlag : BitFlag<7> {};
    struct SignalLevelField : BitField<uint8_t, 5, 2> {};
    struct SetupFlag : BitFlag<4> {};
    struct SerratedVsyncFlag : BitFlag<3> {};
    struct SyncOnGreenFlag : BitFlag<2> {};
    struct CompositeSyncFlag : BitFlag<1> {};
    struct SeparateSyncFlag : BitFlag<0> {};
    struct DfpCompatibleFlag : BitFlag<0> {}; // digital interpretation of bit 0

    using AnalogLayout =
        BitFieldLayout<DigitalFlag, SignalLevelField, SetupFlag, SerratedVsyncFlag,
                       SyncOnGreenFlag, CompositeSyncFlag, SeparateSyncFlag>;
    static_assert(AnalogLayout::required_bytes == 1);
};

// Indexed by the 2-bit selector; every selector value has an entry
inline constexpr std::array<SignalLevel, 4> signal_levels{{
    {0.700, 0.300},
    {0.714, 0.286},
    {1.000, 0.400},
    {0.700, 0.000},
}};

[[nodiscard]] constexpr VideoInput decode_video_input(uint8_t byte) noexcept {
    using L = VideoInputLayout;
    if (L::DigitalFlag::extract(byte)) {
        return DigitalInput{.dfp_compatible = L::DfpCompatibleFlag::extract(byte)};
    }
    return AnalogInput{
        .signal_level = signal_levels[L::SignalLevelField::extract(byte)],
        .setup_expected = L::SetupFlag::extract(byte),
        .supported_sync = SupportedSync{.serrated_vsync = L::SerratedVsyncFlag::extract(byte),
                                        .sync_on_green = L::SyncOnGreenFlag::extract(byte),
                                        .composite_sync = L::CompositeSyncFlag::extract(byte),
                                        .separate_sync = L::SeparateSyncFlag::extract(byte)}};
}

// ============================================================================
// Feature support byte (0x18)
// ============================================================================
struct DpmsLayout {
    struct StandbyFlag : BitFlag<7> {};
    struct SuspendFlag : BitFlag<6> {};
    struct LowPowerFlag : BitFlag<5> {};
    struct DisplayTypeField : EnumBitField<DisplayType, uint8_t, 3, 2> {};
    struct DefaultSrgbFlag : BitFlag<2> {};
    struct PreferredTimingFlag : BitFlag<1> {};
    struct DefaultGtfFlag : BitFlag<0> {};

    using Layout = BitFieldLayout<StandbyFlag, SuspendFlag, LowPowerFlag, DisplayTypeField,
                                  DefaultSrgbFlag, PreferredTimingFlag, DefaultGtfFlag>;
    static_assert(Layout::required_bytes == 1);
};

[[nodiscard]] constexpr DpmsFeatures decode_dpms(uint8_t byte) noexcept {
    using L = DpmsLayout;
    return DpmsFeatures{.standby_supported = L::StandbyFlag::extract(byte),
                        .suspend_supported = L::SuspendFlag::extract(byte),
                        .low_power_supported = L::LowPowerFlag::extract(byte),
                        .display_type = L::DisplayTypeField::decode(byte),
                        .default_srgb = L::DefaultSrgbFlag::extract(byte),
                        .preferred_timing_mode = L::PreferredTimingFlag::extract(byte),
                        .default_gtf_supported = L::DefaultGtfFlag::extract(byte)};
}

// ============================================================================
// Scalar fields (0x15-0x17)
// ============================================================================

[[nodiscard]] constexpr std::optional<ImageSize> decode_max_image_size(uint8_t width_cm,
                                                                       uint8_t height_cm) noexcept {
    if (width_cm == 0 || height_cm == 0) {
        return std::nullopt;
    }
    return ImageSize{.width_cm = static_cast<double>(width_cm),
                     .height_cm = static_cast<double>(height_cm)};
}

inline constexpr uint8_t gamma_unspecified = 0xFF;

[[nodiscard]] constexpr double decode_gamma_value(uint8_t byte) noexcept {
    return (static_cast<double>(byte) + 100.0) / 100.0;
}

[[nodiscard]] constexpr std::optional<double> decode_gamma(uint8_t byte) noexcept {
    if (byte == gamma_unspecified) {
        return std::nullopt;
    }
    return decode_gamma_value(byte);
}

template <typename Cursor>
DecodeResult<DisplayParameters> decode_display_parameters(Cursor& cursor) {
    cursor.set_context("display parameters");
    auto bytes = cursor.template next_bytes<5>();
    if (!bytes) {
        return unexpected(bytes.error());
    }
    const auto& b = *bytes;
    return DisplayParameters{.input = decode_video_input(b[0]),
                             .max_size = decode_max_image_size(b[1], b[2]),
                             .gamma = decode_gamma(b[3]),
                             .dpms = decode_dpms(b[4])};
}

} // namespace detail

} // namespace edidkit
