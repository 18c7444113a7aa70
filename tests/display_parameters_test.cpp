#include <array>
#include <variant>

#include <cstdint>
#include <gtest/gtest.h>

#include "edidkit/detail/byte_cursor.hpp"
#include "edidkit/detail/display_parameters.hpp"
#include "edidkit/utils/memory_source.hpp"

using namespace edidkit;
using namespace edidkit::detail;

// =============================================================================
// Video input
// =============================================================================

TEST(VideoInputTest, Digital) {
    const auto input = decode_video_input(0xA5);
    ASSERT_TRUE(std::holds_alternative<DigitalInput>(input));
    EXPECT_TRUE(std::get<DigitalInput>(input).dfp_compatible);

    const auto plain = decode_video_input(0x80);
    EXPECT_FALSE(std::get<DigitalInput>(plain).dfp_compatible);
}

TEST(VideoInputTest, AnalogSignalLevels) {
    const std::array<SignalLevel, 4> expected{{
        {0.700, 0.300},
        {0.714, 0.286},
        {1.000, 0.400},
        {0.700, 0.000},
    }};
    for (uint8_t level = 0; level < 4; ++level) {
        const auto input = decode_video_input(static_cast<uint8_t>(level << 5));
        ASSERT_TRUE(std::holds_alternative<AnalogInput>(input));
        EXPECT_EQ(std::get<AnalogInput>(input).signal_level, expected[level]);
    }
}

TEST(VideoInputTest, AnalogSyncFlags) {
    // Setup expected, serrated vsync, separate sync
    const auto input = decode_video_input(0b0001'1001);
    const auto& analog = std::get<AnalogInput>(input);
    EXPECT_TRUE(analog.setup_expected);
    EXPECT_TRUE(analog.supported_sync.serrated_vsync);
    EXPECT_FALSE(analog.supported_sync.sync_on_green);
    EXPECT_FALSE(analog.supported_sync.composite_sync);
    EXPECT_TRUE(analog.supported_sync.separate_sync);

    const auto other = std::get<AnalogInput>(decode_video_input(0b0000'0110));
    EXPECT_FALSE(other.setup_expected);
    EXPECT_TRUE(other.supported_sync.sync_on_green);
    EXPECT_TRUE(other.supported_sync.composite_sync);
}

// =============================================================================
// Scalar fields
// =============================================================================

TEST(DisplayParametersTest, MaxImageSize) {
    const auto size = decode_max_image_size(33, 21);
    ASSERT_TRUE(size.has_value());
    EXPECT_DOUBLE_EQ(size->width_cm, 33.0);
    EXPECT_DOUBLE_EQ(size->height_cm, 21.0);

    EXPECT_FALSE(decode_max_image_size(0, 21).has_value());
    EXPECT_FALSE(decode_max_image_size(33, 0).has_value());
}

TEST(DisplayParametersTest, Gamma) {
    ASSERT_TRUE(decode_gamma(120).has_value());
    EXPECT_DOUBLE_EQ(*decode_gamma(120), 2.2);
    EXPECT_DOUBLE_EQ(*decode_gamma(0), 1.0);
    EXPECT_DOUBLE_EQ(*decode_gamma(0xFE), 3.54);
    EXPECT_FALSE(decode_gamma(0xFF).has_value());
}

// =============================================================================
// DPMS / feature support
// =============================================================================

TEST(DpmsTest, AllFlags) {
    const auto dpms = decode_dpms(0b1110'0111);
    EXPECT_TRUE(dpms.standby_supported);
    EXPECT_TRUE(dpms.suspend_supported);
    EXPECT_TRUE(dpms.low_power_supported);
    EXPECT_EQ(dpms.display_type, DisplayType::monochrome);
    EXPECT_TRUE(dpms.default_srgb);
    EXPECT_TRUE(dpms.preferred_timing_mode);
    EXPECT_TRUE(dpms.default_gtf_supported);
}

TEST(DpmsTest, DisplayTypes) {
    EXPECT_EQ(decode_dpms(0x00).display_type, DisplayType::monochrome);
    EXPECT_EQ(decode_dpms(0x08).display_type, DisplayType::rgb_color);
    EXPECT_EQ(decode_dpms(0x10).display_type, DisplayType::other_color);
    EXPECT_EQ(decode_dpms(0x18).display_type, DisplayType::undefined);
}

TEST(DisplayParametersTest, DecodesFiveBytes) {
    const std::array<uint8_t, 5> data{165, 33, 21, 120, 2};
    utils::MemorySource source(data);
    ByteCursor cursor(source);

    auto params = decode_display_parameters(cursor);
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(std::get<DigitalInput>(params->input).dfp_compatible);
    ASSERT_TRUE(params->max_size.has_value());
    EXPECT_DOUBLE_EQ(params->max_size->width_cm, 33.0);
    ASSERT_TRUE(params->gamma.has_value());
    EXPECT_DOUBLE_EQ(*params->gamma, 2.2);
    EXPECT_TRUE(params->dpms.preferred_timing_mode);
    EXPECT_FALSE(params->dpms.default_srgb);
    EXPECT_EQ(cursor.offset(), 5u);
}
