#include <array>
#include <variant>

#include <cstdint>
#include <gtest/gtest.h>

#include "edid_test_helpers.hpp"
#include "edidkit/detail/detailed_timing.hpp"

using namespace edidkit;
using namespace edidkit::detail;
using edidkit::test::Slot;
using edidkit::test::timing_1080p_slot;

namespace {

Slot with_flags(uint8_t flags) {
    Slot slot = timing_1080p_slot;
    slot[17] = flags;
    return slot;
}

} // namespace

// =============================================================================
// Geometry
// =============================================================================

TEST(DetailedTimingTest, Geometry1080p) {
    auto timing = decode_detailed_timing(timing_1080p_slot, 18);
    ASSERT_TRUE(timing.has_value());

    EXPECT_EQ(timing->pixel_clock, 148'500'000u);
    EXPECT_EQ(timing->active, (AxisPair{1920, 1080}));
    EXPECT_EQ(timing->blanking, (AxisPair{280, 45}));
    EXPECT_EQ(timing->front_porch, (AxisPair{88, 4}));
    EXPECT_EQ(timing->sync_width, (AxisPair{44, 5}));
    EXPECT_EQ(timing->back_porch, (AxisPair{148, 36}));
    EXPECT_DOUBLE_EQ(timing->image_size.width_cm, 50.9);
    EXPECT_DOUBLE_EQ(timing->image_size.height_cm, 28.6);
    EXPECT_EQ(timing->border, (AxisPair{0, 0}));
    EXPECT_FALSE(timing->interlaced);
    EXPECT_EQ(timing->stereo, StereoMode::none);
}

TEST(DetailedTimingTest, DerivedTotalsAndRefresh) {
    auto timing = decode_detailed_timing(timing_1080p_slot, 18);
    ASSERT_TRUE(timing.has_value());

    EXPECT_EQ(timing->total(), (AxisPair{2200, 1125}));
    ASSERT_TRUE(timing->refresh_rate_hz().has_value());
    EXPECT_DOUBLE_EQ(*timing->refresh_rate_hz(), 60.0);
}

TEST(DetailedTimingTest, PorchHighBits) {
    Slot slot = timing_1080p_slot;
    // H blanking 0x3FF so the porch values fit
    slot[3] = 0xFF;
    slot[4] = 0x73;
    slot[8] = 0x10;
    slot[9] = 0x20;
    slot[10] = 0x12;
    slot[11] = 0b1001'1011; // h fp hi 2, h sw hi 1, v fp hi 2, v sw hi 3
    slot[6] = 0xFF;          // V blanking low byte

    auto timing = decode_detailed_timing(slot, 18);
    ASSERT_TRUE(timing.has_value());
    EXPECT_EQ(timing->front_porch.horizontal, 0x210);
    EXPECT_EQ(timing->sync_width.horizontal, 0x120);
    EXPECT_EQ(timing->front_porch.vertical, 0x21);
    EXPECT_EQ(timing->sync_width.vertical, 0x32);
    EXPECT_EQ(timing->back_porch.horizontal, 0x3FF - 0x210 - 0x120);
    EXPECT_EQ(timing->back_porch.vertical, 0xFF - 0x21 - 0x32);
}

TEST(DetailedTimingTest, BackPorchUnderflowHorizontal) {
    Slot slot = timing_1080p_slot;
    slot[8] = 0xFF; // front porch 255 + sync 44 > blanking 280

    auto timing = decode_detailed_timing(slot, 36);
    ASSERT_FALSE(timing.has_value());
    EXPECT_EQ(timing.error().code, DecodeErrorCode::malformed_timing_geometry);
    EXPECT_EQ(timing.error().offset, 36u);
    EXPECT_STREQ(timing.error().context, "horizontal back porch");
}

TEST(DetailedTimingTest, BackPorchUnderflowVertical) {
    Slot slot = timing_1080p_slot;
    slot[6] = 8; // vertical blanking 8 < 4 + 5

    auto timing = decode_detailed_timing(slot, 18);
    ASSERT_FALSE(timing.has_value());
    EXPECT_EQ(timing.error().code, DecodeErrorCode::malformed_timing_geometry);
    EXPECT_STREQ(timing.error().context, "vertical back porch");
}

TEST(DetailedTimingTest, BackPorchZeroIsValid) {
    Slot slot = timing_1080p_slot;
    slot[6] = 9; // vertical blanking exactly front porch + sync

    auto timing = decode_detailed_timing(slot, 18);
    ASSERT_TRUE(timing.has_value());
    EXPECT_EQ(timing->back_porch.vertical, 0);
}

TEST(DetailedTimingTest, RefreshUndefinedForZeroTotal) {
    DetailedTiming timing{};
    timing.pixel_clock = 1000;
    EXPECT_FALSE(timing.refresh_rate_hz().has_value());
}

// =============================================================================
// Flags byte
// =============================================================================

TEST(DetailedTimingTest, Interlaced) {
    auto timing = decode_detailed_timing(with_flags(0x9E), 18);
    ASSERT_TRUE(timing.has_value());
    EXPECT_TRUE(timing->interlaced);
}

TEST(DetailedTimingTest, StereoModes) {
    struct Case {
        uint8_t bits; // bit6, bit5, bit0 pattern in place
        StereoMode expected;
    };
    const std::array<Case, 8> cases{{
        {0b0000'0000, StereoMode::none},
        {0b0000'0001, StereoMode::none},
        {0b0010'0000, StereoMode::field_sequential_right},
        {0b0100'0000, StereoMode::field_sequential_left},
        {0b0010'0001, StereoMode::interleaved_right_even},
        {0b0100'0001, StereoMode::interleaved_left_even},
        {0b0110'0000, StereoMode::interleaved_four_way},
        {0b0110'0001, StereoMode::side_by_side},
    }};
    for (const auto& c : cases) {
        EXPECT_EQ(decode_stereo_mode(c.bits), c.expected) << "flags=" << int(c.bits);
    }
}

TEST(DetailedTimingTest, CompositeAnalogSync) {
    for (uint8_t kind : {0x00, 0x08}) {
        const auto green = decode_sync_type(kind);
        ASSERT_TRUE(std::holds_alternative<CompositeSync>(green));
        EXPECT_FALSE(std::get<CompositeSync>(green).serrated);
        EXPECT_TRUE(std::holds_alternative<SyncOnGreen>(std::get<CompositeSync>(green).line));

        const auto rgb = decode_sync_type(static_cast<uint8_t>(kind | 0x06));
        EXPECT_TRUE(std::get<CompositeSync>(rgb).serrated);
        EXPECT_TRUE(std::holds_alternative<SyncOnRgb>(std::get<CompositeSync>(rgb).line));
    }
}

TEST(DetailedTimingTest, CompositeDigitalSync) {
    const auto sync = decode_sync_type(0x12);
    const auto& composite = std::get<CompositeSync>(sync);
    EXPECT_FALSE(composite.serrated);
    ASSERT_TRUE(std::holds_alternative<DigitalSyncLine>(composite.line));
    EXPECT_EQ(std::get<DigitalSyncLine>(composite.line).polarity, SyncPolarity::positive);

    const auto negative = std::get<CompositeSync>(decode_sync_type(0x14));
    EXPECT_TRUE(negative.serrated);
    EXPECT_EQ(std::get<DigitalSyncLine>(negative.line).polarity, SyncPolarity::negative);
}

TEST(DetailedTimingTest, SeparateSync) {
    // bit1 = horizontal, bit2 = vertical
    const auto sync = decode_sync_type(0x1A);
    ASSERT_TRUE(std::holds_alternative<SeparateSync>(sync));
    EXPECT_EQ(std::get<SeparateSync>(sync).horizontal, SyncPolarity::positive);
    EXPECT_EQ(std::get<SeparateSync>(sync).vertical, SyncPolarity::negative);

    const auto swapped = std::get<SeparateSync>(decode_sync_type(0x1C));
    EXPECT_EQ(swapped.horizontal, SyncPolarity::negative);
    EXPECT_EQ(swapped.vertical, SyncPolarity::positive);
}
