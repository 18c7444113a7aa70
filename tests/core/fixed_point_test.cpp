#include "edidkit/detail/fixed_point.hpp"

#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>

using edidkit::detail::ChromaticityFixed;
using edidkit::detail::FixedPoint;

// -----------------------------------------------------------------------------
// 1. Format properties
// -----------------------------------------------------------------------------

TEST(FixedPointTest, ChromaticityFormat) {
    static_assert(ChromaticityFixed::int_bits == 0);
    static_assert(ChromaticityFixed::frac_bits == 10);
    static_assert(ChromaticityFixed::total_bits == 10);
    static_assert(ChromaticityFixed::mask() == 0x3FF);

    EXPECT_DOUBLE_EQ(ChromaticityFixed::min_value(), 0.0);
    EXPECT_DOUBLE_EQ(ChromaticityFixed::max_value(), 1023.0 / 1024.0);
}

TEST(FixedPointTest, UnsignedSmallFormatRange) {
    using F = FixedPoint<4, 4, uint16_t>; // UQ4.4
    static_assert(F::total_bits == 8);

    EXPECT_DOUBLE_EQ(F::min_value(), 0.0);
    EXPECT_DOUBLE_EQ(F::max_value(), 15.9375);
}

// -----------------------------------------------------------------------------
// 2. Conversion
// -----------------------------------------------------------------------------

TEST(FixedPointTest, ToDoubleIsExactForEveryChromaticityValue) {
    for (uint16_t raw = 0; raw < 1024; ++raw) {
        const double v = ChromaticityFixed::to_double(raw);
        ASSERT_DOUBLE_EQ(v, raw / 1024.0);
        ASSERT_GE(v, 0.0);
        ASSERT_LT(v, 1.0);
    }
}

TEST(FixedPointTest, ToDoubleMasksHighBits) {
    // Bits above the 10-bit format are ignored
    EXPECT_DOUBLE_EQ(ChromaticityFixed::to_double(0x0400), 0.0);
    EXPECT_DOUBLE_EQ(ChromaticityFixed::to_double(0xFFFF), 1023.0 / 1024.0);
}

TEST(FixedPointTest, SanitizeRaw) {
    EXPECT_EQ(ChromaticityFixed::sanitize_raw(0x0FFF), 0x03FF);
    EXPECT_EQ(ChromaticityFixed::sanitize_raw(0x0155), 0x0155);
}

TEST(FixedPointTest, KnownPanelCoordinates) {
    // Red primary of a wide-gamut laptop panel: x = 669/1024, y = 342/1024
    EXPECT_NEAR(ChromaticityFixed::to_double(669), 0.6533, 1e-4);
    EXPECT_NEAR(ChromaticityFixed::to_double(342), 0.3340, 1e-4);
}
