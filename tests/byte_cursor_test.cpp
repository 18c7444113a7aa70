#include <array>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>

#include "edid_test_helpers.hpp"
#include "edidkit/detail/byte_cursor.hpp"
#include "edidkit/utils/memory_source.hpp"

using edidkit::DecodeErrorCode;
using edidkit::detail::ByteCursor;
using edidkit::utils::MemorySource;
using namespace edidkit::test;

TEST(ByteCursorTest, ReadsBytesInOrder) {
    const std::array<uint8_t, 3> data{0x11, 0x22, 0x33};
    MemorySource source(data);
    ByteCursor cursor(source);

    EXPECT_EQ(*cursor.next_byte(), 0x11);
    EXPECT_EQ(*cursor.next_byte(), 0x22);
    EXPECT_EQ(*cursor.next_byte(), 0x33);
    EXPECT_EQ(cursor.offset(), 3u);
}

TEST(ByteCursorTest, LittleEndianWords) {
    const std::array<uint8_t, 6> data{0x22, 0xA0, 0x00, 0xFF, 0xFF, 0xFF};
    MemorySource source(data);
    ByteCursor cursor(source);

    EXPECT_EQ(*cursor.next_u16_le(), 0xA022);
    EXPECT_EQ(*cursor.next_u32_le(), 0xFFFFFF00u);
    EXPECT_EQ(cursor.offset(), 6u);
}

TEST(ByteCursorTest, NextBytesReadsFixedGroup) {
    const std::array<uint8_t, 5> data{1, 2, 3, 4, 5};
    MemorySource source(data);
    ByteCursor cursor(source);

    auto group = cursor.next_bytes<4>();
    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(*group, (std::array<uint8_t, 4>{1, 2, 3, 4}));
    EXPECT_EQ(*cursor.next_byte(), 5);
}

TEST(ByteCursorTest, EmptySourceIsEndOfData) {
    MemorySource source(std::span<const uint8_t>{});
    ByteCursor cursor(source);

    auto result = cursor.next_byte();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeErrorCode::unexpected_end_of_data);
    EXPECT_EQ(result.error().offset, 0u);
}

TEST(ByteCursorTest, ShortReadInsideWordIsEndOfData) {
    const std::array<uint8_t, 3> data{0x00, 0xFF, 0xFF};
    MemorySource source(data);
    ByteCursor cursor(source);
    cursor.set_context("header");

    auto result = cursor.next_u32_le();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeErrorCode::unexpected_end_of_data);
    EXPECT_EQ(result.error().offset, 3u);
    EXPECT_STREQ(result.error().context, "header");
}

TEST(ByteCursorTest, RefillsFromChunkedSource) {
    std::vector<uint8_t> data(10);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    ChunkedSource source(data, 3);
    ByteCursor cursor(source);

    auto all = cursor.next_bytes<10>();
    ASSERT_TRUE(all.has_value());
    for (std::size_t i = 0; i < all->size(); ++i) {
        EXPECT_EQ((*all)[i], i);
    }
    EXPECT_EQ(source.fill_calls, 4u);
}

TEST(ByteCursorTest, SmallChunkSizeStillReadsWholeBlock) {
    MemorySource source(golden_block);
    ByteCursor<MemorySource, 7> cursor(source);

    auto block = cursor.next_bytes<edidkit::block_size>();
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(*block, golden_block);
}

TEST(ByteCursorTest, SourceFailure) {
    const std::array<uint8_t, 4> data{1, 2, 3, 4};
    FailingSource source(data, 2);
    ByteCursor cursor(source);
    cursor.set_context("product code");

    EXPECT_TRUE(cursor.next_byte().has_value());
    EXPECT_TRUE(cursor.next_byte().has_value());
    auto result = cursor.next_byte();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeErrorCode::source_failure);
    EXPECT_EQ(result.error().offset, 2u);
    EXPECT_STREQ(result.error().context, "product code");
}

TEST(ByteCursorTest, OverreportedFillIsSourceFailure) {
    OverreportingSource source;
    ByteCursor cursor(source);

    auto result = cursor.next_byte();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DecodeErrorCode::source_failure);
}

TEST(ByteCursorTest, FailUsesCurrentOffsetAndContext) {
    const std::array<uint8_t, 2> data{0, 0};
    MemorySource source(data);
    ByteCursor cursor(source);
    ASSERT_TRUE(cursor.next_u16_le().has_value());
    cursor.set_context("pixel clock");

    edidkit::DecodeResult<void> err = cursor.fail(DecodeErrorCode::missing_preferred_timing);
    ASSERT_FALSE(err.has_value());
    EXPECT_EQ(err.error().code, DecodeErrorCode::missing_preferred_timing);
    EXPECT_EQ(err.error().offset, 2u);
    EXPECT_STREQ(err.error().context, "pixel clock");
    EXPECT_STREQ(err.error().message(), "Missing preferred detailed timing");
}
