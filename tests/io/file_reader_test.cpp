#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <cstdint>
#include <gtest/gtest.h>

#include "edid_test_helpers.hpp"
#include <edidkit/edidkit_io.hpp>

using namespace edidkit;
using namespace edidkit::test;

class EDIDFileReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "edidkit_reader_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    std::filesystem::path write_file(const std::string& name, std::span<const uint8_t> bytes) {
        auto path = temp_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        return path;
    }

    std::filesystem::path temp_dir_;
};

TEST_F(EDIDFileReaderTest, DecodeGoldenFile) {
    auto path = write_file("golden.bin", golden_block);

    EDIDFileReader reader(path.string());
    auto record = reader.decode();
    ASSERT_TRUE(record.has_value()) << record.error().message();
    EXPECT_EQ(record->product().product_code, 0xA022);
    EXPECT_EQ(monitor_name(*record), "Color LCD");
    // Whole file fits in one chunk
    EXPECT_EQ(reader.bytes_read(), block_size);
}

TEST_F(EDIDFileReaderTest, MissingFileThrows) {
    auto path = temp_dir_ / "does_not_exist.bin";
    EXPECT_THROW(EDIDFileReader reader(path.string()), std::runtime_error);
}

TEST_F(EDIDFileReaderTest, OpenFailureIsNotADecodeError) {
    auto path = temp_dir_ / "missing.bin";
    try {
        EDIDFileReader reader(path.string());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST_F(EDIDFileReaderTest, TruncatedFile) {
    auto path = write_file("short.bin", std::span<const uint8_t>(golden_block).first(20));

    EDIDFileReader reader(path.c_str());
    auto record = reader.decode();
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, DecodeErrorCode::unexpected_end_of_data);
    EXPECT_EQ(record.error().offset, 20u);
    EXPECT_EQ(reader.bytes_read(), 20u);
}

TEST_F(EDIDFileReaderTest, MoveTransfersOwnership) {
    auto path = write_file("moved.bin", golden_block);

    EDIDFileReader first(path.string());
    EDIDFileReader moved(std::move(first));

    auto record = moved.decode();
    ASSERT_TRUE(record.has_value());

    // A moved-from reader has no file and reports a source failure
    auto stale = first.decode();
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, DecodeErrorCode::source_failure);
}

TEST_F(EDIDFileReaderTest, MoveAssignment) {
    auto first = write_file("first.bin", golden_block);
    auto second = write_file("second.bin", make_block(text_slot(0xFC, "Second")));

    EDIDFileReader reader(first.string());
    reader = EDIDFileReader(second.string());

    auto record = reader.decode();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(monitor_name(*record), "Second");
}

static_assert(ByteSource<EDIDFileReader>);
