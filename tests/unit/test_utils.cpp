#include <gtest/gtest.h>
#include "uplink/core/utils.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>

using namespace uplink::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("image/png,image/jpeg,video/mp4", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "image/png");
    EXPECT_EQ(result[2], "video/mp4");
    
    auto empty = StringUtils::split("", ',');
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0], "");
    
    auto trailing = StringUtils::split("a,", ',');
    EXPECT_EQ(trailing.size(), 2u);
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  report.pdf \t"), "report.pdf");
    EXPECT_EQ(StringUtils::trim("report.pdf"), "report.pdf");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Photo.JPG"), "photo.jpg");
    EXPECT_EQ(StringUtils::to_lower("IMAGE/PNG"), "image/png");
    EXPECT_EQ(StringUtils::to_lower("Caf\xC3\x89.TXT"), "caf\xC3\x89.txt");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(5 * 1048576), "5.00 MB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    using std::chrono::milliseconds;
    EXPECT_EQ(StringUtils::format_duration(milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(3 * 3600000 + 60000)), "3h 1m");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_uplink_utils.bin";
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, ReadBinary) {
    std::vector<uint8_t> bytes = {0x00, 0xFF, 0x10, 0x0A, 0x0D};
    {
        std::ofstream file(test_file, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
    
    auto content = FileUtils::read_binary(test_file);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, bytes);
    
    EXPECT_FALSE(FileUtils::read_binary("missing_uplink_file.bin").has_value());
}

TEST_F(FileUtilsTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();
    
    EXPECT_EQ(FileUtils::expand_home("~/uplink_data"), home / "uplink_data");
    EXPECT_EQ(FileUtils::expand_home("~"), home / "");
    EXPECT_EQ(FileUtils::expand_home("/var/uplink"), std::filesystem::path("/var/uplink"));
    EXPECT_EQ(FileUtils::expand_home("data/~x"), std::filesystem::path("data/~x"));
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, UnixMillis) {
    auto time = TimeUtils::from_unix_millis(1700000000123);
    EXPECT_EQ(TimeUtils::to_unix_millis(time), 1700000000123);
    EXPECT_EQ(TimeUtils::to_unix_millis(TimeUtils::from_unix_millis(0)), 0);
}

TEST_F(TimeUtilsTest, IsoString) {
    auto time = TimeUtils::from_unix_millis(0);
    EXPECT_EQ(TimeUtils::to_iso_string(time), "1970-01-01T00:00:00Z");
    
    auto later = TimeUtils::from_unix_millis(1700000000000);
    EXPECT_EQ(TimeUtils::to_iso_string(later), "2023-11-14T22:13:20Z");
}
