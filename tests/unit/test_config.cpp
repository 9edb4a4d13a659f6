#include <gtest/gtest.h>
#include "uplink/core/config.hpp"
#include <fstream>
#include <filesystem>

using namespace uplink::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_uplink_config.conf";
    }
    
    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();
    
    config.set("storage.base_dir", "/tmp/uplink");
    
    auto value = config.get("storage.base_dir");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "/tmp/uplink");
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, TypedValues) {
    auto& config = Config::instance();
    
    config.set("upload.sliding_ttl", "yes");
    config.set("upload.max_chunk_retries", "7");
    config.set("upload.max_file_size", "5368709120");
    config.set("log.level", "debug");
    
    EXPECT_TRUE(config.get_bool("upload.sliding_ttl"));
    EXPECT_EQ(config.get_int("upload.max_chunk_retries"), 7);
    EXPECT_EQ(config.get_uint64("upload.max_file_size"), 5368709120ULL);
    EXPECT_EQ(config.get_string("log.level"), "debug");
}

TEST_F(ConfigTest, FallbackValues) {
    auto& config = Config::instance();
    
    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_uint64("nonexistent", 42), 42u);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, MalformedNumbersUseFallback) {
    auto& config = Config::instance();
    
    config.set("upload.max_file_size", "-1");
    config.set("upload.default_chunk_size", "5MB");
    config.set("upload.max_chunk_retries", "");
    
    EXPECT_EQ(config.get_uint64("upload.max_file_size", 10), 10u);
    EXPECT_EQ(config.get_uint64("upload.default_chunk_size", 20), 20u);
    EXPECT_EQ(config.get_int("upload.max_chunk_retries", 5), 5);
}

TEST_F(ConfigTest, UploadDefaults) {
    auto& config = Config::instance();
    config.set_defaults();
    
    EXPECT_EQ(config.get_uint64("upload.max_file_size"), 100ULL * 1024 * 1024);
    EXPECT_EQ(config.get_uint64("upload.default_chunk_size"), 5ULL * 1024 * 1024);
    EXPECT_EQ(config.get_uint64("upload.min_chunk_size"), 1ULL * 1024 * 1024);
    EXPECT_EQ(config.get_uint64("upload.max_chunk_size"), 64ULL * 1024 * 1024);
    EXPECT_EQ(config.get_int("upload.max_chunk_retries"), 5);
    EXPECT_EQ(config.get_int("upload.backoff_base_ms"), 1000);
    EXPECT_EQ(config.get_int("upload.backoff_cap_ms"), 30000);
    EXPECT_EQ(config.get_uint64("upload.session_ttl_seconds"), 86400u);
    EXPECT_EQ(config.get_uint64("upload.failed_grace_seconds"), 7200u);
    EXPECT_EQ(config.get_uint64("upload.completed_retention_seconds"), 3600u);
    EXPECT_FALSE(config.get_bool("upload.sliding_ttl", true));
    EXPECT_EQ(config.get_int("upload.max_concurrent_chunks"), 4);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# uplink test configuration\n";
    file << "storage.base_dir=/var/lib/uplink\n";
    file << "upload.default_chunk_size = 2097152 \n";
    file << "upload.sliding_ttl=true\n";
    file << "not a key value line\n";
    file.close();
    
    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_string("storage.base_dir"), "/var/lib/uplink");
    EXPECT_EQ(config.get_uint64("upload.default_chunk_size"), 2097152u);
    EXPECT_TRUE(config.get_bool("upload.sliding_ttl"));
    EXPECT_EQ(config.values().size(), 3u);
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    std::ofstream file(test_file);
    file << "upload.max_chunk_retries=9\n";
    file.close();
    
    auto& config = Config::instance();
    config.set_defaults();
    ASSERT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_int("upload.max_chunk_retries"), 9);
    EXPECT_EQ(config.get_int("upload.backoff_cap_ms"), 30000);
}
