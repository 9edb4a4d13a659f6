#include <gtest/gtest.h>
#include "uplink/upload/upload_policy.hpp"
#include "uplink/core/config.hpp"

using namespace uplink::upload;
using namespace uplink::core;

namespace {
constexpr uint64_t MB = UploadPolicy::MiB;
}

class UploadPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
    }
    
    void TearDown() override {
        Config::instance().clear();
    }
    
    UploadPolicy policy;
    UploadOptions options;
};

TEST_F(UploadPolicyTest, DefaultsAreValid) {
    EXPECT_TRUE(policy.validate());
    EXPECT_EQ(policy.max_file_size, 100 * MB);
    EXPECT_EQ(policy.default_chunk_size, 5 * MB);
    EXPECT_EQ(policy.max_chunk_retries, 5u);
    EXPECT_EQ(policy.max_concurrent_chunks, 4u);
}

TEST_F(UploadPolicyTest, ValidateRejectsInconsistentLimits) {
    UploadPolicy bad = policy;
    bad.min_chunk_size = 128 * MB;
    EXPECT_FALSE(bad.validate());
    
    bad = policy;
    bad.default_chunk_size = 512;
    EXPECT_FALSE(bad.validate());
    
    bad = policy;
    bad.backoff_cap = std::chrono::milliseconds(10);
    EXPECT_FALSE(bad.validate());
    
    bad = policy;
    bad.max_concurrent_chunks = 0;
    EXPECT_FALSE(bad.validate());
}

TEST_F(UploadPolicyTest, FromConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("upload.max_file_size", "2097152000");
    config.set("upload.max_chunk_retries", "3");
    config.set("upload.backoff_base_ms", "200");
    config.set("upload.sliding_ttl", "true");
    config.set("upload.allowed_types", " image/PNG, text/plain ,");
    
    auto loaded = UploadPolicy::from_config(config);
    
    EXPECT_EQ(loaded.max_file_size, 2097152000u);
    EXPECT_EQ(loaded.max_chunk_retries, 3u);
    EXPECT_EQ(loaded.backoff_base.count(), 200);
    EXPECT_EQ(loaded.backoff_cap.count(), 30000);
    EXPECT_TRUE(loaded.sliding_ttl);
    ASSERT_EQ(loaded.allowed_types.size(), 2u);
    EXPECT_EQ(loaded.allowed_types[0], "image/png");
    EXPECT_EQ(loaded.allowed_types[1], "text/plain");
    EXPECT_TRUE(loaded.validate());
}

TEST_F(UploadPolicyTest, AcceptsKnownRequest) {
    auto result = policy.validate_request("holiday.jpg", 3 * MB, "image/jpeg", options);
    EXPECT_TRUE(result.success()) << result.describe();
}

TEST_F(UploadPolicyTest, RejectsEmptyAndOversizedFiles) {
    auto empty = policy.validate_request("empty.txt", 0, "text/plain", options);
    EXPECT_EQ(empty.error, UploadError::VALIDATION_ERROR);
    EXPECT_EQ(empty.detail.stage, ErrorStage::VALIDATION);
    
    auto oversized = policy.validate_request("big.zip", 100 * MB + 1, "application/zip", options);
    EXPECT_EQ(oversized.error, UploadError::VALIDATION_ERROR);
    ASSERT_TRUE(oversized.detail.expected_size.has_value());
    EXPECT_EQ(*oversized.detail.expected_size, 100 * MB);
    EXPECT_EQ(*oversized.detail.actual_size, 100 * MB + 1);
    
    auto at_limit = policy.validate_request("big.zip", 100 * MB, "application/zip", options);
    EXPECT_TRUE(at_limit.success());
}

TEST_F(UploadPolicyTest, PerRequestSizeLimitOnlyTightens) {
    options.max_size = 1 * MB;
    EXPECT_FALSE(policy.validate_request("a.pdf", 2 * MB, "application/pdf", options));
    
    options.max_size = 500 * MB;
    EXPECT_FALSE(policy.validate_request("a.pdf", 200 * MB, "application/pdf", options));
}

TEST_F(UploadPolicyTest, RejectsDangerousExtensions) {
    EXPECT_TRUE(UploadPolicy::has_dangerous_extension("setup.EXE"));
    EXPECT_TRUE(UploadPolicy::has_dangerous_extension("script.js"));
    EXPECT_FALSE(UploadPolicy::has_dangerous_extension("notes.json"));
    EXPECT_FALSE(UploadPolicy::has_dangerous_extension("README"));
    
    auto result = policy.validate_request("payload.exe", 1024, "application/zip", options);
    EXPECT_EQ(result.error, UploadError::VALIDATION_ERROR);
}

TEST_F(UploadPolicyTest, RejectsInvalidFilenames) {
    EXPECT_FALSE(UploadPolicy::is_valid_filename(""));
    EXPECT_FALSE(UploadPolicy::is_valid_filename(".."));
    EXPECT_FALSE(UploadPolicy::is_valid_filename("dir/file.txt"));
    EXPECT_FALSE(UploadPolicy::is_valid_filename("dir\\file.txt"));
    EXPECT_FALSE(UploadPolicy::is_valid_filename(std::string(256, 'a')));
    EXPECT_TRUE(UploadPolicy::is_valid_filename(std::string(255, 'a')));
    EXPECT_TRUE(UploadPolicy::is_valid_filename("report final (2).pdf"));
}

TEST_F(UploadPolicyTest, TypeAllowList) {
    EXPECT_FALSE(policy.validate_request("x.bin", 10, "application/octet-stream", options));
    EXPECT_TRUE(policy.validate_request("x.png", 10, "IMAGE/PNG", options));
    
    options.allowed_types = {"application/octet-stream"};
    EXPECT_TRUE(policy.validate_request("x.bin", 10, "application/octet-stream", options));
    EXPECT_FALSE(policy.validate_request("x.png", 10, "image/png", options));
    
    UploadPolicy restricted = policy;
    restricted.allowed_types = {"text/plain"};
    EXPECT_FALSE(restricted.validate_request("x.png", 10, "image/png", UploadOptions{}));
    EXPECT_TRUE(restricted.validate_request("x.txt", 10, "text/plain", UploadOptions{}));
}

TEST_F(UploadPolicyTest, ExpectedHashMustBeHexDigest) {
    options.expected_hash = "not-a-hash";
    EXPECT_FALSE(policy.validate_request("a.txt", 10, "text/plain", options));
    
    options.expected_hash = std::string(64, 'a');
    EXPECT_TRUE(policy.validate_request("a.txt", 10, "text/plain", options));
}

TEST_F(UploadPolicyTest, ZeroRequestedChunkSizeRejected) {
    options.chunk_size = 0;
    EXPECT_FALSE(policy.validate_request("a.txt", 10, "text/plain", options));
}

TEST_F(UploadPolicyTest, ChunkSizeLadder) {
    EXPECT_EQ(policy.choose_chunk_size(1), 1 * MB);
    EXPECT_EQ(policy.choose_chunk_size(10 * MB), 1 * MB);
    EXPECT_EQ(policy.choose_chunk_size(10 * MB + 1), 5 * MB);
    EXPECT_EQ(policy.choose_chunk_size(100 * MB), 5 * MB);
    EXPECT_EQ(policy.choose_chunk_size(500 * MB), 16 * MB);
    EXPECT_EQ(policy.choose_chunk_size(2048 * MB), 64 * MB);
}

TEST_F(UploadPolicyTest, RequestedChunkSizeIsClamped) {
    EXPECT_EQ(policy.choose_chunk_size(50 * MB, 4 * MB), 4 * MB);
    EXPECT_EQ(policy.choose_chunk_size(50 * MB, 1024), 1 * MB);
    EXPECT_EQ(policy.choose_chunk_size(50 * MB, 512 * MB), 64 * MB);
}

TEST_F(UploadPolicyTest, ChunkLayout) {
    EXPECT_EQ(UploadPolicy::chunk_count(10 * MB, 4 * MB), 3u);
    EXPECT_EQ(UploadPolicy::chunk_count(8 * MB, 4 * MB), 2u);
    EXPECT_EQ(UploadPolicy::chunk_count(1, 4 * MB), 1u);
    EXPECT_EQ(UploadPolicy::chunk_count(10, 0), 0u);
    
    EXPECT_EQ(UploadPolicy::chunk_size_at(10 * MB, 4 * MB, 0), 4 * MB);
    EXPECT_EQ(UploadPolicy::chunk_size_at(10 * MB, 4 * MB, 1), 4 * MB);
    EXPECT_EQ(UploadPolicy::chunk_size_at(10 * MB, 4 * MB, 2), 2 * MB);
    EXPECT_EQ(UploadPolicy::chunk_size_at(10 * MB, 4 * MB, 3), 0u);
}

TEST_F(UploadPolicyTest, ChunkCountMustFitInIndexRange) {
    constexpr uint64_t max_count = UploadPolicy::MAX_CHUNK_COUNT;
    
    UploadPolicy tiny = policy;
    tiny.min_chunk_size = 1;
    tiny.max_file_size = 8192 * MB;
    EXPECT_FALSE(tiny.validate());
    
    tiny.max_file_size = max_count;
    EXPECT_TRUE(tiny.validate());
    
    tiny.max_file_size = 8192 * MB;
    options.chunk_size = 1;
    EXPECT_TRUE(tiny.validate_request("backup.zip", max_count, "application/zip", options));
    
    auto rejected = tiny.validate_request("backup.zip", max_count + 1, "application/zip", options);
    EXPECT_EQ(rejected.error, UploadError::VALIDATION_ERROR);
    ASSERT_TRUE(rejected.detail.actual_size.has_value());
    EXPECT_EQ(*rejected.detail.actual_size, max_count + 1);
    
    EXPECT_EQ(UploadPolicy::chunk_count(max_count + 1, 1), max_count);
}

TEST_F(UploadPolicyTest, BackoffHintDoublesUpToCap) {
    EXPECT_EQ(policy.backoff_hint(0).count(), 1000);
    EXPECT_EQ(policy.backoff_hint(1).count(), 2000);
    EXPECT_EQ(policy.backoff_hint(3).count(), 8000);
    EXPECT_EQ(policy.backoff_hint(4).count(), 16000);
    EXPECT_EQ(policy.backoff_hint(5).count(), 30000);
    EXPECT_EQ(policy.backoff_hint(40).count(), 30000);
}

TEST_F(UploadPolicyTest, CategoriesAndBuckets) {
    EXPECT_EQ(UploadPolicy::category_for("image/png"), "images");
    EXPECT_EQ(UploadPolicy::category_for("video/mp4"), "videos");
    EXPECT_EQ(UploadPolicy::category_for("audio/flac"), "audio");
    EXPECT_EQ(UploadPolicy::category_for("application/pdf"), "documents");
    EXPECT_EQ(UploadPolicy::category_for("application/zip"), "archives");
    EXPECT_EQ(UploadPolicy::category_for("application/x-unknown"), "other");
    
    EXPECT_EQ(UploadPolicy::bucket_for("image/png"), "media");
    EXPECT_EQ(UploadPolicy::bucket_for("audio/mpeg"), "media");
    EXPECT_EQ(UploadPolicy::bucket_for("application/pdf"), "uploads");
    EXPECT_EQ(UploadPolicy::bucket_for("application/x-unknown"), "uploads");
}
