#include <gtest/gtest.h>
#include "uplink/storage/filesystem_object_storage.hpp"
#include "uplink/crypto/hash.hpp"
#include <filesystem>
#include <memory>

using namespace uplink::storage;

class FilesystemObjectStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "uplink_object_storage_test";
        std::filesystem::remove_all(test_dir_);
        storage_ = std::make_unique<FilesystemObjectStorage>(test_dir_);
        
        data_ = {'h', 'e', 'l', 'l', 'o'};
        metadata_.bucket = "media";
        metadata_.content_type = "image/png";
        metadata_.original_name = "Cat.PNG";
        metadata_.owner_id = "user-1";
        metadata_.extra["session_id"] = "abc";
    }
    
    void TearDown() override {
        storage_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    std::filesystem::path test_dir_;
    std::unique_ptr<FilesystemObjectStorage> storage_;
    std::vector<uint8_t> data_;
    ObjectMetadata metadata_;
};

TEST_F(FilesystemObjectStorageTest, StoreReturnsLocationAndHash) {
    StoredObject stored;
    ASSERT_TRUE(storage_->store(data_, metadata_, stored));
    
    EXPECT_EQ(stored.location.rfind("file://", 0), 0u);
    EXPECT_EQ(stored.size, data_.size());
    EXPECT_EQ(stored.content_hash, uplink::crypto::hash_utils::hex_digest(data_));
    
    auto path = storage_->resolve(stored.location);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(std::filesystem::is_regular_file(*path));
    EXPECT_EQ(path->parent_path().filename(), "media");
    EXPECT_EQ(path->extension(), ".png");
}

TEST_F(FilesystemObjectStorageTest, LoadRoundTrip) {
    StoredObject stored;
    ASSERT_TRUE(storage_->store(data_, metadata_, stored));
    
    std::vector<uint8_t> loaded;
    ASSERT_TRUE(storage_->load(stored.location, loaded));
    EXPECT_EQ(loaded, data_);
}

TEST_F(FilesystemObjectStorageTest, MetadataSidecar) {
    StoredObject stored;
    ASSERT_TRUE(storage_->store(data_, metadata_, stored));
    
    auto loaded = storage_->load_metadata(stored.location);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bucket, "media");
    EXPECT_EQ(loaded->content_type, "image/png");
    EXPECT_EQ(loaded->original_name, "Cat.PNG");
    EXPECT_EQ(loaded->owner_id, "user-1");
    ASSERT_EQ(loaded->extra.count("session_id"), 1u);
    EXPECT_EQ(loaded->extra.at("session_id"), "abc");
}

TEST_F(FilesystemObjectStorageTest, DistinctLocationsForSameContent) {
    StoredObject first;
    StoredObject second;
    ASSERT_TRUE(storage_->store(data_, metadata_, first));
    ASSERT_TRUE(storage_->store(data_, metadata_, second));
    
    EXPECT_NE(first.location, second.location);
    EXPECT_EQ(first.content_hash, second.content_hash);
}

TEST_F(FilesystemObjectStorageTest, BucketNameIsSanitized) {
    metadata_.bucket = "../Secret Bucket";
    
    StoredObject stored;
    ASSERT_TRUE(storage_->store(data_, metadata_, stored));
    
    auto path = storage_->resolve(stored.location);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path().filename(), "secretbucket");
    
    metadata_.bucket = "///";
    ASSERT_TRUE(storage_->store(data_, metadata_, stored));
    EXPECT_EQ(storage_->resolve(stored.location)->parent_path().filename(), "uploads");
}

TEST_F(FilesystemObjectStorageTest, ResolveRejectsForeignLocations) {
    EXPECT_FALSE(storage_->resolve("s3://bucket/key").has_value());
    EXPECT_FALSE(storage_->resolve("file:///etc/passwd").has_value());
    EXPECT_FALSE(storage_->resolve("file://" + (test_dir_ / ".." / "other").string()).has_value());
    
    std::vector<uint8_t> data;
    EXPECT_EQ(storage_->load("file:///etc/passwd", data).error, StorageError::INVALID_ARGUMENT);
    EXPECT_FALSE(storage_->load_metadata("file:///etc/passwd").has_value());
}

TEST_F(FilesystemObjectStorageTest, LoadMissingObject) {
    std::vector<uint8_t> data;
    auto location = "file://" + (test_dir_ / "media" / "missing.bin").string();
    EXPECT_EQ(storage_->load(location, data).error, StorageError::NOT_FOUND);
}

TEST_F(FilesystemObjectStorageTest, TrailingSlashRoot) {
    FilesystemObjectStorage storage(test_dir_.string() + "/");
    EXPECT_EQ(storage.root(), storage_->root());
    
    StoredObject stored;
    ASSERT_TRUE(storage.store(data_, metadata_, stored));
    EXPECT_TRUE(storage_->resolve(stored.location).has_value());
}
