#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "uplink/upload/finalizer.hpp"
#include "uplink/storage/memory_chunk_store.hpp"
#include "uplink/crypto/hash.hpp"
#include <memory>

using namespace uplink::upload;
using namespace uplink::storage;
using ::testing::_;
using ::testing::Return;
using ::testing::Invoke;

class MockObjectStorage : public ObjectStorage {
public:
    MOCK_METHOD(StorageResult, store,
                (const std::vector<uint8_t>&, const ObjectMetadata&, StoredObject&), (override));
};

class FinalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        object_storage_ = std::make_shared<MockObjectStorage>();
        chunk_store_ = std::make_shared<MemoryChunkStore>();
        
        session_.session_id = "finalize-me";
        session_.owner_id = "owner-7";
        session_.filename = "clip.mp4";
        session_.mime_type = "video/mp4";
        session_.bucket = "media";
        session_.metadata["album"] = "summer";
        
        object_.data = {1, 2, 3, 4, 5};
        object_.content_hash = uplink::crypto::hash_utils::hex_digest(object_.data);
    }
    
    auto store_succeeds(const std::string& location) {
        return Invoke([location](const std::vector<uint8_t>& data, const ObjectMetadata&,
                                       StoredObject& stored) {
            stored.location = location;
            stored.content_hash = uplink::crypto::hash_utils::hex_digest(data);
            stored.size = data.size();
            return StorageResult();
        });
    }
    
    std::shared_ptr<MockObjectStorage> object_storage_;
    std::shared_ptr<MemoryChunkStore> chunk_store_;
    UploadSession session_;
    AssembledObject object_;
};

TEST_F(FinalizerTest, StoresObjectWithSessionMetadata) {
    Finalizer finalizer(object_storage_, chunk_store_);
    
    ObjectMetadata captured;
    EXPECT_CALL(*object_storage_, store(object_.data, _, _))
        .WillOnce(Invoke([&](const std::vector<uint8_t>& data, const ObjectMetadata& metadata,
                             StoredObject& stored) {
            captured = metadata;
            stored.location = "file:///objects/media/1.mp4";
            stored.content_hash = uplink::crypto::hash_utils::hex_digest(data);
            stored.size = data.size();
            return StorageResult();
        }));
    
    StoredObject stored;
    auto result = finalizer.finalize(session_, object_, stored);
    ASSERT_TRUE(result.success()) << result.describe();
    
    EXPECT_EQ(stored.location, "file:///objects/media/1.mp4");
    EXPECT_EQ(stored.content_hash, object_.content_hash);
    EXPECT_EQ(stored.size, 5u);
    
    EXPECT_EQ(captured.bucket, "media");
    EXPECT_EQ(captured.content_type, "video/mp4");
    EXPECT_EQ(captured.original_name, "clip.mp4");
    EXPECT_EQ(captured.owner_id, "owner-7");
    EXPECT_EQ(captured.extra.at("album"), "summer");
    EXPECT_EQ(captured.extra.at("session_id"), "finalize-me");
    EXPECT_EQ(captured.extra.at("sha256"), object_.content_hash);
}

TEST_F(FinalizerTest, FailureIsTerminalAtFinalization) {
    Finalizer finalizer(object_storage_, chunk_store_);
    
    EXPECT_CALL(*object_storage_, store(_, _, _))
        .WillOnce(Return(StorageResult(StorageError::IO_ERROR, "disk full")));
    
    StoredObject stored;
    auto result = finalizer.finalize(session_, object_, stored);
    EXPECT_EQ(result.error, UploadError::TERMINAL);
    EXPECT_EQ(result.detail.stage, ErrorStage::FINALIZATION);
    EXPECT_NE(result.message.find("disk full"), std::string::npos);
    EXPECT_TRUE(stored.location.empty());
}

TEST_F(FinalizerTest, RetriesUpToConfiguredAttempts) {
    Finalizer finalizer(object_storage_, chunk_store_, 3);
    
    EXPECT_CALL(*object_storage_, store(_, _, _))
        .WillOnce(Return(StorageResult(StorageError::IO_ERROR, "timeout")))
        .WillOnce(Return(StorageResult(StorageError::IO_ERROR, "timeout")))
        .WillOnce(store_succeeds("file:///objects/media/2.mp4"));
    
    StoredObject stored;
    EXPECT_TRUE(finalizer.finalize(session_, object_, stored));
    EXPECT_EQ(stored.location, "file:///objects/media/2.mp4");
}

TEST_F(FinalizerTest, GivesUpAfterLastAttempt) {
    Finalizer finalizer(object_storage_, chunk_store_, 2);
    
    EXPECT_CALL(*object_storage_, store(_, _, _))
        .Times(2)
        .WillRepeatedly(Return(StorageResult(StorageError::IO_ERROR, "unavailable")));
    
    StoredObject stored;
    auto result = finalizer.finalize(session_, object_, stored);
    EXPECT_EQ(result.error, UploadError::TERMINAL);
    EXPECT_EQ(result.detail.retries_used, 1u);
}

TEST_F(FinalizerTest, MismatchedStoredHashIsTerminal) {
    Finalizer finalizer(object_storage_, chunk_store_, 3);
    
    EXPECT_CALL(*object_storage_, store(_, _, _))
        .WillOnce(Invoke([](const std::vector<uint8_t>&, const ObjectMetadata&, StoredObject& stored) {
            stored.location = "file:///objects/media/3.mp4";
            stored.content_hash = std::string(64, 'a');
            return StorageResult();
        }));
    
    StoredObject stored;
    auto result = finalizer.finalize(session_, object_, stored);
    EXPECT_EQ(result.error, UploadError::TERMINAL);
    EXPECT_EQ(*result.detail.expected_hash, object_.content_hash);
}

TEST_F(FinalizerTest, StorageWithoutHashGetsAssembledHash) {
    Finalizer finalizer(object_storage_, chunk_store_);
    
    EXPECT_CALL(*object_storage_, store(_, _, _))
        .WillOnce(Invoke([](const std::vector<uint8_t>&, const ObjectMetadata&, StoredObject& stored) {
            stored.location = "s3://bucket/key";
            return StorageResult();
        }));
    
    StoredObject stored;
    ASSERT_TRUE(finalizer.finalize(session_, object_, stored));
    EXPECT_EQ(stored.content_hash, object_.content_hash);
    EXPECT_EQ(stored.size, object_.data.size());
}

TEST_F(FinalizerTest, ReleaseDeletesChunks) {
    Finalizer finalizer(object_storage_, chunk_store_);
    ASSERT_TRUE(chunk_store_->put(session_.session_id, 0, {1}));
    ASSERT_TRUE(chunk_store_->put(session_.session_id, 1, {2}));
    
    EXPECT_TRUE(finalizer.release(session_.session_id));
    EXPECT_EQ(chunk_store_->chunk_count(session_.session_id), 0u);
    
    EXPECT_TRUE(finalizer.release(session_.session_id));
}
