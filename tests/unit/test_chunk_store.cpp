#include <gtest/gtest.h>
#include "uplink/storage/file_chunk_store.hpp"
#include "uplink/storage/memory_chunk_store.hpp"
#include <filesystem>
#include <fstream>
#include <memory>

using namespace uplink::storage;

namespace {

std::vector<uint8_t> make_data(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(seed + i);
    }
    return data;
}

}

class FileChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "uplink_chunk_store_test";
        std::filesystem::remove_all(test_dir_);
        store_ = std::make_unique<FileChunkStore>(test_dir_);
    }
    
    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(test_dir_);
    }
    
    std::filesystem::path test_dir_;
    std::unique_ptr<FileChunkStore> store_;
};

TEST_F(FileChunkStoreTest, PutAndGet) {
    auto data = make_data(4096, 7);
    
    ASSERT_TRUE(store_->put("session-a", 0, data));
    EXPECT_TRUE(store_->exists("session-a", 0));
    EXPECT_FALSE(store_->exists("session-a", 1));
    
    std::vector<uint8_t> read;
    ASSERT_TRUE(store_->get("session-a", 0, read));
    EXPECT_EQ(read, data);
}

TEST_F(FileChunkStoreTest, ChunkPathLayout) {
    auto path = store_->get_chunk_path("abc", 12);
    EXPECT_EQ(path, test_dir_ / "abc" / "000012.chunk");
}

TEST_F(FileChunkStoreTest, PutOverwritesAndLeavesNoTempFile) {
    ASSERT_TRUE(store_->put("s1", 3, make_data(100, 1)));
    auto replacement = make_data(50, 9);
    ASSERT_TRUE(store_->put("s1", 3, replacement));
    
    std::vector<uint8_t> read;
    ASSERT_TRUE(store_->get("s1", 3, read));
    EXPECT_EQ(read, replacement);
    
    auto temp = store_->get_chunk_path("s1", 3);
    temp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp));
}

TEST_F(FileChunkStoreTest, EmptyChunkRoundTrips) {
    ASSERT_TRUE(store_->put("s1", 0, {}));
    std::vector<uint8_t> read = {1, 2, 3};
    ASSERT_TRUE(store_->get("s1", 0, read));
    EXPECT_TRUE(read.empty());
}

TEST_F(FileChunkStoreTest, MissingChunkIsNotFound) {
    std::vector<uint8_t> read;
    auto result = store_->get("nobody", 0, read);
    EXPECT_EQ(result.error, StorageError::NOT_FOUND);
}

TEST_F(FileChunkStoreTest, RejectsUnsafeSessionKeys) {
    auto data = make_data(10, 0);
    EXPECT_EQ(store_->put("../escape", 0, data).error, StorageError::INVALID_ARGUMENT);
    EXPECT_EQ(store_->put("", 0, data).error, StorageError::INVALID_ARGUMENT);
    EXPECT_EQ(store_->delete_all("a/b").error, StorageError::INVALID_ARGUMENT);
    EXPECT_FALSE(store_->exists("..", 0));
    EXPECT_FALSE(std::filesystem::exists(test_dir_.parent_path() / "escape"));
}

TEST_F(FileChunkStoreTest, RemoveSingleChunk) {
    ASSERT_TRUE(store_->put("s1", 0, make_data(10, 0)));
    ASSERT_TRUE(store_->put("s1", 1, make_data(10, 1)));
    
    ASSERT_TRUE(store_->remove("s1", 0));
    EXPECT_FALSE(store_->exists("s1", 0));
    EXPECT_TRUE(store_->exists("s1", 1));
    
    EXPECT_TRUE(store_->remove("s1", 7));
}

TEST_F(FileChunkStoreTest, DeleteAllIsIdempotent) {
    ASSERT_TRUE(store_->put("s1", 0, make_data(10, 0)));
    ASSERT_TRUE(store_->put("s1", 1, make_data(10, 1)));
    ASSERT_TRUE(store_->put("s2", 0, make_data(10, 2)));
    
    ASSERT_TRUE(store_->delete_all("s1"));
    EXPECT_FALSE(store_->exists("s1", 0));
    EXPECT_FALSE(store_->exists("s1", 1));
    EXPECT_TRUE(store_->exists("s2", 0));
    
    EXPECT_TRUE(store_->delete_all("s1"));
    EXPECT_TRUE(store_->delete_all("never-existed"));
}

TEST_F(FileChunkStoreTest, ListSessions) {
    EXPECT_TRUE(store_->list_sessions().empty());
    
    ASSERT_TRUE(store_->put("zeta", 0, make_data(1, 0)));
    ASSERT_TRUE(store_->put("alpha", 0, make_data(1, 0)));
    ASSERT_TRUE(store_->put("alpha", 1, make_data(1, 0)));
    
    auto sessions = store_->list_sessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0], "alpha");
    EXPECT_EQ(sessions[1], "zeta");
}

TEST_F(FileChunkStoreTest, ListSessionsNeverThrows) {
    std::vector<std::string> sessions;
    EXPECT_NO_THROW(sessions = store_->list_sessions());
    EXPECT_TRUE(sessions.empty());
    
    ASSERT_TRUE(store_->put("live", 0, make_data(4, 0)));
    std::filesystem::create_directory_symlink(test_dir_ / "gone", test_dir_ / "dangling");
    {
        std::ofstream stray(test_dir_ / "stray.txt");
        stray << "not a session";
    }
    
    EXPECT_NO_THROW(sessions = store_->list_sessions());
    EXPECT_EQ(sessions, (std::vector<std::string>{"live"}));
    
    FileChunkStore file_root(test_dir_ / "stray.txt");
    EXPECT_NO_THROW(sessions = file_root.list_sessions());
    EXPECT_TRUE(sessions.empty());
}

TEST_F(FileChunkStoreTest, SurvivesNewInstance) {
    auto data = make_data(1000, 42);
    ASSERT_TRUE(store_->put("durable", 5, data));
    
    FileChunkStore reopened(test_dir_);
    std::vector<uint8_t> read;
    ASSERT_TRUE(reopened.get("durable", 5, read));
    EXPECT_EQ(read, data);
}

class MemoryChunkStoreTest : public ::testing::Test {
protected:
    MemoryChunkStore store_;
};

TEST_F(MemoryChunkStoreTest, PutGetAndCounters) {
    ASSERT_TRUE(store_.put("m1", 0, make_data(100, 0)));
    ASSERT_TRUE(store_.put("m1", 1, make_data(50, 0)));
    ASSERT_TRUE(store_.put("m2", 0, make_data(25, 0)));
    
    EXPECT_EQ(store_.chunk_count("m1"), 2u);
    EXPECT_EQ(store_.total_bytes(), 175u);
    EXPECT_EQ(store_.put_count(), 3u);
    
    std::vector<uint8_t> read;
    ASSERT_TRUE(store_.get("m1", 1, read));
    EXPECT_EQ(read.size(), 50u);
    EXPECT_EQ(store_.get("m1", 9, read).error, StorageError::NOT_FOUND);
}

TEST_F(MemoryChunkStoreTest, SimulatedFailures) {
    store_.fail_next_puts(2);
    
    EXPECT_EQ(store_.put("m1", 0, make_data(1, 0)).error, StorageError::IO_ERROR);
    EXPECT_EQ(store_.put("m1", 0, make_data(1, 0)).error, StorageError::IO_ERROR);
    EXPECT_TRUE(store_.put("m1", 0, make_data(1, 0)));
    EXPECT_EQ(store_.put_count(), 1u);
}

TEST_F(MemoryChunkStoreTest, DeleteAllAndRemove) {
    ASSERT_TRUE(store_.put("m1", 0, make_data(10, 0)));
    ASSERT_TRUE(store_.put("m1", 1, make_data(10, 0)));
    
    ASSERT_TRUE(store_.remove("m1", 0));
    EXPECT_FALSE(store_.exists("m1", 0));
    EXPECT_TRUE(store_.exists("m1", 1));
    
    ASSERT_TRUE(store_.delete_all("m1"));
    EXPECT_EQ(store_.chunk_count("m1"), 0u);
    EXPECT_TRUE(store_.list_sessions().empty());
}

TEST(SessionKeyTest, Validation) {
    EXPECT_TRUE(is_valid_session_key("0123456789abcdef0123456789abcdef"));
    EXPECT_TRUE(is_valid_session_key("upload_session-1"));
    EXPECT_FALSE(is_valid_session_key(""));
    EXPECT_FALSE(is_valid_session_key("has space"));
    EXPECT_FALSE(is_valid_session_key("dot.dot"));
    EXPECT_FALSE(is_valid_session_key(std::string(129, 'a')));
    EXPECT_TRUE(is_valid_session_key(std::string(128, 'a')));
}
