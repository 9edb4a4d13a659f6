#include <gtest/gtest.h>
#include "uplink/crypto/hash.hpp"
#include "uplink/crypto/random.hpp"
#include <filesystem>
#include <fstream>
#include <set>

namespace uplink::crypto::test {

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(initialize_sodium());
        test_file_ = "test_uplink_hash.bin";
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file_)) {
            std::filesystem::remove(test_file_);
        }
    }
    
    static std::vector<std::uint8_t> bytes(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
    
    std::string test_file_;
};

TEST_F(HashTest, KnownDigests) {
    EXPECT_EQ(hash_utils::hex_digest(bytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(hash_utils::hex_digest(bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashTest, StreamingMatchesOneShot) {
    auto data = bytes("The quick brown fox jumps over the lazy dog");
    
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(std::span(data.data(), 10)));
    ASSERT_TRUE(hasher.update(std::span(data.data() + 10, data.size() - 10)));
    
    Sha256Hash streamed;
    ASSERT_TRUE(hasher.finalize(std::span(streamed)));
    
    EXPECT_EQ(streamed, Sha256Hasher::hash(data));
    EXPECT_EQ(hash_utils::hash_to_hex(streamed),
              "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST_F(HashTest, HasherRequiresInitialize) {
    Sha256Hasher hasher;
    auto data = bytes("data");
    
    auto result = hasher.update(data);
    EXPECT_EQ(result.error, CryptoError::INVALID_STATE);
    
    Sha256Hash output;
    EXPECT_EQ(hasher.finalize(std::span(output)).error, CryptoError::INVALID_STATE);
}

TEST_F(HashTest, FinalizeConsumesHasher) {
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    
    Sha256Hash first;
    ASSERT_TRUE(hasher.finalize(std::span(first)));
    
    Sha256Hash second;
    EXPECT_FALSE(hasher.finalize(std::span(second)));
}

TEST_F(HashTest, FinalizeRejectsShortBuffer) {
    Sha256Hasher hasher;
    ASSERT_TRUE(hasher.initialize());
    
    std::array<std::uint8_t, 16> small{};
    EXPECT_EQ(hasher.finalize(std::span(small)).error, CryptoError::BUFFER_TOO_SMALL);
}

TEST_F(HashTest, HashFile) {
    std::vector<std::uint8_t> content(200000);
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>(i * 31);
    }
    {
        std::ofstream file(test_file_, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), content.size());
    }
    
    Sha256Hash digest;
    ASSERT_TRUE(Sha256Hasher::hash_file(test_file_, digest));
    EXPECT_EQ(digest, Sha256Hasher::hash(content));
    
    Sha256Hash missing;
    EXPECT_EQ(Sha256Hasher::hash_file("no_such_uplink_file.bin", missing).error,
              CryptoError::FILE_READ_ERROR);
}

TEST_F(HashTest, HexConversion) {
    auto digest = Sha256Hasher::hash(bytes("uplink"));
    auto hex = hash_utils::hash_to_hex(digest);
    
    EXPECT_EQ(hex.size(), SHA256_HEX_SIZE);
    EXPECT_TRUE(hash_utils::is_hex_digest(hex));
    
    EXPECT_EQ(hex, hash_utils::hex_digest(bytes("uplink")));
    EXPECT_FALSE(hash_utils::is_hex_digest("abc"));
    EXPECT_FALSE(hash_utils::is_hex_digest(std::string(64, 'g')));
    EXPECT_FALSE(hash_utils::is_hex_digest(hex + "0"));
}

TEST_F(HashTest, RandomHexIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = SecureRandom::generate_hex(16);
        EXPECT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(HashTest, RandomBytesFillBuffer) {
    std::array<std::uint8_t, 64> first{};
    std::array<std::uint8_t, 64> second{};
    
    ASSERT_TRUE(SecureRandom::generate_bytes(first));
    ASSERT_TRUE(SecureRandom::generate_bytes(second));
    EXPECT_NE(first, second);
}

}
