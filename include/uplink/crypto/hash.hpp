#pragma once

#include "crypto_types.hpp"
#include <span>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

namespace uplink::crypto {

// Initializes libsodium once per process. Safe to call repeatedly.
bool initialize_sodium();

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Sha256Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string hash_to_hex(const Sha256Hash& hash);

// Lowercase hex SHA-256 of the given bytes.
std::string hex_digest(std::span<const std::uint8_t> data);

bool is_hex_digest(const std::string& value);

}

}
