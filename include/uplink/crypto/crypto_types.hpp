#pragma once

#include <array>
#include <string>
#include <cstdint>

namespace uplink::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA256_HEX_SIZE = SHA256_HASH_SIZE * 2;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

enum class CryptoError {
    SUCCESS = 0,
    INITIALIZATION_FAILED,
    HASH_FAILED,
    RANDOM_GENERATION_FAILED,
    BUFFER_TOO_SMALL,
    FILE_READ_ERROR,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
