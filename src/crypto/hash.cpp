#include "uplink/crypto/hash.hpp"
#include "uplink/core/logger.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace uplink::crypto {

bool initialize_sodium() {
    static std::once_flag once;
    static bool ready = false;
    
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            LOG_ERROR("Failed to initialize libsodium");
            return;
        }
        ready = true;
    });
    
    return ready;
}

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

CryptoResult Sha256Hasher::initialize() {
    if (!initialize_sodium()) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "libsodium is not available");
    }
    
    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "Failed to initialize SHA-256 hasher");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    if (!initialize_sodium()) {
        throw std::runtime_error("libsodium is not available");
    }
    
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

CryptoResult Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Cannot open file for hashing: " + file_path.string());
    }
    
    Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }
    
    constexpr size_t buffer_size = 65536; // 64KB buffer
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Read error while hashing: " + file_path.string());
    }
    
    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string hex_digest(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

bool is_hex_digest(const std::string& value) {
    return value.size() == SHA256_HEX_SIZE &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c); });
}

}

}
