#include "uplink/crypto/random.hpp"
#include "uplink/crypto/hash.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace uplink::crypto {

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize_sodium()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "libsodium is not available");
    }
    
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

std::string SecureRandom::generate_hex(size_t count) {
    std::vector<std::uint8_t> bytes(count);
    auto result = generate_bytes(bytes);
    if (!result) {
        throw std::runtime_error("Failed to generate random bytes: " + result.message);
    }
    
    std::string hex(count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(count * 2);
    return hex;
}

}
