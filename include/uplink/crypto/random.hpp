#pragma once

#include "crypto_types.hpp"
#include <span>
#include <string>
#include <cstdint>

namespace uplink::crypto {

class SecureRandom {
public:
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    
    // Lowercase hex of `count` random bytes; used for session and object ids.
    static std::string generate_hex(size_t count);
};

}
