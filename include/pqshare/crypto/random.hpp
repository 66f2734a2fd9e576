#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <atomic>
#include <string>

namespace pqshare::crypto {

class SecureRandom {
public:
    // Initializes libsodium; safe to call repeatedly from any thread
    static bool initialize();
    static bool is_initialized() { return initialized_.load(); }

    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static SecureBytes generate_bytes(size_t count);

    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    // 16 random bytes rendered as 32 lowercase hex characters
    static std::string generate_session_id();

private:
    static std::atomic<bool> initialized_;
};

}
