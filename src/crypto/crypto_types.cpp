#include "pqshare/crypto/crypto_types.hpp"
#include <sodium.h>
#include <algorithm>

namespace pqshare::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes)
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data(std::move(other.data)) {
    other.data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
        other.data.clear();
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    // Grow through a fresh buffer so no stale copy survives reallocation
    if (new_size > data.capacity()) {
        std::vector<std::uint8_t> grown(new_size, 0);
        std::copy(data.begin(), data.end(), grown.begin());
        clear();
        data = std::move(grown);
        return;
    }

    if (new_size < data.size()) {
        sodium_memzero(data.data() + new_size, data.size() - new_size);
    }
    data.resize(new_size, 0);
}

void secure_zero(std::span<std::uint8_t> bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "success";
        case CryptoError::NOT_INITIALIZED: return "not initialized";
        case CryptoError::INVALID_KEY: return "invalid key";
        case CryptoError::INVALID_STATE: return "invalid state";
        case CryptoError::KEY_GENERATION_FAILED: return "key generation failed";
        case CryptoError::KEY_EXCHANGE_FAILED: return "key exchange failed";
        case CryptoError::ENCRYPTION_FAILED: return "encryption failed";
        case CryptoError::AUTHENTICATION_FAILED: return "authentication failed";
        case CryptoError::NONCE_EXHAUSTED: return "nonce exhausted";
        case CryptoError::UNKNOWN_KEY_GENERATION: return "unknown key generation";
        case CryptoError::BUFFER_TOO_SMALL: return "buffer too small";
        case CryptoError::HASH_FAILED: return "hash failed";
        case CryptoError::IO_ERROR: return "io error";
    }
    return "unknown";
}

}
