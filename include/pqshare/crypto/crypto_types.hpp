#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pqshare::crypto {

constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;
constexpr size_t X25519_SHARED_SECRET_SIZE = 32;

// ML-KEM-768 (FIPS 203)
constexpr size_t MLKEM768_PUBLIC_KEY_SIZE = 1184;
constexpr size_t MLKEM768_SECRET_KEY_SIZE = 2400;
constexpr size_t MLKEM768_CIPHERTEXT_SIZE = 1088;
constexpr size_t MLKEM768_SHARED_SECRET_SIZE = 32;

constexpr size_t HYBRID_PUBLIC_KEY_SIZE = MLKEM768_PUBLIC_KEY_SIZE + X25519_PUBLIC_KEY_SIZE;
constexpr size_t HYBRID_CIPHERTEXT_SIZE = MLKEM768_CIPHERTEXT_SIZE + X25519_PUBLIC_KEY_SIZE;
constexpr size_t HYBRID_SHARED_SECRET_SIZE = MLKEM768_SHARED_SECRET_SIZE + X25519_SHARED_SECRET_SIZE;

constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

constexpr size_t DIGEST_SIZE = 32;

constexpr size_t SESSION_ID_SIZE = 16;

using X25519PublicKey = std::array<std::uint8_t, X25519_PUBLIC_KEY_SIZE>;
using X25519SecretKey = std::array<std::uint8_t, X25519_SECRET_KEY_SIZE>;

using ChaCha20Key = std::array<std::uint8_t, CHACHA20_KEY_SIZE>;
using ChaCha20Nonce = std::array<std::uint8_t, CHACHA20_NONCE_SIZE>;

// BLAKE2b-256 content digest
using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// Zeroed on destruction; move-only so key material is never duplicated
struct SecureBytes {
    std::vector<std::uint8_t> data;

    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(std::span<const std::uint8_t> bytes);

    ~SecureBytes();

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }

    void clear();
    void resize(size_t new_size);
};

// Overwrites a fixed-size key with zeros
void secure_zero(std::span<std::uint8_t> bytes);

enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    INVALID_KEY,
    INVALID_STATE,
    KEY_GENERATION_FAILED,
    KEY_EXCHANGE_FAILED,
    ENCRYPTION_FAILED,
    AUTHENTICATION_FAILED,
    NONCE_EXHAUSTED,
    UNKNOWN_KEY_GENERATION,
    BUFFER_TOO_SMALL,
    HASH_FAILED,
    IO_ERROR
};

const char* to_string(CryptoError error);

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
