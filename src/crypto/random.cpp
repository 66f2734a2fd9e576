#include "pqshare/crypto/random.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/core/utils.hpp"
#include <sodium.h>
#include <stdexcept>

namespace pqshare::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_.load()) {
        return true;
    }

    // sodium_init is itself thread-safe and idempotent
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    if (!initialized_.exchange(true)) {
        LOG_DEBUG("Cryptographic random number generator initialized");
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Random generator not initialized");
    }

    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

std::uint32_t SecureRandom::generate_uint32() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_session_id() {
    std::array<std::uint8_t, SESSION_ID_SIZE> id{};
    auto result = generate_bytes(std::span(id));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate session id: " + result.message);
    }
    return core::utils::StringUtils::to_hex(id);
}

}
