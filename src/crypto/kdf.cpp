#include "pqshare/crypto/kdf.hpp"
#include "pqshare/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>

namespace pqshare::crypto {

CryptoResult Hkdf::extract(std::span<const std::uint8_t> salt,
                           std::span<const std::uint8_t> input_key_material,
                           std::span<std::uint8_t> prk) {
    if (prk.size() != HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "PRK buffer must be 32 bytes");
    }

    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    // PRK = HMAC-Hash(salt, IKM)
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, salt.data(), salt.size());
    crypto_auth_hmacsha256_update(&state, input_key_material.data(), input_key_material.size());
    crypto_auth_hmacsha256_final(&state, prk.data());
    sodium_memzero(&state, sizeof(state));

    return CryptoResult();
}

CryptoResult Hkdf::expand(std::span<const std::uint8_t> prk,
                          std::span<const std::uint8_t> info,
                          std::span<std::uint8_t> output) {
    if (output.empty() || output.size() > MAX_OUTPUT_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Invalid HKDF output length");
    }

    // T(i) = HMAC-Hash(PRK, T(i-1) || info || i)
    std::array<std::uint8_t, HASH_SIZE> block{};
    size_t block_size = 0;
    size_t offset = 0;
    std::uint8_t counter = 1;

    while (offset < output.size()) {
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, prk.data(), prk.size());
        crypto_auth_hmacsha256_update(&state, block.data(), block_size);
        crypto_auth_hmacsha256_update(&state, info.data(), info.size());
        crypto_auth_hmacsha256_update(&state, &counter, 1);
        crypto_auth_hmacsha256_final(&state, block.data());
        sodium_memzero(&state, sizeof(state));
        block_size = block.size();

        auto take = std::min(block.size(), output.size() - offset);
        std::copy(block.begin(), block.begin() + take, output.begin() + offset);
        offset += take;
        ++counter;
    }

    sodium_memzero(block.data(), block.size());
    return CryptoResult();
}

CryptoResult Hkdf::derive(std::span<const std::uint8_t> input_key_material,
                          std::span<const std::uint8_t> salt,
                          std::span<const std::uint8_t> info,
                          std::span<std::uint8_t> output) {
    std::array<std::uint8_t, HASH_SIZE> prk{};
    auto result = extract(salt, input_key_material, prk);
    if (result.success()) {
        result = expand(prk, info, output);
    }
    sodium_memzero(prk.data(), prk.size());
    return result;
}

}
