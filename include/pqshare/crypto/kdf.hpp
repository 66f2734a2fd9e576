#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <string_view>

namespace pqshare::crypto {

// HKDF (RFC 5869) over HMAC-SHA256
class Hkdf {
public:
    static constexpr size_t HASH_SIZE = 32;
    static constexpr size_t MAX_OUTPUT_SIZE = 255 * HASH_SIZE;

    static CryptoResult extract(std::span<const std::uint8_t> salt,
                                std::span<const std::uint8_t> input_key_material,
                                std::span<std::uint8_t> prk);

    static CryptoResult expand(std::span<const std::uint8_t> prk,
                               std::span<const std::uint8_t> info,
                               std::span<std::uint8_t> output);

    static CryptoResult derive(std::span<const std::uint8_t> input_key_material,
                               std::span<const std::uint8_t> salt,
                               std::span<const std::uint8_t> info,
                               std::span<std::uint8_t> output);
};

inline std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}
