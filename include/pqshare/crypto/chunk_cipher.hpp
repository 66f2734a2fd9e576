#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <vector>

namespace pqshare::crypto {

// ChaCha20-Poly1305 (IETF) for a single chunk. Ciphertext carries the
// 16-byte tag at its end.
class ChunkCipher {
public:
    ChunkCipher();

    CryptoResult encrypt(std::span<const std::uint8_t> plaintext,
                         std::span<const std::uint8_t> additional_data,
                         const ChaCha20Key& key,
                         const ChaCha20Nonce& nonce,
                         std::vector<std::uint8_t>& out_ciphertext) const;

    CryptoResult decrypt(std::span<const std::uint8_t> ciphertext,
                         std::span<const std::uint8_t> additional_data,
                         const ChaCha20Key& key,
                         const ChaCha20Nonce& nonce,
                         std::vector<std::uint8_t>& out_plaintext) const;

    // nonce = base XOR (u32be(generation) || u64be(counter))
    static ChaCha20Nonce make_nonce(const ChaCha20Nonce& base, std::uint32_t generation, std::uint64_t counter);
    static void split_nonce(const ChaCha20Nonce& nonce, const ChaCha20Nonce& base,
                            std::uint32_t& out_generation, std::uint64_t& out_counter);
};

// Associated data binding a ciphertext to its chunk position
std::vector<std::uint8_t> chunk_associated_data(std::uint32_t index, std::uint32_t total_chunks);

}
