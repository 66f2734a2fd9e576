#include "pqshare/crypto/chunk_cipher.hpp"
#include "pqshare/crypto/random.hpp"
#include <sodium.h>
#include <stdexcept>

namespace pqshare::crypto {

ChunkCipher::ChunkCipher() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for chunk encryption");
    }
}

CryptoResult ChunkCipher::encrypt(std::span<const std::uint8_t> plaintext,
                                  std::span<const std::uint8_t> additional_data,
                                  const ChaCha20Key& key,
                                  const ChaCha20Nonce& nonce,
                                  std::vector<std::uint8_t>& out_ciphertext) const {
    out_ciphertext.resize(plaintext.size() + AEAD_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        out_ciphertext.data(),
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        additional_data.data(),
        additional_data.size(),
        nullptr,  // nsec (not used)
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        out_ciphertext.clear();
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "ChaCha20-Poly1305 encryption failed");
    }

    out_ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return CryptoResult();
}

CryptoResult ChunkCipher::decrypt(std::span<const std::uint8_t> ciphertext,
                                  std::span<const std::uint8_t> additional_data,
                                  const ChaCha20Key& key,
                                  const ChaCha20Nonce& nonce,
                                  std::vector<std::uint8_t>& out_plaintext) const {
    if (ciphertext.size() < AEAD_TAG_SIZE) {
        return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Ciphertext shorter than tag");
    }

    out_plaintext.resize(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;

    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        out_plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        ciphertext.data(),
        ciphertext.size(),
        additional_data.data(),
        additional_data.size(),
        nonce.data(),
        key.data()
    );

    if (result != 0) {
        out_plaintext.clear();
        return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "ChaCha20-Poly1305 tag mismatch");
    }

    out_plaintext.resize(static_cast<size_t>(plaintext_len));
    return CryptoResult();
}

ChaCha20Nonce ChunkCipher::make_nonce(const ChaCha20Nonce& base, std::uint32_t generation, std::uint64_t counter) {
    ChaCha20Nonce nonce = base;
    for (size_t i = 0; i < 4; ++i) {
        nonce[i] ^= static_cast<std::uint8_t>((generation >> (24 - 8 * i)) & 0xFF);
    }
    for (size_t i = 0; i < 8; ++i) {
        nonce[4 + i] ^= static_cast<std::uint8_t>((counter >> (56 - 8 * i)) & 0xFF);
    }
    return nonce;
}

void ChunkCipher::split_nonce(const ChaCha20Nonce& nonce, const ChaCha20Nonce& base,
                              std::uint32_t& out_generation, std::uint64_t& out_counter) {
    out_generation = 0;
    out_counter = 0;
    for (size_t i = 0; i < 4; ++i) {
        out_generation = (out_generation << 8) | static_cast<std::uint8_t>(nonce[i] ^ base[i]);
    }
    for (size_t i = 4; i < CHACHA20_NONCE_SIZE; ++i) {
        out_counter = (out_counter << 8) | static_cast<std::uint8_t>(nonce[i] ^ base[i]);
    }
}

std::vector<std::uint8_t> chunk_associated_data(std::uint32_t index, std::uint32_t total_chunks) {
    return {
        static_cast<std::uint8_t>((index >> 24) & 0xFF),
        static_cast<std::uint8_t>((index >> 16) & 0xFF),
        static_cast<std::uint8_t>((index >> 8) & 0xFF),
        static_cast<std::uint8_t>(index & 0xFF),
        static_cast<std::uint8_t>((total_chunks >> 24) & 0xFF),
        static_cast<std::uint8_t>((total_chunks >> 16) & 0xFF),
        static_cast<std::uint8_t>((total_chunks >> 8) & 0xFF),
        static_cast<std::uint8_t>(total_chunks & 0xFF)
    };
}

}
