#pragma once

#include "pqshare/crypto/chunk_cipher.hpp"
#include "pqshare/crypto/hybrid_key_exchange.hpp"
#include <chrono>
#include <optional>

namespace pqshare::crypto {

struct RotationPolicy {
    std::chrono::seconds interval{300};
    std::uint64_t byte_limit = 1ULL << 30;
    std::chrono::milliseconds grace{10000};
};

struct SealedPayload {
    std::vector<std::uint8_t> ciphertext;
    ChaCha20Nonce nonce{};
    std::uint32_t generation = 0;
    std::uint64_t counter = 0;
};

// Per-session key state: the current generation, the superseded one while it
// drains, and the per-generation nonce counter. Owned by exactly one session.
class SessionKeyring {
public:
    static constexpr std::uint32_t MAX_GENERATION_LOOKAHEAD = 4;

    SessionKeyring();
    ~SessionKeyring();

    SessionKeyring(const SessionKeyring&) = delete;
    SessionKeyring& operator=(const SessionKeyring&) = delete;

    CryptoResult establish(SecureBytes shared_secret, KeyExchangeRole role,
                           std::chrono::steady_clock::time_point now);
    bool is_established() const { return current_.has_value(); }

    std::uint32_t get_generation() const;
    std::uint64_t get_send_counter() const;
    bool has_previous_generation() const { return previous_.has_value(); }

    bool needs_rotation(std::chrono::steady_clock::time_point now, const RotationPolicy& policy) const;

    // Local rotation; the superseded key stays usable for decryption until now + grace
    CryptoResult rotate(std::chrono::steady_clock::time_point now, std::chrono::milliseconds grace);

    CryptoResult seal(std::span<const std::uint8_t> plaintext,
                      std::span<const std::uint8_t> additional_data,
                      SealedPayload& out);

    // Accepts the current generation, the previous one inside its grace
    // window, or a later generation (committed only when authentication passes)
    CryptoResult open(std::span<const std::uint8_t> ciphertext,
                      std::span<const std::uint8_t> additional_data,
                      const ChaCha20Nonce& nonce,
                      std::chrono::steady_clock::time_point now,
                      std::chrono::milliseconds grace,
                      std::vector<std::uint8_t>& out_plaintext);

    void expire_retired(std::chrono::steady_clock::time_point now);
    void wipe();

private:
    struct GenerationKeys {
        std::uint32_t generation = 0;
        ChaCha20Key send_key{};
        ChaCha20Key receive_key{};
        std::uint64_t next_counter = 0;
        std::uint64_t bytes_sealed = 0;
        std::chrono::steady_clock::time_point activated_at{};

        void wipe();
    };

    CryptoResult keys_from_secret(std::span<const std::uint8_t> secret, std::uint32_t generation,
                                  std::chrono::steady_clock::time_point now, GenerationKeys& out) const;
    void install(GenerationKeys next, SecureBytes next_secret,
                 std::chrono::steady_clock::time_point now, std::chrono::milliseconds grace);

    ChunkCipher cipher_;
    KeyExchangeRole role_;
    SecureBytes secret_;
    ChaCha20Nonce nonce_base_{};
    std::optional<GenerationKeys> current_;
    std::optional<GenerationKeys> previous_;
    std::chrono::steady_clock::time_point previous_retire_at_{};
};

}
