#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <memory>

namespace pqshare::crypto {

enum class KeyExchangeRole {
    INITIATOR,
    RESPONDER
};

enum class KeyExchangePhase {
    IDLE,
    AWAITING_CIPHERTEXT,
    COMPLETE,
    FAILED
};

// Keys for one generation, split by direction of travel
struct SessionKeyMaterial {
    ChaCha20Key initiator_to_responder{};
    ChaCha20Key responder_to_initiator{};
    ChaCha20Nonce nonce_base{};

    void wipe();
};

// ML-KEM-768 combined with X25519. The initiator publishes
// mlkem_pk || x25519_pk, the responder answers mlkem_ct || x25519_pk and both
// hold mlkem_ss || x25519_ss afterwards.
class HybridKeyExchange {
public:
    HybridKeyExchange();
    ~HybridKeyExchange();

    HybridKeyExchange(const HybridKeyExchange&) = delete;
    HybridKeyExchange& operator=(const HybridKeyExchange&) = delete;

    // Initiator: generate both ephemeral keypairs
    CryptoResult initiate(std::vector<std::uint8_t>& out_public_key_bytes);

    // Responder: encapsulate against the peer and compute the EC share
    CryptoResult respond(std::span<const std::uint8_t> peer_public_key_bytes,
                         std::vector<std::uint8_t>& out_ciphertext_bytes);

    // Initiator: decapsulate and compute the EC share
    CryptoResult complete(std::span<const std::uint8_t> ciphertext_bytes);

    // Moves the 64-byte concatenated secret out; valid once COMPLETE
    SecureBytes take_shared_secret();

    KeyExchangePhase get_phase() const { return phase_; }
    KeyExchangeRole get_role() const { return role_; }
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    KeyExchangePhase phase_;
    KeyExchangeRole role_;
};

// HKDF-SHA256 over the concatenated secret with the fixed session context
CryptoResult derive_session_keys(std::span<const std::uint8_t> shared_secret,
                                 SessionKeyMaterial& out_keys);

// PRF step of the rotation chain: secret_g = HKDF(secret_{g-1}, "pqshare-rotate" || g)
CryptoResult derive_rotated_secret(std::span<const std::uint8_t> prior_secret,
                                   std::uint32_t generation,
                                   SecureBytes& out_secret);

}
