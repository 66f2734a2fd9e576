#include "pqshare/crypto/session_keyring.hpp"
#include "pqshare/core/logger.hpp"
#include <limits>

namespace pqshare::crypto {

void SessionKeyring::GenerationKeys::wipe() {
    secure_zero(send_key);
    secure_zero(receive_key);
}

SessionKeyring::SessionKeyring()
    : role_(KeyExchangeRole::INITIATOR) {
}

SessionKeyring::~SessionKeyring() {
    wipe();
}

CryptoResult SessionKeyring::establish(SecureBytes shared_secret, KeyExchangeRole role,
                                       std::chrono::steady_clock::time_point now) {
    if (shared_secret.size() != HYBRID_SHARED_SECRET_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "Shared secret must be 64 bytes");
    }

    wipe();
    role_ = role;

    SessionKeyMaterial material;
    auto result = derive_session_keys(shared_secret.span(), material);
    if (!result) {
        return result;
    }

    GenerationKeys keys;
    keys.generation = 0;
    keys.activated_at = now;
    if (role_ == KeyExchangeRole::INITIATOR) {
        keys.send_key = material.initiator_to_responder;
        keys.receive_key = material.responder_to_initiator;
    } else {
        keys.send_key = material.responder_to_initiator;
        keys.receive_key = material.initiator_to_responder;
    }
    nonce_base_ = material.nonce_base;
    material.wipe();

    secret_ = std::move(shared_secret);
    current_ = keys;
    keys.wipe();
    return CryptoResult();
}

std::uint32_t SessionKeyring::get_generation() const {
    return current_ ? current_->generation : 0;
}

std::uint64_t SessionKeyring::get_send_counter() const {
    return current_ ? current_->next_counter : 0;
}

bool SessionKeyring::needs_rotation(std::chrono::steady_clock::time_point now,
                                    const RotationPolicy& policy) const {
    if (!current_) {
        return false;
    }
    if (policy.byte_limit > 0 && current_->bytes_sealed >= policy.byte_limit) {
        return true;
    }
    return policy.interval.count() > 0 && now - current_->activated_at >= policy.interval;
}

CryptoResult SessionKeyring::keys_from_secret(std::span<const std::uint8_t> secret,
                                              std::uint32_t generation,
                                              std::chrono::steady_clock::time_point now,
                                              GenerationKeys& out) const {
    SessionKeyMaterial material;
    auto result = derive_session_keys(secret, material);
    if (!result) {
        return result;
    }

    out.generation = generation;
    out.next_counter = 0;
    out.bytes_sealed = 0;
    out.activated_at = now;
    if (role_ == KeyExchangeRole::INITIATOR) {
        out.send_key = material.initiator_to_responder;
        out.receive_key = material.responder_to_initiator;
    } else {
        out.send_key = material.responder_to_initiator;
        out.receive_key = material.initiator_to_responder;
    }
    // The nonce base is fixed at generation 0; the generation field keeps nonces distinct
    material.wipe();
    return CryptoResult();
}

void SessionKeyring::install(GenerationKeys next, SecureBytes next_secret,
                             std::chrono::steady_clock::time_point now,
                             std::chrono::milliseconds grace) {
    if (previous_) {
        previous_->wipe();
    }
    previous_ = current_;
    previous_retire_at_ = now + grace;
    current_->wipe();
    current_ = next;
    next.wipe();
    secret_ = std::move(next_secret);
}

CryptoResult SessionKeyring::rotate(std::chrono::steady_clock::time_point now,
                                    std::chrono::milliseconds grace) {
    if (!current_) {
        return CryptoResult(CryptoError::INVALID_STATE, "No session keys established");
    }

    auto next_generation = current_->generation + 1;
    SecureBytes next_secret;
    auto result = derive_rotated_secret(secret_.span(), next_generation, next_secret);
    if (!result) {
        return result;
    }

    GenerationKeys next;
    result = keys_from_secret(next_secret.span(), next_generation, now, next);
    if (!result) {
        return result;
    }

    install(next, std::move(next_secret), now, grace);
    LOG_DEBUG("Session keys rotated to generation {}", next_generation);
    return CryptoResult();
}

CryptoResult SessionKeyring::seal(std::span<const std::uint8_t> plaintext,
                                  std::span<const std::uint8_t> additional_data,
                                  SealedPayload& out) {
    if (!current_) {
        return CryptoResult(CryptoError::INVALID_STATE, "No session keys established");
    }

    if (current_->next_counter == std::numeric_limits<std::uint64_t>::max()) {
        return CryptoResult(CryptoError::NONCE_EXHAUSTED, "Nonce counter exhausted; rotate keys");
    }

    auto counter = current_->next_counter;
    auto nonce = ChunkCipher::make_nonce(nonce_base_, current_->generation, counter);

    auto result = cipher_.encrypt(plaintext, additional_data, current_->send_key, nonce, out.ciphertext);
    if (!result) {
        return result;
    }

    // Counter advances only after a successful seal, never reused
    current_->next_counter = counter + 1;
    current_->bytes_sealed += plaintext.size();
    out.nonce = nonce;
    out.generation = current_->generation;
    out.counter = counter;
    return CryptoResult();
}

CryptoResult SessionKeyring::open(std::span<const std::uint8_t> ciphertext,
                                  std::span<const std::uint8_t> additional_data,
                                  const ChaCha20Nonce& nonce,
                                  std::chrono::steady_clock::time_point now,
                                  std::chrono::milliseconds grace,
                                  std::vector<std::uint8_t>& out_plaintext) {
    if (!current_) {
        return CryptoResult(CryptoError::INVALID_STATE, "No session keys established");
    }

    expire_retired(now);

    std::uint32_t generation = 0;
    std::uint64_t counter = 0;
    ChunkCipher::split_nonce(nonce, nonce_base_, generation, counter);

    if (generation == current_->generation) {
        return cipher_.decrypt(ciphertext, additional_data, current_->receive_key, nonce, out_plaintext);
    }

    if (previous_ && generation == previous_->generation) {
        return cipher_.decrypt(ciphertext, additional_data, previous_->receive_key, nonce, out_plaintext);
    }

    if (generation < current_->generation ||
        generation - current_->generation > MAX_GENERATION_LOOKAHEAD) {
        return CryptoResult(CryptoError::UNKNOWN_KEY_GENERATION,
                            "No key for generation " + std::to_string(generation));
    }

    // Peer rotated ahead of us: walk the chain on a scratch copy
    SecureBytes candidate_secret(secret_.span());
    for (auto g = current_->generation + 1; g <= generation; ++g) {
        SecureBytes next_secret;
        auto result = derive_rotated_secret(candidate_secret.span(), g, next_secret);
        if (!result) {
            return result;
        }
        candidate_secret = std::move(next_secret);
    }

    GenerationKeys candidate;
    auto result = keys_from_secret(candidate_secret.span(), generation, now, candidate);
    if (!result) {
        return result;
    }

    result = cipher_.decrypt(ciphertext, additional_data, candidate.receive_key, nonce, out_plaintext);
    if (!result) {
        candidate.wipe();
        return result;
    }

    install(candidate, std::move(candidate_secret), now, grace);
    LOG_DEBUG("Adopted peer key generation {}", generation);
    return CryptoResult();
}

void SessionKeyring::expire_retired(std::chrono::steady_clock::time_point now) {
    if (previous_ && now >= previous_retire_at_) {
        LOG_DEBUG("Discarding key generation {} after grace window", previous_->generation);
        previous_->wipe();
        previous_.reset();
    }
}

void SessionKeyring::wipe() {
    if (current_) {
        current_->wipe();
        current_.reset();
    }
    if (previous_) {
        previous_->wipe();
        previous_.reset();
    }
    secret_.clear();
    secure_zero(nonce_base_);
}

}
