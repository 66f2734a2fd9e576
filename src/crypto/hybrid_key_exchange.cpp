#include "pqshare/crypto/hybrid_key_exchange.hpp"
#include "pqshare/crypto/kdf.hpp"
#include "pqshare/crypto/random.hpp"
#include "pqshare/core/logger.hpp"
#include <oqs/oqs.h>
#include <sodium.h>
#include <algorithm>

namespace pqshare::crypto {

namespace {
    constexpr std::string_view SESSION_SALT = "pqshare-kdf-salt-v1";
    constexpr std::string_view SESSION_INFO = "pqshare-session-keys-v1";
    constexpr std::string_view ROTATION_SALT = "pqshare-rotation-v1";
    constexpr std::string_view ROTATION_INFO = "pqshare-rotate";

    constexpr size_t SESSION_KEY_MATERIAL_SIZE = 2 * CHACHA20_KEY_SIZE + CHACHA20_NONCE_SIZE;

    struct KemDeleter {
        void operator()(OQS_KEM* kem) const { OQS_KEM_free(kem); }
    };
    using KemHandle = std::unique_ptr<OQS_KEM, KemDeleter>;

    KemHandle open_mlkem768() {
        KemHandle kem(OQS_KEM_new(OQS_KEM_alg_ml_kem_768));
        if (kem &&
            (kem->length_public_key != MLKEM768_PUBLIC_KEY_SIZE ||
             kem->length_ciphertext != MLKEM768_CIPHERTEXT_SIZE ||
             kem->length_shared_secret != MLKEM768_SHARED_SECRET_SIZE ||
             kem->length_secret_key != MLKEM768_SECRET_KEY_SIZE)) {
            LOG_ERROR("liboqs ML-KEM-768 parameters do not match expected sizes");
            return nullptr;
        }
        return kem;
    }
}

void SessionKeyMaterial::wipe() {
    secure_zero(initiator_to_responder);
    secure_zero(responder_to_initiator);
    secure_zero(nonce_base);
}

struct HybridKeyExchange::Impl {
    KemHandle kem;
    SecureBytes kem_secret_key;
    X25519SecretKey ec_secret_key{};
    X25519PublicKey ec_public_key{};
    SecureBytes shared_secret;

    void wipe() {
        kem_secret_key.clear();
        shared_secret.clear();
        secure_zero(ec_secret_key);
        ec_public_key.fill(0);
    }

    // Writes the X25519 share into the second half of shared_secret
    CryptoResult compute_ec_share(std::span<const std::uint8_t> peer_public) {
        std::array<std::uint8_t, X25519_SHARED_SECRET_SIZE> ec_shared{};
        // Rejects low-order peer points
        if (crypto_scalarmult(ec_shared.data(), ec_secret_key.data(), peer_public.data()) != 0) {
            return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED, "Invalid X25519 public key");
        }
        std::copy(ec_shared.begin(), ec_shared.end(),
                  shared_secret.data.begin() + MLKEM768_SHARED_SECRET_SIZE);
        secure_zero(ec_shared);
        return CryptoResult();
    }
};

HybridKeyExchange::HybridKeyExchange()
    : impl_(std::make_unique<Impl>())
    , phase_(KeyExchangePhase::IDLE)
    , role_(KeyExchangeRole::INITIATOR) {
}

HybridKeyExchange::~HybridKeyExchange() {
    impl_->wipe();
}

CryptoResult HybridKeyExchange::initiate(std::vector<std::uint8_t>& out_public_key_bytes) {
    if (phase_ != KeyExchangePhase::IDLE) {
        return CryptoResult(CryptoError::INVALID_STATE, "Key exchange already in progress");
    }

    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    impl_->kem = open_mlkem768();
    if (!impl_->kem) {
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "ML-KEM-768 is not available");
    }

    std::vector<std::uint8_t> kem_public(MLKEM768_PUBLIC_KEY_SIZE);
    impl_->kem_secret_key = SecureBytes(MLKEM768_SECRET_KEY_SIZE);
    if (OQS_KEM_keypair(impl_->kem.get(), kem_public.data(), impl_->kem_secret_key.data_ptr()) != OQS_SUCCESS) {
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "ML-KEM-768 keypair generation failed");
    }

    if (crypto_box_keypair(impl_->ec_public_key.data(), impl_->ec_secret_key.data()) != 0) {
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "X25519 keypair generation failed");
    }

    out_public_key_bytes.clear();
    out_public_key_bytes.reserve(HYBRID_PUBLIC_KEY_SIZE);
    out_public_key_bytes.insert(out_public_key_bytes.end(), kem_public.begin(), kem_public.end());
    out_public_key_bytes.insert(out_public_key_bytes.end(),
                                impl_->ec_public_key.begin(), impl_->ec_public_key.end());

    role_ = KeyExchangeRole::INITIATOR;
    phase_ = KeyExchangePhase::AWAITING_CIPHERTEXT;
    LOG_DEBUG("Hybrid key exchange initiated ({} byte public key)", out_public_key_bytes.size());
    return CryptoResult();
}

CryptoResult HybridKeyExchange::respond(std::span<const std::uint8_t> peer_public_key_bytes,
                                        std::vector<std::uint8_t>& out_ciphertext_bytes) {
    if (phase_ != KeyExchangePhase::IDLE) {
        return CryptoResult(CryptoError::INVALID_STATE, "Key exchange already in progress");
    }

    if (peer_public_key_bytes.size() != HYBRID_PUBLIC_KEY_SIZE) {
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED,
                            "Hybrid public key has wrong length: " + std::to_string(peer_public_key_bytes.size()));
    }

    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    impl_->kem = open_mlkem768();
    if (!impl_->kem) {
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "ML-KEM-768 is not available");
    }

    auto peer_kem_public = peer_public_key_bytes.first(MLKEM768_PUBLIC_KEY_SIZE);
    auto peer_ec_public = peer_public_key_bytes.subspan(MLKEM768_PUBLIC_KEY_SIZE);

    std::vector<std::uint8_t> kem_ciphertext(MLKEM768_CIPHERTEXT_SIZE);
    impl_->shared_secret = SecureBytes(HYBRID_SHARED_SECRET_SIZE);
    if (OQS_KEM_encaps(impl_->kem.get(), kem_ciphertext.data(),
                       impl_->shared_secret.data_ptr(), peer_kem_public.data()) != OQS_SUCCESS) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED, "ML-KEM-768 encapsulation failed");
    }

    if (crypto_box_keypair(impl_->ec_public_key.data(), impl_->ec_secret_key.data()) != 0) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "X25519 keypair generation failed");
    }

    auto result = impl_->compute_ec_share(peer_ec_public);
    if (!result) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return result;
    }

    out_ciphertext_bytes.clear();
    out_ciphertext_bytes.reserve(HYBRID_CIPHERTEXT_SIZE);
    out_ciphertext_bytes.insert(out_ciphertext_bytes.end(), kem_ciphertext.begin(), kem_ciphertext.end());
    out_ciphertext_bytes.insert(out_ciphertext_bytes.end(),
                                impl_->ec_public_key.begin(), impl_->ec_public_key.end());

    // Ephemeral EC secret is no longer needed
    secure_zero(impl_->ec_secret_key);

    role_ = KeyExchangeRole::RESPONDER;
    phase_ = KeyExchangePhase::COMPLETE;
    LOG_DEBUG("Hybrid key exchange answered as responder");
    return CryptoResult();
}

CryptoResult HybridKeyExchange::complete(std::span<const std::uint8_t> ciphertext_bytes) {
    if (phase_ != KeyExchangePhase::AWAITING_CIPHERTEXT) {
        return CryptoResult(CryptoError::INVALID_STATE, "No key exchange awaiting a response");
    }

    if (ciphertext_bytes.size() != HYBRID_CIPHERTEXT_SIZE) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED,
                            "Hybrid ciphertext has wrong length: " + std::to_string(ciphertext_bytes.size()));
    }

    auto kem_ciphertext = ciphertext_bytes.first(MLKEM768_CIPHERTEXT_SIZE);
    auto peer_ec_public = ciphertext_bytes.subspan(MLKEM768_CIPHERTEXT_SIZE);

    impl_->shared_secret = SecureBytes(HYBRID_SHARED_SECRET_SIZE);
    if (OQS_KEM_decaps(impl_->kem.get(), impl_->shared_secret.data_ptr(),
                       kem_ciphertext.data(), impl_->kem_secret_key.data_ptr()) != OQS_SUCCESS) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED, "ML-KEM-768 decapsulation failed");
    }

    auto result = impl_->compute_ec_share(peer_ec_public);
    if (!result) {
        impl_->wipe();
        phase_ = KeyExchangePhase::FAILED;
        return result;
    }

    impl_->kem_secret_key.clear();
    secure_zero(impl_->ec_secret_key);

    phase_ = KeyExchangePhase::COMPLETE;
    LOG_DEBUG("Hybrid key exchange completed as initiator");
    return CryptoResult();
}

SecureBytes HybridKeyExchange::take_shared_secret() {
    if (phase_ != KeyExchangePhase::COMPLETE) {
        return SecureBytes();
    }
    return std::move(impl_->shared_secret);
}

void HybridKeyExchange::reset() {
    impl_->wipe();
    impl_->kem.reset();
    phase_ = KeyExchangePhase::IDLE;
    role_ = KeyExchangeRole::INITIATOR;
}

CryptoResult derive_session_keys(std::span<const std::uint8_t> shared_secret,
                                 SessionKeyMaterial& out_keys) {
    if (shared_secret.size() != HYBRID_SHARED_SECRET_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "Shared secret must be 64 bytes");
    }

    SecureBytes okm(SESSION_KEY_MATERIAL_SIZE);
    auto result = Hkdf::derive(shared_secret, as_bytes(SESSION_SALT), as_bytes(SESSION_INFO), okm.span());
    if (!result) {
        return result;
    }

    // [0,32) initiator->responder, [32,64) responder->initiator, [64,76) nonce base
    auto it = okm.data.begin();
    std::copy(it, it + CHACHA20_KEY_SIZE, out_keys.initiator_to_responder.begin());
    it += CHACHA20_KEY_SIZE;
    std::copy(it, it + CHACHA20_KEY_SIZE, out_keys.responder_to_initiator.begin());
    it += CHACHA20_KEY_SIZE;
    std::copy(it, it + CHACHA20_NONCE_SIZE, out_keys.nonce_base.begin());

    return CryptoResult();
}

CryptoResult derive_rotated_secret(std::span<const std::uint8_t> prior_secret,
                                   std::uint32_t generation,
                                   SecureBytes& out_secret) {
    if (prior_secret.size() != HYBRID_SHARED_SECRET_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "Prior secret must be 64 bytes");
    }

    std::vector<std::uint8_t> info(ROTATION_INFO.begin(), ROTATION_INFO.end());
    info.push_back((generation >> 24) & 0xFF);
    info.push_back((generation >> 16) & 0xFF);
    info.push_back((generation >> 8) & 0xFF);
    info.push_back(generation & 0xFF);

    out_secret = SecureBytes(HYBRID_SHARED_SECRET_SIZE);
    return Hkdf::derive(prior_secret, as_bytes(ROTATION_SALT), info, out_secret.span());
}

}
