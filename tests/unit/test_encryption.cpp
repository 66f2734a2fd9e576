#include <gtest/gtest.h>
#include "pqshare/crypto/chunk_cipher.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/crypto/kdf.hpp"
#include "pqshare/crypto/random.hpp"
#include "pqshare/crypto/session_keyring.hpp"
#include "pqshare/core/utils.hpp"
#include <set>

using namespace pqshare::crypto;
using pqshare::core::utils::StringUtils;

class EncryptionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        SecureRandom::generate_bytes(key_);
        SecureRandom::generate_bytes(nonce_);
        plaintext_ = {'c', 'h', 'u', 'n', 'k', ' ', 'd', 'a', 't', 'a'};
        ad_ = chunk_associated_data(7, 160);
    }

    ChaCha20Key key_{};
    ChaCha20Nonce nonce_{};
    std::vector<std::uint8_t> plaintext_;
    std::vector<std::uint8_t> ad_;
    ChunkCipher cipher_;
};

TEST_F(EncryptionTest, Hash_KnownDigestAndStreaming) {
    std::vector<std::uint8_t> empty;
    // BLAKE2b-256 of the empty string
    EXPECT_EQ(hash_utils::digest_to_hex(ContentHasher::hash(empty)),
              "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

    std::vector<std::uint8_t> data(100000, 0x5a);
    ContentHasher hasher;
    ASSERT_TRUE(hasher.initialize());
    ASSERT_TRUE(hasher.update(std::span(data).first(40000)));
    ASSERT_TRUE(hasher.update(std::span(data).subspan(40000)));
    Digest streamed{};
    ASSERT_TRUE(hasher.finalize(streamed));
    EXPECT_TRUE(hash_utils::digest_equal(streamed, ContentHasher::hash(data)));

    auto parsed = hash_utils::digest_from_hex(hash_utils::digest_to_hex(streamed));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, streamed);
    EXPECT_FALSE(hash_utils::digest_from_hex("abcd").has_value());
}

TEST_F(EncryptionTest, Hkdf_Rfc5869Case1) {
    auto ikm = std::vector<std::uint8_t>(22, 0x0b);
    auto salt = *StringUtils::from_hex("000102030405060708090a0b0c");
    auto info = *StringUtils::from_hex("f0f1f2f3f4f5f6f7f8f9");

    std::array<std::uint8_t, 32> prk{};
    ASSERT_TRUE(Hkdf::extract(salt, ikm, prk));
    EXPECT_EQ(StringUtils::to_hex(prk), "077709362c2e32df0ddc3f0dc47bba6390b6c73bb50f9c3122ec844ad7c2b3e5");

    std::vector<std::uint8_t> okm(42);
    ASSERT_TRUE(Hkdf::expand(prk, info, okm));
    EXPECT_EQ(StringUtils::to_hex(okm),
              "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");

    std::vector<std::uint8_t> derived(42);
    ASSERT_TRUE(Hkdf::derive(ikm, salt, info, derived));
    EXPECT_EQ(derived, okm);
}

TEST_F(EncryptionTest, Hkdf_RejectsOversizedOutput) {
    std::vector<std::uint8_t> ikm(32, 1);
    std::vector<std::uint8_t> output(Hkdf::MAX_OUTPUT_SIZE + 1);
    EXPECT_FALSE(Hkdf::derive(ikm, {}, {}, output));
}

TEST_F(EncryptionTest, ChunkCipher_EncryptDecrypt) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(cipher_.encrypt(plaintext_, ad_, key_, nonce_, ciphertext));
    EXPECT_EQ(ciphertext.size(), plaintext_.size() + AEAD_TAG_SIZE);

    std::vector<std::uint8_t> decrypted;
    ASSERT_TRUE(cipher_.decrypt(ciphertext, ad_, key_, nonce_, decrypted));
    EXPECT_EQ(decrypted, plaintext_);
}

TEST_F(EncryptionTest, ChunkCipher_TamperingFailsAuthentication) {
    std::vector<std::uint8_t> ciphertext;
    ASSERT_TRUE(cipher_.encrypt(plaintext_, ad_, key_, nonce_, ciphertext));
    std::vector<std::uint8_t> decrypted;

    auto flipped = ciphertext;
    flipped[0] ^= 0x01;
    EXPECT_EQ(cipher_.decrypt(flipped, ad_, key_, nonce_, decrypted).error, CryptoError::AUTHENTICATION_FAILED);

    // Same bytes presented as a different chunk index
    auto other_ad = chunk_associated_data(8, 160);
    EXPECT_EQ(cipher_.decrypt(ciphertext, other_ad, key_, nonce_, decrypted).error,
              CryptoError::AUTHENTICATION_FAILED);

    auto other_key = key_;
    other_key[0] ^= 0x80;
    EXPECT_FALSE(cipher_.decrypt(ciphertext, ad_, other_key, nonce_, decrypted));

    std::vector<std::uint8_t> too_short(AEAD_TAG_SIZE - 1);
    EXPECT_FALSE(cipher_.decrypt(too_short, ad_, key_, nonce_, decrypted));
}

TEST_F(EncryptionTest, ChunkCipher_NonceLayout) {
    ChaCha20Nonce base{};
    auto nonce = ChunkCipher::make_nonce(base, 2, 5);
    EXPECT_EQ(StringUtils::to_hex(nonce), "000000020000000000000005");

    SecureRandom::generate_bytes(base);
    std::uint32_t generation = 0;
    std::uint64_t counter = 0;
    ChunkCipher::split_nonce(ChunkCipher::make_nonce(base, 3, 123456789), base, generation, counter);
    EXPECT_EQ(generation, 3u);
    EXPECT_EQ(counter, 123456789u);

    EXPECT_EQ(StringUtils::to_hex(chunk_associated_data(1, 258)), "0000000100000102");
}

class SessionKeyringTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        secret_ = SecureRandom::generate_bytes(HYBRID_SHARED_SECRET_SIZE);
        ASSERT_TRUE(initiator_.establish(SecureBytes(secret_.span()), KeyExchangeRole::INITIATOR, now_));
        ASSERT_TRUE(responder_.establish(SecureBytes(secret_.span()), KeyExchangeRole::RESPONDER, now_));
    }

    std::vector<std::uint8_t> transfer(SessionKeyring& from, SessionKeyring& to,
                                       const std::vector<std::uint8_t>& data,
                                       std::chrono::steady_clock::time_point at, CryptoResult* status = nullptr) {
        SealedPayload sealed;
        EXPECT_TRUE(from.seal(data, {}, sealed));
        std::vector<std::uint8_t> out;
        auto result = to.open(sealed.ciphertext, {}, sealed.nonce, at, GRACE, out);
        if (status) {
            *status = result;
        }
        return out;
    }

    static constexpr std::chrono::milliseconds GRACE{10000};
    SecureBytes secret_;
    SessionKeyring initiator_;
    SessionKeyring responder_;
    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::now();
};

TEST_F(SessionKeyringTest, Keyring_DirectionalKeys) {
    std::vector<std::uint8_t> data = {1, 2, 3, 4};
    EXPECT_EQ(transfer(initiator_, responder_, data, now_), data);
    EXPECT_EQ(transfer(responder_, initiator_, data, now_), data);

    // A peer cannot open its own traffic
    SealedPayload sealed;
    ASSERT_TRUE(initiator_.seal(data, {}, sealed));
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(initiator_.open(sealed.ciphertext, {}, sealed.nonce, now_, GRACE, out));
}

TEST_F(SessionKeyringTest, Keyring_NoncesNeverRepeat) {
    std::set<ChaCha20Nonce> nonces;
    std::vector<std::uint8_t> data(64, 0x11);
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 100; ++i) {
            SealedPayload sealed;
            ASSERT_TRUE(initiator_.seal(data, {}, sealed));
            EXPECT_TRUE(nonces.insert(sealed.nonce).second);
        }
        ASSERT_TRUE(initiator_.rotate(now_, GRACE));
        EXPECT_EQ(initiator_.get_send_counter(), 0u);
    }
    EXPECT_EQ(nonces.size(), 300u);
    EXPECT_EQ(initiator_.get_generation(), 3u);
}

TEST_F(SessionKeyringTest, Keyring_RotationAdoptedByPeer) {
    std::vector<std::uint8_t> data = {9, 8, 7};
    ASSERT_TRUE(initiator_.rotate(now_, GRACE));

    CryptoResult status;
    EXPECT_EQ(transfer(initiator_, responder_, data, now_, &status), data);
    EXPECT_TRUE(status);
    EXPECT_EQ(responder_.get_generation(), 1u);
    EXPECT_EQ(transfer(responder_, initiator_, data, now_), data);
}

TEST_F(SessionKeyringTest, Keyring_GraceWindowForPreviousGeneration) {
    std::vector<std::uint8_t> data = {5, 5, 5};
    SealedPayload in_flight;
    ASSERT_TRUE(initiator_.seal(data, {}, in_flight));

    ASSERT_TRUE(responder_.rotate(now_, GRACE));
    EXPECT_TRUE(responder_.has_previous_generation());

    std::vector<std::uint8_t> out;
    EXPECT_TRUE(responder_.open(in_flight.ciphertext, {}, in_flight.nonce, now_ + std::chrono::seconds(5), GRACE, out));
    EXPECT_EQ(out, data);

    auto late = now_ + GRACE + std::chrono::milliseconds(1);
    EXPECT_EQ(responder_.open(in_flight.ciphertext, {}, in_flight.nonce, late, GRACE, out).error,
              CryptoError::UNKNOWN_KEY_GENERATION);
    EXPECT_FALSE(responder_.has_previous_generation());
}

TEST_F(SessionKeyringTest, Keyring_ForgedFutureGenerationNotCommitted) {
    std::vector<std::uint8_t> data = {1};
    ASSERT_TRUE(initiator_.rotate(now_, GRACE));
    SealedPayload sealed;
    ASSERT_TRUE(initiator_.seal(data, {}, sealed));
    sealed.ciphertext[0] ^= 0x01;

    std::vector<std::uint8_t> out;
    EXPECT_FALSE(responder_.open(sealed.ciphertext, {}, sealed.nonce, now_, GRACE, out));
    EXPECT_EQ(responder_.get_generation(), 0u);
}

TEST_F(SessionKeyringTest, Keyring_RejectsGenerationBeyondLookahead) {
    for (std::uint32_t i = 0; i <= SessionKeyring::MAX_GENERATION_LOOKAHEAD; ++i) {
        ASSERT_TRUE(initiator_.rotate(now_, GRACE));
    }
    CryptoResult status;
    transfer(initiator_, responder_, std::vector<std::uint8_t>{1, 2}, now_, &status);
    EXPECT_EQ(status.error, CryptoError::UNKNOWN_KEY_GENERATION);
    EXPECT_EQ(responder_.get_generation(), 0u);
}

TEST_F(SessionKeyringTest, Keyring_RotationPolicy) {
    RotationPolicy policy;
    policy.interval = std::chrono::seconds(300);
    policy.byte_limit = 1000;

    EXPECT_FALSE(initiator_.needs_rotation(now_, policy));
    EXPECT_TRUE(initiator_.needs_rotation(now_ + std::chrono::seconds(300), policy));

    SealedPayload sealed;
    std::vector<std::uint8_t> data(1000, 0);
    ASSERT_TRUE(initiator_.seal(data, {}, sealed));
    EXPECT_TRUE(initiator_.needs_rotation(now_, policy));

    ASSERT_TRUE(initiator_.rotate(now_, GRACE));
    EXPECT_FALSE(initiator_.needs_rotation(now_, policy));
}

TEST_F(SessionKeyringTest, Keyring_WipeAndBadSecret) {
    initiator_.wipe();
    EXPECT_FALSE(initiator_.is_established());
    SealedPayload sealed;
    EXPECT_EQ(initiator_.seal(std::vector<std::uint8_t>{1}, {}, sealed).error, CryptoError::INVALID_STATE);

    SessionKeyring keyring;
    EXPECT_EQ(keyring.establish(SecureRandom::generate_bytes(32), KeyExchangeRole::INITIATOR, now_).error,
              CryptoError::INVALID_KEY);
}
