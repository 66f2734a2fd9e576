#include <benchmark/benchmark.h>
#include "pqshare/crypto/chunk_cipher.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/crypto/hybrid_key_exchange.hpp"
#include "pqshare/crypto/random.hpp"
#include "pqshare/crypto/session_keyring.hpp"
#include <chrono>
#include <vector>

using namespace pqshare::crypto;

class CryptoBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        (void)state;
        SecureRandom::initialize();
        now_ = std::chrono::steady_clock::now();

        HybridKeyExchange initiator;
        HybridKeyExchange responder;
        std::vector<std::uint8_t> public_key;
        std::vector<std::uint8_t> ciphertext;
        initiator.initiate(public_key);
        responder.respond(public_key, ciphertext);
        initiator.complete(ciphertext);

        sender_.establish(initiator.take_shared_secret(), KeyExchangeRole::INITIATOR, now_);
        receiver_.establish(responder.take_shared_secret(), KeyExchangeRole::RESPONDER, now_);

        chunk_.resize(64 * 1024);
        SecureRandom::generate_bytes(chunk_);
        aad_ = chunk_associated_data(7, 1000);
        key_ = ChaCha20Key{};
        base_ = ChaCha20Nonce{};
    }

    void TearDown(const ::benchmark::State& state) override {
        (void)state;
        sender_.wipe();
        receiver_.wipe();
    }

protected:
    std::chrono::steady_clock::time_point now_;
    SessionKeyring sender_;
    SessionKeyring receiver_;
    ChunkCipher cipher_;
    ChaCha20Key key_{};
    ChaCha20Nonce base_{};
    std::vector<std::uint8_t> chunk_;
    std::vector<std::uint8_t> aad_;
};

// Both halves of the hybrid exchange plus key derivation
BENCHMARK_F(CryptoBenchmarkFixture, HybridKeyExchange_Full)(benchmark::State& state) {
    for (auto _ : state) {
        HybridKeyExchange initiator;
        HybridKeyExchange responder;
        std::vector<std::uint8_t> public_key;
        std::vector<std::uint8_t> ciphertext;
        initiator.initiate(public_key);
        responder.respond(public_key, ciphertext);
        initiator.complete(ciphertext);

        SessionKeyMaterial keys;
        auto secret = initiator.take_shared_secret();
        benchmark::DoNotOptimize(derive_session_keys(secret.span(), keys));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(CryptoBenchmarkFixture, KeyRotation)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(sender_.rotate(now_, std::chrono::milliseconds(10000)));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(CryptoBenchmarkFixture, ChunkCipher_Encrypt64KB)(benchmark::State& state) {
    std::vector<std::uint8_t> ciphertext;
    std::uint64_t counter = 0;
    for (auto _ : state) {
        auto nonce = ChunkCipher::make_nonce(base_, 0, counter++);
        benchmark::DoNotOptimize(cipher_.encrypt(chunk_, aad_, key_, nonce, ciphertext));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(chunk_.size()));
}

BENCHMARK_F(CryptoBenchmarkFixture, ChunkCipher_Decrypt64KB)(benchmark::State& state) {
    auto nonce = ChunkCipher::make_nonce(base_, 0, 1);
    std::vector<std::uint8_t> ciphertext;
    cipher_.encrypt(chunk_, aad_, key_, nonce, ciphertext);

    std::vector<std::uint8_t> plaintext;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cipher_.decrypt(ciphertext, aad_, key_, nonce, plaintext));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(chunk_.size()));
}

BENCHMARK_F(CryptoBenchmarkFixture, Keyring_SealOpen64KB)(benchmark::State& state) {
    std::vector<std::uint8_t> plaintext;
    for (auto _ : state) {
        SealedPayload sealed;
        sender_.seal(chunk_, aad_, sealed);
        benchmark::DoNotOptimize(receiver_.open(sealed.ciphertext, aad_, sealed.nonce, now_,
                                                std::chrono::milliseconds(10000), plaintext));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(chunk_.size()));
}

static void ContentHash(benchmark::State& state) {
    SecureRandom::initialize();
    std::vector<std::uint8_t> data(static_cast<std::size_t>(state.range(0)));
    SecureRandom::generate_bytes(data);
    for (auto _ : state) {
        benchmark::DoNotOptimize(ContentHasher::hash(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(ContentHash)->Range(1024, 4 * 1024 * 1024);

static void SessionIdGeneration(benchmark::State& state) {
    SecureRandom::initialize();
    for (auto _ : state) {
        benchmark::DoNotOptimize(SecureRandom::generate_session_id());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(SessionIdGeneration);

BENCHMARK_MAIN();
