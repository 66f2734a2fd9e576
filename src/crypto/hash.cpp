#include "pqshare/crypto/hash.hpp"
#include "pqshare/crypto/random.hpp"
#include "pqshare/core/utils.hpp"
#include <sodium.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace pqshare::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

ContentHasher::~ContentHasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

CryptoResult ContentHasher::initialize() {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium unavailable");
    }

    if (crypto_generichash_init(&impl_->state, nullptr, 0, DIGEST_SIZE) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to initialize hasher");
    }

    initialized_ = true;
    return CryptoResult();
}

CryptoResult ContentHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }

    return CryptoResult();
}

CryptoResult ContentHasher::finalize(Digest& output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), output.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Digest ContentHasher::hash(std::span<const std::uint8_t> data) {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium unavailable");
    }

    Digest result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

CryptoResult ContentHasher::hash_file(const std::filesystem::path& file_path, Digest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::IO_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    ContentHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        auto bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return CryptoResult(CryptoError::IO_ERROR, "Read error while hashing " + file_path.string());
    }

    return hasher.finalize(output);
}

namespace hash_utils {

bool digest_equal(const Digest& a, const Digest& b) {
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string digest_to_hex(const Digest& digest) {
    return core::utils::StringUtils::to_hex(digest);
}

std::optional<Digest> digest_from_hex(const std::string& hex) {
    if (hex.size() != DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    auto bytes = core::utils::StringUtils::from_hex(hex);
    if (!bytes) {
        return std::nullopt;
    }

    Digest digest;
    std::copy(bytes->begin(), bytes->end(), digest.begin());
    return digest;
}

}

}
