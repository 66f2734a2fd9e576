#pragma once

#include "pqshare/crypto/crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pqshare::crypto {

// Streaming BLAKE2b-256 used for chunk and whole-file digests
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(Digest& output);

    bool is_initialized() const { return initialized_; }

    static Digest hash(std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Digest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

// Constant-time comparison
bool digest_equal(const Digest& a, const Digest& b);

std::string digest_to_hex(const Digest& digest);
std::optional<Digest> digest_from_hex(const std::string& hex);

}

}
