#pragma once

#include "pqshare/core/types.hpp"
#include "pqshare/crypto/crypto_types.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace pqshare::storage {

constexpr std::uint32_t MIN_CHUNK_SIZE = 16 * 1024;
constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr std::uint32_t MAX_WIDE_AREA_CHUNK_SIZE = 256 * 1024;
constexpr std::uint32_t MIN_LOCAL_CHUNK_SIZE = 1024 * 1024;
constexpr std::uint32_t MAX_LOCAL_CHUNK_SIZE = 4 * 1024 * 1024;
constexpr std::uint32_t MAX_TOTAL_CHUNKS = 100000;
constexpr std::uint64_t MAX_FILE_SIZE = 4ULL * 1024 * 1024 * 1024;

struct Chunk {
    std::uint32_t index = 0;
    std::vector<std::uint8_t> data;
    crypto::Digest hash{};
};

enum class ChunkVerdict {
    ACCEPTED,
    REJECTED
};

ChunkVerdict verify_chunk(std::span<const std::uint8_t> data, const crypto::Digest& claimed_hash);

// A zero-byte file is carried as a single empty chunk
std::uint32_t chunk_count_for(std::uint64_t file_size, std::uint32_t chunk_size);

// Expected length of chunk `index`, or nullopt when the index is out of range
std::optional<std::uint32_t> expected_chunk_length(std::uint64_t file_size, std::uint32_t chunk_size,
                                                   std::uint32_t index);

// Without a preference, local paths get 1-4 MiB scaled by file size and
// wide-area paths get DEFAULT_CHUNK_SIZE. A preferred tier is clamped to the
// mode's range. Either is raised until the chunk count fits MAX_TOTAL_CHUNKS.
std::uint32_t select_chunk_size(std::uint64_t file_size, core::NetworkMode mode,
                                std::optional<std::uint32_t> preferred = std::nullopt);

class Chunker;

// Lazy, finite, restartable view over a Chunker
class ChunkSequence {
public:
    ChunkSequence(Chunker& chunker, std::uint32_t start_index);

    bool has_next() const;
    crypto::CryptoResult next(Chunk& out);
    void restart(std::uint32_t index);
    std::uint32_t position() const { return position_; }

private:
    Chunker& chunker_;
    std::uint32_t position_;
};

class Chunker {
public:
    Chunker(std::filesystem::path file_path, std::uint32_t chunk_size);
    static Chunker from_memory(std::vector<std::uint8_t> content, std::uint32_t chunk_size);

    Chunker(Chunker&&) = default;
    Chunker& operator=(Chunker&&) = default;

    crypto::CryptoResult open();
    bool is_open() const { return opened_; }

    std::uint64_t get_file_size() const { return file_size_; }
    std::uint32_t get_chunk_size() const { return chunk_size_; }
    std::uint32_t get_total_chunks() const { return total_chunks_; }
    const std::filesystem::path& get_path() const { return file_path_; }

    crypto::CryptoResult read_chunk(std::uint32_t index, Chunk& out);
    crypto::CryptoResult compute_file_hash(crypto::Digest& out);

    ChunkSequence split(std::uint32_t start_index = 0) { return ChunkSequence(*this, start_index); }

private:
    Chunker() = default;

    std::filesystem::path file_path_;
    std::optional<std::vector<std::uint8_t>> memory_;
    std::ifstream stream_;
    std::uint32_t chunk_size_ = DEFAULT_CHUNK_SIZE;
    std::uint64_t file_size_ = 0;
    std::uint32_t total_chunks_ = 0;
    bool opened_ = false;
};

}
