#include "pqshare/storage/chunker.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/core/logger.hpp"
#include <algorithm>

namespace pqshare::storage {

using crypto::CryptoError;
using crypto::CryptoResult;

ChunkVerdict verify_chunk(std::span<const std::uint8_t> data, const crypto::Digest& claimed_hash) {
    auto computed = crypto::ContentHasher::hash(data);
    return crypto::hash_utils::digest_equal(computed, claimed_hash) ? ChunkVerdict::ACCEPTED
                                                                   : ChunkVerdict::REJECTED;
}

std::uint32_t chunk_count_for(std::uint64_t file_size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    if (file_size == 0) {
        return 1;
    }
    return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

std::optional<std::uint32_t> expected_chunk_length(std::uint64_t file_size, std::uint32_t chunk_size,
                                                   std::uint32_t index) {
    auto total = chunk_count_for(file_size, chunk_size);
    if (index >= total) {
        return std::nullopt;
    }
    auto offset = static_cast<std::uint64_t>(index) * chunk_size;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(chunk_size, file_size - offset));
}

std::uint32_t select_chunk_size(std::uint64_t file_size, core::NetworkMode mode,
                                std::optional<std::uint32_t> preferred) {
    std::uint32_t size = 0;
    std::uint32_t ceiling = 0;

    if (mode == core::NetworkMode::LOCAL) {
        constexpr std::uint64_t MiB = 1024 * 1024;
        if (preferred) {
            size = std::clamp(*preferred, MIN_LOCAL_CHUNK_SIZE, MAX_LOCAL_CHUNK_SIZE);
        } else if (file_size < 64 * MiB) {
            size = MIN_LOCAL_CHUNK_SIZE;
        } else if (file_size < 512 * MiB) {
            size = 2 * MIN_LOCAL_CHUNK_SIZE;
        } else {
            size = MAX_LOCAL_CHUNK_SIZE;
        }
        ceiling = MAX_LOCAL_CHUNK_SIZE;
    } else {
        size = std::clamp(preferred.value_or(DEFAULT_CHUNK_SIZE), MIN_CHUNK_SIZE, MAX_WIDE_AREA_CHUNK_SIZE);
        // Large files may exceed the wide-area ceiling to respect the chunk-count limit
        ceiling = MAX_LOCAL_CHUNK_SIZE;
    }

    while (chunk_count_for(file_size, size) > MAX_TOTAL_CHUNKS && size < ceiling) {
        size *= 2;
    }
    return size;
}

ChunkSequence::ChunkSequence(Chunker& chunker, std::uint32_t start_index)
    : chunker_(chunker)
    , position_(start_index) {
}

bool ChunkSequence::has_next() const {
    return position_ < chunker_.get_total_chunks();
}

CryptoResult ChunkSequence::next(Chunk& out) {
    if (!has_next()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Chunk sequence exhausted");
    }

    auto result = chunker_.read_chunk(position_, out);
    if (result) {
        ++position_;
    }
    return result;
}

void ChunkSequence::restart(std::uint32_t index) {
    position_ = std::min(index, chunker_.get_total_chunks());
}

Chunker::Chunker(std::filesystem::path file_path, std::uint32_t chunk_size)
    : file_path_(std::move(file_path))
    , chunk_size_(chunk_size) {
}

Chunker Chunker::from_memory(std::vector<std::uint8_t> content, std::uint32_t chunk_size) {
    Chunker chunker;
    chunker.chunk_size_ = chunk_size;
    chunker.file_size_ = content.size();
    chunker.memory_ = std::move(content);
    chunker.total_chunks_ = chunk_count_for(chunker.file_size_, chunk_size);
    chunker.opened_ = chunk_size > 0;
    return chunker;
}

CryptoResult Chunker::open() {
    if (opened_) {
        return CryptoResult();
    }

    if (chunk_size_ == 0) {
        return CryptoResult(CryptoError::INVALID_STATE, "Chunk size must be positive");
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(file_path_, ec);
    if (ec) {
        return CryptoResult(CryptoError::IO_ERROR, "Cannot stat " + file_path_.string() + ": " + ec.message());
    }

    if (size > MAX_FILE_SIZE) {
        return CryptoResult(CryptoError::IO_ERROR, "File exceeds maximum transfer size");
    }

    stream_.open(file_path_, std::ios::binary);
    if (!stream_.is_open()) {
        return CryptoResult(CryptoError::IO_ERROR, "Cannot open " + file_path_.string());
    }

    file_size_ = size;
    total_chunks_ = chunk_count_for(file_size_, chunk_size_);
    if (total_chunks_ > MAX_TOTAL_CHUNKS) {
        stream_.close();
        return CryptoResult(CryptoError::INVALID_STATE,
                            "Chunk size " + std::to_string(chunk_size_) + " yields too many chunks");
    }

    opened_ = true;
    LOG_DEBUG("Opened {} ({} bytes, {} chunks of {} bytes)",
              file_path_.filename().string(), file_size_, total_chunks_, chunk_size_);
    return CryptoResult();
}

CryptoResult Chunker::read_chunk(std::uint32_t index, Chunk& out) {
    if (!opened_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Chunker not opened");
    }

    auto length = expected_chunk_length(file_size_, chunk_size_, index);
    if (!length) {
        return CryptoResult(CryptoError::INVALID_STATE, "Chunk index " + std::to_string(index) + " out of range");
    }

    auto offset = static_cast<std::uint64_t>(index) * chunk_size_;
    out.index = index;
    out.data.resize(*length);

    if (memory_) {
        std::copy_n(memory_->begin() + static_cast<std::ptrdiff_t>(offset), *length, out.data.begin());
    } else if (*length > 0) {
        stream_.clear();
        stream_.seekg(static_cast<std::streamoff>(offset));
        stream_.read(reinterpret_cast<char*>(out.data.data()), *length);
        if (static_cast<std::uint32_t>(stream_.gcount()) != *length) {
            return CryptoResult(CryptoError::IO_ERROR,
                                "Short read for chunk " + std::to_string(index) + " of " + file_path_.string());
        }
    }

    out.hash = crypto::ContentHasher::hash(out.data);
    return CryptoResult();
}

CryptoResult Chunker::compute_file_hash(crypto::Digest& out) {
    if (!opened_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Chunker not opened");
    }

    if (memory_) {
        out = crypto::ContentHasher::hash(*memory_);
        return CryptoResult();
    }
    return crypto::ContentHasher::hash_file(file_path_, out);
}

}
