#include "pqshare/storage/assembler.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/core/logger.hpp"

namespace pqshare::storage {

Assembler::Assembler(AssemblyPlan plan, std::optional<std::filesystem::path> output_path)
    : plan_(plan)
    , output_path_(std::move(output_path))
    , received_(plan.total_chunks) {
}

Assembler::~Assembler() {
    if (part_file_.is_open()) {
        part_file_.close();
    }
}

std::optional<std::filesystem::path> Assembler::get_part_path() const {
    if (!output_path_) {
        return std::nullopt;
    }
    auto part = *output_path_;
    part += ".part";
    return part;
}

AssemblyResult Assembler::validate_plan() const {
    if (plan_.chunk_size == 0 || plan_.total_chunks == 0 || plan_.total_chunks > MAX_TOTAL_CHUNKS) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "Invalid chunk layout");
    }
    if (plan_.file_size > MAX_FILE_SIZE) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "File exceeds maximum transfer size");
    }
    if (chunk_count_for(plan_.file_size, plan_.chunk_size) != plan_.total_chunks) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "Chunk count does not match file size");
    }
    return AssemblyResult();
}

AssemblyResult Assembler::open(const ChunkBitmap* already_received) {
    if (opened_) {
        return AssemblyResult();
    }

    auto result = validate_plan();
    if (!result) {
        return result;
    }

    if (already_received && already_received->size() != plan_.total_chunks) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "Recovered bitmap has wrong size");
    }

    if (output_path_) {
        auto part_path = *get_part_path();
        std::error_code ec;

        bool recovering = already_received && !already_received->none();
        if (recovering) {
            auto existing = std::filesystem::file_size(part_path, ec);
            if (ec || existing != plan_.file_size) {
                return AssemblyResult(AssemblyError::IO_ERROR,
                                      "Part file missing or truncated: " + part_path.string());
            }
        } else {
            if (output_path_->has_parent_path()) {
                std::filesystem::create_directories(output_path_->parent_path(), ec);
            }
            std::ofstream create(part_path, std::ios::binary | std::ios::trunc);
            if (!create.is_open()) {
                return AssemblyResult(AssemblyError::IO_ERROR, "Cannot create " + part_path.string());
            }
            create.close();
            std::filesystem::resize_file(part_path, plan_.file_size, ec);
            if (ec) {
                return AssemblyResult(AssemblyError::IO_ERROR, "Cannot size part file: " + ec.message());
            }
        }

        part_file_.open(part_path, std::ios::binary | std::ios::in | std::ios::out);
        if (!part_file_.is_open()) {
            return AssemblyResult(AssemblyError::IO_ERROR, "Cannot open " + part_path.string());
        }
    } else if (already_received && !already_received->none()) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "In-memory assembler cannot recover chunks");
    }

    if (already_received) {
        received_ = *already_received;
        for (auto index : received_.present()) {
            bytes_received_ += expected_chunk_length(plan_.file_size, plan_.chunk_size, index).value_or(0);
        }
    }

    opened_ = true;
    return AssemblyResult();
}

AddChunkResult Assembler::add_chunk(std::uint32_t index, std::span<const std::uint8_t> data,
                                    const crypto::Digest& claimed_hash) {
    auto length = expected_chunk_length(plan_.file_size, plan_.chunk_size, index);
    if (!opened_ || !length) {
        return AddChunkResult::OUT_OF_RANGE;
    }

    if (received_.test(index)) {
        return AddChunkResult::DUPLICATE;
    }

    if (data.size() != *length || verify_chunk(data, claimed_hash) != ChunkVerdict::ACCEPTED) {
        return AddChunkResult::REJECTED;
    }

    if (part_file_.is_open()) {
        part_file_.seekp(static_cast<std::streamoff>(static_cast<std::uint64_t>(index) * plan_.chunk_size));
        part_file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!part_file_) {
            part_file_.clear();
            LOG_ERROR("Failed writing chunk {} to part file", index);
            return AddChunkResult::IO_ERROR;
        }
    } else {
        memory_chunks_.emplace(index, std::vector<std::uint8_t>(data.begin(), data.end()));
    }

    received_.set(index);
    bytes_received_ += data.size();
    return AddChunkResult::STORED;
}

AssemblyResult Assembler::flush() {
    if (part_file_.is_open()) {
        part_file_.flush();
        if (!part_file_) {
            part_file_.clear();
            return AssemblyResult(AssemblyError::IO_ERROR, "Failed to flush part file");
        }
    }
    return AssemblyResult();
}

AssemblyResult Assembler::assemble(std::vector<std::uint8_t>& out_file_bytes) {
    if (output_path_) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "File-backed assembler must be finalized");
    }

    if (!received_.all()) {
        return AssemblyResult(AssemblyError::INCOMPLETE_TRANSFER,
                              std::to_string(received_.size() - received_.count()) + " chunks missing");
    }

    out_file_bytes.clear();
    out_file_bytes.reserve(plan_.file_size);
    for (const auto& [index, data] : memory_chunks_) {
        out_file_bytes.insert(out_file_bytes.end(), data.begin(), data.end());
    }

    auto computed = crypto::ContentHasher::hash(out_file_bytes);
    if (out_file_bytes.size() != plan_.file_size ||
        !crypto::hash_utils::digest_equal(computed, plan_.file_hash)) {
        out_file_bytes.clear();
        return AssemblyResult(AssemblyError::CORRUPTED_TRANSFER, "Full-file hash mismatch");
    }

    return AssemblyResult();
}

AssemblyResult Assembler::finalize() {
    if (!output_path_) {
        return AssemblyResult(AssemblyError::INVALID_PLAN, "In-memory assembler has no output file");
    }

    if (!received_.all()) {
        return AssemblyResult(AssemblyError::INCOMPLETE_TRANSFER,
                              std::to_string(received_.size() - received_.count()) + " chunks missing");
    }

    auto result = flush();
    if (!result) {
        return result;
    }
    part_file_.close();

    auto part_path = *get_part_path();
    crypto::Digest computed{};
    auto hash_result = crypto::ContentHasher::hash_file(part_path, computed);
    if (!hash_result) {
        return AssemblyResult(AssemblyError::IO_ERROR, hash_result.message);
    }

    if (!crypto::hash_utils::digest_equal(computed, plan_.file_hash)) {
        LOG_ERROR("Full-file hash mismatch for {}", output_path_->filename().string());
        discard();
        return AssemblyResult(AssemblyError::CORRUPTED_TRANSFER, "Full-file hash mismatch");
    }

    std::error_code ec;
    std::filesystem::rename(part_path, *output_path_, ec);
    if (ec) {
        return AssemblyResult(AssemblyError::IO_ERROR, "Cannot move part file into place: " + ec.message());
    }

    LOG_INFO("Assembled {} ({} bytes)", output_path_->filename().string(), plan_.file_size);
    return AssemblyResult();
}

void Assembler::discard() {
    if (part_file_.is_open()) {
        part_file_.close();
    }
    memory_chunks_.clear();
    if (auto part = get_part_path()) {
        std::error_code ec;
        std::filesystem::remove(*part, ec);
    }
}

}
