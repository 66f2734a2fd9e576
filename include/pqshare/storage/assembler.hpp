#pragma once

#include "pqshare/storage/chunk_bitmap.hpp"
#include "pqshare/storage/chunker.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>

namespace pqshare::storage {

struct AssemblyPlan {
    std::uint32_t total_chunks = 0;
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::uint64_t file_size = 0;
    crypto::Digest file_hash{};
};

enum class AddChunkResult {
    STORED,
    DUPLICATE,
    REJECTED,       // hash or length mismatch, nothing stored
    OUT_OF_RANGE,
    IO_ERROR
};

enum class AssemblyError {
    NONE = 0,
    INCOMPLETE_TRANSFER,
    CORRUPTED_TRANSFER,
    INVALID_PLAN,
    IO_ERROR
};

struct AssemblyResult {
    AssemblyError error;
    std::string message;

    AssemblyResult(AssemblyError err = AssemblyError::NONE, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == AssemblyError::NONE; }
    operator bool() const { return success(); }
};

// Accepts verified chunks in any order. With an output path, chunk bytes are
// written straight into "<output>.part" at their offsets, which doubles as the
// durable chunk store for resume; otherwise they are held in memory.
class Assembler {
public:
    explicit Assembler(AssemblyPlan plan, std::optional<std::filesystem::path> output_path = std::nullopt);
    ~Assembler();

    Assembler(const Assembler&) = delete;
    Assembler& operator=(const Assembler&) = delete;

    // `already_received` marks chunks recovered from an existing part file
    AssemblyResult open(const ChunkBitmap* already_received = nullptr);

    AddChunkResult add_chunk(std::uint32_t index, std::span<const std::uint8_t> data,
                             const crypto::Digest& claimed_hash);

    bool has_chunk(std::uint32_t index) const { return received_.test(index); }
    bool is_complete() const { return received_.all(); }
    const ChunkBitmap& get_received() const { return received_; }
    const AssemblyPlan& get_plan() const { return plan_; }
    std::uint64_t get_bytes_received() const { return bytes_received_; }

    AssemblyResult flush();

    // In-memory assembly; verifies completeness and the full-file hash
    AssemblyResult assemble(std::vector<std::uint8_t>& out_file_bytes);

    // File-backed assembly; verifies and renames the part file into place
    AssemblyResult finalize();

    // Drops any partial output
    void discard();

    std::optional<std::filesystem::path> get_part_path() const;
    const std::optional<std::filesystem::path>& get_output_path() const { return output_path_; }

private:
    AssemblyResult validate_plan() const;

    AssemblyPlan plan_;
    std::optional<std::filesystem::path> output_path_;
    ChunkBitmap received_;
    std::map<std::uint32_t, std::vector<std::uint8_t>> memory_chunks_;
    std::fstream part_file_;
    std::uint64_t bytes_received_ = 0;
    bool opened_ = false;
};

}
