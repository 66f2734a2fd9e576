#include <gtest/gtest.h>
#include "pqshare/storage/assembler.hpp"
#include "pqshare/storage/chunk_bitmap.hpp"
#include "pqshare/storage/chunker.hpp"
#include "pqshare/crypto/hash.hpp"
#include "pqshare/crypto/random.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>

using namespace pqshare::storage;
using namespace pqshare;

class FileStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::SecureRandom::initialize());
        test_dir_ = std::filesystem::temp_directory_path() / "pqshare_storage_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::vector<std::uint8_t> random_content(size_t size) {
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<std::uint8_t> data(size);
        for (auto& byte : data) {
            byte = static_cast<std::uint8_t>(dist(rng));
        }
        return data;
    }

    std::filesystem::path write_file(const std::string& name, const std::vector<std::uint8_t>& content) {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return path;
    }

    AssemblyPlan plan_for(const std::vector<std::uint8_t>& content, std::uint32_t chunk_size) {
        AssemblyPlan plan;
        plan.file_size = content.size();
        plan.chunk_size = chunk_size;
        plan.total_chunks = chunk_count_for(content.size(), chunk_size);
        plan.file_hash = crypto::ContentHasher::hash(content);
        return plan;
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileStorageTest, ChunkBitmap_SetTestAndCount) {
    ChunkBitmap bitmap(10);
    EXPECT_TRUE(bitmap.none());
    EXPECT_TRUE(bitmap.set(3));
    EXPECT_FALSE(bitmap.set(3));
    EXPECT_TRUE(bitmap.set(9));
    EXPECT_EQ(bitmap.count(), 2u);
    EXPECT_TRUE(bitmap.test(9));
    EXPECT_FALSE(bitmap.test(10));
    EXPECT_THROW(bitmap.set(10), std::out_of_range);

    bitmap.reset(3);
    EXPECT_EQ(bitmap.count(), 1u);
    EXPECT_DOUBLE_EQ(bitmap.fraction(), 0.1);
    EXPECT_EQ(bitmap.missing().size(), 9u);
    EXPECT_EQ(bitmap.present(), std::vector<std::uint32_t>{9});
}

TEST_F(FileStorageTest, ChunkBitmap_FromBytesRejectsPadding) {
    ChunkBitmap bitmap(10);
    bitmap.set(0);
    bitmap.set(8);
    auto copy = ChunkBitmap::from_bytes(10, bitmap.bytes());
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(*copy, bitmap);
    EXPECT_EQ(copy->count(), 2u);

    std::vector<std::uint8_t> padded = {0x01, 0x04};
    EXPECT_FALSE(ChunkBitmap::from_bytes(10, padded).has_value());
    EXPECT_FALSE(ChunkBitmap::from_bytes(10, std::vector<std::uint8_t>{0x01}).has_value());
}

TEST_F(FileStorageTest, ChunkBitmap_DifferenceAndMerge) {
    ChunkBitmap local(5);
    ChunkBitmap peer(5);
    local.set(0);
    local.set(1);
    local.set(2);
    peer.set(1);
    peer.set(4);

    EXPECT_EQ(local.difference(peer), (std::vector<std::uint32_t>{0, 2}));
    local.merge(peer);
    EXPECT_EQ(local.count(), 4u);
    EXPECT_EQ(local.missing(), std::vector<std::uint32_t>{3});
    EXPECT_THROW(local.merge(ChunkBitmap(6)), std::invalid_argument);
}

TEST_F(FileStorageTest, ChunkLayout_CountsAndLengths) {
    EXPECT_EQ(chunk_count_for(0, 65536), 1u);
    EXPECT_EQ(chunk_count_for(65536, 65536), 1u);
    EXPECT_EQ(chunk_count_for(65537, 65536), 2u);

    EXPECT_EQ(expected_chunk_length(0, 65536, 0), 0u);
    EXPECT_EQ(expected_chunk_length(100000, 65536, 1), 100000u - 65536u);
    EXPECT_FALSE(expected_chunk_length(100000, 65536, 2).has_value());
}

TEST_F(FileStorageTest, SelectChunkSize_RespectsModeBounds) {
    using pqshare::core::NetworkMode;
    constexpr std::uint64_t MiB = 1024 * 1024;

    EXPECT_EQ(select_chunk_size(10 * MiB, NetworkMode::WIDE_AREA), DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(select_chunk_size(10 * MiB, NetworkMode::WIDE_AREA, 4096), MIN_CHUNK_SIZE);
    EXPECT_EQ(select_chunk_size(10 * MiB, NetworkMode::WIDE_AREA, 8 * MiB), MAX_WIDE_AREA_CHUNK_SIZE);

    EXPECT_EQ(select_chunk_size(10 * MiB, NetworkMode::LOCAL), MIN_LOCAL_CHUNK_SIZE);
    EXPECT_EQ(select_chunk_size(100 * MiB, NetworkMode::LOCAL), 2 * MIN_LOCAL_CHUNK_SIZE);
    EXPECT_EQ(select_chunk_size(1024 * MiB, NetworkMode::LOCAL), MAX_LOCAL_CHUNK_SIZE);

    // 4 GiB at 16 KiB would need far more than the chunk limit
    auto size = select_chunk_size(MAX_FILE_SIZE, NetworkMode::WIDE_AREA, MIN_CHUNK_SIZE);
    EXPECT_LE(chunk_count_for(MAX_FILE_SIZE, size), MAX_TOTAL_CHUNKS);
}

TEST_F(FileStorageTest, Chunker_ReadsEveryChunkWithHash) {
    auto content = random_content(200000);
    auto path = write_file("source.bin", content);

    Chunker chunker(path, MIN_CHUNK_SIZE);
    ASSERT_TRUE(chunker.open());
    EXPECT_EQ(chunker.get_file_size(), content.size());
    EXPECT_EQ(chunker.get_total_chunks(), chunk_count_for(content.size(), MIN_CHUNK_SIZE));

    std::vector<std::uint8_t> rebuilt;
    auto sequence = chunker.split();
    Chunk chunk;
    while (sequence.has_next()) {
        ASSERT_TRUE(sequence.next(chunk));
        EXPECT_EQ(verify_chunk(chunk.data, chunk.hash), ChunkVerdict::ACCEPTED);
        rebuilt.insert(rebuilt.end(), chunk.data.begin(), chunk.data.end());
    }
    EXPECT_EQ(rebuilt, content);
    EXPECT_FALSE(sequence.next(chunk));

    crypto::Digest file_hash{};
    ASSERT_TRUE(chunker.compute_file_hash(file_hash));
    EXPECT_TRUE(crypto::hash_utils::digest_equal(file_hash, crypto::ContentHasher::hash(content)));
}

TEST_F(FileStorageTest, Chunker_SequenceRestartsAtIndex) {
    auto content = random_content(5 * MIN_CHUNK_SIZE);
    auto chunker = Chunker::from_memory(content, MIN_CHUNK_SIZE);

    auto sequence = chunker.split(3);
    Chunk chunk;
    ASSERT_TRUE(sequence.next(chunk));
    EXPECT_EQ(chunk.index, 3u);

    sequence.restart(1);
    ASSERT_TRUE(sequence.next(chunk));
    EXPECT_EQ(chunk.index, 1u);
    EXPECT_TRUE(std::equal(chunk.data.begin(), chunk.data.end(), content.begin() + MIN_CHUNK_SIZE));
}

TEST_F(FileStorageTest, Chunker_EmptyFileIsOneEmptyChunk) {
    auto path = write_file("empty.bin", {});
    Chunker chunker(path, MIN_CHUNK_SIZE);
    ASSERT_TRUE(chunker.open());
    EXPECT_EQ(chunker.get_total_chunks(), 1u);

    Chunk chunk;
    ASSERT_TRUE(chunker.read_chunk(0, chunk));
    EXPECT_TRUE(chunk.data.empty());
}

TEST_F(FileStorageTest, Chunker_MissingFileFails) {
    Chunker chunker(test_dir_ / "missing.bin", MIN_CHUNK_SIZE);
    auto result = chunker.open();
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, crypto::CryptoError::IO_ERROR);

    Chunk chunk;
    EXPECT_FALSE(chunker.read_chunk(0, chunk));
}

TEST_F(FileStorageTest, VerifyChunk_DetectsTampering) {
    auto content = random_content(1000);
    auto hash = crypto::ContentHasher::hash(content);
    EXPECT_EQ(verify_chunk(content, hash), ChunkVerdict::ACCEPTED);

    content[500] ^= 0x01;
    EXPECT_EQ(verify_chunk(content, hash), ChunkVerdict::REJECTED);
}

TEST_F(FileStorageTest, Assembler_OutOfOrderInMemory) {
    auto content = random_content(6 * MIN_CHUNK_SIZE + 123);
    auto chunker = Chunker::from_memory(content, MIN_CHUNK_SIZE);

    Assembler assembler(plan_for(content, MIN_CHUNK_SIZE));
    ASSERT_TRUE(assembler.open());

    std::vector<std::uint32_t> order = {6, 2, 0, 5, 1, 4, 3};
    for (auto index : order) {
        Chunk chunk;
        ASSERT_TRUE(chunker.read_chunk(index, chunk));
        EXPECT_EQ(assembler.add_chunk(index, chunk.data, chunk.hash), AddChunkResult::STORED);
        EXPECT_EQ(assembler.add_chunk(index, chunk.data, chunk.hash), AddChunkResult::DUPLICATE);
    }
    EXPECT_TRUE(assembler.is_complete());
    EXPECT_EQ(assembler.get_bytes_received(), content.size());

    std::vector<std::uint8_t> output;
    ASSERT_TRUE(assembler.assemble(output));
    EXPECT_EQ(output, content);
}

TEST_F(FileStorageTest, Assembler_RejectsBadChunks) {
    auto content = random_content(3 * MIN_CHUNK_SIZE);
    auto chunker = Chunker::from_memory(content, MIN_CHUNK_SIZE);
    Assembler assembler(plan_for(content, MIN_CHUNK_SIZE));
    ASSERT_TRUE(assembler.open());

    Chunk chunk;
    ASSERT_TRUE(chunker.read_chunk(1, chunk));
    auto tampered = chunk.data;
    tampered[0] ^= 0xFF;
    EXPECT_EQ(assembler.add_chunk(1, tampered, chunk.hash), AddChunkResult::REJECTED);
    EXPECT_FALSE(assembler.has_chunk(1));

    auto truncated = chunk.data;
    truncated.pop_back();
    EXPECT_EQ(assembler.add_chunk(1, truncated, crypto::ContentHasher::hash(truncated)), AddChunkResult::REJECTED);
    EXPECT_EQ(assembler.add_chunk(7, chunk.data, chunk.hash), AddChunkResult::OUT_OF_RANGE);
}

TEST_F(FileStorageTest, Assembler_IncompleteAndCorrupted) {
    auto content = random_content(2 * MIN_CHUNK_SIZE);
    auto chunker = Chunker::from_memory(content, MIN_CHUNK_SIZE);

    Assembler incomplete(plan_for(content, MIN_CHUNK_SIZE));
    ASSERT_TRUE(incomplete.open());
    Chunk chunk;
    ASSERT_TRUE(chunker.read_chunk(0, chunk));
    incomplete.add_chunk(0, chunk.data, chunk.hash);
    std::vector<std::uint8_t> output;
    EXPECT_EQ(incomplete.assemble(output).error, AssemblyError::INCOMPLETE_TRANSFER);

    // Every chunk verifies but the declared whole-file hash does not
    auto plan = plan_for(content, MIN_CHUNK_SIZE);
    plan.file_hash[0] ^= 0x01;
    Assembler corrupted(plan);
    ASSERT_TRUE(corrupted.open());
    for (std::uint32_t i = 0; i < 2; ++i) {
        ASSERT_TRUE(chunker.read_chunk(i, chunk));
        EXPECT_EQ(corrupted.add_chunk(i, chunk.data, chunk.hash), AddChunkResult::STORED);
    }
    EXPECT_EQ(corrupted.assemble(output).error, AssemblyError::CORRUPTED_TRANSFER);
}

TEST_F(FileStorageTest, Assembler_InvalidPlan) {
    AssemblyPlan plan;
    plan.file_size = 100000;
    plan.chunk_size = MIN_CHUNK_SIZE;
    plan.total_chunks = 3;
    Assembler assembler(plan);
    EXPECT_EQ(assembler.open().error, AssemblyError::INVALID_PLAN);
}

TEST_F(FileStorageTest, Assembler_FileBackedFinalizeAndRecover) {
    auto content = random_content(4 * MIN_CHUNK_SIZE + 17);
    auto chunker = Chunker::from_memory(content, MIN_CHUNK_SIZE);
    auto plan = plan_for(content, MIN_CHUNK_SIZE);
    auto output = test_dir_ / "out" / "received.bin";

    ChunkBitmap received;
    {
        Assembler first(plan, output);
        ASSERT_TRUE(first.open());
        for (std::uint32_t i : {0u, 2u, 4u}) {
            Chunk chunk;
            ASSERT_TRUE(chunker.read_chunk(i, chunk));
            ASSERT_EQ(first.add_chunk(i, chunk.data, chunk.hash), AddChunkResult::STORED);
        }
        ASSERT_TRUE(first.flush());
        received = first.get_received();
        ASSERT_TRUE(first.get_part_path().has_value());
        EXPECT_TRUE(std::filesystem::exists(*first.get_part_path()));
    }

    // A restarted receiver picks the part file back up
    Assembler second(plan, output);
    ASSERT_TRUE(second.open(&received));
    EXPECT_EQ(second.get_received().count(), 3u);
    for (auto index : second.get_received().missing()) {
        Chunk chunk;
        ASSERT_TRUE(chunker.read_chunk(index, chunk));
        ASSERT_EQ(second.add_chunk(index, chunk.data, chunk.hash), AddChunkResult::STORED);
    }
    ASSERT_TRUE(second.finalize());
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "out" / "received.bin.part"));

    std::ifstream file(output, std::ios::binary);
    std::vector<std::uint8_t> written((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(written, content);
}

TEST_F(FileStorageTest, Assembler_RecoverWithoutPartFileFails) {
    auto content = random_content(2 * MIN_CHUNK_SIZE);
    ChunkBitmap received(2);
    received.set(0);

    Assembler assembler(plan_for(content, MIN_CHUNK_SIZE), test_dir_ / "never_written.bin");
    EXPECT_EQ(assembler.open(&received).error, AssemblyError::IO_ERROR);
}

TEST_F(FileStorageTest, Assembler_DiscardRemovesPartFile) {
    auto content = random_content(MIN_CHUNK_SIZE);
    auto output = test_dir_ / "discarded.bin";
    Assembler assembler(plan_for(content, MIN_CHUNK_SIZE), output);
    ASSERT_TRUE(assembler.open());
    ASSERT_TRUE(std::filesystem::exists(*assembler.get_part_path()));

    assembler.discard();
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "discarded.bin.part"));
    EXPECT_FALSE(std::filesystem::exists(output));
}
