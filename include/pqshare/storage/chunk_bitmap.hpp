#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pqshare::storage {

// One bit per chunk index, LSB-first within each byte. Bits past size() are always zero.
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(std::uint32_t bit_count);

    static std::optional<ChunkBitmap> from_bytes(std::uint32_t bit_count, std::span<const std::uint8_t> bytes);

    std::uint32_t size() const { return bit_count_; }
    std::uint32_t count() const { return set_count_; }

    bool test(std::uint32_t index) const;
    // Returns true when the bit was newly set
    bool set(std::uint32_t index);
    void reset(std::uint32_t index);

    bool all() const { return set_count_ == bit_count_; }
    bool none() const { return set_count_ == 0; }
    double fraction() const;

    std::vector<std::uint32_t> missing() const;
    std::vector<std::uint32_t> present() const;

    // Indices set here and clear in other; both bitmaps must have equal size
    std::vector<std::uint32_t> difference(const ChunkBitmap& other) const;
    void merge(const ChunkBitmap& other);

    const std::vector<std::uint8_t>& bytes() const { return bits_; }

    bool operator==(const ChunkBitmap& other) const {
        return bit_count_ == other.bit_count_ && bits_ == other.bits_;
    }

private:
    std::uint32_t bit_count_ = 0;
    std::uint32_t set_count_ = 0;
    std::vector<std::uint8_t> bits_;
};

}
