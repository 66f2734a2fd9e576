#include "pqshare/storage/chunk_bitmap.hpp"
#include <bit>
#include <stdexcept>
#include <string>

namespace pqshare::storage {

ChunkBitmap::ChunkBitmap(std::uint32_t bit_count)
    : bit_count_(bit_count)
    , set_count_(0)
    , bits_((static_cast<size_t>(bit_count) + 7) / 8, 0) {
}

std::optional<ChunkBitmap> ChunkBitmap::from_bytes(std::uint32_t bit_count, std::span<const std::uint8_t> bytes) {
    ChunkBitmap bitmap(bit_count);
    if (bytes.size() != bitmap.bits_.size()) {
        return std::nullopt;
    }

    // Reject set padding bits in the trailing byte
    auto tail_bits = bit_count % 8;
    if (tail_bits != 0 && (bytes.back() >> tail_bits) != 0) {
        return std::nullopt;
    }

    bitmap.bits_.assign(bytes.begin(), bytes.end());
    for (auto byte : bitmap.bits_) {
        bitmap.set_count_ += static_cast<std::uint32_t>(std::popcount(byte));
    }
    return bitmap;
}

bool ChunkBitmap::test(std::uint32_t index) const {
    if (index >= bit_count_) {
        return false;
    }
    return (bits_[index / 8] >> (index % 8)) & 0x01;
}

bool ChunkBitmap::set(std::uint32_t index) {
    if (index >= bit_count_) {
        throw std::out_of_range("Chunk index " + std::to_string(index) + " outside bitmap");
    }

    auto mask = static_cast<std::uint8_t>(1u << (index % 8));
    auto& byte = bits_[index / 8];
    if (byte & mask) {
        return false;
    }
    byte |= mask;
    ++set_count_;
    return true;
}

void ChunkBitmap::reset(std::uint32_t index) {
    if (index >= bit_count_) {
        return;
    }

    auto mask = static_cast<std::uint8_t>(1u << (index % 8));
    auto& byte = bits_[index / 8];
    if (byte & mask) {
        byte &= static_cast<std::uint8_t>(~mask);
        --set_count_;
    }
}

double ChunkBitmap::fraction() const {
    if (bit_count_ == 0) {
        return 0.0;
    }
    return static_cast<double>(set_count_) / static_cast<double>(bit_count_);
}

std::vector<std::uint32_t> ChunkBitmap::missing() const {
    std::vector<std::uint32_t> indices;
    indices.reserve(bit_count_ - set_count_);
    for (std::uint32_t i = 0; i < bit_count_; ++i) {
        if (!test(i)) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::uint32_t> ChunkBitmap::present() const {
    std::vector<std::uint32_t> indices;
    indices.reserve(set_count_);
    for (std::uint32_t i = 0; i < bit_count_; ++i) {
        if (test(i)) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::uint32_t> ChunkBitmap::difference(const ChunkBitmap& other) const {
    if (other.bit_count_ != bit_count_) {
        throw std::invalid_argument("Bitmap sizes differ");
    }

    std::vector<std::uint32_t> indices;
    for (std::uint32_t i = 0; i < bit_count_; ++i) {
        if (test(i) && !other.test(i)) {
            indices.push_back(i);
        }
    }
    return indices;
}

void ChunkBitmap::merge(const ChunkBitmap& other) {
    if (other.bit_count_ != bit_count_) {
        throw std::invalid_argument("Bitmap sizes differ");
    }

    set_count_ = 0;
    for (size_t i = 0; i < bits_.size(); ++i) {
        bits_[i] |= other.bits_[i];
        set_count_ += static_cast<std::uint32_t>(std::popcount(bits_[i]));
    }
}

}
