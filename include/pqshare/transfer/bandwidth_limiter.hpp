#pragma once

#include "pqshare/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>

namespace pqshare::transfer {

// Token bucket on an injected clock. The bucket always holds at least one
// chunk so a single send can never be starved by a small capacity.
class BandwidthLimiter {
public:
    static constexpr std::chrono::milliseconds BURST_WINDOW{100};

    BandwidthLimiter(std::uint64_t bytes_per_second, std::uint64_t min_capacity, core::TimePoint now);

    void set_rate(std::uint64_t bytes_per_second, core::TimePoint now);
    void set_min_capacity(std::uint64_t min_capacity);

    // A zero cap disables the ceiling
    void set_ceiling(std::uint64_t bytes_per_second) { ceiling_ = bytes_per_second; }

    bool try_consume(std::uint64_t bytes, core::TimePoint now);

    // Time until `bytes` tokens are available
    std::chrono::microseconds time_until(std::uint64_t bytes, core::TimePoint now);

    std::uint64_t get_rate() const;
    std::uint64_t get_capacity() const { return capacity_; }
    std::uint64_t get_available_tokens() const { return available_tokens_; }

private:
    void refill(core::TimePoint now);
    void update_capacity();

    std::uint64_t rate_;
    std::uint64_t ceiling_ = 0;
    std::uint64_t min_capacity_;
    std::uint64_t capacity_;
    std::uint64_t available_tokens_;
    core::TimePoint last_refill_;
    double fractional_tokens_ = 0.0;
};

}
