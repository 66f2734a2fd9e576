#include "pqshare/transfer/bandwidth_limiter.hpp"
#include <algorithm>

namespace pqshare::transfer {

BandwidthLimiter::BandwidthLimiter(std::uint64_t bytes_per_second, std::uint64_t min_capacity, core::TimePoint now)
    : rate_(bytes_per_second)
    , min_capacity_(min_capacity)
    , capacity_(0)
    , available_tokens_(0)
    , last_refill_(now) {
    update_capacity();
    available_tokens_ = capacity_;
}

void BandwidthLimiter::set_rate(std::uint64_t bytes_per_second, core::TimePoint now) {
    refill(now);
    rate_ = bytes_per_second;
    update_capacity();
    available_tokens_ = std::min(available_tokens_, capacity_);
}

void BandwidthLimiter::set_min_capacity(std::uint64_t min_capacity) {
    min_capacity_ = min_capacity;
    update_capacity();
    available_tokens_ = std::min(available_tokens_, capacity_);
}

bool BandwidthLimiter::try_consume(std::uint64_t bytes, core::TimePoint now) {
    refill(now);
    if (available_tokens_ < bytes) {
        return false;
    }
    available_tokens_ -= bytes;
    return true;
}

std::chrono::microseconds BandwidthLimiter::time_until(std::uint64_t bytes, core::TimePoint now) {
    refill(now);
    if (available_tokens_ >= bytes) {
        return std::chrono::microseconds(0);
    }
    auto rate = get_rate();
    if (rate == 0) {
        return std::chrono::microseconds::max();
    }
    auto missing = bytes - available_tokens_;
    return std::chrono::microseconds((missing * 1000000 + rate - 1) / rate);
}

std::uint64_t BandwidthLimiter::get_rate() const {
    return ceiling_ > 0 ? std::min(rate_, ceiling_) : rate_;
}

void BandwidthLimiter::refill(core::TimePoint now) {
    if (now <= last_refill_) {
        return;
    }

    auto elapsed = std::chrono::duration<double>(now - last_refill_).count();
    double tokens = static_cast<double>(get_rate()) * elapsed + fractional_tokens_;
    auto whole = static_cast<std::uint64_t>(tokens);
    fractional_tokens_ = tokens - static_cast<double>(whole);

    available_tokens_ = std::min(available_tokens_ + whole, capacity_);
    if (available_tokens_ == capacity_) {
        fractional_tokens_ = 0.0;
    }
    last_refill_ = now;
}

void BandwidthLimiter::update_capacity() {
    auto burst = get_rate() * static_cast<std::uint64_t>(BURST_WINDOW.count()) / 1000;
    capacity_ = std::max(burst, min_capacity_);
}

}
