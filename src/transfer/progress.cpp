#include "pqshare/transfer/progress.hpp"
#include <algorithm>

namespace pqshare::transfer {

ProgressEstimator::ProgressEstimator(std::uint64_t total_bytes, core::TimePoint start)
    : total_bytes_(total_bytes)
    , baseline_bytes_(0)
    , transferred_bytes_(0)
    , start_time_(start)
    , last_update_(start)
    , smoothed_speed_(0.0)
    , average_speed_(0.0) {
}

void ProgressEstimator::set_baseline(std::uint64_t bytes_already_done) {
    baseline_bytes_ = std::min(bytes_already_done, total_bytes_);
}

void ProgressEstimator::record(std::uint64_t bytes, core::TimePoint now) {
    transferred_bytes_ += bytes;
    last_update_ = now;
    transfer_history_.emplace_back(now, bytes);
    cleanup_old_history(now);
}

bool ProgressEstimator::should_report(core::TimePoint now) {
    if (last_report_ && now - *last_report_ < SAMPLE_INTERVAL) {
        return false;
    }

    cleanup_old_history(now);

    // Speed over the retained history window
    double window_seconds = std::chrono::duration<double>(
        std::min<core::Clock::duration>(now - start_time_, HISTORY_WINDOW)).count();
    std::uint64_t window_bytes = 0;
    for (const auto& [timestamp, bytes] : transfer_history_) {
        window_bytes += bytes;
    }

    if (window_seconds > 0.0) {
        double instant = static_cast<double>(window_bytes) / window_seconds;
        smoothed_speed_ = last_report_ ? SMOOTHING * instant + (1.0 - SMOOTHING) * smoothed_speed_ : instant;
    }

    double elapsed = std::chrono::duration<double>(now - start_time_).count();
    if (elapsed > 0.0) {
        average_speed_ = static_cast<double>(transferred_bytes_) / elapsed;
    }

    last_report_ = now;
    return true;
}

ProgressSnapshot ProgressEstimator::snapshot() const {
    ProgressSnapshot snapshot;
    snapshot.total_bytes = total_bytes_;
    snapshot.bytes_done = std::min(total_bytes_, baseline_bytes_ + transferred_bytes_);
    snapshot.fraction = total_bytes_ > 0
        ? static_cast<double>(snapshot.bytes_done) / static_cast<double>(total_bytes_)
        : (transferred_bytes_ > 0 || baseline_bytes_ > 0 ? 1.0 : 0.0);
    snapshot.current_speed_bps = smoothed_speed_;
    snapshot.average_speed_bps = average_speed_;

    // Use current speed if available, fall back to average speed
    double speed = smoothed_speed_ > 0.0 ? smoothed_speed_ : average_speed_;
    if (speed > 0.0 && snapshot.bytes_done < total_bytes_) {
        double remaining = static_cast<double>(total_bytes_ - snapshot.bytes_done);
        snapshot.eta = std::chrono::milliseconds(static_cast<std::int64_t>(remaining / speed * 1000.0));
    }
    return snapshot;
}

void ProgressEstimator::cleanup_old_history(core::TimePoint now) {
    auto cutoff = now - HISTORY_WINDOW;
    while (!transfer_history_.empty() && transfer_history_.front().first < cutoff) {
        transfer_history_.pop_front();
    }
}

}
