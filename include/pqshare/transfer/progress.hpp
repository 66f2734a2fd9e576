#pragma once

#include "pqshare/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

namespace pqshare::transfer {

struct ProgressSnapshot {
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_done = 0;
    double fraction = 0.0;
    double current_speed_bps = 0.0;     // smoothed
    double average_speed_bps = 0.0;
    std::chrono::milliseconds eta{0};   // zero when unknown or done
};

// Speed and ETA for one session. Bytes restored on resume count toward
// progress but not toward speed.
class ProgressEstimator {
public:
    static constexpr std::chrono::seconds HISTORY_WINDOW{5};
    static constexpr std::chrono::milliseconds SAMPLE_INTERVAL{250};
    static constexpr double SMOOTHING = 0.3;

    ProgressEstimator(std::uint64_t total_bytes, core::TimePoint start);

    void set_baseline(std::uint64_t bytes_already_done);
    void record(std::uint64_t bytes, core::TimePoint now);

    // True at most once per SAMPLE_INTERVAL; refreshes the smoothed speed
    bool should_report(core::TimePoint now);

    ProgressSnapshot snapshot() const;

private:
    void cleanup_old_history(core::TimePoint now);

    std::uint64_t total_bytes_;
    std::uint64_t baseline_bytes_;
    std::uint64_t transferred_bytes_;
    core::TimePoint start_time_;
    core::TimePoint last_update_;
    std::optional<core::TimePoint> last_report_;
    std::deque<std::pair<core::TimePoint, std::uint64_t>> transfer_history_;
    double smoothed_speed_;
    double average_speed_;
};

}
