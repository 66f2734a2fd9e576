#pragma once

#include "pqshare/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace pqshare::transfer {

struct NetworkSample {
    std::chrono::microseconds rtt{0};
    double loss_rate = 0.0;             // 0..1
    std::chrono::microseconds jitter{0};
    double buffer_occupancy = 0.0;      // 0..1
};

enum class NetworkCondition {
    HEALTHY,
    NEUTRAL,
    CONGESTED
};

const char* to_string(NetworkCondition condition);

struct AdaptiveConfig {
    std::uint32_t chunk_size = 0;
    std::uint64_t target_rate = 0;      // bytes per second
    std::uint64_t min_rate = 0;
    std::uint64_t max_rate = 0;
    std::uint32_t concurrency = 1;
    std::uint32_t max_concurrency = 10;
    core::NetworkMode mode = core::NetworkMode::WIDE_AREA;
    core::BitrateMode bitrate_mode = core::BitrateMode::BALANCED;
};

struct WindowAnalysis {
    NetworkCondition condition = NetworkCondition::NEUTRAL;
    double severity = 0.0;
    double rtt_ratio = 1.0;
    double avg_loss = 0.0;
    double avg_buffer = 0.0;
    std::chrono::microseconds avg_rtt{0};
    std::chrono::microseconds avg_jitter{0};
};

// AIMD over a sliding window of samples. Only this class mutates AdaptiveConfig.
class AdaptiveBitrateController {
public:
    static constexpr std::size_t WINDOW_SIZE = 50;
    static constexpr std::size_t EVALUATION_SPAN = 10;
    static constexpr std::uint32_t HEALTHY_EVALUATIONS_TO_GROW = 3;
    static constexpr std::chrono::milliseconds ADJUSTMENT_INTERVAL{500};

    explicit AdaptiveBitrateController(core::NetworkMode mode,
                                       core::BitrateMode bitrate_mode = core::BitrateMode::BALANCED);

    static AdaptiveConfig initial_config(core::NetworkMode mode, core::BitrateMode bitrate_mode);
    static const std::vector<std::uint32_t>& chunk_tiers(core::NetworkMode mode);

    // Records the sample, evaluates the window and adjusts when allowed
    NetworkCondition report(const NetworkSample& sample, core::TimePoint now);

    WindowAnalysis analyze() const;

    const AdaptiveConfig& get_config() const { return config_; }
    std::chrono::microseconds get_baseline_rtt() const { return baseline_rtt_; }
    std::uint32_t get_consecutive_healthy() const { return consecutive_healthy_; }
    std::size_t get_sample_count() const { return samples_.size(); }
    std::uint64_t get_adjustment_count() const { return adjustments_; }

    // Gap between chunk sends: chunk_size / target_rate / concurrency
    std::chrono::microseconds send_interval(std::uint32_t chunk_size) const;

    // Chunk size for a new session at the current tier
    std::uint32_t chunk_size_for(std::uint64_t file_size) const;

    // Moves the tier to the one a session actually runs at; a resumed
    // session keeps the chunk size its bitmap was built on
    void align_chunk_tier(std::uint32_t chunk_size);

    void reset();

private:
    bool adjustment_allowed(core::TimePoint now) const;
    void increase(core::TimePoint now);
    void decrease(double severity, core::TimePoint now);
    double increase_factor() const;

    AdaptiveConfig config_;
    std::deque<NetworkSample> samples_;
    std::chrono::microseconds baseline_rtt_{0};
    std::uint32_t consecutive_healthy_ = 0;
    std::optional<core::TimePoint> last_adjustment_;
    std::uint64_t adjustments_ = 0;
};

}
