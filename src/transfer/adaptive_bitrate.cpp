#include "pqshare/transfer/adaptive_bitrate.hpp"
#include "pqshare/core/logger.hpp"
#include "pqshare/storage/chunker.hpp"
#include <algorithm>

namespace pqshare::transfer {

namespace {
    constexpr std::uint64_t KiB = 1024;
    constexpr std::uint64_t MiB = 1024 * 1024;

    constexpr double HEALTHY_RTT_RATIO = 1.5;
    constexpr double CONGESTED_RTT_RATIO = 1.5;
    constexpr double LOSS_THRESHOLD = 0.01;
    constexpr double HEALTHY_BUFFER = 0.8;
    constexpr double CONGESTED_BUFFER = 0.9;
}

const char* to_string(NetworkCondition condition) {
    switch (condition) {
        case NetworkCondition::HEALTHY: return "healthy";
        case NetworkCondition::NEUTRAL: return "neutral";
        case NetworkCondition::CONGESTED: return "congested";
    }
    return "unknown";
}

AdaptiveBitrateController::AdaptiveBitrateController(core::NetworkMode mode, core::BitrateMode bitrate_mode)
    : config_(initial_config(mode, bitrate_mode)) {
}

AdaptiveConfig AdaptiveBitrateController::initial_config(core::NetworkMode mode, core::BitrateMode bitrate_mode) {
    AdaptiveConfig config;
    config.mode = mode;
    config.bitrate_mode = bitrate_mode;
    config.min_rate = 64 * KiB;
    config.max_concurrency = 10;

    if (mode == core::NetworkMode::LOCAL) {
        config.chunk_size = static_cast<std::uint32_t>(1 * MiB);
        config.target_rate = 100 * MiB;
        config.max_rate = 1000 * MiB;
        config.concurrency = 8;
    } else {
        config.chunk_size = static_cast<std::uint32_t>(64 * KiB);
        config.target_rate = 5 * MiB;
        config.max_rate = 50 * MiB;
        config.concurrency = 3;
    }
    return config;
}

const std::vector<std::uint32_t>& AdaptiveBitrateController::chunk_tiers(core::NetworkMode mode) {
    static const std::vector<std::uint32_t> wide_area = {
        16 * 1024, 32 * 1024, 64 * 1024, 128 * 1024, 256 * 1024
    };
    static const std::vector<std::uint32_t> local = {
        1024 * 1024, 2 * 1024 * 1024, 4 * 1024 * 1024
    };
    return mode == core::NetworkMode::LOCAL ? local : wide_area;
}

NetworkCondition AdaptiveBitrateController::report(const NetworkSample& sample, core::TimePoint now) {
    samples_.push_back(sample);
    if (samples_.size() > WINDOW_SIZE) {
        samples_.pop_front();
    }

    if (sample.rtt.count() > 0 && (baseline_rtt_.count() == 0 || sample.rtt < baseline_rtt_)) {
        baseline_rtt_ = sample.rtt;
    }

    auto analysis = analyze();
    switch (analysis.condition) {
        case NetworkCondition::HEALTHY:
            consecutive_healthy_++;
            if (consecutive_healthy_ >= HEALTHY_EVALUATIONS_TO_GROW && adjustment_allowed(now)) {
                increase(now);
            }
            break;
        case NetworkCondition::CONGESTED:
            consecutive_healthy_ = 0;
            if (adjustment_allowed(now)) {
                decrease(analysis.severity, now);
            }
            break;
        case NetworkCondition::NEUTRAL:
            consecutive_healthy_ = 0;
            break;
    }

    return analysis.condition;
}

WindowAnalysis AdaptiveBitrateController::analyze() const {
    WindowAnalysis analysis;
    if (samples_.empty()) {
        return analysis;
    }

    auto span = std::min(samples_.size(), EVALUATION_SPAN);
    auto begin = samples_.end() - static_cast<std::ptrdiff_t>(span);

    double rtt_sum = 0.0;
    double jitter_sum = 0.0;
    double loss_sum = 0.0;
    double buffer_sum = 0.0;
    for (auto it = begin; it != samples_.end(); ++it) {
        rtt_sum += static_cast<double>(it->rtt.count());
        jitter_sum += static_cast<double>(it->jitter.count());
        loss_sum += it->loss_rate;
        buffer_sum += it->buffer_occupancy;
    }

    auto count = static_cast<double>(span);
    double avg_rtt = rtt_sum / count;
    double avg_jitter = jitter_sum / count;
    analysis.avg_rtt = std::chrono::microseconds(static_cast<std::int64_t>(avg_rtt));
    analysis.avg_jitter = std::chrono::microseconds(static_cast<std::int64_t>(avg_jitter));
    analysis.avg_loss = loss_sum / count;
    analysis.avg_buffer = buffer_sum / count;
    analysis.rtt_ratio = baseline_rtt_.count() > 0 ? avg_rtt / static_cast<double>(baseline_rtt_.count()) : 1.0;

    bool congested = analysis.rtt_ratio > CONGESTED_RTT_RATIO ||
                     analysis.avg_loss >= LOSS_THRESHOLD ||
                     avg_jitter > avg_rtt / 2.0 ||
                     analysis.avg_buffer > CONGESTED_BUFFER;

    bool healthy = analysis.rtt_ratio < HEALTHY_RTT_RATIO &&
                   analysis.avg_loss < LOSS_THRESHOLD &&
                   avg_jitter < avg_rtt / 3.0 &&
                   analysis.avg_buffer < HEALTHY_BUFFER;

    // A zero RTT window carries no jitter signal
    if (avg_rtt <= 0.0) {
        congested = analysis.avg_loss >= LOSS_THRESHOLD || analysis.avg_buffer > CONGESTED_BUFFER;
        healthy = analysis.avg_loss < LOSS_THRESHOLD && analysis.avg_buffer < HEALTHY_BUFFER;
    }

    if (congested) {
        analysis.condition = NetworkCondition::CONGESTED;
    } else if (healthy) {
        analysis.condition = NetworkCondition::HEALTHY;
    } else {
        analysis.condition = NetworkCondition::NEUTRAL;
    }

    analysis.severity = std::clamp(analysis.avg_loss * 5.0 +
                                   (analysis.rtt_ratio - 1.0) * 0.3 +
                                   (analysis.avg_buffer > 0.8 ? 0.3 : 0.0),
                                   0.0, 1.0);
    return analysis;
}

std::chrono::microseconds AdaptiveBitrateController::send_interval(std::uint32_t chunk_size) const {
    if (config_.target_rate == 0 || config_.concurrency == 0) {
        return std::chrono::microseconds(0);
    }
    double seconds = static_cast<double>(chunk_size) / static_cast<double>(config_.target_rate) /
                     static_cast<double>(config_.concurrency);
    return std::chrono::microseconds(static_cast<std::int64_t>(seconds * 1e6));
}

std::uint32_t AdaptiveBitrateController::chunk_size_for(std::uint64_t file_size) const {
    return storage::select_chunk_size(file_size, config_.mode, config_.chunk_size);
}

void AdaptiveBitrateController::align_chunk_tier(std::uint32_t chunk_size) {
    const auto& tiers = chunk_tiers(config_.mode);
    auto above = std::upper_bound(tiers.begin(), tiers.end(), chunk_size);
    config_.chunk_size = above == tiers.begin() ? tiers.front() : *(above - 1);
}

void AdaptiveBitrateController::reset() {
    config_ = initial_config(config_.mode, config_.bitrate_mode);
    samples_.clear();
    baseline_rtt_ = std::chrono::microseconds(0);
    consecutive_healthy_ = 0;
    last_adjustment_.reset();
}

bool AdaptiveBitrateController::adjustment_allowed(core::TimePoint now) const {
    return !last_adjustment_ || now - *last_adjustment_ >= ADJUSTMENT_INTERVAL;
}

double AdaptiveBitrateController::increase_factor() const {
    switch (config_.bitrate_mode) {
        case core::BitrateMode::AGGRESSIVE: return 1.25;
        case core::BitrateMode::CONSERVATIVE: return 1.05;
        case core::BitrateMode::BALANCED: return 1.10;
    }
    return 1.10;
}

void AdaptiveBitrateController::increase(core::TimePoint now) {
    auto raised = static_cast<std::uint64_t>(static_cast<double>(config_.target_rate) * increase_factor());
    config_.target_rate = std::min(config_.max_rate, std::max(raised, config_.target_rate + 1));

    const auto& tiers = chunk_tiers(config_.mode);
    auto next = std::upper_bound(tiers.begin(), tiers.end(), config_.chunk_size);
    if (next != tiers.end()) {
        config_.chunk_size = *next;
    }

    config_.concurrency = std::min(config_.max_concurrency, config_.concurrency + 1);
    consecutive_healthy_ = 0;
    last_adjustment_ = now;
    adjustments_++;

    LOG_DEBUG("Bitrate increased: rate={} chunk={} concurrency={}",
              config_.target_rate, config_.chunk_size, config_.concurrency);
}

void AdaptiveBitrateController::decrease(double severity, core::TimePoint now) {
    // 20% cut at zero severity, 50% at full severity
    double factor = 0.8 - 0.3 * severity;
    auto lowered = static_cast<std::uint64_t>(static_cast<double>(config_.target_rate) * factor);
    config_.target_rate = std::max(config_.min_rate, lowered);

    const auto& tiers = chunk_tiers(config_.mode);
    auto current = std::lower_bound(tiers.begin(), tiers.end(), config_.chunk_size);
    if (current != tiers.begin()) {
        config_.chunk_size = *(current - 1);
    }

    config_.concurrency = config_.concurrency > 1 ? config_.concurrency - 1 : 1;
    last_adjustment_ = now;
    adjustments_++;

    LOG_DEBUG("Bitrate decreased (severity {:.2f}): rate={} chunk={} concurrency={}",
              severity, config_.target_rate, config_.chunk_size, config_.concurrency);
}

}
