#include <gtest/gtest.h>
#include "pqshare/transfer/adaptive_bitrate.hpp"
#include "pqshare/transfer/bandwidth_limiter.hpp"
#include "pqshare/transfer/progress.hpp"

using namespace pqshare::transfer;
using pqshare::core::BitrateMode;
using pqshare::core::NetworkMode;
using pqshare::core::TimePoint;
using namespace std::chrono_literals;

class AdaptiveBitrateTest : public ::testing::Test {
protected:
    static NetworkSample healthy() {
        NetworkSample sample;
        sample.rtt = 20ms;
        sample.jitter = 1ms;
        sample.buffer_occupancy = 0.3;
        return sample;
    }

    static NetworkSample lossy(double loss) {
        auto sample = healthy();
        sample.loss_rate = loss;
        return sample;
    }

    TimePoint now_ = pqshare::core::Clock::now();
};

TEST_F(AdaptiveBitrateTest, Initial_ConfigPerNetworkMode) {
    auto wan = AdaptiveBitrateController::initial_config(NetworkMode::WIDE_AREA, BitrateMode::BALANCED);
    EXPECT_EQ(wan.chunk_size, 64u * 1024);
    EXPECT_EQ(wan.target_rate, 5u * 1024 * 1024);
    EXPECT_EQ(wan.concurrency, 3u);
    EXPECT_EQ(wan.min_rate, 64u * 1024);

    auto lan = AdaptiveBitrateController::initial_config(NetworkMode::LOCAL, BitrateMode::BALANCED);
    EXPECT_EQ(lan.chunk_size, 1024u * 1024);
    EXPECT_EQ(lan.target_rate, 100u * 1024 * 1024);
    EXPECT_EQ(lan.concurrency, 8u);

    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    EXPECT_EQ(controller.send_interval(64 * 1024).count(), 4166);
}

TEST_F(AdaptiveBitrateTest, Healthy_GrowsAfterThreeEvaluations) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    EXPECT_EQ(controller.report(healthy(), now_), NetworkCondition::HEALTHY);
    EXPECT_EQ(controller.report(healthy(), now_ + 10ms), NetworkCondition::HEALTHY);
    EXPECT_EQ(controller.get_config().concurrency, 3u);

    controller.report(healthy(), now_ + 20ms);
    const auto& config = controller.get_config();
    EXPECT_NEAR(static_cast<double>(config.target_rate), 5.0 * 1024 * 1024 * 1.10, 2.0);
    EXPECT_EQ(config.chunk_size, 128u * 1024);
    EXPECT_EQ(config.concurrency, 4u);
    EXPECT_EQ(controller.get_consecutive_healthy(), 0u);
}

TEST_F(AdaptiveBitrateTest, Healthy_RespectsAdjustmentInterval) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    for (int i = 0; i < 3; ++i) {
        controller.report(healthy(), now_);
    }
    ASSERT_EQ(controller.get_adjustment_count(), 1u);

    for (int i = 0; i < 3; ++i) {
        controller.report(healthy(), now_ + 100ms);
    }
    EXPECT_EQ(controller.get_adjustment_count(), 1u);

    controller.report(healthy(), now_ + 600ms);
    EXPECT_EQ(controller.get_adjustment_count(), 2u);
    EXPECT_EQ(controller.get_config().chunk_size, 256u * 1024);
}

TEST_F(AdaptiveBitrateTest, Growth_FactorFollowsBitrateMode) {
    auto grow_once = [this](BitrateMode mode) {
        AdaptiveBitrateController controller(NetworkMode::WIDE_AREA, mode);
        for (int i = 0; i < 3; ++i) {
            controller.report(healthy(), now_);
        }
        return static_cast<double>(controller.get_config().target_rate) / (5.0 * 1024 * 1024);
    };
    EXPECT_NEAR(grow_once(BitrateMode::AGGRESSIVE), 1.25, 1e-6);
    EXPECT_NEAR(grow_once(BitrateMode::BALANCED), 1.10, 1e-6);
    EXPECT_NEAR(grow_once(BitrateMode::CONSERVATIVE), 1.05, 1e-6);
}

TEST_F(AdaptiveBitrateTest, Congestion_CutsBySeverity) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    EXPECT_EQ(controller.report(lossy(0.05), now_), NetworkCondition::CONGESTED);

    // severity = 0.05 * 5 = 0.25 -> factor 0.725
    const auto& config = controller.get_config();
    EXPECT_NEAR(static_cast<double>(config.target_rate), 5.0 * 1024 * 1024 * 0.725, 2.0);
    EXPECT_EQ(config.chunk_size, 32u * 1024);
    EXPECT_EQ(config.concurrency, 2u);
}

TEST_F(AdaptiveBitrateTest, Congestion_ThreeSamplesCutEachTime) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    std::uint64_t previous = controller.get_config().target_rate;
    const std::uint32_t chunks[] = {32u * 1024, 16u * 1024, 16u * 1024};
    const std::uint32_t concurrency[] = {2u, 1u, 1u};

    auto last = now_;
    for (int i = 0; i < 3; ++i) {
        last = now_ + i * 500ms;
        EXPECT_EQ(controller.report(lossy(0.05), last), NetworkCondition::CONGESTED);
        const auto& config = controller.get_config();
        EXPECT_LT(config.target_rate, previous);
        EXPECT_NEAR(static_cast<double>(config.target_rate) / static_cast<double>(previous), 0.725, 1e-6);
        EXPECT_EQ(config.chunk_size, chunks[i]);
        EXPECT_EQ(config.concurrency, concurrency[i]);
        previous = config.target_rate;
    }
    EXPECT_EQ(controller.get_adjustment_count(), 3u);

    // The window recovers to healthy, but nothing moves until 500ms after the last cut
    for (int k = 1; k <= 12; ++k) {
        controller.report(healthy(), last + k * 10ms);
    }
    EXPECT_EQ(controller.get_config().target_rate, previous);
    EXPECT_EQ(controller.get_adjustment_count(), 3u);
    EXPECT_GE(controller.get_consecutive_healthy(), AdaptiveBitrateController::HEALTHY_EVALUATIONS_TO_GROW);

    EXPECT_EQ(controller.report(healthy(), last + 500ms), NetworkCondition::HEALTHY);
    EXPECT_GT(controller.get_config().target_rate, previous);
    EXPECT_EQ(controller.get_adjustment_count(), 4u);
}

TEST_F(AdaptiveBitrateTest, ChunkTier_ForNewSessions) {
    AdaptiveBitrateController wan(NetworkMode::WIDE_AREA);
    EXPECT_EQ(wan.chunk_size_for(10 * 1024 * 1024), 64u * 1024);

    // Congestion lowers the tier handed to the next session
    wan.report(lossy(0.05), now_);
    EXPECT_EQ(wan.chunk_size_for(10 * 1024 * 1024), 32u * 1024);

    AdaptiveBitrateController lan(NetworkMode::LOCAL);
    EXPECT_EQ(lan.chunk_size_for(10 * 1024 * 1024), 1024u * 1024);

    // A resumed session keeps its size; the controller follows the nearest tier below it
    wan.align_chunk_tier(128 * 1024);
    EXPECT_EQ(wan.get_config().chunk_size, 128u * 1024);
    wan.align_chunk_tier(100 * 1024);
    EXPECT_EQ(wan.get_config().chunk_size, 64u * 1024);
    wan.align_chunk_tier(1024);
    EXPECT_EQ(wan.get_config().chunk_size, 16u * 1024);
}

TEST_F(AdaptiveBitrateTest, Congestion_RttInflation) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    controller.report(healthy(), now_);

    auto slow = healthy();
    slow.rtt = 80ms;
    for (int i = 0; i < 9; ++i) {
        controller.report(slow, now_ + 1ms);
    }
    auto analysis = controller.analyze();
    EXPECT_EQ(analysis.condition, NetworkCondition::CONGESTED);
    EXPECT_GT(analysis.rtt_ratio, 1.5);
    EXPECT_EQ(controller.get_baseline_rtt(), 20ms);
}

TEST_F(AdaptiveBitrateTest, Congestion_FloorsAtMinimums) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    auto t = now_;
    for (int i = 0; i < 40; ++i) {
        controller.report(lossy(0.5), t);
        t += 500ms;
    }
    const auto& config = controller.get_config();
    EXPECT_EQ(config.target_rate, config.min_rate);
    EXPECT_EQ(config.chunk_size, 16u * 1024);
    EXPECT_EQ(config.concurrency, 1u);
}

TEST_F(AdaptiveBitrateTest, Neutral_ResetsHealthyStreak) {
    AdaptiveBitrateController controller(NetworkMode::LOCAL);
    controller.report(healthy(), now_);
    controller.report(healthy(), now_);

    // Window jitter averages 8ms against a 20ms RTT: neither healthy nor congested
    auto borderline = healthy();
    borderline.jitter = 22ms;
    EXPECT_EQ(controller.report(borderline, now_), NetworkCondition::NEUTRAL);
    EXPECT_EQ(controller.get_consecutive_healthy(), 0u);
    EXPECT_EQ(controller.get_adjustment_count(), 0u);
}

TEST_F(AdaptiveBitrateTest, Window_IsBounded) {
    AdaptiveBitrateController controller(NetworkMode::WIDE_AREA);
    for (int i = 0; i < 120; ++i) {
        controller.report(lossy(0.005), now_);
    }
    EXPECT_EQ(controller.get_sample_count(), AdaptiveBitrateController::WINDOW_SIZE);

    controller.reset();
    EXPECT_EQ(controller.get_sample_count(), 0u);
    EXPECT_EQ(controller.get_config().target_rate, 5u * 1024 * 1024);
}

class BandwidthLimiterTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t MiB = 1024 * 1024;
    TimePoint now_ = pqshare::core::Clock::now();
};

TEST_F(BandwidthLimiterTest, Limiter_BurstAndRefill) {
    BandwidthLimiter limiter(MiB, 65536, now_);
    EXPECT_EQ(limiter.get_capacity(), MiB / 10);

    EXPECT_TRUE(limiter.try_consume(100000, now_));
    EXPECT_FALSE(limiter.try_consume(10000, now_));
    EXPECT_EQ(limiter.time_until(10000, now_).count(), 4905);

    EXPECT_TRUE(limiter.try_consume(10000, now_ + 5ms));
}

TEST_F(BandwidthLimiterTest, Limiter_CapacityHoldsOneChunk) {
    BandwidthLimiter limiter(10000, 65536, now_);
    EXPECT_EQ(limiter.get_capacity(), 65536u);
    EXPECT_TRUE(limiter.try_consume(65536, now_));
    EXPECT_FALSE(limiter.try_consume(1, now_));
}

TEST_F(BandwidthLimiterTest, Limiter_CeilingCapsRate) {
    BandwidthLimiter limiter(10 * MiB, 1024, now_);
    limiter.set_ceiling(MiB);
    EXPECT_EQ(limiter.get_rate(), MiB);

    limiter.set_rate(512 * 1024, now_);
    EXPECT_EQ(limiter.get_rate(), 512u * 1024);

    limiter.set_ceiling(0);
    limiter.set_rate(0, now_);
    ASSERT_TRUE(limiter.try_consume(limiter.get_available_tokens(), now_));
    EXPECT_EQ(limiter.time_until(1, now_ + 1s), std::chrono::microseconds::max());
}

class ProgressEstimatorTest : public ::testing::Test {
protected:
    TimePoint start_ = pqshare::core::Clock::now();
};

TEST_F(ProgressEstimatorTest, Progress_BaselineExcludedFromSpeed) {
    ProgressEstimator estimator(1000, start_);
    estimator.set_baseline(400);
    estimator.record(100, start_ + 1s);

    ASSERT_TRUE(estimator.should_report(start_ + 1s));
    auto snapshot = estimator.snapshot();
    EXPECT_EQ(snapshot.bytes_done, 500u);
    EXPECT_DOUBLE_EQ(snapshot.fraction, 0.5);
    EXPECT_DOUBLE_EQ(snapshot.current_speed_bps, 100.0);
    EXPECT_DOUBLE_EQ(snapshot.average_speed_bps, 100.0);
    EXPECT_EQ(snapshot.eta.count(), 5000);

    EXPECT_FALSE(estimator.should_report(start_ + 1100ms));
    EXPECT_TRUE(estimator.should_report(start_ + 1250ms));
}

TEST_F(ProgressEstimatorTest, Progress_CompleteAndEmpty) {
    ProgressEstimator estimator(100, start_);
    estimator.record(150, start_ + 1s);
    auto snapshot = estimator.snapshot();
    EXPECT_EQ(snapshot.bytes_done, 100u);
    EXPECT_DOUBLE_EQ(snapshot.fraction, 1.0);
    EXPECT_EQ(snapshot.eta.count(), 0);

    ProgressEstimator empty(0, start_);
    EXPECT_DOUBLE_EQ(empty.snapshot().fraction, 0.0);
}
