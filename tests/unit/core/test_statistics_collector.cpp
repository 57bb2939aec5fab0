/**
 * @file test_statistics_collector.cpp
 * @brief Unit tests for batch throughput statistics
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_engine/core/statistics_collector.h>

#include <thread>

namespace kcenon::transfer_engine::test {

class StatisticsCollectorTest : public ::testing::Test {
protected:
    static auto fast_config() -> statistics_collector::config {
        statistics_collector::config cfg;
        cfg.rate_sample_interval = duration{0};
        cfg.min_eta_update_interval = duration{0};
        return cfg;
    }
};

TEST_F(StatisticsCollectorTest, InitialState) {
    statistics_collector stats;
    EXPECT_FALSE(stats.is_active());
    EXPECT_EQ(stats.get_bytes_transferred(), 0u);
    EXPECT_FALSE(stats.get_eta().has_value());
}

TEST_F(StatisticsCollectorTest, StartAndStop) {
    statistics_collector stats;
    stats.start(1000);
    EXPECT_TRUE(stats.is_active());
    stats.stop();
    EXPECT_FALSE(stats.is_active());
}

TEST_F(StatisticsCollectorTest, ProgressIsMonotonic) {
    statistics_collector stats(fast_config());
    stats.start(1000);

    stats.record_progress(300);
    stats.record_progress(200);
    EXPECT_EQ(stats.get_bytes_transferred(), 300u);

    stats.record_progress(700);
    EXPECT_EQ(stats.get_bytes_transferred(), 700u);
}

TEST_F(StatisticsCollectorTest, UnitCounters) {
    statistics_collector stats;
    stats.start();
    stats.record_unit(transfer_status::ok);
    stats.record_unit(transfer_status::ok);
    stats.record_unit(transfer_status::skipped);
    stats.record_unit(transfer_status::error);

    auto snap = stats.get_snapshot();
    EXPECT_EQ(snap.units_ok, 2u);
    EXPECT_EQ(snap.units_skipped, 1u);
    EXPECT_EQ(snap.units_failed, 1u);
}

TEST_F(StatisticsCollectorTest, UnknownTotalHasNoEta) {
    statistics_collector stats(fast_config());
    stats.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stats.record_progress(500);

    auto snap = stats.get_snapshot();
    EXPECT_FALSE(snap.total_bytes.has_value());
    EXPECT_FALSE(snap.estimated_remaining.has_value());
}

TEST_F(StatisticsCollectorTest, EtaWithKnownTotal) {
    statistics_collector stats(fast_config());
    stats.start(10000);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    stats.record_progress(5000);

    auto eta = stats.get_eta();
    ASSERT_TRUE(eta.has_value());
    EXPECT_GT(eta->count(), 0);
    EXPECT_GT(stats.get_average_rate(), 0.0);
}

TEST_F(StatisticsCollectorTest, EtaIsZeroWhenComplete) {
    statistics_collector stats(fast_config());
    stats.start(100);
    stats.record_progress(100);

    auto eta = stats.get_eta();
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(eta->count(), 0);
}

TEST_F(StatisticsCollectorTest, TotalCanBecomeKnown) {
    statistics_collector stats(fast_config());
    stats.start();
    EXPECT_FALSE(stats.get_snapshot().total_bytes.has_value());

    stats.set_total_bytes(4096);
    EXPECT_EQ(stats.get_snapshot().total_bytes, std::optional<uint64_t>(4096));
}

TEST_F(StatisticsCollectorTest, ElapsedFreezesAfterStop) {
    statistics_collector stats;
    stats.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stats.stop();

    auto first = stats.get_elapsed();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(stats.get_elapsed(), first);
}

TEST_F(StatisticsCollectorTest, Reset) {
    statistics_collector stats;
    stats.start(100);
    stats.record_progress(50);
    stats.record_unit(transfer_status::ok);
    stats.reset();

    auto snap = stats.get_snapshot();
    EXPECT_EQ(snap.bytes_transferred, 0u);
    EXPECT_EQ(snap.units_ok, 0u);
    EXPECT_FALSE(snap.total_bytes.has_value());
}

}  // namespace kcenon::transfer_engine::test
