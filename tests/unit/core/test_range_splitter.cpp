/**
 * @file test_range_splitter.cpp
 * @brief Unit tests for byte-range splitting
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_engine/core/range_splitter.h>

namespace kcenon::transfer_engine::test {

class RangeSplitterTest : public ::testing::Test {
protected:
    static auto small_policy(uint64_t threshold, uint32_t components) -> range_split_policy {
        range_split_policy policy{threshold, components};
        policy.min_component_size = 1;
        return policy;
    }
};

TEST_F(RangeSplitterTest, DefaultPolicy) {
    range_split_policy policy;
    EXPECT_EQ(policy.threshold, 150ULL * 1024 * 1024);
    EXPECT_EQ(policy.component_count, 4u);
    EXPECT_TRUE(policy.validate().has_value());
}

TEST_F(RangeSplitterTest, InvalidPolicy) {
    range_split_policy no_threshold{0, 4};
    EXPECT_EQ(no_threshold.validate().error().code, error_code::invalid_configuration);

    range_split_policy no_components{100, 0};
    EXPECT_EQ(no_components.validate().error().code, error_code::invalid_configuration);
}

TEST_F(RangeSplitterTest, BelowThresholdStaysWhole) {
    range_splitter splitter(small_policy(100, 4));
    EXPECT_FALSE(splitter.should_split(99));
    EXPECT_TRUE(splitter.split(99).empty());
    EXPECT_TRUE(splitter.split(0).empty());
}

TEST_F(RangeSplitterTest, EvenSplit) {
    range_splitter splitter(small_policy(100, 4));
    auto ranges = splitter.split(400);

    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0], (byte_range{0, 100}));
    EXPECT_EQ(ranges[1], (byte_range{100, 200}));
    EXPECT_EQ(ranges[2], (byte_range{200, 300}));
    EXPECT_EQ(ranges[3], (byte_range{300, 400}));
}

TEST_F(RangeSplitterTest, UnevenSplitCoversWholeObject) {
    range_splitter splitter(small_policy(100, 3));
    auto ranges = splitter.split(1001);

    ASSERT_FALSE(ranges.empty());
    EXPECT_EQ(ranges.front().start, 0u);
    EXPECT_EQ(ranges.back().end, 1001u);
    for (std::size_t i = 1; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i - 1].end, ranges[i].start);
        EXPECT_FALSE(ranges[i].empty());
    }
}

TEST_F(RangeSplitterTest, MinimumComponentSizeLimitsCount) {
    range_split_policy policy{100, 8};
    policy.min_component_size = 100;
    range_splitter splitter(policy);

    // 250 bytes allow only two components of at least 100 bytes
    auto ranges = splitter.split(250);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], (byte_range{0, 125}));
    EXPECT_EQ(ranges[1], (byte_range{125, 250}));
}

TEST_F(RangeSplitterTest, SingleComponentPolicyNeverSplits) {
    range_splitter splitter(small_policy(1, 1));
    EXPECT_FALSE(splitter.should_split(1024));
    EXPECT_TRUE(splitter.split(1024).empty());
}

}  // namespace kcenon::transfer_engine::test
