#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "diagnostics/statistics.hpp"
#include <vector>

using namespace streamready::stats;
using ::testing::ElementsAre;

class RollingWindowTest : public ::testing::Test {
protected:
    RollingWindow<double> window_{10};
};

TEST_F(RollingWindowTest, LengthNeverExceedsCapacity) {
    for (int i = 1; i <= 25; ++i) {
        window_.push(static_cast<double>(i));
        EXPECT_LE(window_.size(), window_.capacity());
    }

    EXPECT_EQ(window_.size(), 10u);
    EXPECT_TRUE(window_.full());
}

TEST_F(RollingWindowTest, EvictsOldestFirst) {
    for (int i = 1; i <= 13; ++i) {
        window_.push(static_cast<double>(i));
    }

    EXPECT_DOUBLE_EQ(window_.front(), 4.0);
    EXPECT_DOUBLE_EQ(window_.back(), 13.0);
    EXPECT_THAT(window_.values(), ElementsAre(4, 5, 6, 7, 8, 9, 10, 11, 12, 13));
}

TEST_F(RollingWindowTest, ClearEmptiesWindow) {
    window_.push(1.0);
    window_.push(2.0);
    window_.clear();

    EXPECT_TRUE(window_.empty());
    EXPECT_EQ(window_.capacity(), 10u);
}

TEST(RollingWindowCapacityTest, ZeroCapacityHoldsOneValue) {
    RollingWindow<int> window(0);
    window.push(1);
    window.push(2);

    EXPECT_EQ(window.capacity(), 1u);
    EXPECT_EQ(window.size(), 1u);
    EXPECT_EQ(window.back(), 2);
}

TEST(StatisticsTest, MeanOfValues) {
    EXPECT_DOUBLE_EQ(mean({}), 0.0);
    EXPECT_DOUBLE_EQ(mean({7.0}), 7.0);
    EXPECT_DOUBLE_EQ(mean({2.0, 4.0, 6.0}), 4.0);
}

TEST(StatisticsTest, StdDevIsZeroForFewerThanTwoPoints) {
    EXPECT_DOUBLE_EQ(stdDev({}), 0.0);
    EXPECT_DOUBLE_EQ(stdDev({42.0}), 0.0);
}

TEST(StatisticsTest, StdDevUsesPopulationVariance) {
    // Sample variance would give 2.138
    EXPECT_DOUBLE_EQ(stdDev({2, 4, 4, 4, 5, 5, 7, 9}), 2.0);
    EXPECT_DOUBLE_EQ(stdDev({1800, 1800, 1800}), 0.0);
}

TEST(StatisticsTest, StdDevIsNeverNegative) {
    const std::vector<std::vector<double>> inputs = {
        {-5.0, -1.0}, {0.0, 0.0, 0.0}, {1e-9, 2e-9}, {1e6, -1e6, 3.0}
    };
    for (const auto& input : inputs) {
        EXPECT_GE(stdDev(input), 0.0);
    }
}

TEST(StatisticsTest, MeanAbsoluteDeviation) {
    EXPECT_DOUBLE_EQ(meanAbsoluteDeviation({}), 0.0);
    EXPECT_DOUBLE_EQ(meanAbsoluteDeviation({10.0}), 0.0);
    EXPECT_DOUBLE_EQ(meanAbsoluteDeviation({1.0, 3.0}), 1.0);
    EXPECT_DOUBLE_EQ(meanAbsoluteDeviation({70.0, 150.0}), 40.0);
}

TEST(StatisticsTest, PercentileUsesNearestRankOnSortedCopy) {
    const std::vector<double> values = {5, 1, 4, 2, 3};

    EXPECT_DOUBLE_EQ(percentile(values, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(values, 50.0), 3.0);
    EXPECT_DOUBLE_EQ(percentile(values, 100.0), 5.0);

    // Input order is untouched
    EXPECT_DOUBLE_EQ(values.front(), 5.0);
}

TEST(StatisticsTest, PercentileOfEmptyInputIsZero) {
    EXPECT_DOUBLE_EQ(percentile({}, 5.0), 0.0);
}

TEST(StatisticsTest, SinglePointLocationIsThePoint) {
    EXPECT_DOUBLE_EQ(mean({42.0}), 42.0);
    EXPECT_DOUBLE_EQ(percentile({42.0}, 5.0), 42.0);
    EXPECT_DOUBLE_EQ(percentile({42.0}, 95.0), 42.0);
    EXPECT_DOUBLE_EQ(median({42.0}), 42.0);
    EXPECT_DOUBLE_EQ(meanAbsoluteDeviation({42.0}), 0.0);
}

TEST(StatisticsTest, FifthPercentile) {
    std::vector<double> values;
    for (int i = 1; i <= 20; ++i) {
        values.push_back(i);
    }
    // index floor(20 * 0.05) = 1
    EXPECT_DOUBLE_EQ(percentile(values, 5.0), 2.0);
}

TEST(StatisticsTest, Median) {
    EXPECT_DOUBLE_EQ(median({}), 0.0);
    EXPECT_DOUBLE_EQ(median({3, 1, 2}), 2.0);
    EXPECT_DOUBLE_EQ(median({4, 1, 3, 2}), 2.5);
}

TEST(StatisticsTest, TrendSlopeOverLastPoints) {
    const std::vector<double> values = {0.0, 1.0, 2.0, 4.0};

    EXPECT_DOUBLE_EQ(trendSlope(values, 3), 1.5);
    EXPECT_DOUBLE_EQ(trendSlope(values), 4.0 / 3.0);
    EXPECT_DOUBLE_EQ(trendSlope({3.0, 2.0, 1.0}, 3), -1.0);
}

TEST(StatisticsTest, TrendSlopeNeedsEnoughPoints) {
    EXPECT_DOUBLE_EQ(trendSlope({}), 0.0);
    EXPECT_DOUBLE_EQ(trendSlope({5.0}), 0.0);
    EXPECT_DOUBLE_EQ(trendSlope({1.0, 2.0}, 3), 0.0);
}

TEST(StatisticsTest, ToDoublesPreservesOrder) {
    RollingWindow<float> window(3);
    window.push(1.5f);
    window.push(2.5f);
    window.push(3.5f);
    window.push(4.5f);

    EXPECT_THAT(toDoubles(window), ElementsAre(2.5, 3.5, 4.5));
}

TEST(StatisticsTest, Clamp01) {
    EXPECT_DOUBLE_EQ(clamp01(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(clamp01(0.25), 0.25);
    EXPECT_DOUBLE_EQ(clamp01(3.0), 1.0);
}
