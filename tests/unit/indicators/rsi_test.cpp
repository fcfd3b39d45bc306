#include "strategy_core/indicators/rsi.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace strategy_core {
namespace {

constexpr double kTolerance = 1e-8;

TEST(RsiTest, ThrowsWhenPeriodIsNotPositive) {
    EXPECT_THROW((void)Rsi({1.0, 2.0, 3.0}, 0), std::invalid_argument);
    EXPECT_THROW((void)Rsi({}, -14), std::invalid_argument);
}

TEST(RsiTest, NeedsOneMorePriceThanPeriod) {
    EXPECT_FALSE(Rsi({1.0, 2.0, 3.0}, 3).has_value());
    EXPECT_TRUE(Rsi({1.0, 2.0, 3.0, 4.0}, 3).has_value());
}

TEST(RsiTest, StrictlyRisingSeriesReadsHundred) {
    std::vector<double> prices;
    for (int i = 0; i < 30; ++i) {
        prices.push_back(100.0 + 0.5 * i);
    }
    const auto value = Rsi(prices, 14);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 100.0);
}

TEST(RsiTest, StrictlyFallingSeriesReadsZero) {
    std::vector<double> prices;
    for (int i = 0; i < 30; ++i) {
        prices.push_back(100.0 - 0.5 * i);
    }
    const auto value = Rsi(prices, 14);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 0.0);
}

TEST(RsiTest, FlatSeriesReadsFifty) {
    const std::vector<double> prices(20, 42.0);
    const auto value = Rsi(prices, 14);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 50.0);
}

TEST(RsiTest, SeedOnlyUsesSimpleAverages) {
    // Deltas +1, -1, +2: avg_gain = 1, avg_loss = 1/3, rs = 3.
    const auto value = Rsi({10.0, 11.0, 10.0, 12.0}, 3);
    ASSERT_TRUE(value.has_value());
    EXPECT_NEAR(*value, 75.0, kTolerance);
}

TEST(RsiTest, AppliesWilderSmoothingAfterSeed) {
    // Seed over +1, -1 gives 0.5 / 0.5. Then +2 -> 1.25 / 0.25, -1 -> 0.625 / 0.625.
    const auto balanced = Rsi({10.0, 11.0, 10.0, 12.0, 11.0}, 2);
    ASSERT_TRUE(balanced.has_value());
    EXPECT_NEAR(*balanced, 50.0, kTolerance);

    // One more +2 step -> 1.3125 / 0.3125.
    const auto value = Rsi({10.0, 11.0, 10.0, 12.0, 11.0, 13.0}, 2);
    ASSERT_TRUE(value.has_value());
    const double rs = 1.3125 / 0.3125;
    EXPECT_NEAR(*value, 100.0 - 100.0 / (1.0 + rs), kTolerance);
}

TEST(RsiTest, SmoothingIsOrderSensitive) {
    const auto forward = Rsi({10.0, 11.0, 10.0, 12.0, 11.0, 13.0}, 2);
    const auto swapped = Rsi({10.0, 11.0, 10.0, 12.0, 14.0, 13.0}, 2);
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(swapped.has_value());
    EXPECT_NE(*forward, *swapped);
}

TEST(RsiTest, ValueStaysWithinOscillatorRange) {
    const std::vector<double> prices = {44.0,  44.34, 44.09, 43.61, 44.33, 44.83, 45.10,
                                        45.42, 45.84, 46.08, 45.89, 46.03, 45.61, 46.28,
                                        46.28, 46.00, 46.03, 46.41, 46.22, 45.64};
    const auto value = Rsi(prices, 14);
    ASSERT_TRUE(value.has_value());
    EXPECT_GT(*value, 0.0);
    EXPECT_LT(*value, 100.0);
}

TEST(RsiTest, RepeatedCallsAreBitIdentical) {
    const std::vector<double> prices = {44.0, 44.34, 44.09, 43.61, 44.33, 44.83, 45.10, 45.42};
    const auto first = Rsi(prices, 5);
    const auto second = Rsi(prices, 5);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

}  // namespace
}  // namespace strategy_core
