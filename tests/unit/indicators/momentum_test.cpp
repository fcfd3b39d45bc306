#include "strategy_core/indicators/momentum.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace strategy_core {
namespace {

constexpr double kTolerance = 1e-8;

TEST(MomentumTest, ThrowsWhenPeriodIsNotPositive) {
    EXPECT_THROW((void)Momentum({1.0, 2.0}, 0), std::invalid_argument);
    EXPECT_THROW((void)Momentum({}, -1), std::invalid_argument);
}

TEST(MomentumTest, PercentChangeAgainstPricePeriodBarsBack) {
    const auto value = Momentum({90.0, 100.0, 105.0, 110.0}, 2);
    ASSERT_TRUE(value.has_value());
    EXPECT_NEAR(*value, 10.0, kTolerance);

    const auto falling = Momentum({200.0, 150.0}, 1);
    ASSERT_TRUE(falling.has_value());
    EXPECT_NEAR(*falling, -25.0, kTolerance);
}

TEST(MomentumTest, UndefinedWhenHistoryIsShort) {
    EXPECT_FALSE(Momentum({100.0, 105.0}, 2).has_value());
}

TEST(MomentumTest, UndefinedWhenReferencePriceIsZero) {
    EXPECT_FALSE(Momentum({0.0, 1.0, 2.0}, 2).has_value());
}

}  // namespace
}  // namespace strategy_core
