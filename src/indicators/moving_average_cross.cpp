#include "strategy_core/indicators/moving_average_cross.h"

#include <algorithm>
#include <cstddef>

#include "strategy_core/indicators/period.h"

namespace strategy_core {
namespace {

// Mean of prices[end - window, end).
double WindowMean(const std::vector<double>& prices, std::size_t end, std::size_t window) {
    double sum = 0.0;
    for (std::size_t i = end - window; i < end; ++i) {
        sum += prices[i];
    }
    return sum / static_cast<double>(window);
}

}  // namespace

std::optional<CrossSignal> MovingAverageCross(const std::vector<double>& prices,
                                              int short_period,
                                              int long_period) {
    ValidatePeriod(short_period);
    ValidatePeriod(long_period);

    const auto short_window = static_cast<std::size_t>(short_period);
    const auto long_window = static_cast<std::size_t>(long_period);
    if (prices.size() < std::max(short_window, long_window) + 1) {
        return std::nullopt;
    }

    const std::size_t last = prices.size();
    const double short_now = WindowMean(prices, last, short_window);
    const double long_now = WindowMean(prices, last, long_window);
    const double short_prev = WindowMean(prices, last - 1, short_window);
    const double long_prev = WindowMean(prices, last - 1, long_window);

    if (short_prev <= long_prev && short_now > long_now) {
        return CrossSignal::kGolden;
    }
    if (short_prev >= long_prev && short_now < long_now) {
        return CrossSignal::kDeath;
    }
    return CrossSignal::kNone;
}

const char* CrossSignalName(CrossSignal signal) {
    switch (signal) {
        case CrossSignal::kNone:
            return "none";
        case CrossSignal::kGolden:
            return "golden";
        case CrossSignal::kDeath:
            return "death";
    }
    return "none";
}

}  // namespace strategy_core
