#include "strategy_core/indicators/moving_average.h"

#include <cstddef>

#include "strategy_core/indicators/period.h"

namespace strategy_core {

std::optional<double> MovingAverage(const std::vector<double>& prices, int period) {
    ValidatePeriod(period);

    const auto window = static_cast<std::size_t>(period);
    if (prices.size() < window) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (std::size_t i = prices.size() - window; i < prices.size(); ++i) {
        sum += prices[i];
    }
    return sum / static_cast<double>(period);
}

}  // namespace strategy_core
