#include "strategy_core/indicators/momentum.h"

#include <cstddef>

#include "strategy_core/indicators/period.h"

namespace strategy_core {

std::optional<double> Momentum(const std::vector<double>& prices, int period) {
    ValidatePeriod(period);

    const auto window = static_cast<std::size_t>(period);
    if (prices.size() < window + 1) {
        return std::nullopt;
    }

    const double current = prices.back();
    const double past = prices[prices.size() - 1 - window];
    if (past == 0.0) {
        return std::nullopt;
    }
    return (current - past) / past * 100.0;
}

}  // namespace strategy_core
