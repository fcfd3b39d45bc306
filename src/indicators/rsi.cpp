#include "strategy_core/indicators/rsi.h"

#include <algorithm>
#include <cstddef>

#include "strategy_core/indicators/period.h"

namespace strategy_core {

std::optional<double> Rsi(const std::vector<double>& prices, int period) {
    ValidatePeriod(period);

    const auto window = static_cast<std::size_t>(period);
    if (prices.size() < window + 1) {
        return std::nullopt;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (std::size_t i = 1; i <= window; ++i) {
        const double delta = prices[i] - prices[i - 1];
        if (delta >= 0.0) {
            avg_gain += delta;
        } else {
            avg_loss -= delta;
        }
    }

    const double n = static_cast<double>(period);
    avg_gain /= n;
    avg_loss /= n;

    // Wilder smoothing, strictly in chronological order.
    for (std::size_t i = window + 1; i < prices.size(); ++i) {
        const double delta = prices[i] - prices[i - 1];
        const double gain = std::max(delta, 0.0);
        const double loss = std::max(-delta, 0.0);
        avg_gain = ((n - 1.0) * avg_gain + gain) / n;
        avg_loss = ((n - 1.0) * avg_loss + loss) / n;
    }

    if (avg_loss == 0.0) {
        return avg_gain == 0.0 ? 50.0 : 100.0;
    }
    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

}  // namespace strategy_core
