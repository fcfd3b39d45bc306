#include "strategy_core/indicators/atr.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "strategy_core/indicators/period.h"

namespace strategy_core {

std::optional<double> Atr(const std::vector<double>& high,
                          const std::vector<double>& low,
                          const std::vector<double>& close,
                          int period) {
    ValidatePeriod(period);

    const std::size_t len = high.size();
    if (len == 0 || low.size() != len || close.size() != len) {
        throw std::invalid_argument("high, low, close must have the same non-zero length");
    }

    const auto window = static_cast<std::size_t>(period);
    if (len < window + 1) {
        return std::nullopt;
    }

    std::vector<double> true_ranges;
    true_ranges.reserve(len - 1);
    for (std::size_t i = 1; i < len; ++i) {
        const double prev_close = close[i - 1];
        const double tr = std::max({high[i] - low[i],
                                    std::fabs(high[i] - prev_close),
                                    std::fabs(low[i] - prev_close)});
        // high < low is not rejected, so the range itself may come out negative.
        true_ranges.push_back(std::fabs(tr));
    }

    if (true_ranges.size() < window) {
        return std::nullopt;
    }

    double seed_sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        seed_sum += true_ranges[i];
    }

    const double n = static_cast<double>(period);
    double atr = seed_sum / n;
    for (std::size_t i = window; i < true_ranges.size(); ++i) {
        atr = ((n - 1.0) * atr + true_ranges[i]) / n;
    }
    return atr;
}

}  // namespace strategy_core
