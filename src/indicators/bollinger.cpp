#include "strategy_core/indicators/bollinger.h"

#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "strategy_core/indicators/period.h"

namespace strategy_core {

std::optional<BollingerBands> BollingerBandsOf(const std::vector<double>& prices,
                                               int period,
                                               double num_std) {
    ValidatePeriod(period);
    if (!std::isfinite(num_std) || num_std < 0.0) {
        throw std::invalid_argument("num_std must be a finite non-negative number");
    }

    const auto window = static_cast<std::size_t>(period);
    if (prices.size() < window) {
        return std::nullopt;
    }

    const std::size_t begin = prices.size() - window;
    double sum = 0.0;
    for (std::size_t i = begin; i < prices.size(); ++i) {
        sum += prices[i];
    }
    const double mean = sum / static_cast<double>(period);

    double stddev = 0.0;
    if (window > 1) {
        double squares = 0.0;
        for (std::size_t i = begin; i < prices.size(); ++i) {
            const double diff = prices[i] - mean;
            squares += diff * diff;
        }
        stddev = std::sqrt(squares / static_cast<double>(window - 1));
    }

    BollingerBands bands;
    bands.middle = mean;
    bands.lower = mean - num_std * stddev;
    bands.upper = mean + num_std * stddev;
    return bands;
}

}  // namespace strategy_core
