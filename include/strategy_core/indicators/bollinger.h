#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

struct BollingerBands {
    double lower{0.0};
    double middle{0.0};
    double upper{0.0};
};

// Bands around the mean of the last `period` prices, `num_std` sample standard deviations
// wide. A one-bar window has zero width.
std::optional<BollingerBands> BollingerBandsOf(const std::vector<double>& prices,
                                               int period,
                                               double num_std = 2.0);

}  // namespace strategy_core
