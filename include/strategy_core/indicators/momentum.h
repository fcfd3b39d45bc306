#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

// Percent change of the last price against the price `period` bars earlier. Empty with
// fewer than period + 1 prices or when the reference price is zero.
std::optional<double> Momentum(const std::vector<double>& prices, int period);

}  // namespace strategy_core
