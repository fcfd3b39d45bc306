#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

// Arithmetic mean of the last `period` prices. Empty when fewer than `period` prices exist.
std::optional<double> MovingAverage(const std::vector<double>& prices, int period);

}  // namespace strategy_core
