#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

// Relative Strength Index with Wilder smoothing over prices ordered oldest first.
//
// The first `period` deltas seed the average gain and loss; every later delta is folded
// in with avg = ((period - 1) * avg + x) / period. Needs period + 1 prices, otherwise the
// result is empty. A flat series reads 50, a series without losses reads 100.
std::optional<double> Rsi(const std::vector<double>& prices, int period);

}  // namespace strategy_core
