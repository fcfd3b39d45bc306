#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

// Average True Range with Wilder smoothing.
//
// high, low and close are aligned bar by bar and must share one non-zero length; a
// mismatch throws std::invalid_argument. Bar i (i >= 1) contributes
// max(high - low, |high - prev_close|, |low - prev_close|), so `period` true ranges need
// period + 1 bars. The first `period` ranges are averaged, the rest are smoothed in order.
std::optional<double> Atr(const std::vector<double>& high,
                          const std::vector<double>& low,
                          const std::vector<double>& close,
                          int period);

}  // namespace strategy_core
