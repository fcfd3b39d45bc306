#pragma once

#include <optional>
#include <vector>

namespace strategy_core {

enum class CrossSignal {
    kNone,
    kGolden,
    kDeath,
};

// Compares the short and long moving averages on the last two bars. Golden when the short
// average moves from at-or-below the long one to above it, death for the mirror move.
// Both averages must exist on the previous bar too, so long_period + 1 prices are needed
// (short_period + 1 when the short window is the wider one).
std::optional<CrossSignal> MovingAverageCross(const std::vector<double>& prices,
                                              int short_period,
                                              int long_period);

const char* CrossSignalName(CrossSignal signal);

}  // namespace strategy_core
