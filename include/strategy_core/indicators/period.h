#pragma once

namespace strategy_core {

// Throws std::invalid_argument unless period >= 1.
void ValidatePeriod(int period);

}  // namespace strategy_core
