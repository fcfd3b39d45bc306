#include "strategy_core/indicators/period.h"

#include <stdexcept>

namespace strategy_core {

void ValidatePeriod(int period) {
    if (period <= 0) {
        throw std::invalid_argument("period must be greater than zero");
    }
}

}  // namespace strategy_core
