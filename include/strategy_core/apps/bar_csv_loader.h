#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace strategy_core::apps {

// Column-major OHLC bars in file order.
struct OhlcColumns {
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;

    std::size_t size() const { return close.size(); }
};

// Loads high/low/close columns from a header-indexed CSV file. Column names are matched
// case-sensitively against a small alias list (high/High/HighPrice/HIGH_PRICE, ...).
// Blank lines are skipped; a cell that is not a number fails the whole load.
bool LoadOhlcCsv(const std::string& path, OhlcColumns* out, std::string* error);

}  // namespace strategy_core::apps
