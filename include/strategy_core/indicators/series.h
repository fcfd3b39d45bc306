#pragma once

#include <optional>
#include <string>
#include <vector>

namespace strategy_core {

enum class SeriesOrder {
    kOldestFirst,
    kNewestFirst,
};

// Copies `values` into oldest-first order. Empty input or any NaN/inf sample yields
// std::nullopt.
std::optional<std::vector<double>> PrepareSeries(const std::vector<double>& values,
                                                 SeriesOrder order = SeriesOrder::kOldestFirst);

bool ParseSeriesOrder(const std::string& text, SeriesOrder* out);

const char* SeriesOrderName(SeriesOrder order);

}  // namespace strategy_core
