#pragma once

#include <optional>
#include <string>

#include "strategy_core/apps/bar_csv_loader.h"
#include "strategy_core/core/indicator_config.h"
#include "strategy_core/indicators/bollinger.h"
#include "strategy_core/indicators/moving_average_cross.h"

namespace strategy_core::apps {

struct IndicatorReport {
    std::size_t bar_count{0};
    std::optional<double> moving_average;
    std::optional<double> rsi;
    std::optional<double> atr;
    std::optional<BollingerBands> bollinger;
    std::optional<double> momentum;
    std::optional<CrossSignal> cross;
};

// Runs every indicator over `bars` with the periods in `config`. Returns false with
// `error` set when a column cannot be prepared (empty or non-finite samples). Invalid
// periods surface as std::invalid_argument from the indicator functions.
bool BuildIndicatorReport(const OhlcColumns& bars,
                          const IndicatorRunConfig& config,
                          IndicatorReport* out,
                          std::string* error);

std::string IndicatorReportToJson(const IndicatorReport& report,
                                  const IndicatorRunConfig& config,
                                  const std::string& source);

}  // namespace strategy_core::apps
