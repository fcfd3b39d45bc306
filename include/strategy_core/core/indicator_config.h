#pragma once

#include <string>
#include <unordered_map>

#include "strategy_core/core/structured_log.h"
#include "strategy_core/indicators/series.h"

namespace strategy_core {

struct IndicatorRunConfig {
    int ma_period{20};
    int rsi_period{14};
    int atr_period{14};
    int bollinger_period{20};
    double bollinger_num_std{2.0};
    int momentum_period{5};
    int cross_short_period{5};
    int cross_long_period{20};
    SeriesOrder input_order{SeriesOrder::kOldestFirst};
    LogConfig log;
};

// Expands ${NAME} references from the environment. Unset variables expand to "".
std::string ResolveEnvVars(const std::string& raw);

std::string GetEnvOrDefault(const char* key, const std::string& default_value);

// Applies recognised keys from `kv` onto `config`; unknown keys are ignored.
// Periods are not range-checked here, the indicators reject them on use.
bool ApplyConfigOverrides(const std::unordered_map<std::string, std::string>& kv,
                          IndicatorRunConfig* config,
                          std::string* error);

bool LoadIndicatorRunConfig(const std::string& path,
                            IndicatorRunConfig* config,
                            std::string* error);

}  // namespace strategy_core
