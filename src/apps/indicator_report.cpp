#include "strategy_core/apps/indicator_report.h"

#include <sstream>
#include <utility>
#include <vector>

#include "strategy_core/apps/cli_support.h"
#include "strategy_core/indicators/atr.h"
#include "strategy_core/indicators/momentum.h"
#include "strategy_core/indicators/moving_average.h"
#include "strategy_core/indicators/rsi.h"
#include "strategy_core/indicators/series.h"

namespace strategy_core::apps {
namespace {

bool PrepareColumn(const std::vector<double>& raw,
                   SeriesOrder order,
                   const char* name,
                   std::vector<double>* out,
                   std::string* error) {
    auto prepared = PrepareSeries(raw, order);
    if (!prepared.has_value()) {
        if (error != nullptr) {
            *error = std::string(name) + " column is empty or contains non-finite values";
        }
        return false;
    }
    *out = std::move(*prepared);
    return true;
}

}  // namespace

bool BuildIndicatorReport(const OhlcColumns& bars,
                          const IndicatorRunConfig& config,
                          IndicatorReport* out,
                          std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "indicator report output is null";
        }
        return false;
    }

    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    if (!PrepareColumn(bars.high, config.input_order, "high", &high, error) ||
        !PrepareColumn(bars.low, config.input_order, "low", &low, error) ||
        !PrepareColumn(bars.close, config.input_order, "close", &close, error)) {
        return false;
    }

    IndicatorReport report;
    report.bar_count = close.size();
    report.moving_average = MovingAverage(close, config.ma_period);
    report.rsi = Rsi(close, config.rsi_period);
    report.atr = Atr(high, low, close, config.atr_period);
    report.bollinger = BollingerBandsOf(close, config.bollinger_period, config.bollinger_num_std);
    report.momentum = Momentum(close, config.momentum_period);
    report.cross = MovingAverageCross(close, config.cross_short_period, config.cross_long_period);

    *out = std::move(report);
    return true;
}

std::string IndicatorReportToJson(const IndicatorReport& report,
                                  const IndicatorRunConfig& config,
                                  const std::string& source) {
    std::ostringstream json;
    json << "{\n"
         << "  \"source\": \"" << JsonEscape(source) << "\",\n"
         << "  \"bar_count\": " << report.bar_count << ",\n"
         << "  \"input_order\": \"" << SeriesOrderName(config.input_order) << "\",\n"
         << "  \"moving_average\": {\"period\": " << config.ma_period
         << ", \"value\": " << FormatOptional(report.moving_average) << "},\n"
         << "  \"rsi\": {\"period\": " << config.rsi_period
         << ", \"value\": " << FormatOptional(report.rsi) << "},\n"
         << "  \"atr\": {\"period\": " << config.atr_period
         << ", \"value\": " << FormatOptional(report.atr) << "},\n"
         << "  \"bollinger\": {\"period\": " << config.bollinger_period
         << ", \"num_std\": " << FormatDouble(config.bollinger_num_std);
    if (report.bollinger.has_value()) {
        json << ", \"lower\": " << FormatDouble(report.bollinger->lower)
             << ", \"middle\": " << FormatDouble(report.bollinger->middle)
             << ", \"upper\": " << FormatDouble(report.bollinger->upper);
    } else {
        json << ", \"lower\": null, \"middle\": null, \"upper\": null";
    }
    json << "},\n"
         << "  \"momentum\": {\"period\": " << config.momentum_period
         << ", \"value\": " << FormatOptional(report.momentum) << "},\n"
         << "  \"ma_cross\": {\"short_period\": " << config.cross_short_period
         << ", \"long_period\": " << config.cross_long_period << ", \"signal\": ";
    if (report.cross.has_value()) {
        json << "\"" << CrossSignalName(*report.cross) << "\"";
    } else {
        json << "null";
    }
    json << "}\n"
         << "}\n";
    return json.str();
}

}  // namespace strategy_core::apps
