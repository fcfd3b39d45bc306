#include <iostream>
#include <stdexcept>
#include <string>

#include "strategy_core/apps/bar_csv_loader.h"
#include "strategy_core/apps/cli_support.h"
#include "strategy_core/apps/indicator_report.h"
#include "strategy_core/core/indicator_config.h"
#include "strategy_core/core/structured_log.h"

namespace {

constexpr const char* kApp = "indicator_cli";

void PrintUsage() {
    std::cerr << "usage: indicator_cli --csv <bars.csv> [--config <run.yaml>]\n"
              << "                     [--ma_period N] [--rsi_period N] [--atr_period N]\n"
              << "                     [--bollinger_period N] [--bollinger_num_std K]\n"
              << "                     [--momentum_period N]\n"
              << "                     [--cross_short_period N] [--cross_long_period N]\n"
              << "                     [--input_order oldest_first|newest_first]\n"
              << "                     [--output_json <path>]\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace strategy_core;
    using namespace strategy_core::apps;

    const auto args = ParseArgs(argc, argv);
    if (HasArg(args, "help")) {
        PrintUsage();
        return 0;
    }

    IndicatorRunConfig config;
    std::string error;
    const std::string config_path =
        GetArgAny(args, {"config", "config_path"}, GetEnvOrDefault("STRATEGY_CORE_CONFIG_PATH", ""));
    if (!config_path.empty() && !LoadIndicatorRunConfig(config_path, &config, &error)) {
        EmitStructuredLog(&config.log,
                          kApp,
                          "error",
                          "config_load_failed",
                          {{"config_path", config_path}, {"error", error}});
        return 2;
    }
    if (!ApplyConfigOverrides(args, &config, &error)) {
        EmitStructuredLog(&config.log, kApp, "error", "invalid_argument", {{"error", error}});
        return 2;
    }

    const std::string csv_path = GetArgAny(args, {"csv", "csv_path", "csv-path"});
    if (csv_path.empty()) {
        EmitStructuredLog(&config.log, kApp, "error", "invalid_argument", {{"error", "csv is required"}});
        PrintUsage();
        return 2;
    }

    OhlcColumns bars;
    if (!LoadOhlcCsv(csv_path, &bars, &error)) {
        EmitStructuredLog(&config.log,
                          kApp,
                          "error",
                          "csv_load_failed",
                          {{"csv_path", csv_path}, {"error", error}});
        return 1;
    }
    EmitStructuredLog(&config.log,
                      kApp,
                      "debug",
                      "csv_loaded",
                      {{"csv_path", csv_path},
                       {"bars", std::to_string(bars.size())},
                       {"input_order", SeriesOrderName(config.input_order)}});

    IndicatorReport report;
    try {
        if (!BuildIndicatorReport(bars, config, &report, &error)) {
            EmitStructuredLog(&config.log,
                              kApp,
                              "error",
                              "series_rejected",
                              {{"csv_path", csv_path}, {"error", error}});
            return 1;
        }
    } catch (const std::invalid_argument& ex) {
        EmitStructuredLog(&config.log, kApp, "error", "indicator_rejected", {{"error", ex.what()}});
        return 2;
    }

    if (!report.moving_average.has_value() || !report.rsi.has_value() ||
        !report.atr.has_value() || !report.bollinger.has_value() ||
        !report.momentum.has_value() || !report.cross.has_value()) {
        EmitStructuredLog(&config.log,
                          kApp,
                          "warn",
                          "insufficient_history",
                          {{"bars", std::to_string(report.bar_count)}});
    }

    const std::string json = IndicatorReportToJson(report, config, csv_path);
    const std::string output_json = GetArgAny(args, {"output_json", "output-json"});
    if (output_json.empty()) {
        std::cout << json;
    } else if (!WriteTextFile(output_json, json, &error)) {
        EmitStructuredLog(&config.log,
                          kApp,
                          "error",
                          "output_write_failed",
                          {{"output_json", output_json}, {"error", error}});
        return 1;
    }

    EmitStructuredLog(&config.log,
                      kApp,
                      "info",
                      "indicators_computed",
                      {{"csv_path", csv_path},
                       {"bars", std::to_string(report.bar_count)},
                       {"rsi", FormatOptional(report.rsi)},
                       {"atr", FormatOptional(report.atr)}});
    return 0;
}
