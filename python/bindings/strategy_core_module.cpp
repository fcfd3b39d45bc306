#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "strategy_core/indicators/atr.h"
#include "strategy_core/indicators/bollinger.h"
#include "strategy_core/indicators/momentum.h"
#include "strategy_core/indicators/moving_average.h"
#include "strategy_core/indicators/moving_average_cross.h"
#include "strategy_core/indicators/rsi.h"
#include "strategy_core/indicators/series.h"

namespace py = pybind11;

namespace strategy_core {
namespace {

// (lower, middle, upper) to match the tuple shape Python callers unpack.
std::optional<std::tuple<double, double, double>> BollingerTuple(const std::vector<double>& prices,
                                                                 int period,
                                                                 double num_std) {
    const auto bands = BollingerBandsOf(prices, period, num_std);
    if (!bands.has_value()) {
        return std::nullopt;
    }
    return std::make_tuple(bands->lower, bands->middle, bands->upper);
}

// "golden", "death" or "none"; None while the long average has no previous bar.
std::optional<std::string> CrossSignalFromPython(const std::vector<double>& prices,
                                                 int short_period,
                                                 int long_period) {
    const auto signal = MovingAverageCross(prices, short_period, long_period);
    if (!signal.has_value()) {
        return std::nullopt;
    }
    return std::string(CrossSignalName(*signal));
}

std::optional<std::vector<double>> PrepareSeriesFromPython(const std::vector<double>& values,
                                                           bool newest_first) {
    return PrepareSeries(values, newest_first ? SeriesOrder::kNewestFirst : SeriesOrder::kOldestFirst);
}

}  // namespace
}  // namespace strategy_core

// std::invalid_argument surfaces in Python as ValueError; std::nullopt as None.
PYBIND11_MODULE(strategy_core, m) {
    using namespace strategy_core;

    m.doc() = "Wilder-smoothed technical indicators over oldest-first price series";

    m.def("moving_average", &MovingAverage, py::arg("prices"), py::arg("period"));
    m.def("rsi", &Rsi, py::arg("prices"), py::arg("period"));
    m.def("atr",
          &Atr,
          py::arg("high"),
          py::arg("low"),
          py::arg("close"),
          py::arg("period"));
    m.def("bollinger_bands",
          &BollingerTuple,
          py::arg("prices"),
          py::arg("period"),
          py::arg("num_std") = 2.0);
    m.def("momentum", &Momentum, py::arg("prices"), py::arg("period") = 5);
    m.def("moving_average_cross",
          &CrossSignalFromPython,
          py::arg("prices"),
          py::arg("short_period") = 5,
          py::arg("long_period") = 20);
    m.def("prepare_series",
          &PrepareSeriesFromPython,
          py::arg("values"),
          py::arg("newest_first") = false);
}
