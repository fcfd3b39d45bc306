#include "strategy_core/indicators/series.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace strategy_core {

std::optional<std::vector<double>> PrepareSeries(const std::vector<double>& values,
                                                 SeriesOrder order) {
    if (values.empty()) {
        return std::nullopt;
    }
    for (const double value : values) {
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
    }

    std::vector<double> prepared(values);
    if (order == SeriesOrder::kNewestFirst) {
        std::reverse(prepared.begin(), prepared.end());
    }
    return prepared;
}

bool ParseSeriesOrder(const std::string& text, SeriesOrder* out) {
    if (out == nullptr) {
        return false;
    }
    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "oldest_first" || normalized == "ascending") {
        *out = SeriesOrder::kOldestFirst;
        return true;
    }
    if (normalized == "newest_first" || normalized == "descending") {
        *out = SeriesOrder::kNewestFirst;
        return true;
    }
    return false;
}

const char* SeriesOrderName(SeriesOrder order) {
    switch (order) {
        case SeriesOrder::kOldestFirst:
            return "oldest_first";
        case SeriesOrder::kNewestFirst:
            return "newest_first";
    }
    return "oldest_first";
}

}  // namespace strategy_core
