#include "strategy_core/apps/bar_csv_loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "strategy_core/apps/cli_support.h"

namespace strategy_core::apps {
namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

bool FindColumn(const std::map<std::string, std::size_t>& header_index,
                std::initializer_list<const char*> candidates,
                std::size_t* out) {
    for (const char* key : candidates) {
        const auto it = header_index.find(key);
        if (it != header_index.end()) {
            *out = it->second;
            return true;
        }
    }
    return false;
}

bool ParseCell(const std::vector<std::string>& cells, std::size_t column, double* out) {
    if (column >= cells.size()) {
        return false;
    }
    const std::string text = Trim(cells[column]);
    if (text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const double value = std::stod(text, &parsed);
        if (parsed != text.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

bool LoadOhlcCsv(const std::string& path, OhlcColumns* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "ohlc output is null";
        }
        return false;
    }

    const std::filesystem::path file_path(path);
    std::ifstream input(file_path);
    if (!input.is_open()) {
        if (error != nullptr) {
            *error = "unable to open csv file: " + file_path.string();
        }
        return false;
    }

    std::string header_line;
    if (!std::getline(input, header_line)) {
        if (error != nullptr) {
            *error = "csv file is empty: " + file_path.string();
        }
        return false;
    }

    // Spreadsheet exports prefix the header with a UTF-8 byte order mark.
    if (header_line.rfind(kUtf8Bom, 0) == 0) {
        header_line.erase(0, sizeof(kUtf8Bom) - 1);
    }
    const auto headers = SplitCsvLine(header_line);
    std::map<std::string, std::size_t> header_index;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        header_index[Trim(headers[i])] = i;
    }

    std::size_t high_column = 0;
    std::size_t low_column = 0;
    std::size_t close_column = 0;
    if (!FindColumn(header_index, {"high", "High", "HighPrice", "HIGH_PRICE"}, &high_column)) {
        if (error != nullptr) {
            *error = "csv missing high column: " + file_path.string();
        }
        return false;
    }
    if (!FindColumn(header_index, {"low", "Low", "LowPrice", "LOW_PRICE"}, &low_column)) {
        if (error != nullptr) {
            *error = "csv missing low column: " + file_path.string();
        }
        return false;
    }
    if (!FindColumn(header_index,
                    {"close", "Close", "ClosePrice", "CLOSE_PRICE", "LastPrice", "last_price"},
                    &close_column)) {
        if (error != nullptr) {
            *error = "csv missing close column: " + file_path.string();
        }
        return false;
    }

    OhlcColumns loaded;
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (Trim(line).empty()) {
            continue;
        }

        const auto cells = SplitCsvLine(line);
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        if (!ParseCell(cells, high_column, &high) || !ParseCell(cells, low_column, &low) ||
            !ParseCell(cells, close_column, &close)) {
            if (error != nullptr) {
                *error = "invalid bar at line " + std::to_string(line_no) + ": " + line;
            }
            return false;
        }
        loaded.high.push_back(high);
        loaded.low.push_back(low);
        loaded.close.push_back(close);
    }

    *out = std::move(loaded);
    return true;
}

}  // namespace strategy_core::apps
