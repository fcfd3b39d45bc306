#include "strategy_core/core/indicator_config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace strategy_core {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::unordered_map<std::string, std::string> LoadSimpleYaml(const std::string& path,
                                                            std::string* error) {
    std::unordered_map<std::string, std::string> kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "strategy_core:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = ResolveEnvVars(Trim(line.substr(pos + 1)));
        if (!key.empty()) {
            kv[key] = std::move(value);
        }
    }
    return kv;
}

bool ParseIntValue(const std::string& raw, int* out) {
    if (out == nullptr) {
        return false;
    }
    const std::string text = Trim(raw);
    if (text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const int value = std::stoi(text, &parsed);
        if (parsed != text.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDoubleValue(const std::string& raw, double* out) {
    if (out == nullptr) {
        return false;
    }
    const std::string text = Trim(raw);
    if (text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const double value = std::stod(text, &parsed);
        if (parsed != text.size() || !std::isfinite(value)) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SetOptionalInt(const std::unordered_map<std::string, std::string>& kv,
                    const char* key,
                    int* target,
                    std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return true;
    }
    int parsed = 0;
    if (!ParseIntValue(it->second, &parsed)) {
        if (error != nullptr) {
            *error = std::string("invalid integer for key: ") + key;
        }
        return false;
    }
    *target = parsed;
    return true;
}

bool SetOptionalDouble(const std::unordered_map<std::string, std::string>& kv,
                       const char* key,
                       double* target,
                       std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return true;
    }
    double parsed = 0.0;
    if (!ParseDoubleValue(it->second, &parsed)) {
        if (error != nullptr) {
            *error = std::string("invalid number for key: ") + key;
        }
        return false;
    }
    *target = parsed;
    return true;
}

}  // namespace

std::string ResolveEnvVars(const std::string& raw) {
    std::string resolved;
    resolved.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
        const auto open = raw.find("${", pos);
        if (open == std::string::npos) {
            resolved.append(raw, pos, std::string::npos);
            break;
        }
        const auto close = raw.find('}', open + 2);
        if (close == std::string::npos) {
            resolved.append(raw, pos, std::string::npos);
            break;
        }
        resolved.append(raw, pos, open - pos);
        const std::string name = raw.substr(open + 2, close - open - 2);
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            resolved.append(value);
        }
        pos = close + 1;
    }
    return resolved;
}

std::string GetEnvOrDefault(const char* key, const std::string& default_value) {
    const char* value = std::getenv(key);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    return value;
}

bool ApplyConfigOverrides(const std::unordered_map<std::string, std::string>& kv,
                          IndicatorRunConfig* config,
                          std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    IndicatorRunConfig updated = *config;
    if (!SetOptionalInt(kv, "ma_period", &updated.ma_period, error) ||
        !SetOptionalInt(kv, "rsi_period", &updated.rsi_period, error) ||
        !SetOptionalInt(kv, "atr_period", &updated.atr_period, error) ||
        !SetOptionalInt(kv, "bollinger_period", &updated.bollinger_period, error) ||
        !SetOptionalDouble(kv, "bollinger_num_std", &updated.bollinger_num_std, error) ||
        !SetOptionalInt(kv, "momentum_period", &updated.momentum_period, error) ||
        !SetOptionalInt(kv, "cross_short_period", &updated.cross_short_period, error) ||
        !SetOptionalInt(kv, "cross_long_period", &updated.cross_long_period, error)) {
        return false;
    }

    if (const auto it = kv.find("input_order"); it != kv.end()) {
        if (!ParseSeriesOrder(Trim(it->second), &updated.input_order)) {
            if (error != nullptr) {
                *error = "invalid input_order: " + it->second;
            }
            return false;
        }
    }

    if (const auto it = kv.find("log_level"); it != kv.end()) {
        if (!IsKnownLogLevel(it->second)) {
            if (error != nullptr) {
                *error = "invalid log_level: " + it->second;
            }
            return false;
        }
        updated.log.log_level = NormalizeLogLevel(it->second);
    }

    if (const auto it = kv.find("log_sink"); it != kv.end()) {
        const auto sink = NormalizeLogLevel(it->second);
        if (sink != "stderr" && sink != "stdout") {
            if (error != nullptr) {
                *error = "invalid log_sink: " + it->second;
            }
            return false;
        }
        updated.log.log_sink = sink;
    }

    *config = std::move(updated);
    return true;
}

bool LoadIndicatorRunConfig(const std::string& path,
                            IndicatorRunConfig* config,
                            std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    IndicatorRunConfig loaded;
    if (!ApplyConfigOverrides(kv, &loaded, &load_error)) {
        if (error != nullptr) {
            *error = path + ": " + load_error;
        }
        return false;
    }

    *config = std::move(loaded);
    return true;
}

}  // namespace strategy_core
