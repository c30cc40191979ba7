#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include "common/Logger.h"

namespace quantscan {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

bool isNumericCell(const std::string& s) {
    return !s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '-');
}

// The whole cell must be consumed: "2024-01-01" is not a timestamp.
long long parseInt64(const std::string& s) {
    size_t pos = 0;
    const long long value = std::stoll(s, &pos);
    if (pos != s.size()) {
        throw std::invalid_argument("not an integer: " + s);
    }
    return value;
}

double parseFinite(const std::string& s) {
    size_t pos = 0;
    const double value = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(value)) {
        throw std::invalid_argument("not a finite number: " + s);
    }
    return value;
}

// Numbers may arrive as JSON numbers or as strings.
double toDouble(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parseFinite(v.get<std::string>());
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    throw std::invalid_argument("expected a number, got " + std::string(v.type_name()));
}

Decimal toDecimal(const nlohmann::json& v) {
    if (v.is_string()) return Decimal::fromString(v.get<std::string>());
    return Decimal::fromDouble(toDouble(v));
}

double field(const nlohmann::json& item, const char* name, const char* short_name) {
    if (item.contains(name)) return toDouble(item.at(name));
    if (item.contains(short_name)) return toDouble(item.at(short_name));
    throw std::invalid_argument(std::string("missing field ") + name);
}

void sortByTime(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path,
                                         const std::string& symbol,
                                         const std::string& timeframe) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::vector<std::string> header;
    std::string line;
    while (std::getline(file, line)) {
        const auto row = splitRow(line);
        if (row.size() < 6 || row[0].empty()) continue;

        if (!isNumericCell(row[0])) {
            if (header.empty()) {
                header = row;
            }
            continue;
        }

        try {
            Candle candle;
            candle.symbol = symbol;
            candle.timeframe = timeframe;
            candle.timestamp = parseInt64(row[0]);
            candle.open = parseFinite(row[1]);
            candle.high = parseFinite(row[2]);
            candle.low = parseFinite(row[3]);
            candle.close = parseFinite(row[4]);
            candle.volume = parseFinite(row[5]);
            for (size_t i = 6; i < row.size() && i < header.size(); ++i) {
                if (row[i].empty()) continue;
                candle.indicators[header[i]] = parseFinite(row[i]);
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTime(candles);
    LOG_INFO("Loaded {} candles for {} from {}", candles.size(), symbol, file_path);
    return candles;
}

Candle DataHistory::candleFromJson(const nlohmann::json& item) {
    Candle candle;
    candle.timestamp = item.contains("timestamp") ? item.at("timestamp").get<long long>()
                                                  : item.at("t").get<long long>();
    candle.open = field(item, "open", "o");
    candle.high = field(item, "high", "h");
    candle.low = field(item, "low", "l");
    candle.close = field(item, "close", "c");
    candle.volume = field(item, "volume", "v");
    candle.symbol = item.value("symbol", std::string());
    candle.timeframe = item.value("timeframe", std::string());

    if (item.contains("indicators") && item.at("indicators").is_object()) {
        for (const auto& [name, value] : item.at("indicators").items()) {
            if (value.is_null()) continue;
            candle.indicators[name] = toDouble(value);
        }
    }
    return candle;
}

SymbolCandles DataHistory::loadJSON(const std::string& file_path) {
    SymbolCandles data;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return data;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return data;
    }

    const std::string fallback_symbol = std::filesystem::path(file_path).stem().string();
    auto addCandle = [&](const nlohmann::json& item, const std::string& symbol) {
        try {
            Candle candle = candleFromJson(item);
            if (!symbol.empty()) candle.symbol = symbol;
            if (candle.symbol.empty()) candle.symbol = fallback_symbol;
            data[candle.symbol].push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Skipping malformed candle in {}: {}", file_path, e.what());
        }
    };

    if (j.is_object()) {
        for (const auto& [symbol, candles] : j.items()) {
            if (!candles.is_array()) {
                LOG_WARN("Ignoring non-array entry '{}' in {}", symbol, file_path);
                continue;
            }
            for (const auto& item : candles) addCandle(item, symbol);
        }
    } else if (j.is_array()) {
        for (const auto& item : j) addCandle(item, "");
    } else {
        LOG_ERROR("Unexpected JSON layout in {}", file_path);
        return data;
    }

    size_t total = 0;
    for (auto& [symbol, candles] : data) {
        sortByTime(candles);
        total += candles.size();
    }
    LOG_INFO("Loaded {} candles for {} symbols from {}", total, data.size(), file_path);
    return data;
}

BacktestSignal DataHistory::signalFromJson(const nlohmann::json& item) {
    BacktestSignal result;
    result.symbol = item.at("symbol").get<std::string>();
    result.timestamp = item.at("timestamp").get<long long>();

    std::string direction = item.at("direction").get<std::string>();
    std::transform(direction.begin(), direction.end(), direction.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (direction == "LONG") {
        result.direction = Direction::LONG;
    } else if (direction == "SHORT") {
        result.direction = Direction::SHORT;
    } else {
        throw std::invalid_argument("unknown direction '" + direction + "'");
    }

    result.entry = toDecimal(item.at("entry"));
    result.stop_loss = toDecimal(item.at("sl"));
    result.take_profit = toDecimal(item.at("tp"));
    if (item.contains("confidence")) {
        result.confidence = toDouble(item.at("confidence"));
    }
    if (item.contains("indicators")) {
        result.conditions = signal::ConditionSet::fromJson(item.at("indicators"));
    }
    if (item.contains("leverage") && item.at("leverage").is_number_integer()) {
        result.leverage = item.at("leverage").get<int>();
    }
    return result;
}

std::vector<BacktestSignal> DataHistory::loadSignals(const std::string& file_path) {
    std::vector<BacktestSignal> signals;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open signals file: {}", file_path);
        return signals;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing signals file: {} - {}", file_path, e.what());
        return signals;
    }
    if (!j.is_array()) {
        LOG_ERROR("Signals file must hold a JSON array: {}", file_path);
        return signals;
    }

    for (const auto& item : j) {
        try {
            signals.push_back(signalFromJson(item));
        } catch (const std::exception& e) {
            LOG_WARN("Skipping malformed signal in {}: {}", file_path, e.what());
        }
    }

    LOG_INFO("Loaded {} signals from {}", signals.size(), file_path);
    return signals;
}

std::vector<Candle> DataHistory::filterByTime(const std::vector<Candle>& candles,
                                              long long start_ms,
                                              long long end_ms) {
    std::vector<Candle> filtered;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(filtered),
                 [&](const Candle& c) { return c.timestamp >= start_ms && c.timestamp <= end_ms; });
    return filtered;
}

} // namespace backtest
} // namespace quantscan
