#pragma once

#include <string>
#include <vector>
#include <map>
#include "common/Types.h"
#include "backtest/BacktestEngine.h"

namespace quantscan {
namespace backtest {

// File loaders for historical candles and recorded signals. Failures are
// logged and produce an empty (or partial) result instead of throwing.
class DataHistory {
public:
    // Header row required: timestamp,open,high,low,close,volume[,indicator...]
    // Every column after volume becomes a candle indicator named by its header.
    static std::vector<Candle> loadCSV(const std::string& file_path,
                                       const std::string& symbol,
                                       const std::string& timeframe = "");

    // Either {"BTCUSDT": [candle, ...], ...} or a flat array of candles that
    // carry a "symbol" field. Candles without one fall under the file stem.
    // Each symbol's candles come back sorted by timestamp.
    static SymbolCandles loadJSON(const std::string& file_path);

    // Array of {symbol, timestamp, direction, entry, sl, tp, confidence, indicators}.
    static std::vector<BacktestSignal> loadSignals(const std::string& file_path);

    // Inclusive on both ends.
    static std::vector<Candle> filterByTime(const std::vector<Candle>& candles,
                                            long long start_ms,
                                            long long end_ms);

    static Candle candleFromJson(const nlohmann::json& item);
    static BacktestSignal signalFromJson(const nlohmann::json& item);
};

} // namespace backtest
} // namespace quantscan
