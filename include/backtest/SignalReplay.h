#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backtest/BacktestEngine.h"
#include "signal/ActiveSignal.h"
#include "signal/ConfigResolver.h"
#include "signal/SignalConfig.h"

namespace quantscan {
namespace backtest {

// Produces backtest signals by feeding historical candles one at a time
// through a fresh detection engine whose clock follows candle time.
class SignalReplay {
public:
    // Only `created` events become signals, stamped with the candle that
    // produced them.
    static std::vector<BacktestSignal> generateSignals(
        const SymbolCandles& symbols_data,
        const signal::SignalConfig& config,
        const std::string& timeframe,
        std::shared_ptr<signal::IConfigResolver> resolver = nullptr);

    static BacktestSignal toBacktestSignal(const signal::ActiveSignal& active, long long timestamp);
};

} // namespace backtest
} // namespace quantscan
