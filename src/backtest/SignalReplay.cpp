#include "backtest/SignalReplay.h"
#include "common/Logger.h"
#include "signal/SignalDetectionEngine.h"

namespace quantscan {
namespace backtest {

BacktestSignal SignalReplay::toBacktestSignal(const signal::ActiveSignal& active, long long timestamp) {
    BacktestSignal s;
    s.symbol = active.symbol;
    s.timestamp = timestamp;
    s.direction = active.direction;
    s.entry = active.entry_price;
    s.stop_loss = active.stop_loss;
    s.take_profit = active.take_profit;
    s.confidence = active.confidence;
    s.conditions = active.conditions;
    return s;
}

std::vector<BacktestSignal> SignalReplay::generateSignals(
    const SymbolCandles& symbols_data,
    const signal::SignalConfig& config,
    const std::string& timeframe,
    std::shared_ptr<signal::IConfigResolver> resolver) {

    long long candle_time = 0;
    signal::SignalDetectionEngine engine(config, std::move(resolver));
    engine.setClock([&candle_time] { return candle_time; });

    std::vector<BacktestSignal> signals;
    for (const auto& [symbol, candles] : symbols_data) {
        if (candles.empty()) continue;
        LOG_INFO("Processing {} with {} candles...", symbol, candles.size());

        for (size_t i = 0; i < candles.size(); ++i) {
            const Candle& candle = candles[i];
            candle_time = candle.timestamp;
            engine.updateCandles(symbol, {candle});

            if (i < signal::tuning::MIN_CANDLES_FOR_SIGNAL) continue;

            auto event = engine.processSymbol(symbol, timeframe);
            if (!event || event->action != signal::SignalAction::CREATED) continue;

            signals.push_back(toBacktestSignal(event->signal, candle.timestamp));
            LOG_INFO("Signal generated for {}: {} @ {}", symbol,
                     directionToString(event->signal.direction), event->signal.entry_price.toString());
        }
    }

    LOG_INFO("Generated {} signals across {} symbols", signals.size(), symbols_data.size());
    return signals;
}

} // namespace backtest
} // namespace quantscan
