#pragma once

#include "common/Types.h"
#include "signal/ActiveSignal.h"
#include "signal/CandleCache.h"
#include "signal/ConditionScorer.h"
#include "signal/ConfigResolver.h"
#include "signal/SignalConfig.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quantscan {
namespace signal {

// Turns per-symbol candle streams into scored entry signals and walks each
// symbol's single active signal through create / update / delete.
// Not thread-safe; callers serialize calls per engine.
class SignalDetectionEngine {
public:
    // Throws std::invalid_argument when `config` fails validation. A null
    // resolver means every symbol uses `config` unchanged.
    explicit SignalDetectionEngine(const SignalConfig& config = SignalConfig(),
                                   std::shared_ptr<IConfigResolver> resolver = nullptr);

    // Appends in the given order; the oldest candles fall out once the
    // cache holds max_candles_cache.
    void updateCandles(const std::string& symbol, const std::vector<Candle>& candles);

    // At most one lifecycle event per call. Indicator failures are logged
    // and yield no event.
    std::optional<SignalEvent> processSymbol(const std::string& symbol,
                                             const std::string& timeframe = "5m");

    std::vector<ActiveSignal> getActiveSignals() const;
    std::optional<ActiveSignal> getActiveSignal(const std::string& symbol) const;

    // Drops the signal once a consumer has acted on it.
    bool removeSignal(const std::string& symbol);

    // Removes signals older than signal_expiry_minutes; returns their symbols.
    std::vector<std::string> cleanupExpiredSignals();

    size_t cachedCandleCount(const std::string& symbol) const;

    // Epoch-ms source for signal ages. Defaults to the system clock.
    void setClock(std::function<long long()> clock) { clock_ = std::move(clock); }

    const SignalConfig& config() const { return config_; }

private:
    std::optional<SignalEvent> detectNewSignal(const std::string& symbol,
                                               const std::string& timeframe,
                                               const RingBuffer<Candle>& cache,
                                               const SignalConfig& config);

    std::optional<SignalEvent> updateExistingSignal(const std::string& symbol,
                                                    const RingBuffer<Candle>& cache,
                                                    const SignalConfig& config);

    bool passesGates(const std::string& symbol, const RingBuffer<Candle>& cache) const;

    static void placeExits(ActiveSignal& signal, double atr, const SignalConfig& config);

    long long now() const { return clock_(); }

    SignalConfig config_;
    std::shared_ptr<IConfigResolver> resolver_;
    std::function<long long()> clock_;

    std::map<std::string, RingBuffer<Candle>> candle_cache_;
    std::map<std::string, ActiveSignal> active_signals_;
};

} // namespace signal
} // namespace quantscan
