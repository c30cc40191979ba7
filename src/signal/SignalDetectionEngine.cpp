#include "signal/SignalDetectionEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace quantscan {
namespace signal {

namespace {
long long systemNowMs() {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

long long minutesToMs(int minutes) {
    return static_cast<long long>(minutes) * 60LL * 1000LL;
}
}

SignalDetectionEngine::SignalDetectionEngine(const SignalConfig& config,
                                             std::shared_ptr<IConfigResolver> resolver)
    : config_(config),
      resolver_(resolver ? std::move(resolver) : std::make_shared<DefaultConfigResolver>(config)),
      clock_(systemNowMs) {
    const auto errors = config_.validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto& e : errors) {
            if (!joined.empty()) joined += "; ";
            joined += e;
        }
        throw std::invalid_argument("Invalid signal config: " + joined);
    }

    LOG_INFO("Signal engine ready: LONG RSI {}-{}, SHORT RSI {}-{}, min confidence {:.2f}, max score {:.1f}",
             config_.long_rsi_min, config_.long_rsi_max,
             config_.short_rsi_min, config_.short_rsi_max,
             config_.min_confidence, config_.maxScore());
}

void SignalDetectionEngine::updateCandles(const std::string& symbol, const std::vector<Candle>& candles) {
    auto it = candle_cache_.find(symbol);
    if (it == candle_cache_.end()) {
        it = candle_cache_.emplace(symbol, RingBuffer<Candle>(static_cast<size_t>(config_.max_candles_cache))).first;
    }
    for (const auto& candle : candles) {
        it->second.push(candle);
    }
    LOG_DEBUG("Updated {} cache: {} candles", symbol, it->second.size());
}

std::optional<SignalEvent> SignalDetectionEngine::processSymbol(const std::string& symbol,
                                                                const std::string& timeframe) {
    auto cache_it = candle_cache_.find(symbol);
    const size_t cached = (cache_it == candle_cache_.end()) ? 0 : cache_it->second.size();
    if (cached < tuning::MIN_CANDLES_FOR_SIGNAL) {
        LOG_DEBUG("{}: Not enough candles ({})", symbol, cached);
        return std::nullopt;
    }

    try {
        const RingBuffer<Candle>& cache = cache_it->second;
        const SignalConfig config = resolver_->needsCandles(symbol)
            ? resolver_->resolveConfig(symbol, cache.toVector())
            : resolver_->resolveConfig(symbol, {});

        if (active_signals_.count(symbol)) {
            return updateExistingSignal(symbol, cache, config);
        }
        return detectNewSignal(symbol, timeframe, cache, config);
    } catch (const std::exception& e) {
        LOG_ERROR("Error processing {}: {}", symbol, e.what());
        return std::nullopt;
    }
}

bool SignalDetectionEngine::passesGates(const std::string& symbol, const RingBuffer<Candle>& cache) const {
    const Candle& current = cache.back();

    // Ranging markets produce false breakouts
    const double adx = current.indicator(indicator::ADX);
    if (adx < tuning::RANGING_ADX_FLOOR) {
        LOG_DEBUG("{}: ranging market (ADX {:.1f}), skipping", symbol, adx);
        return false;
    }

    const auto volumes = analytics::TechnicalIndicators::extractVolumes(
        cache.tail(tuning::VOLUME_MA_PERIOD));
    const double avg_volume = analytics::TechnicalIndicators::calculateSMA(
        volumes, static_cast<int>(tuning::VOLUME_MA_PERIOD));
    if (avg_volume <= 0.0 || current.volume < avg_volume * tuning::VOLUME_SPIKE_GATE) {
        LOG_DEBUG("{}: no volume confirmation ({:.2f} vs avg {:.2f})", symbol, current.volume, avg_volume);
        return false;
    }
    return true;
}

void SignalDetectionEngine::placeExits(ActiveSignal& signal, double atr, const SignalConfig& config) {
    const Decimal sl_distance = Decimal::fromDouble(atr * config.sl_atr_multiplier);
    const Decimal tp_distance = Decimal::fromDouble(atr * config.tp_atr_multiplier);

    if (signal.direction == Direction::LONG) {
        signal.stop_loss = signal.entry_price - sl_distance;
        signal.take_profit = signal.entry_price + tp_distance;
    } else {
        signal.stop_loss = signal.entry_price + sl_distance;
        signal.take_profit = signal.entry_price - tp_distance;
    }
}

std::optional<SignalEvent> SignalDetectionEngine::detectNewSignal(const std::string& symbol,
                                                                  const std::string& timeframe,
                                                                  const RingBuffer<Candle>& cache,
                                                                  const SignalConfig& config) {
    if (!passesGates(symbol, cache)) {
        return std::nullopt;
    }

    const Candle& current = cache[cache.size() - 1];
    const Candle& previous = cache[cache.size() - 2];
    const ConditionScorer scorer(config);

    for (Direction direction : {Direction::LONG, Direction::SHORT}) {
        const ScoreResult result = scorer.evaluate(direction, current, previous);
        if (!result.triggered) {
            continue;
        }

        ActiveSignal signal;
        signal.symbol = symbol;
        signal.direction = direction;
        signal.timeframe = timeframe;
        signal.entry_price = Decimal::fromDouble(current.close);
        signal.confidence = result.confidence;
        signal.conditions = result.conditions;
        signal.description = describeSignal(direction, result.conditions,
                                            current.indicator(indicator::RSI),
                                            current.indicator(indicator::ADX));
        signal.created_at = now();
        signal.last_updated = signal.created_at;
        placeExits(signal, current.indicator(indicator::ATR), config);

        active_signals_[symbol] = signal;
        LOG_INFO("NEW {} signal: {} @ {} (Conf: {:.0f}%)",
                 directionToString(direction), symbol, signal.entry_price.toString(),
                 signal.confidence * 100.0);
        return SignalEvent{SignalAction::CREATED, signal};
    }
    return std::nullopt;
}

std::optional<SignalEvent> SignalDetectionEngine::updateExistingSignal(const std::string& symbol,
                                                                       const RingBuffer<Candle>& cache,
                                                                       const SignalConfig& config) {
    ActiveSignal& signal = active_signals_.at(symbol);
    const Candle& current = cache[cache.size() - 1];
    const Candle& previous = cache[cache.size() - 2];

    const ScoreResult result = ConditionScorer(config).evaluate(signal.direction, current, previous);

    if (result.raw_confidence < config.min_confidence * tuning::INVALIDATION_TOLERANCE) {
        LOG_INFO("INVALIDATED {} signal: {}", directionToString(signal.direction), symbol);
        SignalEvent event{SignalAction::DELETED, signal};
        active_signals_.erase(symbol);
        return event;
    }

    const long long now_ms = now();
    if (signal.ageMs(now_ms) > minutesToMs(config.signal_expiry_minutes)) {
        LOG_INFO("EXPIRED {} signal: {}", directionToString(signal.direction), symbol);
        SignalEvent event{SignalAction::DELETED, signal};
        active_signals_.erase(symbol);
        return event;
    }

    const double change = std::abs(result.confidence - signal.confidence);
    if (change > tuning::UPDATE_CONFIDENCE_DELTA) {
        const double old_confidence = signal.confidence;
        signal.confidence = result.confidence;
        signal.conditions = result.conditions;
        signal.last_updated = now_ms;
        signal.description = describeSignal(signal.direction, result.conditions,
                                            current.indicator(indicator::RSI),
                                            current.indicator(indicator::ADX));
        placeExits(signal, current.indicator(indicator::ATR), config);

        LOG_INFO("UPDATED {} signal: {} (Conf: {:.0f}% -> {:.0f}%)",
                 directionToString(signal.direction), symbol,
                 old_confidence * 100.0, signal.confidence * 100.0);
        return SignalEvent{SignalAction::UPDATED, signal};
    }
    return std::nullopt;
}

std::vector<ActiveSignal> SignalDetectionEngine::getActiveSignals() const {
    std::vector<ActiveSignal> out;
    out.reserve(active_signals_.size());
    for (const auto& [symbol, signal] : active_signals_) {
        out.push_back(signal);
    }
    return out;
}

std::optional<ActiveSignal> SignalDetectionEngine::getActiveSignal(const std::string& symbol) const {
    auto it = active_signals_.find(symbol);
    if (it == active_signals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SignalDetectionEngine::removeSignal(const std::string& symbol) {
    if (active_signals_.erase(symbol) == 0) {
        return false;
    }
    LOG_INFO("Removed signal for {}", symbol);
    return true;
}

std::vector<std::string> SignalDetectionEngine::cleanupExpiredSignals() {
    const long long now_ms = now();
    const long long expiry_ms = minutesToMs(config_.signal_expiry_minutes);

    std::vector<std::string> expired;
    for (auto it = active_signals_.begin(); it != active_signals_.end();) {
        if (it->second.ageMs(now_ms) > expiry_ms) {
            expired.push_back(it->first);
            it = active_signals_.erase(it);
        } else {
            ++it;
        }
    }

    if (!expired.empty()) {
        LOG_INFO("Cleaned up {} expired signals", expired.size());
    }
    return expired;
}

size_t SignalDetectionEngine::cachedCandleCount(const std::string& symbol) const {
    auto it = candle_cache_.find(symbol);
    return (it == candle_cache_.end()) ? 0 : it->second.size();
}

} // namespace signal
} // namespace quantscan
