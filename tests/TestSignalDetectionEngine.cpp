#include "signal/SignalDetectionEngine.h"
#include "TestCandles.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <memory>

using namespace quantscan;
using namespace quantscan::signal;

namespace {
constexpr long long kMinute = 60 * 1000;

struct FakeClock {
    long long now = 0;
};

SignalDetectionEngine makeEngine(FakeClock& clock, const SignalConfig& config = SignalConfig()) {
    SignalDetectionEngine engine(config);
    engine.setClock([&clock] { return clock.now; });
    return engine;
}

// Records the history size handed to each resolveConfig call.
class RecordingResolver : public IConfigResolver {
public:
    explicit RecordingResolver(bool wants_candles) : wants_candles_(wants_candles) {}

    SignalConfig resolveConfig(const std::string&, const std::vector<Candle>& recent) override {
        received.push_back(recent.size());
        return SignalConfig();
    }
    bool needsCandles(const std::string&) const override { return wants_candles_; }

    std::vector<size_t> received;

private:
    bool wants_candles_;
};

// 49 quiet candles then the given trigger candle.
void seed(SignalDetectionEngine& engine, const std::string& symbol, const Candle& trigger) {
    engine.updateCandles(symbol, testdata::neutralHistory(49));
    engine.updateCandles(symbol, {trigger});
}
}

int main() {
    // Not enough history
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        engine.updateCandles("BTCUSDT", testdata::neutralHistory(48));
        engine.updateCandles("BTCUSDT", {testdata::bullishCandle(49 * kMinute)});
        assert(engine.cachedCandleCount("BTCUSDT") == 49);
        assert(!engine.processSymbol("BTCUSDT"));
        assert(!engine.processSymbol("UNKNOWN"));
    }

    // LONG created with ATR-based exits
    {
        FakeClock clock;
        clock.now = 1000;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute));

        auto event = engine.processSymbol("BTCUSDT", "15m");
        assert(event);
        assert(event->action == SignalAction::CREATED);
        const ActiveSignal& s = event->signal;
        assert(s.direction == Direction::LONG);
        assert(s.timeframe == "15m");
        assert(s.entry_price == Decimal::fromInt(100));
        assert(s.stop_loss == Decimal::fromString("98.5"));
        assert(s.take_profit == Decimal::fromString("102.5"));
        assert(std::abs(s.confidence - 0.92) < 1e-9);
        assert(s.created_at == 1000);
        assert(s.description.find("(13/13 conditions)") != std::string::npos);

        assert(engine.getActiveSignals().size() == 1);
        assert(engine.getActiveSignal("BTCUSDT"));

        // Same candle again: nothing changed enough to report
        assert(!engine.processSymbol("BTCUSDT"));

        const auto j = toJson(*event);
        assert(j.at("action") == "created");
        assert(j.at("signal").at("stop_loss") == "98.5");
        assert(j.at("signal").at("conditions_met").at("price_above_ema").get<bool>());
    }

    // SHORT created when only the bearish side qualifies
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "ETHUSDT", testdata::bearishCandle(49 * kMinute));

        auto event = engine.processSymbol("ETHUSDT");
        assert(event && event->action == SignalAction::CREATED);
        assert(event->signal.direction == Direction::SHORT);
        assert(event->signal.stop_loss == Decimal::fromString("101.5"));
        assert(event->signal.take_profit == Decimal::fromString("97.5"));
        assert(event->signal.stop_loss > event->signal.entry_price);
    }

    // Ranging market gate
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        Candle trigger = testdata::bullishCandle(49 * kMinute);
        trigger.indicators[indicator::ADX] = 15.0;
        seed(engine, "BTCUSDT", trigger);
        assert(!engine.processSymbol("BTCUSDT"));
        assert(engine.getActiveSignals().empty());
    }

    // Volume confirmation gate
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute, 110.0));
        assert(!engine.processSymbol("BTCUSDT"));
    }

    // Confidence move above the threshold yields UPDATED around the stored entry
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute));
        assert(engine.processSymbol("BTCUSDT"));

        clock.now = 5 * kMinute;
        Candle next = testdata::bullishCandle(50 * kMinute);
        next.close = 101.0;
        next.indicators[indicator::ATR] = 2.0;
        engine.updateCandles("BTCUSDT", {next});   // MACD was already positive: no crossover

        auto event = engine.processSymbol("BTCUSDT");
        assert(event && event->action == SignalAction::UPDATED);
        assert(event->signal.confidence < 0.92 - 0.05);
        assert(event->signal.entry_price == Decimal::fromInt(100));
        assert(event->signal.stop_loss == Decimal::fromInt(97));
        assert(event->signal.take_profit == Decimal::fromInt(105));
        assert(event->signal.last_updated == 5 * kMinute);
        assert(!event->signal.conditions.macd_crossover);
    }

    // Collapse in score yields DELETED
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute));
        assert(engine.processSymbol("BTCUSDT"));

        engine.updateCandles("BTCUSDT", {testdata::bearishCandle(50 * kMinute)});
        auto event = engine.processSymbol("BTCUSDT");
        assert(event && event->action == SignalAction::DELETED);
        assert(event->signal.direction == Direction::LONG);
        assert(!engine.getActiveSignal("BTCUSDT"));
    }

    // Expiry is checked on the update path
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute));
        assert(engine.processSymbol("BTCUSDT"));

        clock.now = 61 * kMinute;
        engine.updateCandles("BTCUSDT", {testdata::bullishCandle(50 * kMinute)});
        auto event = engine.processSymbol("BTCUSDT");
        assert(event && event->action == SignalAction::DELETED);
        assert(engine.getActiveSignals().empty());
    }

    // Periodic cleanup and manual removal
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        seed(engine, "BTCUSDT", testdata::bullishCandle(49 * kMinute));
        seed(engine, "ETHUSDT", testdata::bearishCandle(49 * kMinute));
        assert(engine.processSymbol("BTCUSDT"));
        clock.now = 30 * kMinute;
        assert(engine.processSymbol("ETHUSDT"));

        clock.now = 61 * kMinute;
        const auto expired = engine.cleanupExpiredSignals();
        assert(expired.size() == 1 && expired[0] == "BTCUSDT");
        assert(engine.getActiveSignal("ETHUSDT"));

        assert(engine.removeSignal("ETHUSDT"));
        assert(!engine.removeSignal("ETHUSDT"));
        assert(engine.getActiveSignals().empty());
    }

    // A missing indicator is reported as no event
    {
        FakeClock clock;
        auto engine = makeEngine(clock);
        Candle trigger = testdata::bullishCandle(49 * kMinute);
        trigger.indicators.erase(indicator::PSAR_BULLISH);
        seed(engine, "BTCUSDT", trigger);
        assert(!engine.processSymbol("BTCUSDT"));
        assert(engine.getActiveSignals().empty());
    }

    // Cache keeps only the newest candles
    {
        FakeClock clock;
        SignalConfig config;
        config.max_candles_cache = 60;
        auto engine = makeEngine(clock, config);
        engine.updateCandles("BTCUSDT", testdata::neutralHistory(100));
        assert(engine.cachedCandleCount("BTCUSDT") == 60);
    }

    // History is copied for the resolver only when it asks for it
    {
        auto quiet = std::make_shared<RecordingResolver>(false);
        SignalDetectionEngine engine(SignalConfig(), quiet);
        seed(engine, "BTCUSDT", testdata::neutralCandle(49 * kMinute));
        engine.processSymbol("BTCUSDT");
        engine.processSymbol("BTCUSDT");
        assert(quiet->received.size() == 2);
        assert(quiet->received[0] == 0 && quiet->received[1] == 0);

        auto hungry = std::make_shared<RecordingResolver>(true);
        SignalDetectionEngine engine2(SignalConfig(), hungry);
        seed(engine2, "BTCUSDT", testdata::neutralCandle(49 * kMinute));
        engine2.processSymbol("BTCUSDT");
        assert(hungry->received.size() == 1);
        assert(hungry->received[0] == 50);

        VolatilityConfigResolver volatility(SignalConfig(), nullptr);
        assert(volatility.needsCandles("BTCUSDT"));
        volatility.resolveConfig("BTCUSDT", testdata::neutralHistory(50));
        assert(!volatility.needsCandles("BTCUSDT"));
        assert(volatility.needsCandles("ETHUSDT"));
        assert(!DefaultConfigResolver(SignalConfig()).needsCandles("BTCUSDT"));
    }

    // Invalid configuration is rejected up front
    {
        SignalConfig config;
        config.min_confidence = 0.0;
        bool threw = false;
        try {
            SignalDetectionEngine engine(config);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] SignalDetectionEngine PASSED\n";
    return 0;
}
