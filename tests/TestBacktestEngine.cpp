#include "backtest/BacktestEngine.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace quantscan;
using namespace quantscan::backtest;

namespace {
constexpr long long kHour = 60LL * 60 * 1000;

Candle bar(long long hour, double high, double low, double close) {
    return Candle(close, high, low, close, 1000.0, hour * kHour);
}

BacktestSignal makeSignal(const std::string& symbol, long long hour, Direction direction,
                          const char* entry, const char* sl, const char* tp) {
    BacktestSignal s;
    s.symbol = symbol;
    s.timestamp = hour * kHour;
    s.direction = direction;
    s.entry = Decimal::fromString(entry);
    s.stop_loss = Decimal::fromString(sl);
    s.take_profit = Decimal::fromString(tp);
    return s;
}

void checkConservation(const BacktestEngine& engine, const BacktestMetrics& m) {
    const auto& state = engine.getState();
    Decimal at_cost;
    for (const auto& position : state.open_positions) {
        at_cost += position.position_size;
    }
    assert(state.cash + at_cost == state.equity);
    assert(m.final_equity == m.initial_capital + m.total_profit_loss);

    Decimal running_max;
    for (size_t i = 0; i < m.equity_curve.size(); ++i) {
        const auto& snapshot = m.equity_curve[i];
        assert(snapshot.drawdown <= m.max_drawdown);
        if (snapshot.drawdown > running_max) running_max = snapshot.drawdown;
        if (i > 0) {
            assert(snapshot.timestamp >= m.equity_curve[i - 1].timestamp);
            assert(snapshot.total_trades == m.equity_curve[i - 1].total_trades + 1);
        }
    }
    assert(running_max == m.max_drawdown);
}
}

int main() {
    // Take profit hit on the second bar
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 116, 99, 115), bar(2, 117, 113, 114)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("BTCUSDT", 0, Direction::LONG, "100", "95", "115")});

        assert(m.total_trades == 1);
        assert(m.winning_trades == 1);
        assert(m.total_profit_loss == Decimal::fromInt(15));
        assert(m.final_equity == Decimal::fromInt(10015));
        assert(std::abs(m.roi - 0.15) < 1e-9);
        assert(m.win_rate == 100.0);
        assert(m.sharpe_ratio == 0.0);

        const ClosedTrade& t = m.closed_trades.front();
        assert(t.reason == CloseReason::TAKE_PROFIT);
        assert(t.exit_price == Decimal::fromInt(115));
        assert(t.quantity == Decimal::fromInt(1));
        assert(t.profit_loss_percentage == Decimal::fromInt(15));
        assert(t.risk_reward_ratio == Decimal::fromInt(3));
        assert(t.closed_at == kHour);
        assert(t.duration_hours == 1.0);
        checkConservation(engine, m);

        const auto j = toJson(m);
        assert(j.at("final_equity") == "10015");
        assert(j.at("closed_trades").at(0).at("status") == "CLOSED_TP");
    }

    // A bar touching both levels resolves as the stop
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 116, 94, 110)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("BTCUSDT", 0, Direction::LONG, "100", "95", "115")});
        assert(m.total_trades == 1);
        assert(m.closed_trades[0].reason == CloseReason::STOP_LOSS);
        assert(m.total_profit_loss == Decimal::fromInt(-5));
        assert(m.losing_trades == 1);
        assert(m.max_drawdown == Decimal::fromInt(5));
        checkConservation(engine, m);
    }

    // SHORT bar touching both levels also resolves as the stop
    {
        SymbolCandles data;
        data["ETHUSDT"] = {bar(0, 101, 99, 100), bar(1, 106, 89, 95)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("ETHUSDT", 0, Direction::SHORT, "100", "105", "90")});
        assert(m.total_trades == 1);
        assert(m.closed_trades[0].reason == CloseReason::STOP_LOSS);
        assert(m.closed_trades[0].exit_price == Decimal::fromInt(105));
        assert(m.total_profit_loss == Decimal::fromInt(-5));
        checkConservation(engine, m);
    }

    // SHORT mirrors the comparisons
    {
        SymbolCandles data;
        data["ETHUSDT"] = {bar(0, 101, 99, 100), bar(1, 101, 89, 90)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("ETHUSDT", 0, Direction::SHORT, "100", "105", "90")});
        assert(m.closed_trades[0].reason == CloseReason::TAKE_PROFIT);
        assert(m.total_profit_loss == Decimal::fromInt(10));
        assert(m.closed_trades[0].risk_reward_ratio == Decimal::fromInt(2));
        checkConservation(engine, m);
    }

    // Position limit, then end-of-data liquidation at the last close
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 103, 100, 102)};
        data["ETHUSDT"] = {bar(0, 51, 49, 50), bar(1, 52, 48, 49)};

        BacktestConfig config;
        config.max_open_positions = 1;
        BacktestEngine engine(config);
        const auto m = engine.runBacktest(data, {
            makeSignal("ETHUSDT", 1, Direction::LONG, "49", "40", "60"),
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "90", "120"),
        });

        assert(m.total_trades == 1);
        const ClosedTrade& t = m.closed_trades.front();
        assert(t.symbol == "BTCUSDT");
        assert(t.reason == CloseReason::END_OF_BACKTEST);
        assert(t.exit_price == Decimal::fromInt(102));
        assert(t.profit_loss == Decimal::fromInt(2));
        checkConservation(engine, m);
    }

    // Rejected signal leaves cash and positions untouched
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 103, 100, 102)};
        data["ETHUSDT"] = {bar(0, 51, 49, 50), bar(1, 52, 48, 49)};

        BacktestConfig config;
        config.max_open_positions = 1;
        BacktestEngine engine(config);
        engine.processSignal(makeSignal("BTCUSDT", 0, Direction::LONG, "100", "90", "120"), data);
        assert(engine.getState().open_positions.size() == 1);
        assert(engine.getState().cash == Decimal::fromInt(9900));

        engine.processSignal(makeSignal("ETHUSDT", 1, Direction::LONG, "49", "40", "60"), data);
        assert(engine.getState().open_positions.size() == 1);
        assert(engine.getState().cash == Decimal::fromInt(9900));
        assert(engine.getState().equity == Decimal::fromInt(10000));
    }

    // Cash gate
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 101, 99, 100)};

        BacktestConfig config;
        config.initial_capital = Decimal::fromInt(150);
        BacktestEngine engine(config);
        const auto m = engine.runBacktest(data, {
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "90", "120"),
            makeSignal("BTCUSDT", 1, Direction::LONG, "100", "90", "120"),
        });
        assert(m.total_trades == 1);
        checkConservation(engine, m);
    }

    // Opposite signal closes the open position at its entry
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 106, 104, 105), bar(2, 111, 109, 110), bar(3, 109, 107, 108)};

        BacktestConfig config;
        config.close_on_opposite_signal = true;
        BacktestEngine engine(config);
        const auto m = engine.runBacktest(data, {
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "50", "200"),
            makeSignal("BTCUSDT", 2, Direction::SHORT, "110", "200", "10"),
        });

        assert(m.total_trades == 2);
        assert(m.closed_trades[0].reason == CloseReason::OPPOSING_SIGNAL);
        assert(m.closed_trades[0].exit_price == Decimal::fromInt(110));
        assert(m.closed_trades[0].profit_loss == Decimal::fromInt(10));
        assert(m.closed_trades[1].direction == Direction::SHORT);
        assert(m.closed_trades[1].reason == CloseReason::END_OF_BACKTEST);
        assert(m.closed_trades[1].exit_price == Decimal::fromInt(108));
        checkConservation(engine, m);
    }

    // Drawdown follows the equity curve
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 101, 89, 95), bar(2, 101, 99, 100), bar(3, 131, 99, 130)};

        BacktestConfig config;
        config.position_size = Decimal::fromInt(1000);
        BacktestEngine engine(config);
        const auto m = engine.runBacktest(data, {
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "90", "120"),
            makeSignal("BTCUSDT", 2, Direction::LONG, "100", "90", "130"),
        });

        assert(m.total_trades == 2);
        assert(m.total_profit_loss == Decimal::fromInt(200));
        assert(m.max_drawdown == Decimal::fromInt(100));
        assert(std::abs(m.max_drawdown_percentage - 1.0) < 1e-9);
        assert(m.equity_curve.back().drawdown.isZero());
        assert(m.best_trade && m.best_trade->pnl == Decimal::fromInt(300));
        assert(m.worst_trade && m.worst_trade->pnl == Decimal::fromInt(-100));
        assert(std::abs(m.profit_factor - 3.0) < 1e-9);
        assert(m.sharpe_ratio > 0.0);
        checkConservation(engine, m);
    }

    // Symbol without candles stays open at cost and books no trade
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("XRPUSDT", 0, Direction::LONG, "0.5", "0.4", "0.7")});
        assert(m.total_trades == 0);
        assert(m.final_equity == Decimal::fromInt(10000));
        assert(engine.getState().open_positions.size() == 1);
        assert(engine.getState().cash == Decimal::fromInt(9900));
        assert(m.equity_curve.size() == 1);
        checkConservation(engine, m);
    }

    // Equity curve stays in time order when a later close is booked first
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 101, 99, 100), bar(10, 116, 99, 115)};
        data["SOLUSDT"] = {bar(5, 21, 19, 20), bar(6, 20, 17, 18)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "95", "115"),
            makeSignal("ETHUSDT", 5, Direction::LONG, "50", "45", "60"),
            makeSignal("SOLUSDT", 5, Direction::LONG, "20", "18", "25"),
        });

        assert(m.total_trades == 2);
        assert(m.closed_trades[0].symbol == "BTCUSDT");
        assert(m.closed_trades[0].closed_at == 10 * kHour);
        assert(m.closed_trades[1].symbol == "SOLUSDT");
        assert(m.closed_trades[1].reason == CloseReason::STOP_LOSS);
        assert(m.closed_trades[1].closed_at == 6 * kHour);
        assert(m.total_profit_loss == Decimal::fromInt(5));

        assert(m.equity_curve.size() == 3);
        assert(m.equity_curve[0].timestamp == 0);
        assert(m.equity_curve[1].timestamp == 10 * kHour);
        assert(m.equity_curve[2].timestamp == 10 * kHour);

        assert(engine.getState().open_positions.size() == 1);
        assert(engine.getState().open_positions[0].symbol == "ETHUSDT");
        checkConservation(engine, m);
    }

    // Signal after the last bar liquidates at its own entry time
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 103, 100, 102)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {makeSignal("BTCUSDT", 5, Direction::LONG, "100", "90", "120")});
        assert(m.total_trades == 1);
        const ClosedTrade& t = m.closed_trades.front();
        assert(t.reason == CloseReason::END_OF_BACKTEST);
        assert(t.exit_price == Decimal::fromInt(102));
        assert(t.closed_at == 5 * kHour);
        assert(t.duration_hours == 0.0);
        assert(m.avg_trade_duration_hours == 0.0);
        assert(m.equity_curve.back().timestamp == 5 * kHour);
        checkConservation(engine, m);
    }

    // Cash and max drawdown checked after every close
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(0, 101, 99, 100), bar(1, 101, 89, 95), bar(2, 101, 99, 100),
                           bar(3, 131, 99, 130), bar(4, 101, 94, 96)};

        BacktestConfig config;
        config.position_size = Decimal::fromInt(1000);
        BacktestEngine engine(config);

        const std::vector<BacktestSignal> signals = {
            makeSignal("BTCUSDT", 0, Direction::LONG, "100", "90", "120"),
            makeSignal("BTCUSDT", 2, Direction::LONG, "100", "90", "130"),
            makeSignal("BTCUSDT", 4, Direction::LONG, "100", "95", "200"),
        };
        const char* expected_cash[] = {"9900", "10200", "10150"};
        const char* expected_max_drawdown[] = {"100", "100", "100"};
        const char* expected_drawdown[] = {"100", "0", "50"};

        Decimal previous_max;
        for (size_t i = 0; i < signals.size(); ++i) {
            const Decimal cash_before = engine.getState().cash;
            const size_t trades_before = engine.getState().closed_trades.size();

            engine.processSignal(signals[i], data);

            const auto& state = engine.getState();
            assert(state.open_positions.empty());
            assert(state.closed_trades.size() == trades_before + 1);
            const ClosedTrade& t = state.closed_trades.back();
            assert(state.cash == cash_before - config.position_size + t.position_size + t.profit_loss);
            assert(state.cash == Decimal::fromString(expected_cash[i]));
            assert(state.equity == state.cash);

            assert(state.max_drawdown >= previous_max);
            assert(state.max_drawdown == Decimal::fromString(expected_max_drawdown[i]));
            assert(state.current_drawdown == Decimal::fromString(expected_drawdown[i]));
            assert(engine.getEquityCurve().back().drawdown == state.current_drawdown);
            previous_max = state.max_drawdown;
        }
    }

    // No signals
    {
        SymbolCandles data;
        data["BTCUSDT"] = {bar(5, 101, 99, 100)};

        BacktestEngine engine;
        const auto m = engine.runBacktest(data, {});
        assert(m.total_trades == 0);
        assert(m.final_equity == Decimal::fromInt(10000));
        assert(m.initial_capital == Decimal::fromInt(10000));
        assert(m.equity_curve.size() == 1);
        assert(m.equity_curve[0].timestamp == 5 * kHour);
        assert(!m.best_trade);
        assert(toJson(m).at("best_trade").is_null());
    }

    // Bad configuration
    {
        BacktestConfig config;
        config.position_size = Decimal();
        bool threw = false;
        try {
            BacktestEngine engine(config);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
