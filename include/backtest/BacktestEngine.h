#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Decimal.h"
#include "common/Types.h"
#include "signal/ConditionSet.h"

namespace quantscan {
namespace backtest {

using SymbolCandles = std::map<std::string, std::vector<Candle>>;

enum class CloseReason {
    STOP_LOSS,
    TAKE_PROFIT,
    OPPOSING_SIGNAL,
    END_OF_BACKTEST
};

const char* closeReasonToString(CloseReason reason);

struct BacktestConfig {
    Decimal initial_capital = Decimal::fromInt(10000);
    Decimal position_size = Decimal::fromInt(100);
    int max_open_positions = 5;
    // Close an open position when a signal in the other direction arrives
    // for the same symbol.
    bool close_on_opposite_signal = false;
};

// One entry to simulate, as emitted by the detection engine or loaded from file.
struct BacktestSignal {
    std::string symbol;
    long long timestamp = 0;        // epoch ms
    Direction direction = Direction::LONG;
    Decimal entry;
    Decimal stop_loss;
    Decimal take_profit;
    double confidence = 0.7;
    signal::ConditionSet conditions;
    std::optional<int> leverage;
};

struct BacktestPosition {
    std::string symbol;
    Direction direction = Direction::LONG;
    Decimal entry_price;
    long long entry_time = 0;
    Decimal quantity;               // position_size / entry_price
    Decimal position_size;          // capital allocated
    Decimal stop_loss;
    Decimal take_profit;
    std::optional<int> leverage;
    double signal_confidence = 0.0;
    signal::ConditionSet signal_conditions;
};

struct ClosedTrade {
    std::string symbol;
    Direction direction = Direction::LONG;
    Decimal entry_price;
    Decimal exit_price;
    Decimal stop_loss;
    Decimal take_profit;
    Decimal position_size;
    Decimal quantity;
    Decimal profit_loss;
    Decimal profit_loss_percentage;
    long long opened_at = 0;
    long long closed_at = 0;
    double duration_hours = 0.0;
    CloseReason reason = CloseReason::END_OF_BACKTEST;
    double signal_confidence = 0.0;
    signal::ConditionSet signal_conditions;
    Decimal risk_reward_ratio;
    std::optional<int> leverage;
};

struct EquitySnapshot {
    long long timestamp = 0;
    Decimal equity;
    Decimal cash;
    int open_positions = 0;
    int total_trades = 0;
    Decimal drawdown;
};

// equity == cash + sum(position_size of open_positions) after every update;
// open positions are valued at allocated cost.
struct BacktestState {
    Decimal equity;
    Decimal cash;
    std::vector<BacktestPosition> open_positions;
    std::vector<ClosedTrade> closed_trades;
    Decimal peak_equity;
    Decimal current_drawdown;
    Decimal max_drawdown;
};

struct TradeSummary {
    std::string symbol;
    Decimal pnl;
    Decimal pnl_pct;
};

struct BacktestMetrics {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;                  // %
    Decimal total_profit_loss;
    double roi = 0.0;                       // %
    Decimal final_equity;
    Decimal initial_capital;
    Decimal max_drawdown;
    double max_drawdown_percentage = 0.0;
    Decimal avg_profit_per_trade;
    Decimal avg_winning_trade;
    Decimal avg_losing_trade;
    double avg_trade_duration_hours = 0.0;
    double profit_factor = 0.0;
    double sharpe_ratio = 0.0;
    std::optional<TradeSummary> best_trade;
    std::optional<TradeSummary> worst_trade;
    std::vector<EquitySnapshot> equity_curve;
    std::vector<ClosedTrade> closed_trades;
};

// Replays signals in timestamp order against historical candles. Exits are
// resolved pessimistically: when a candle touches both levels the stop wins.
// One instance per run.
class BacktestEngine {
public:
    // Throws std::invalid_argument for a non-positive position size or
    // position limit, or negative capital.
    explicit BacktestEngine(const BacktestConfig& config = BacktestConfig());

    BacktestMetrics runBacktest(const SymbolCandles& symbols_data,
                                const std::vector<BacktestSignal>& signals);

    // Opens a position unless the position limit or cash forbids it, then
    // sweeps every open position for exits from the signal time on.
    void processSignal(const BacktestSignal& signal, const SymbolCandles& symbols_data);

    // Liquidates at each symbol's last close, never before the entry time.
    // Positions on symbols without data stay open, valued at cost, and book
    // no trade.
    void closeAllPositions(const SymbolCandles& symbols_data);

    BacktestMetrics calculateFinalMetrics() const;

    const BacktestState& getState() const { return state_; }
    const std::vector<EquitySnapshot>& getEquityCurve() const { return equity_curve_; }
    const BacktestConfig& getConfig() const { return config_; }

private:
    void resetState(long long start_time);
    void updatePositions(const SymbolCandles& symbols_data, long long current_time);
    void closeOpposingPositions(const BacktestSignal& signal);
    void closePosition(const BacktestPosition& position, const Decimal& exit_price,
                       long long exit_time, CloseReason reason);
    Decimal openPositionsValue() const;
    void recordSnapshot(long long timestamp);

    BacktestConfig config_;
    BacktestState state_;
    std::vector<EquitySnapshot> equity_curve_;
};

nlohmann::json toJson(const ClosedTrade& trade);
nlohmann::json toJson(const EquitySnapshot& snapshot);
nlohmann::json toJson(const BacktestMetrics& metrics);

} // namespace backtest
} // namespace quantscan
