#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace quantscan {
namespace backtest {

namespace {
constexpr double MS_PER_HOUR = 3600.0 * 1000.0;

long long earliestTimestamp(const SymbolCandles& symbols_data) {
    long long earliest = std::numeric_limits<long long>::max();
    for (const auto& [symbol, candles] : symbols_data) {
        for (const auto& candle : candles) {
            earliest = std::min(earliest, candle.timestamp);
        }
    }
    return (earliest == std::numeric_limits<long long>::max()) ? 0 : earliest;
}

double safeRatio(double numerator, double denominator) {
    return (denominator > 0.0) ? numerator / denominator : 0.0;
}
}

const char* closeReasonToString(CloseReason reason) {
    switch (reason) {
        case CloseReason::STOP_LOSS: return "CLOSED_SL";
        case CloseReason::TAKE_PROFIT: return "CLOSED_TP";
        case CloseReason::OPPOSING_SIGNAL: return "CLOSED_OPPOSITE";
        case CloseReason::END_OF_BACKTEST: return "CLOSED_END";
    }
    return "CLOSED_END";
}

BacktestEngine::BacktestEngine(const BacktestConfig& config)
    : config_(config) {
    if (config_.position_size <= Decimal()) {
        throw std::invalid_argument("position_size must be positive");
    }
    if (config_.initial_capital < Decimal()) {
        throw std::invalid_argument("initial_capital must not be negative");
    }
    if (config_.max_open_positions < 1) {
        throw std::invalid_argument("max_open_positions must be at least 1");
    }
    resetState(0);
}

void BacktestEngine::resetState(long long start_time) {
    state_ = BacktestState();
    state_.cash = config_.initial_capital;
    state_.equity = config_.initial_capital;
    state_.peak_equity = config_.initial_capital;

    equity_curve_.clear();
    recordSnapshot(start_time);
}

BacktestMetrics BacktestEngine::runBacktest(const SymbolCandles& symbols_data,
                                            const std::vector<BacktestSignal>& signals) {
    LOG_INFO("Starting backtest with {} signals across {} symbols", signals.size(), symbols_data.size());
    resetState(earliestTimestamp(symbols_data));

    std::vector<BacktestSignal> sorted_signals = signals;
    std::stable_sort(sorted_signals.begin(), sorted_signals.end(),
                     [](const BacktestSignal& a, const BacktestSignal& b) {
                         return a.timestamp < b.timestamp;
                     });

    for (const auto& signal : sorted_signals) {
        processSignal(signal, symbols_data);
    }

    closeAllPositions(symbols_data);

    BacktestMetrics metrics = calculateFinalMetrics();
    LOG_INFO("Backtest completed: {} trades, Win Rate: {:.2f}%, P/L: {}",
             metrics.total_trades, metrics.win_rate, metrics.total_profit_loss.toString());
    return metrics;
}

void BacktestEngine::processSignal(const BacktestSignal& signal, const SymbolCandles& symbols_data) {
    if (config_.close_on_opposite_signal) {
        closeOpposingPositions(signal);
    }

    if (static_cast<int>(state_.open_positions.size()) >= config_.max_open_positions) {
        LOG_DEBUG("Max positions reached, skipping {}", signal.symbol);
        return;
    }
    if (state_.cash < config_.position_size) {
        LOG_DEBUG("Insufficient cash ({}), skipping {}", state_.cash.toString(), signal.symbol);
        return;
    }
    if (signal.entry <= Decimal()) {
        LOG_WARN("Non-positive entry price for {}, skipping", signal.symbol);
        return;
    }

    BacktestPosition position;
    position.symbol = signal.symbol;
    position.direction = signal.direction;
    position.entry_price = signal.entry;
    position.entry_time = signal.timestamp;
    position.position_size = config_.position_size;
    position.quantity = config_.position_size / signal.entry;
    position.stop_loss = signal.stop_loss;
    position.take_profit = signal.take_profit;
    position.leverage = signal.leverage;
    position.signal_confidence = signal.confidence;
    position.signal_conditions = signal.conditions;

    state_.open_positions.push_back(position);
    state_.cash -= config_.position_size;

    LOG_DEBUG("Opened {} {} @ {} (TP: {}, SL: {})",
              directionToString(position.direction), position.symbol,
              position.entry_price.toString(), position.take_profit.toString(),
              position.stop_loss.toString());

    updatePositions(symbols_data, signal.timestamp);
}

void BacktestEngine::updatePositions(const SymbolCandles& symbols_data, long long current_time) {
    size_t i = 0;
    while (i < state_.open_positions.size()) {
        const BacktestPosition& position = state_.open_positions[i];

        auto data_it = symbols_data.find(position.symbol);
        if (data_it == symbols_data.end()) {
            ++i;
            continue;
        }

        std::optional<Decimal> exit_price;
        long long exit_time = 0;
        CloseReason reason = CloseReason::END_OF_BACKTEST;

        for (const auto& candle : data_it->second) {
            if (candle.timestamp < position.entry_time || candle.timestamp < current_time) {
                continue;
            }

            const Decimal high = Decimal::fromDouble(candle.high);
            const Decimal low = Decimal::fromDouble(candle.low);

            // Stop first: a candle touching both levels resolves as a loss
            if (position.direction == Direction::LONG) {
                if (low <= position.stop_loss) {
                    exit_price = position.stop_loss;
                    reason = CloseReason::STOP_LOSS;
                } else if (high >= position.take_profit) {
                    exit_price = position.take_profit;
                    reason = CloseReason::TAKE_PROFIT;
                }
            } else {
                if (high >= position.stop_loss) {
                    exit_price = position.stop_loss;
                    reason = CloseReason::STOP_LOSS;
                } else if (low <= position.take_profit) {
                    exit_price = position.take_profit;
                    reason = CloseReason::TAKE_PROFIT;
                }
            }

            if (exit_price) {
                exit_time = candle.timestamp;
                break;
            }
        }

        if (!exit_price) {
            ++i;
            continue;
        }

        const BacktestPosition closing = position;
        state_.open_positions.erase(state_.open_positions.begin() + static_cast<std::ptrdiff_t>(i));
        closePosition(closing, *exit_price, exit_time, reason);
    }
}

void BacktestEngine::closeOpposingPositions(const BacktestSignal& signal) {
    size_t i = 0;
    while (i < state_.open_positions.size()) {
        const BacktestPosition& position = state_.open_positions[i];
        if (position.symbol != signal.symbol || position.direction == signal.direction) {
            ++i;
            continue;
        }
        const BacktestPosition closing = position;
        state_.open_positions.erase(state_.open_positions.begin() + static_cast<std::ptrdiff_t>(i));
        closePosition(closing, signal.entry, signal.timestamp, CloseReason::OPPOSING_SIGNAL);
    }
}

void BacktestEngine::closePosition(const BacktestPosition& position, const Decimal& exit_price,
                                   long long exit_time, CloseReason reason) {
    Decimal pnl;
    Decimal risk;
    Decimal reward;
    if (position.direction == Direction::LONG) {
        pnl = (exit_price - position.entry_price) * position.quantity;
        risk = position.entry_price - position.stop_loss;
        reward = position.take_profit - position.entry_price;
    } else {
        pnl = (position.entry_price - exit_price) * position.quantity;
        risk = position.stop_loss - position.entry_price;
        reward = position.entry_price - position.take_profit;
    }

    ClosedTrade trade;
    trade.symbol = position.symbol;
    trade.direction = position.direction;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.stop_loss = position.stop_loss;
    trade.take_profit = position.take_profit;
    trade.position_size = position.position_size;
    trade.quantity = position.quantity;
    trade.profit_loss = pnl;
    trade.profit_loss_percentage = pnl / position.position_size * Decimal::fromInt(100);
    trade.opened_at = position.entry_time;
    trade.closed_at = exit_time;
    trade.duration_hours = static_cast<double>(exit_time - position.entry_time) / MS_PER_HOUR;
    trade.reason = reason;
    trade.signal_confidence = position.signal_confidence;
    trade.signal_conditions = position.signal_conditions;
    trade.risk_reward_ratio = (risk > Decimal()) ? reward / risk : Decimal();
    trade.leverage = position.leverage;
    state_.closed_trades.push_back(trade);

    // The closed position is already out of open_positions
    state_.cash += position.position_size + pnl;
    state_.equity = state_.cash + openPositionsValue();

    if (state_.equity > state_.peak_equity) {
        state_.peak_equity = state_.equity;
        state_.current_drawdown = Decimal();
    } else {
        state_.current_drawdown = state_.peak_equity - state_.equity;
        if (state_.current_drawdown > state_.max_drawdown) {
            state_.max_drawdown = state_.current_drawdown;
        }
    }

    recordSnapshot(exit_time);

    LOG_DEBUG("Closed {} {} @ {} | P/L: {} ({}%) | Status: {}",
              directionToString(position.direction), position.symbol, exit_price.toString(),
              pnl.toString(), trade.profit_loss_percentage.toString(), closeReasonToString(reason));
    Logger::getInstance().logTrade(position.symbol, directionToString(position.direction),
                                   position.entry_price.toDouble(), exit_price.toDouble(),
                                   pnl.toDouble(), closeReasonToString(reason));
}

void BacktestEngine::closeAllPositions(const SymbolCandles& symbols_data) {
    std::vector<BacktestPosition> unpriced;

    while (!state_.open_positions.empty()) {
        const BacktestPosition position = state_.open_positions.front();
        state_.open_positions.erase(state_.open_positions.begin());

        auto data_it = symbols_data.find(position.symbol);
        if (data_it == symbols_data.end() || data_it->second.empty()) {
            LOG_WARN("No data for {}, position left open at cost", position.symbol);
            unpriced.push_back(position);
            continue;
        }

        // A signal newer than the last bar exits at its own entry time
        const Candle& last = data_it->second.back();
        const long long exit_time = std::max(last.timestamp, position.entry_time);
        closePosition(position, Decimal::fromDouble(last.close), exit_time, CloseReason::END_OF_BACKTEST);
    }

    state_.open_positions = std::move(unpriced);
}

Decimal BacktestEngine::openPositionsValue() const {
    Decimal total;
    for (const auto& position : state_.open_positions) {
        total += position.position_size;
    }
    return total;
}

void BacktestEngine::recordSnapshot(long long timestamp) {
    EquitySnapshot snapshot;
    // Closes are booked in signal order; the curve never steps back in time
    snapshot.timestamp = equity_curve_.empty()
        ? timestamp
        : std::max(timestamp, equity_curve_.back().timestamp);
    snapshot.equity = state_.equity;
    snapshot.cash = state_.cash;
    snapshot.open_positions = static_cast<int>(state_.open_positions.size());
    snapshot.total_trades = static_cast<int>(state_.closed_trades.size());
    snapshot.drawdown = state_.current_drawdown;
    equity_curve_.push_back(snapshot);
}

BacktestMetrics BacktestEngine::calculateFinalMetrics() const {
    BacktestMetrics m;
    m.initial_capital = config_.initial_capital;
    m.final_equity = state_.equity;
    m.equity_curve = equity_curve_;

    const auto& trades = state_.closed_trades;
    if (trades.empty()) {
        return m;
    }

    m.total_trades = static_cast<int>(trades.size());
    m.closed_trades = trades;
    m.max_drawdown = state_.max_drawdown;

    Decimal gross_profit;
    Decimal gross_loss;
    double total_hours = 0.0;
    std::vector<double> returns;
    returns.reserve(trades.size());

    const ClosedTrade* best = &trades.front();
    const ClosedTrade* worst = &trades.front();

    for (const auto& t : trades) {
        if (t.profit_loss > Decimal()) {
            ++m.winning_trades;
            gross_profit += t.profit_loss;
        } else {
            ++m.losing_trades;
            gross_loss += t.profit_loss;
        }
        m.total_profit_loss += t.profit_loss;
        total_hours += t.duration_hours;
        returns.push_back(t.profit_loss_percentage.toDouble());

        if (t.profit_loss > best->profit_loss) best = &t;
        if (t.profit_loss < worst->profit_loss) worst = &t;
    }

    const double initial = config_.initial_capital.toDouble();
    m.win_rate = static_cast<double>(m.winning_trades) / m.total_trades * 100.0;
    m.roi = safeRatio(m.total_profit_loss.toDouble(), initial) * 100.0;
    m.max_drawdown_percentage = safeRatio(state_.max_drawdown.toDouble(), initial) * 100.0;

    m.avg_profit_per_trade = m.total_profit_loss / Decimal::fromInt(m.total_trades);
    if (m.winning_trades > 0) {
        m.avg_winning_trade = gross_profit / Decimal::fromInt(m.winning_trades);
    }
    if (m.losing_trades > 0) {
        m.avg_losing_trade = gross_loss / Decimal::fromInt(m.losing_trades);
    }
    m.avg_trade_duration_hours = total_hours / m.total_trades;

    m.profit_factor = safeRatio(gross_profit.toDouble(), gross_loss.abs().toDouble());

    // Mean over population deviation of per-trade % returns, no risk-free rate
    double mean_return = 0.0;
    for (double r : returns) mean_return += r;
    mean_return /= returns.size();
    double variance = 0.0;
    for (double r : returns) variance += (r - mean_return) * (r - mean_return);
    const double std_return = std::sqrt(variance / returns.size());
    m.sharpe_ratio = (std_return > 0.0) ? mean_return / std_return : 0.0;

    m.best_trade = TradeSummary{best->symbol, best->profit_loss, best->profit_loss_percentage};
    m.worst_trade = TradeSummary{worst->symbol, worst->profit_loss, worst->profit_loss_percentage};
    return m;
}

nlohmann::json toJson(const ClosedTrade& t) {
    nlohmann::json j = {
        {"symbol", t.symbol},
        {"direction", directionToString(t.direction)},
        {"entry_price", t.entry_price.toString()},
        {"exit_price", t.exit_price.toString()},
        {"stop_loss", t.stop_loss.toString()},
        {"take_profit", t.take_profit.toString()},
        {"position_size", t.position_size.toString()},
        {"quantity", t.quantity.toString()},
        {"profit_loss", t.profit_loss.toString()},
        {"profit_loss_percentage", t.profit_loss_percentage.toString()},
        {"opened_at", t.opened_at},
        {"closed_at", t.closed_at},
        {"duration_hours", t.duration_hours},
        {"status", closeReasonToString(t.reason)},
        {"signal_confidence", t.signal_confidence},
        {"signal_indicators", t.signal_conditions.toJson(t.direction)},
        {"risk_reward_ratio", t.risk_reward_ratio.toString()},
    };
    j["leverage"] = t.leverage ? nlohmann::json(*t.leverage) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json toJson(const EquitySnapshot& s) {
    return {
        {"timestamp", s.timestamp},
        {"equity", s.equity.toDouble()},
        {"cash", s.cash.toDouble()},
        {"open_positions", s.open_positions},
        {"total_trades", s.total_trades},
        {"drawdown", s.drawdown.toDouble()},
    };
}

nlohmann::json toJson(const BacktestMetrics& m) {
    auto summary = [](const std::optional<TradeSummary>& t) -> nlohmann::json {
        if (!t) return nullptr;
        return {{"symbol", t->symbol}, {"pnl", t->pnl.toString()}, {"pnl_pct", t->pnl_pct.toString()}};
    };

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& s : m.equity_curve) curve.push_back(toJson(s));
    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : m.closed_trades) trades.push_back(toJson(t));

    return {
        {"total_trades", m.total_trades},
        {"winning_trades", m.winning_trades},
        {"losing_trades", m.losing_trades},
        {"win_rate", m.win_rate},
        {"total_profit_loss", m.total_profit_loss.toString()},
        {"roi", m.roi},
        {"final_equity", m.final_equity.toString()},
        {"initial_capital", m.initial_capital.toString()},
        {"max_drawdown", m.max_drawdown.toString()},
        {"max_drawdown_percentage", m.max_drawdown_percentage},
        {"avg_profit_per_trade", m.avg_profit_per_trade.toString()},
        {"avg_winning_trade", m.avg_winning_trade.toString()},
        {"avg_losing_trade", m.avg_losing_trade.toString()},
        {"avg_trade_duration_hours", m.avg_trade_duration_hours},
        {"profit_factor", m.profit_factor},
        {"sharpe_ratio", m.sharpe_ratio},
        {"best_trade", summary(m.best_trade)},
        {"worst_trade", summary(m.worst_trade)},
        {"equity_curve", curve},
        {"closed_trades", trades},
    };
}

} // namespace backtest
} // namespace quantscan
