#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestEngine.h"
#include "signal/MarketPresets.h"
#include "signal/SignalConfig.h"

namespace quantscan {

class Config {
public:
    static Config& getInstance();

    // Missing or unparsable files keep the defaults. Throws
    // std::invalid_argument when a signal section or market preset fails
    // validation; the previous settings stay in effect.
    void load(const std::string& config_path);

    // Back to built-in defaults.
    void reset();

    signal::SignalConfig getSignalConfig() const { return signal_config_; }
    const signal::MarketPresets& getMarketPresets() const { return market_presets_; }
    // Market preset with the timeframe override applied; UNKNOWN uses binance.
    signal::SignalConfig getMarketConfig(signal::MarketType market, const std::string& timeframe = "") const {
        return market_presets_.configFor(market, timeframe);
    }

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    void setInitialCapital(const Decimal& v) { backtest_config_.initial_capital = v; }
    void setPositionSize(const Decimal& v) { backtest_config_.position_size = v; }
    void setMaxOpenPositions(int v) { backtest_config_.max_open_positions = v; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLoadedPath() const { return loaded_path_; }

private:
    Config();

    void applyJson(const nlohmann::json& j);

    signal::SignalConfig signal_config_;
    signal::MarketPresets market_presets_;
    backtest::BacktestConfig backtest_config_;
    std::string log_level_ = "info";
    std::string loaded_path_;
};

} // namespace quantscan
