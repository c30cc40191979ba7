#include "app/Cli.h"
#include "common/Logger.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/SignalReplay.h"
#include "signal/SignalDetectionEngine.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace quantscan {
namespace app {

namespace {

backtest::SymbolCandles loadCandles(const std::string& path, const std::string& timeframe) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".csv") {
        const std::string symbol = std::filesystem::path(path).stem().string();
        backtest::SymbolCandles data;
        auto candles = backtest::DataHistory::loadCSV(path, symbol, timeframe);
        if (!candles.empty()) {
            data[symbol] = std::move(candles);
        }
        return data;
    }
    return backtest::DataHistory::loadJSON(path);
}

void printSummary(const backtest::BacktestMetrics& m, std::ostream& out) {
    out << "\nBacktest results\n";
    out << "---------------------------------------------\n";
    out << "Initial capital: " << m.initial_capital.toString() << "\n";
    out << "Final equity:    " << m.final_equity.toString() << "\n";
    out << "Total P/L:       " << m.total_profit_loss.toString() << "\n";
    out << std::fixed << std::setprecision(2);
    out << "ROI:             " << m.roi << "%\n";
    out << "Max drawdown:    " << m.max_drawdown.toString()
        << " (" << m.max_drawdown_percentage << "%)\n";
    out << "Total trades:    " << m.total_trades << "\n";
    out << "Winning trades:  " << m.winning_trades << "\n";
    out << "Losing trades:   " << m.losing_trades << "\n";
    out << "Win rate:        " << m.win_rate << "%\n";
    out << "Avg win:         " << m.avg_winning_trade.toString() << "\n";
    out << "Avg loss:        " << m.avg_losing_trade.toString() << "\n";
    out << "Avg duration:    " << m.avg_trade_duration_hours << " h\n";
    out << std::setprecision(3);
    out << "Profit factor:   " << m.profit_factor << "\n";
    out << "Sharpe ratio:    " << m.sharpe_ratio << "\n";
    if (m.best_trade) {
        out << "Best trade:      " << m.best_trade->symbol << " " << m.best_trade->pnl.toString()
            << " (" << m.best_trade->pnl_pct.toString() << "%)\n";
    }
    if (m.worst_trade) {
        out << "Worst trade:     " << m.worst_trade->symbol << " " << m.worst_trade->pnl.toString()
            << " (" << m.worst_trade->pnl_pct.toString() << "%)\n";
    }
    out << "---------------------------------------------\n";
}

} // namespace

void printUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  quantscan --backtest <candles.json|csv> [--signals <signals.json>]\n"
        << "            [--config <config.json>] [--initial-capital X] [--position-size Y]\n"
        << "            [--max-positions N] [--timeframe TF] [--volatility-aware | --base-config] [--json]\n"
        << "  quantscan --scan <candles.json|csv> [--config <config.json>] [--timeframe TF]\n"
        << "            [--volatility-aware | --base-config] [--json]\n"
        << "\n"
        << "Thresholds come from the market preset of each symbol unless --base-config\n"
        << "(the \"signal\" section) or --volatility-aware is given.\n";
}

bool parseArgs(const std::vector<std::string>& args, CliOptions& opts, std::ostream& err) {
    if (args.size() < 2) {
        return false;
    }
    if (args[0] == "--backtest") {
        opts.mode = Mode::BACKTEST;
    } else if (args[0] == "--scan") {
        opts.mode = Mode::SCAN;
    } else {
        return false;
    }
    opts.data_path = args[1];

    for (size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool has_value = (i + 1 < args.size());
        if (arg == "--json") {
            opts.json_mode = true;
            continue;
        }
        if (arg == "--volatility-aware") {
            opts.volatility_aware = true;
            continue;
        }
        if (arg == "--base-config") {
            opts.base_config = true;
            continue;
        }
        if (arg == "--signals" && has_value) {
            opts.signals_path = args[++i];
            continue;
        }
        if (arg == "--config" && has_value) {
            opts.config_path = args[++i];
            continue;
        }
        if (arg == "--timeframe" && has_value) {
            opts.timeframe = args[++i];
            continue;
        }
        if (arg == "--initial-capital" && has_value) {
            try {
                opts.initial_capital = Decimal::fromString(args[++i]);
            } catch (const std::exception&) {
                err << "Invalid --initial-capital value. Ignored.\n";
            }
            continue;
        }
        if (arg == "--position-size" && has_value) {
            try {
                opts.position_size = Decimal::fromString(args[++i]);
            } catch (const std::exception&) {
                err << "Invalid --position-size value. Ignored.\n";
            }
            continue;
        }
        if (arg == "--max-positions" && has_value) {
            try {
                opts.max_positions = std::stoi(args[++i]);
            } catch (const std::exception&) {
                err << "Invalid --max-positions value. Ignored.\n";
            }
            continue;
        }
        err << "Unknown argument: " << arg << "\n";
        return false;
    }

    if (opts.volatility_aware && opts.base_config) {
        err << "--volatility-aware and --base-config are exclusive\n";
        return false;
    }
    return true;
}

std::shared_ptr<signal::IConfigResolver> makeResolver(const CliOptions& opts, const Config& config) {
    if (opts.volatility_aware) {
        return std::make_shared<signal::VolatilityConfigResolver>(
            config.getSignalConfig(), std::make_shared<signal::VolatilityClassifier>());
    }
    if (opts.base_config) {
        return std::make_shared<signal::DefaultConfigResolver>(config.getSignalConfig());
    }
    return std::make_shared<signal::MarketConfigResolver>(config.getMarketPresets(), opts.timeframe);
}

int runBacktest(const CliOptions& opts, Config& config, std::ostream& out) {
    if (opts.initial_capital) config.setInitialCapital(*opts.initial_capital);
    if (opts.position_size) config.setPositionSize(*opts.position_size);
    if (opts.max_positions) config.setMaxOpenPositions(*opts.max_positions);

    const auto data = loadCandles(opts.data_path, opts.timeframe);
    if (data.empty()) {
        std::cerr << "No candles loaded from " << opts.data_path << "\n";
        return 1;
    }

    std::vector<backtest::BacktestSignal> signals;
    if (!opts.signals_path.empty()) {
        signals = backtest::DataHistory::loadSignals(opts.signals_path);
    } else {
        signals = backtest::SignalReplay::generateSignals(
            data, config.getSignalConfig(), opts.timeframe, makeResolver(opts, config));
    }

    backtest::BacktestEngine engine(config.getBacktestConfig());
    const auto metrics = engine.runBacktest(data, signals);

    if (opts.json_mode) {
        out << backtest::toJson(metrics).dump() << "\n";
    } else {
        printSummary(metrics, out);
    }
    return 0;
}

int runScan(const CliOptions& opts, const Config& config, std::ostream& out) {
    const auto data = loadCandles(opts.data_path, opts.timeframe);
    if (data.empty()) {
        std::cerr << "No candles loaded from " << opts.data_path << "\n";
        return 1;
    }

    signal::SignalDetectionEngine engine(config.getSignalConfig(), makeResolver(opts, config));
    nlohmann::json events = nlohmann::json::array();

    for (const auto& [symbol, candles] : data) {
        engine.updateCandles(symbol, candles);
        auto event = engine.processSymbol(symbol, opts.timeframe);
        if (!event) {
            if (!opts.json_mode) out << symbol << ": no signal\n";
            continue;
        }
        if (opts.json_mode) {
            events.push_back(signal::toJson(*event));
        } else {
            const auto& s = event->signal;
            out << symbol << ": " << signal::signalActionToString(event->action) << " "
                << directionToString(s.direction) << " @ " << s.entry_price.toString()
                << " SL " << s.stop_loss.toString() << " TP " << s.take_profit.toString()
                << std::fixed << std::setprecision(0) << " conf " << s.confidence * 100.0 << "%\n"
                << "  " << s.description << "\n";
        }
    }

    if (opts.json_mode) {
        out << events.dump() << "\n";
    }
    return 0;
}

int run(const CliOptions& opts, std::ostream& out) {
    try {
        auto& config = Config::getInstance();
        config.load(opts.config_path);
        Logger::getInstance().setLevel(opts.json_mode ? "warn" : config.getLogLevel());

        if (!std::filesystem::exists(opts.data_path)) {
            std::cerr << "Data file not found: " << opts.data_path << "\n";
            return 1;
        }

        if (opts.mode == Mode::BACKTEST) {
            LOG_INFO("Starting backtest mode with file: {}", opts.data_path);
            return runBacktest(opts, config, out);
        }
        LOG_INFO("Starting scan mode with file: {}", opts.data_path);
        return runScan(opts, config, out);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace app
} // namespace quantscan
