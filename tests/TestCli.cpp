#include "app/Cli.h"
#include "TestCandles.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace quantscan;
using namespace quantscan::app;

namespace {
const std::string kNoConfig = "/nonexistent/quantscan/config.json";

std::filesystem::path writeFile(const std::string& name, const std::string& content) {
    const auto dir = std::filesystem::temp_directory_path() / "quantscan_test_cli";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

// One CSV row per candle, indicator columns taken from the first candle.
std::string toCsv(const std::vector<Candle>& candles) {
    std::ostringstream csv;
    csv << "timestamp,open,high,low,close,volume";
    for (const auto& [name, value] : candles.front().indicators) {
        csv << "," << name;
    }
    csv << "\n";
    for (const auto& c : candles) {
        csv << c.timestamp << "," << c.open << "," << c.high << "," << c.low << ","
            << c.close << "," << c.volume;
        for (const auto& [name, value] : candles.front().indicators) {
            csv << "," << c.indicator(name);
        }
        csv << "\n";
    }
    return csv.str();
}

bool parse(const std::vector<std::string>& args, CliOptions& opts) {
    std::ostringstream err;
    return parseArgs(args, opts, err);
}
}

int main() {
    // Full backtest command line
    {
        CliOptions opts;
        std::ostringstream err;
        assert(parseArgs({"--backtest", "data.csv", "--signals", "s.json", "--config", "c.json",
                          "--initial-capital", "5000", "--position-size", "250",
                          "--max-positions", "3", "--timeframe", "1h", "--json"}, opts, err));
        assert(opts.mode == Mode::BACKTEST);
        assert(opts.data_path == "data.csv");
        assert(opts.signals_path == "s.json");
        assert(opts.config_path == "c.json");
        assert(opts.timeframe == "1h");
        assert(opts.json_mode);
        assert(opts.initial_capital && *opts.initial_capital == Decimal::fromInt(5000));
        assert(opts.position_size && *opts.position_size == Decimal::fromInt(250));
        assert(opts.max_positions && *opts.max_positions == 3);
        assert(err.str().empty());
    }

    // Scan defaults
    {
        CliOptions opts;
        assert(parse({"--scan", "candles.json"}, opts));
        assert(opts.mode == Mode::SCAN);
        assert(opts.config_path == "config/config.json");
        assert(opts.timeframe == "4h");
        assert(!opts.json_mode && !opts.volatility_aware && !opts.base_config);
    }

    // Rejected command lines
    {
        CliOptions opts;
        assert(!parse({}, opts));
        assert(!parse({"--backtest"}, opts));
        assert(!parse({"--optimize", "data.csv"}, opts));
        assert(!parse({"--scan", "data.csv", "--verbose"}, opts));
        assert(!parse({"--scan", "data.csv", "--volatility-aware", "--base-config"}, opts));
    }

    // Malformed numbers are reported and ignored
    {
        CliOptions opts;
        std::ostringstream err;
        assert(parseArgs({"--backtest", "data.csv", "--initial-capital", "lots", "--max-positions", "x"},
                         opts, err));
        assert(!opts.initial_capital);
        assert(!opts.max_positions);
        assert(err.str().find("--initial-capital") != std::string::npos);
        assert(err.str().find("--max-positions") != std::string::npos);
    }

    // Threshold source per flag
    {
        Config& config = Config::getInstance();
        config.reset();

        CliOptions opts;
        assert(std::dynamic_pointer_cast<signal::MarketConfigResolver>(makeResolver(opts, config)));
        opts.base_config = true;
        auto base = makeResolver(opts, config);
        assert(std::dynamic_pointer_cast<signal::DefaultConfigResolver>(base));
        assert(base->resolveConfig("BTCUSDT", {}).long_rsi_min == config.getSignalConfig().long_rsi_min);
        opts.base_config = false;
        opts.volatility_aware = true;
        assert(std::dynamic_pointer_cast<signal::VolatilityConfigResolver>(makeResolver(opts, config)));
    }

    // Missing data file
    {
        CliOptions opts;
        assert(parse({"--backtest", "/nonexistent/quantscan.csv", "--config", kNoConfig}, opts));
        std::ostringstream out;
        assert(run(opts, out) == 1);
        assert(out.str().empty());
    }

    // Backtest with a signals file, JSON report on the output stream
    {
        Config::getInstance().reset();
        const auto candles = writeFile("BTCUSDT.csv",
            "timestamp,open,high,low,close,volume\n"
            "0,100,101,99,100,1000\n"
            "3600000,110,116,99,115,1000\n");
        const auto signals = writeFile("signals.json", R"([
            {"symbol": "BTCUSDT", "timestamp": 0, "direction": "LONG",
             "entry": "100", "sl": "95", "tp": "115"}
        ])");

        CliOptions opts;
        assert(parse({"--backtest", candles.string(), "--signals", signals.string(),
                      "--config", kNoConfig, "--initial-capital", "5000", "--json"}, opts));
        std::ostringstream out;
        assert(run(opts, out) == 0);

        const auto report = nlohmann::json::parse(out.str());
        assert(report.at("total_trades") == 1);
        assert(report.at("initial_capital") == "5000");
        assert(report.at("final_equity") == "5015");
        assert(report.at("closed_trades").at(0).at("status") == "CLOSED_TP");

        std::ostringstream text;
        opts.json_mode = false;
        assert(run(opts, text) == 0);
        assert(text.str().find("Total trades:    1") != std::string::npos);
        Config::getInstance().reset();
    }

    // Scan using the base signal section
    {
        Config::getInstance().reset();
        std::vector<Candle> history = testdata::neutralHistory(49);
        history.push_back(testdata::bullishCandle(49 * 60000));
        const auto candles = writeFile("BTCUSDT_scan.csv", toCsv(history));

        CliOptions opts;
        assert(parse({"--scan", candles.string(), "--config", kNoConfig, "--base-config", "--json"}, opts));
        std::ostringstream out;
        assert(run(opts, out) == 0);

        const auto events = nlohmann::json::parse(out.str());
        assert(events.is_array() && events.size() == 1);
        assert(events.at(0).at("action") == "created");
        assert(events.at(0).at("signal").at("direction") == "LONG");
        assert(events.at(0).at("signal").at("stop_loss") == "98.5");
        assert(events.at(0).at("signal").at("timeframe") == "4h");

        std::ostringstream text;
        opts.json_mode = false;
        assert(run(opts, text) == 0);
        assert(text.str().find("LONG @ 100") != std::string::npos);
    }

    std::cout << "[TEST] Cli PASSED\n";
    return 0;
}
