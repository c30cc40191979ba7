#pragma once

#include "common/Config.h"
#include "common/Decimal.h"
#include "signal/ConfigResolver.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace quantscan {
namespace app {

enum class Mode {
    BACKTEST,
    SCAN
};

struct CliOptions {
    Mode mode = Mode::BACKTEST;
    std::string data_path;
    std::string signals_path;
    std::string config_path = "config/config.json";
    std::string timeframe = "4h";
    bool volatility_aware = false;
    bool base_config = false;      // config.json "signal" section for every symbol
    bool json_mode = false;
    std::optional<Decimal> initial_capital;
    std::optional<Decimal> position_size;
    std::optional<int> max_positions;
};

void printUsage(std::ostream& out);

// args excludes the program name. Malformed numeric values are reported on
// `err` and ignored; an unknown flag or mode fails the parse.
bool parseArgs(const std::vector<std::string>& args, CliOptions& opts, std::ostream& err);

// Threshold source per symbol: the volatility classifier, the base signal
// config, or (default) the preset of the symbol's market.
std::shared_ptr<signal::IConfigResolver> makeResolver(const CliOptions& opts, const Config& config);

int runBacktest(const CliOptions& opts, Config& config, std::ostream& out);
int runScan(const CliOptions& opts, const Config& config, std::ostream& out);

// Loads the config, then dispatches on the mode. Command output goes to
// `out`, diagnostics to stderr and the log. Returns the process exit code.
int run(const CliOptions& opts, std::ostream& out);

} // namespace app
} // namespace quantscan
