#include "common/Config.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace quantscan {

namespace {
Decimal moneyValue(const nlohmann::json& section, const char* key, const Decimal& fallback) {
    if (!section.contains(key)) return fallback;
    const auto& v = section.at(key);
    if (v.is_string()) return Decimal::fromString(v.get<std::string>());
    if (v.is_number()) return Decimal::fromDouble(v.get<double>());
    throw std::invalid_argument(std::string("backtest.") + key + " must be a number");
}

void requireValid(const signal::SignalConfig& config, const std::string& name) {
    const auto errors = config.validate();
    if (errors.empty()) return;

    std::string message = "Invalid " + name + " configuration:";
    for (const auto& e : errors) {
        message += "\n  - " + e;
    }
    throw std::invalid_argument(message);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config()
    : market_presets_(signal::MarketPresets::defaults()) {}

void Config::reset() {
    signal_config_ = signal::SignalConfig();
    market_presets_ = signal::MarketPresets::defaults();
    backtest_config_ = backtest::BacktestConfig();
    log_level_ = "info";
    loaded_path_.clear();
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    std::clog << "Config path: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::clog << "Warning: config file not found: " << config_path.string() << std::endl;
        std::clog << "Using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::clog << "Warning: cannot open config file." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error: " << e.what() << std::endl;
        return;
    }

    applyJson(j);
    loaded_path_ = config_path.string();
    std::clog << "Config loaded: min confidence=" << signal_config_.min_confidence
              << ", position size=" << backtest_config_.position_size.toString() << std::endl;
}

void Config::applyJson(const nlohmann::json& j) {
    // Build everything first so a rejected file leaves the old settings intact
    signal::SignalConfig signal_config = signal_config_;
    signal::MarketPresets presets = market_presets_;
    backtest::BacktestConfig backtest_config = backtest_config_;
    std::string log_level = log_level_;

    try {
        if (j.contains("signal")) {
            signal_config = signal::signalConfigFromJson(j.at("signal"), signal_config);
        }

        if (j.contains("markets") && j.at("markets").is_object()) {
            for (const auto& [name, section] : j.at("markets").items()) {
                auto market = signal::marketTypeFromString(name);
                if (!market || *market == signal::MarketType::UNKNOWN) {
                    std::clog << "Warning: ignoring unknown market '" << name << "'" << std::endl;
                    continue;
                }
                presets.presets[*market] = signal::signalConfigFromJson(section, presets.presets[*market]);
            }
        }

        if (j.contains("timeframe_overrides") && j.at("timeframe_overrides").is_object()) {
            for (const auto& [timeframe, markets] : j.at("timeframe_overrides").items()) {
                presets.timeframe_overrides[timeframe] = markets;
            }
        }

        if (j.contains("backtest")) {
            const auto& b = j.at("backtest");
            backtest_config.initial_capital = moneyValue(b, "initial_capital", backtest_config.initial_capital);
            backtest_config.position_size = moneyValue(b, "position_size", backtest_config.position_size);
            backtest_config.max_open_positions = b.value("max_open_positions", backtest_config.max_open_positions);
            backtest_config.close_on_opposite_signal =
                b.value("close_on_opposite_signal", backtest_config.close_on_opposite_signal);
        }

        if (j.contains("logging")) {
            log_level = j.at("logging").value("level", log_level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed config value: ") + e.what());
    }

    requireValid(signal_config, "signal");
    for (const auto& [market, config] : presets.presets) {
        requireValid(config, signal::marketTypeToString(market));
        for (const auto& [timeframe, overrides] : presets.timeframe_overrides.items()) {
            requireValid(presets.configFor(market, timeframe),
                         std::string(signal::marketTypeToString(market)) + " " + timeframe);
        }
    }
    if (backtest_config.position_size <= Decimal() || backtest_config.max_open_positions < 1) {
        throw std::invalid_argument("Invalid backtest configuration: position_size and max_open_positions must be positive");
    }

    signal_config_ = signal_config;
    market_presets_ = presets;
    backtest_config_ = backtest_config;
    log_level_ = log_level;
}

} // namespace quantscan
