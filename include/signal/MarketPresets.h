#pragma once

#include "signal/SignalConfig.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace quantscan {
namespace signal {

enum class MarketType { BINANCE, FOREX, UNKNOWN };

const char* marketTypeToString(MarketType market);
std::optional<MarketType> marketTypeFromString(const std::string& name);

// Crypto patterns are tried before forex ones, so "ETHBTC" is crypto.
MarketType detectMarketType(const std::string& symbol);

// Per-market signal presets plus partial per-timeframe overrides of the form
// {"15m": {"binance": {...}, "forex": {...}}}.
struct MarketPresets {
    std::map<MarketType, SignalConfig> presets;
    nlohmann::json timeframe_overrides = nlohmann::json::object();

    static MarketPresets defaults();

    // UNKNOWN resolves to the BINANCE preset.
    SignalConfig configFor(MarketType market, const std::string& timeframe) const;
};

} // namespace signal
} // namespace quantscan
