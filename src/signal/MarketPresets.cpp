#include "signal/MarketPresets.h"
#include "common/Logger.h"

#include <regex>

namespace quantscan {
namespace signal {

const char* marketTypeToString(MarketType market) {
    switch (market) {
        case MarketType::BINANCE: return "binance";
        case MarketType::FOREX: return "forex";
        case MarketType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<MarketType> marketTypeFromString(const std::string& name) {
    if (name == "binance") return MarketType::BINANCE;
    if (name == "forex") return MarketType::FOREX;
    if (name == "unknown") return MarketType::UNKNOWN;
    return std::nullopt;
}

MarketType detectMarketType(const std::string& symbol) {
    static const std::regex binance_patterns[] = {
        std::regex("^[A-Z]+USDT$"),
        std::regex("^[A-Z]+BUSD$"),
        std::regex("^[A-Z]+BTC$"),
        std::regex("^[A-Z]+ETH$"),
    };
    static const std::regex forex_patterns[] = {
        std::regex("^[A-Z]{6}$"),
        std::regex("^[A-Z]{3}_[A-Z]{3}$"),
    };

    for (const auto& pattern : binance_patterns) {
        if (std::regex_match(symbol, pattern)) return MarketType::BINANCE;
    }
    for (const auto& pattern : forex_patterns) {
        if (std::regex_match(symbol, pattern)) return MarketType::FOREX;
    }
    return MarketType::UNKNOWN;
}

MarketPresets MarketPresets::defaults() {
    MarketPresets m;

    SignalConfig binance;
    binance.long_rsi_min = 23.0;
    binance.long_rsi_max = 33.0;
    binance.long_adx_min = 26.0;
    binance.short_rsi_min = 67.0;
    binance.short_rsi_max = 77.0;
    binance.short_adx_min = 28.0;
    binance.sl_atr_multiplier = 1.5;
    binance.tp_atr_multiplier = 5.25;
    binance.min_confidence = 0.73;
    m.presets[MarketType::BINANCE] = binance;

    SignalConfig forex;
    forex.long_rsi_min = 25.0;
    forex.long_rsi_max = 35.0;
    forex.long_adx_min = 20.0;
    forex.short_rsi_min = 65.0;
    forex.short_rsi_max = 75.0;
    forex.short_adx_min = 20.0;
    forex.sl_atr_multiplier = 2.0;
    forex.tp_atr_multiplier = 6.0;
    forex.min_confidence = 0.70;
    m.presets[MarketType::FOREX] = forex;

    auto ov = [](double adx, double conf, double sl, double tp) {
        return nlohmann::json{
            {"long_adx_min", adx},
            {"min_confidence", conf},
            {"sl_atr_multiplier", sl},
            {"tp_atr_multiplier", tp},
        };
    };
    m.timeframe_overrides = {
        {"15m", {{"binance", ov(25.0, 0.75, 2.0, 5.0)}, {"forex", ov(22.0, 0.72, 2.5, 6.5)}}},
        {"1h", {{"binance", ov(26.0, 0.73, 2.5, 6.5)}, {"forex", ov(20.0, 0.70, 2.0, 6.0)}}},
        {"4h", {{"binance", nlohmann::json::object()}, {"forex", nlohmann::json::object()}}},
        {"1d", {{"binance", ov(30.0, 0.70, 3.0, 8.0)}, {"forex", ov(25.0, 0.68, 3.5, 9.0)}}},
    };
    return m;
}

SignalConfig MarketPresets::configFor(MarketType market, const std::string& timeframe) const {
    if (market == MarketType::UNKNOWN) {
        market = MarketType::BINANCE;
    }

    auto it = presets.find(market);
    SignalConfig config = (it != presets.end()) ? it->second : SignalConfig();

    const char* market_key = marketTypeToString(market);
    if (timeframe_overrides.contains(timeframe) && timeframe_overrides.at(timeframe).contains(market_key)) {
        const auto& overrides = timeframe_overrides.at(timeframe).at(market_key);
        if (!overrides.empty()) {
            LOG_DEBUG("Applying {} overrides for {} timeframe", market_key, timeframe);
            config = signalConfigFromJson(overrides, config);
        }
    }
    return config;
}

} // namespace signal
} // namespace quantscan
