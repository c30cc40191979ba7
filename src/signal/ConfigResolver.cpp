#include "signal/ConfigResolver.h"
#include "common/Logger.h"

namespace quantscan {
namespace signal {

SignalConfig DefaultConfigResolver::resolveConfig(const std::string&, const std::vector<Candle>&) {
    return config_;
}

VolatilityConfigResolver::VolatilityConfigResolver(const SignalConfig& base,
                                                   std::shared_ptr<VolatilityClassifier> classifier)
    : base_(base),
      classifier_(classifier ? std::move(classifier) : std::make_shared<VolatilityClassifier>()) {}

SignalConfig VolatilityConfigResolver::applyProfile(const SignalConfig& base, const VolatilityProfile& profile) {
    SignalConfig config = base;
    config.sl_atr_multiplier = profile.sl_multiplier;
    config.tp_atr_multiplier = profile.tp_multiplier;
    config.long_adx_min = profile.adx_threshold;
    config.short_adx_min = profile.adx_threshold;
    config.min_confidence = profile.min_confidence;
    return config;
}

SignalConfig VolatilityConfigResolver::resolveConfig(const std::string& symbol,
                                                     const std::vector<Candle>& recent) {
    auto it = resolved_.find(symbol);
    if (it != resolved_.end()) {
        return it->second;
    }

    const VolatilityProfile profile = classifier_->classifySymbol(symbol, recent);
    SignalConfig config = applyProfile(base_, profile);
    LOG_INFO("{} volatility {}: SL {}x, TP {}x, ADX {}, confidence {:.2f}",
             symbol, volatilityLevelToString(profile.volatility_level),
             config.sl_atr_multiplier, config.tp_atr_multiplier,
             config.long_adx_min, config.min_confidence);

    resolved_.emplace(symbol, config);
    return config;
}

bool VolatilityConfigResolver::needsCandles(const std::string& symbol) const {
    return resolved_.count(symbol) == 0;
}

MarketConfigResolver::MarketConfigResolver(MarketPresets presets, std::string timeframe)
    : presets_(std::move(presets)), timeframe_(std::move(timeframe)) {}

SignalConfig MarketConfigResolver::resolveConfig(const std::string& symbol, const std::vector<Candle>&) {
    const MarketType market = detectMarketType(symbol);
    if (market == MarketType::UNKNOWN) {
        LOG_DEBUG("Unknown market for {}, using binance preset", symbol);
    }
    return presets_.configFor(market, timeframe_);
}

} // namespace signal
} // namespace quantscan
