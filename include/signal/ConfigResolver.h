#pragma once

#include "common/Types.h"
#include "signal/MarketPresets.h"
#include "signal/SignalConfig.h"
#include "signal/VolatilityClassifier.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quantscan {
namespace signal {

// Supplies the effective SignalConfig for one symbol.
class IConfigResolver {
public:
    virtual ~IConfigResolver() = default;

    virtual SignalConfig resolveConfig(
        const std::string& symbol,
        const std::vector<Candle>& recent
    ) = 0;

    // False when resolveConfig ignores `recent` for this symbol, so callers
    // may pass an empty history.
    virtual bool needsCandles(const std::string& /*symbol*/) const { return false; }
};

class DefaultConfigResolver : public IConfigResolver {
public:
    explicit DefaultConfigResolver(const SignalConfig& config) : config_(config) {}

    SignalConfig resolveConfig(const std::string& symbol, const std::vector<Candle>& recent) override;

private:
    SignalConfig config_;
};

// Overlays the classifier's exit multipliers, ADX floor and minimum
// confidence on a base config. Computed once per symbol.
class VolatilityConfigResolver : public IConfigResolver {
public:
    VolatilityConfigResolver(const SignalConfig& base,
                             std::shared_ptr<VolatilityClassifier> classifier);

    SignalConfig resolveConfig(const std::string& symbol, const std::vector<Candle>& recent) override;
    bool needsCandles(const std::string& symbol) const override;

    static SignalConfig applyProfile(const SignalConfig& base, const VolatilityProfile& profile);

private:
    SignalConfig base_;
    std::shared_ptr<VolatilityClassifier> classifier_;
    std::map<std::string, SignalConfig> resolved_;
};

// Picks the preset of the symbol's market for a fixed timeframe.
class MarketConfigResolver : public IConfigResolver {
public:
    MarketConfigResolver(MarketPresets presets, std::string timeframe);

    SignalConfig resolveConfig(const std::string& symbol, const std::vector<Candle>& recent) override;

private:
    MarketPresets presets_;
    std::string timeframe_;
};

} // namespace signal
} // namespace quantscan
