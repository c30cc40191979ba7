#pragma once

#include "common/Types.h"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quantscan {
namespace signal {

enum class VolatilityLevel { LOW, MEDIUM, HIGH };

inline const char* volatilityLevelToString(VolatilityLevel level) {
    switch (level) {
        case VolatilityLevel::LOW: return "LOW";
        case VolatilityLevel::MEDIUM: return "MEDIUM";
        case VolatilityLevel::HIGH: return "HIGH";
    }
    return "MEDIUM";
}

struct VolatilityProfile {
    std::string symbol;
    VolatilityLevel volatility_level = VolatilityLevel::MEDIUM;
    double daily_volatility = 0.0;          // %
    double atr_pct = 0.0;                   // ATR as % of price
    double rsi_extremes_frequency = 0.0;    // share of candles with RSI < 30 or > 70
    double confidence = 0.0;                // certainty of the classification
    long long last_updated = 0;             // epoch ms

    // Recommended signal parameters
    double sl_multiplier = 0.0;
    double tp_multiplier = 0.0;
    double adx_threshold = 0.0;
    double min_confidence = 0.0;
};

// Buckets symbols into LOW/MEDIUM/HIGH volatility, first by known asset
// category and otherwise from recent candles.
class VolatilityClassifier {
public:
    static constexpr double HIGH_VOL_THRESHOLD = 10.0;
    static constexpr double LOW_VOL_THRESHOLD = 5.0;
    static constexpr double HIGH_ATR_PCT = 5.0;
    static constexpr double LOW_ATR_PCT = 2.0;
    static constexpr size_t MIN_CANDLES_DETAILED = 20;
    static constexpr int ATR_PERIOD = 14;
    static constexpr int RSI_PERIOD = 14;
    static constexpr long long CACHE_TTL_MS = 24LL * 60 * 60 * 1000;

    VolatilityClassifier();

    // With empty `recent`, known assets use their category and unknown
    // ones default to MEDIUM. Results are cached for CACHE_TTL_MS.
    VolatilityProfile classifySymbol(const std::string& symbol,
                                     const std::vector<Candle>& recent = {},
                                     bool force_recalculate = false);

    void clearCache(const std::optional<std::string>& symbol = std::nullopt);
    size_t cacheSize() const { return cache_.size(); }

    void setClock(std::function<long long()> clock) { clock_ = std::move(clock); }

    static std::string baseAsset(const std::string& symbol);
    static VolatilityProfile makeProfile(const std::string& symbol, VolatilityLevel level, double confidence);

private:
    std::optional<VolatilityProfile> quickClassify(const std::string& symbol) const;
    VolatilityProfile detailedClassify(const std::string& symbol, const std::vector<Candle>& candles) const;
    long long now() const;

    std::map<std::string, VolatilityProfile> cache_;
    std::function<long long()> clock_;

    static const std::set<std::string> MEME_COINS;
    static const std::set<std::string> MAJOR_COINS;
    static const std::set<std::string> ESTABLISHED_ALTS;
};

} // namespace signal
} // namespace quantscan
