#include "signal/VolatilityClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>

namespace quantscan {
namespace signal {

using analytics::TechnicalIndicators;

const std::set<std::string> VolatilityClassifier::MEME_COINS = {
    "PEPE", "SHIB", "DOGE", "FLOKI", "WIF", "BONK", "BABYDOGE",
    "ELON", "AKITA", "KISHU", "SAFEMOON", "MEME"
};

const std::set<std::string> VolatilityClassifier::MAJOR_COINS = {
    "BTC", "ETH", "BNB", "USDT", "USDC", "BUSD", "DAI"
};

const std::set<std::string> VolatilityClassifier::ESTABLISHED_ALTS = {
    "SOL", "ADA", "DOT", "MATIC", "AVAX", "LINK", "UNI", "AAVE",
    "ATOM", "ALGO", "XLM", "VET", "FIL", "SAND", "MANA", "AXS"
};

namespace {
void eraseAll(std::string& s, const std::string& token) {
    for (size_t pos = s.find(token); pos != std::string::npos; pos = s.find(token)) {
        s.erase(pos, token.size());
    }
}
}

VolatilityClassifier::VolatilityClassifier()
    : clock_([] {
          return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch()).count());
      }) {}

long long VolatilityClassifier::now() const {
    return clock_();
}

std::string VolatilityClassifier::baseAsset(const std::string& symbol) {
    std::string base = symbol;
    eraseAll(base, "USDT");
    eraseAll(base, "BUSD");
    eraseAll(base, "USD");
    return base;
}

VolatilityProfile VolatilityClassifier::makeProfile(const std::string& symbol, VolatilityLevel level,
                                                    double confidence) {
    VolatilityProfile p;
    p.symbol = symbol;
    p.volatility_level = level;
    p.confidence = confidence;

    switch (level) {
        case VolatilityLevel::HIGH:
            // Wider stops, bigger targets
            p.daily_volatility = 15.0;
            p.atr_pct = 6.0;
            p.rsi_extremes_frequency = 0.3;
            p.sl_multiplier = 2.0;
            p.tp_multiplier = 3.5;
            p.adx_threshold = 18.0;
            p.min_confidence = 0.70;
            break;
        case VolatilityLevel::MEDIUM:
            p.daily_volatility = 7.5;
            p.atr_pct = 3.0;
            p.rsi_extremes_frequency = 0.15;
            p.sl_multiplier = 1.5;
            p.tp_multiplier = 2.5;
            p.adx_threshold = 22.0;
            p.min_confidence = 0.75;
            break;
        case VolatilityLevel::LOW:
            p.daily_volatility = 3.5;
            p.atr_pct = 1.5;
            p.rsi_extremes_frequency = 0.05;
            p.sl_multiplier = 1.0;
            p.tp_multiplier = 2.0;
            p.adx_threshold = 20.0;
            p.min_confidence = 0.70;
            break;
    }
    return p;
}

VolatilityProfile VolatilityClassifier::classifySymbol(const std::string& symbol,
                                                       const std::vector<Candle>& recent,
                                                       bool force_recalculate) {
    const long long now_ms = now();

    if (!force_recalculate) {
        auto it = cache_.find(symbol);
        if (it != cache_.end() && now_ms - it->second.last_updated < CACHE_TTL_MS) {
            LOG_DEBUG("Using cached volatility profile for {}: {}",
                      symbol, volatilityLevelToString(it->second.volatility_level));
            return it->second;
        }
    }

    std::optional<VolatilityProfile> quick = quickClassify(symbol);
    VolatilityProfile profile;
    if (quick && recent.empty()) {
        profile = *quick;
    } else if (!recent.empty()) {
        profile = detailedClassify(symbol, recent);
    } else {
        LOG_WARN("Could not classify {}, using MEDIUM volatility as default", symbol);
        profile = makeProfile(symbol, VolatilityLevel::MEDIUM, 0.5);
        profile.last_updated = now_ms;
        return profile;
    }

    profile.last_updated = now_ms;
    cache_[symbol] = profile;
    return profile;
}

std::optional<VolatilityProfile> VolatilityClassifier::quickClassify(const std::string& symbol) const {
    const std::string base = baseAsset(symbol);

    if (MEME_COINS.count(base) || base.find("PEPE") != std::string::npos ||
        base.find("INU") != std::string::npos) {
        return makeProfile(symbol, VolatilityLevel::HIGH, 0.8);
    }
    if (MAJOR_COINS.count(base)) {
        return makeProfile(symbol, VolatilityLevel::LOW, 0.9);
    }
    if (ESTABLISHED_ALTS.count(base)) {
        return makeProfile(symbol, VolatilityLevel::MEDIUM, 0.8);
    }
    return std::nullopt;
}

VolatilityProfile VolatilityClassifier::detailedClassify(const std::string& symbol,
                                                         const std::vector<Candle>& candles) const {
    if (candles.size() < MIN_CANDLES_DETAILED) {
        LOG_WARN("Insufficient data for {} ({} candles), using quick classification",
                 symbol, candles.size());
        auto quick = quickClassify(symbol);
        return quick ? *quick : makeProfile(symbol, VolatilityLevel::MEDIUM, 0.5);
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);

    // Hourly return deviation scaled to a day
    const auto returns = TechnicalIndicators::calculateReturns(closes);
    const double mean_return = TechnicalIndicators::calculateMean(returns);
    const double daily_vol =
        TechnicalIndicators::calculateStandardDeviation(returns, mean_return, 1) * 100.0 * std::sqrt(24.0);

    const double atr = TechnicalIndicators::calculateATR(candles, ATR_PERIOD);
    const double last_close = closes.back();
    const double atr_pct = (last_close > 0.0) ? atr / last_close * 100.0 : 0.0;

    const auto rsi = TechnicalIndicators::calculateRSISeries(closes, RSI_PERIOD);
    size_t extremes = 0;
    for (double value : rsi) {
        if (!std::isnan(value) && (value < 30.0 || value > 70.0)) ++extremes;
    }
    const double rsi_extreme_freq = static_cast<double>(extremes) / candles.size();

    VolatilityLevel level = VolatilityLevel::MEDIUM;
    if (daily_vol >= HIGH_VOL_THRESHOLD || atr_pct >= HIGH_ATR_PCT) {
        level = VolatilityLevel::HIGH;
    } else if (daily_vol <= LOW_VOL_THRESHOLD && atr_pct <= LOW_ATR_PCT) {
        level = VolatilityLevel::LOW;
    }

    LOG_INFO("Classified {} as {} volatility (daily_vol={:.2f}%, atr={:.2f}%, rsi_extremes={:.1f}%)",
             symbol, volatilityLevelToString(level), daily_vol, atr_pct, rsi_extreme_freq * 100.0);

    VolatilityProfile profile = makeProfile(symbol, level, 0.9);
    profile.daily_volatility = daily_vol;
    profile.atr_pct = atr_pct;
    profile.rsi_extremes_frequency = rsi_extreme_freq;
    return profile;
}

void VolatilityClassifier::clearCache(const std::optional<std::string>& symbol) {
    if (symbol) {
        cache_.erase(*symbol);
        LOG_INFO("Cleared volatility cache for {}", *symbol);
    } else {
        cache_.clear();
        LOG_INFO("Cleared all volatility cache");
    }
}

} // namespace signal
} // namespace quantscan
