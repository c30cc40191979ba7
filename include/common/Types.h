#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace quantscan {

using Price = double;
using Volume = double;

enum class Direction { LONG, SHORT };

// Raised when a candle lacks an indicator or carries a non-finite value.
class IndicatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline const char* directionToString(Direction d) {
    return (d == Direction::LONG) ? "LONG" : "SHORT";
}

// Indicator names as produced by the upstream indicator pipeline.
namespace indicator {
constexpr const char* RSI = "rsi";
constexpr const char* MACD_HIST = "macd_hist";
constexpr const char* ADX = "adx";
constexpr const char* ATR = "atr";
constexpr const char* EMA_9 = "ema_9";
constexpr const char* EMA_21 = "ema_21";
constexpr const char* EMA_50 = "ema_50";
constexpr const char* PLUS_DI = "plus_di";
constexpr const char* MINUS_DI = "minus_di";
constexpr const char* BB_UPPER = "bb_upper";
constexpr const char* BB_LOWER = "bb_lower";
constexpr const char* MFI = "mfi";
constexpr const char* SUPERTREND_DIRECTION = "supertrend_direction";
constexpr const char* PSAR_BULLISH = "psar_bullish";
constexpr const char* HA_BULLISH = "ha_bullish";
constexpr const char* VOLUME_TREND = "volume_trend";
} // namespace indicator

struct Candle {
    std::string symbol;
    std::string timeframe;
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;                       // epoch ms
    std::map<std::string, double> indicators;  // flags stored as 0/1

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    bool hasIndicator(const std::string& name) const {
        return indicators.find(name) != indicators.end();
    }

    // Throws IndicatorError when missing or not finite.
    double indicator(const std::string& name) const;

    bool flag(const std::string& name) const {
        return indicator(name) > 0.5;
    }
};

} // namespace quantscan
