#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <utility>

namespace quantscan {
namespace signal {

// Which of the 13 scoring checks fired for a direction.
struct ConditionSet {
    static constexpr size_t kCount = 13;

    bool macd_crossover = false;
    bool rsi_favorable = false;
    bool price_vs_ema = false;       // above EMA50 for LONG, below for SHORT
    bool strong_trend = false;
    bool heikin_ashi = false;        // bullish for LONG, bearish for SHORT
    bool volume_spike = false;
    bool ema_aligned = false;
    bool di_dominant = false;        // +DI > -DI for LONG, mirrored for SHORT
    bool bb_favorable = false;
    bool low_volatility = false;
    bool supertrend_aligned = false;
    bool mfi_favorable = false;
    bool psar_aligned = false;

    using Entry = std::pair<const char*, bool>;

    // Named in the order the checks are scored.
    std::array<Entry, kCount> entries(Direction direction) const;

    int countMet() const;

    nlohmann::json toJson(Direction direction) const;

    // Accepts either direction's naming.
    static ConditionSet fromJson(const nlohmann::json& j);
};

} // namespace signal
} // namespace quantscan
