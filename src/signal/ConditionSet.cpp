#include "signal/ConditionSet.h"

namespace quantscan {
namespace signal {

std::array<ConditionSet::Entry, ConditionSet::kCount> ConditionSet::entries(Direction direction) const {
    const bool is_long = (direction == Direction::LONG);
    return {{
        {"macd_crossover", macd_crossover},
        {"rsi_favorable", rsi_favorable},
        {is_long ? "price_above_ema" : "price_below_ema", price_vs_ema},
        {"strong_trend", strong_trend},
        {is_long ? "ha_bullish" : "ha_bearish", heikin_ashi},
        {"volume_spike", volume_spike},
        {"ema_aligned", ema_aligned},
        {is_long ? "positive_di" : "negative_di", di_dominant},
        {"bb_favorable", bb_favorable},
        {"low_volatility", low_volatility},
        {"supertrend_aligned", supertrend_aligned},
        {"mfi_favorable", mfi_favorable},
        {"psar_aligned", psar_aligned},
    }};
}

int ConditionSet::countMet() const {
    int met = 0;
    for (const auto& entry : entries(Direction::LONG)) {
        if (entry.second) ++met;
    }
    return met;
}

nlohmann::json ConditionSet::toJson(Direction direction) const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, met] : entries(direction)) {
        j[name] = met;
    }
    return j;
}

ConditionSet ConditionSet::fromJson(const nlohmann::json& j) {
    ConditionSet c;
    if (!j.is_object()) {
        return c;
    }
    auto flag = [&](const char* a, const char* b = nullptr) {
        if (j.contains(a) && j[a].is_boolean()) return j[a].get<bool>();
        if (b && j.contains(b) && j[b].is_boolean()) return j[b].get<bool>();
        return false;
    };
    c.macd_crossover = flag("macd_crossover");
    c.rsi_favorable = flag("rsi_favorable");
    c.price_vs_ema = flag("price_above_ema", "price_below_ema");
    c.strong_trend = flag("strong_trend");
    c.heikin_ashi = flag("ha_bullish", "ha_bearish");
    c.volume_spike = flag("volume_spike");
    c.ema_aligned = flag("ema_aligned");
    c.di_dominant = flag("positive_di", "negative_di");
    c.bb_favorable = flag("bb_favorable");
    c.low_volatility = flag("low_volatility");
    c.supertrend_aligned = flag("supertrend_aligned");
    c.mfi_favorable = flag("mfi_favorable");
    c.psar_aligned = flag("psar_aligned");
    return c;
}

} // namespace signal
} // namespace quantscan
