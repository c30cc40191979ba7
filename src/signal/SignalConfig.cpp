#include "signal/SignalConfig.h"

#include <spdlog/fmt/fmt.h>

namespace quantscan {
namespace signal {

double SignalConfig::maxScore() const {
    return macd_weight + rsi_weight + price_ema_weight + adx_weight + ha_weight +
           volume_weight + ema_alignment_weight + di_weight + bb_weight +
           volatility_weight + supertrend_weight + mfi_weight + psar_weight;
}

std::vector<std::string> SignalConfig::validate() const {
    std::vector<std::string> errors;

    if (!(0.0 <= long_rsi_min && long_rsi_min < long_rsi_max && long_rsi_max <= 100.0)) {
        errors.push_back(fmt::format("Invalid LONG RSI range: {}-{}", long_rsi_min, long_rsi_max));
    }
    if (!(0.0 <= short_rsi_min && short_rsi_min < short_rsi_max && short_rsi_max <= 100.0)) {
        errors.push_back(fmt::format("Invalid SHORT RSI range: {}-{}", short_rsi_min, short_rsi_max));
    }
    if (!(0.0 <= long_adx_min && long_adx_min <= 100.0)) {
        errors.push_back(fmt::format("Invalid LONG ADX: {}", long_adx_min));
    }
    if (!(0.0 <= short_adx_min && short_adx_min <= 100.0)) {
        errors.push_back(fmt::format("Invalid SHORT ADX: {}", short_adx_min));
    }
    if (long_volume_multiplier <= 0.0 || short_volume_multiplier <= 0.0) {
        errors.push_back(fmt::format("Invalid volume multipliers: {}/{}",
                                     long_volume_multiplier, short_volume_multiplier));
    }
    if (sl_atr_multiplier <= 0.0) {
        errors.push_back(fmt::format("Invalid SL multiplier: {}", sl_atr_multiplier));
    }
    if (tp_atr_multiplier <= 0.0) {
        errors.push_back(fmt::format("Invalid TP multiplier: {}", tp_atr_multiplier));
    }
    if (tp_atr_multiplier <= sl_atr_multiplier) {
        errors.push_back(fmt::format("TP must be > SL (TP: {}, SL: {})", tp_atr_multiplier, sl_atr_multiplier));
    }
    if (!(0.0 < min_confidence && min_confidence <= 1.0)) {
        errors.push_back(fmt::format("Invalid confidence: {}", min_confidence));
    }
    if (max_candles_cache < static_cast<int>(tuning::MIN_CANDLES_FOR_SIGNAL)) {
        errors.push_back(fmt::format("Candle cache too small: {} (need >= {})",
                                     max_candles_cache, tuning::MIN_CANDLES_FOR_SIGNAL));
    }
    if (signal_expiry_minutes <= 0) {
        errors.push_back(fmt::format("Invalid signal expiry: {} minutes", signal_expiry_minutes));
    }

    const std::pair<const char*, double> weights[] = {
        {"macd_weight", macd_weight},
        {"rsi_weight", rsi_weight},
        {"price_ema_weight", price_ema_weight},
        {"adx_weight", adx_weight},
        {"ha_weight", ha_weight},
        {"volume_weight", volume_weight},
        {"ema_alignment_weight", ema_alignment_weight},
        {"di_weight", di_weight},
        {"bb_weight", bb_weight},
        {"volatility_weight", volatility_weight},
        {"supertrend_weight", supertrend_weight},
        {"mfi_weight", mfi_weight},
        {"psar_weight", psar_weight},
    };
    for (const auto& [name, value] : weights) {
        if (!(value > 0.0)) {
            errors.push_back(fmt::format("Weight {} must be positive (got {})", name, value));
        }
    }
    return errors;
}

SignalConfig signalConfigFromJson(const nlohmann::json& j, const SignalConfig& base) {
    SignalConfig c = base;
    if (!j.is_object()) {
        return c;
    }

    c.long_rsi_min = j.value("long_rsi_min", c.long_rsi_min);
    c.long_rsi_max = j.value("long_rsi_max", c.long_rsi_max);
    c.long_adx_min = j.value("long_adx_min", c.long_adx_min);
    c.long_volume_multiplier = j.value("long_volume_multiplier", c.long_volume_multiplier);

    c.short_rsi_min = j.value("short_rsi_min", c.short_rsi_min);
    c.short_rsi_max = j.value("short_rsi_max", c.short_rsi_max);
    c.short_adx_min = j.value("short_adx_min", c.short_adx_min);
    c.short_volume_multiplier = j.value("short_volume_multiplier", c.short_volume_multiplier);

    c.sl_atr_multiplier = j.value("sl_atr_multiplier", c.sl_atr_multiplier);
    c.tp_atr_multiplier = j.value("tp_atr_multiplier", c.tp_atr_multiplier);

    c.min_confidence = j.value("min_confidence", c.min_confidence);
    c.max_candles_cache = j.value("max_candles_cache", c.max_candles_cache);
    c.signal_expiry_minutes = j.value("signal_expiry_minutes", c.signal_expiry_minutes);

    c.macd_weight = j.value("macd_weight", c.macd_weight);
    c.rsi_weight = j.value("rsi_weight", c.rsi_weight);
    c.price_ema_weight = j.value("price_ema_weight", c.price_ema_weight);
    c.adx_weight = j.value("adx_weight", c.adx_weight);
    c.ha_weight = j.value("ha_weight", c.ha_weight);
    c.volume_weight = j.value("volume_weight", c.volume_weight);
    c.ema_alignment_weight = j.value("ema_alignment_weight", c.ema_alignment_weight);
    c.di_weight = j.value("di_weight", c.di_weight);
    c.bb_weight = j.value("bb_weight", c.bb_weight);
    c.volatility_weight = j.value("volatility_weight", c.volatility_weight);
    c.supertrend_weight = j.value("supertrend_weight", c.supertrend_weight);
    c.mfi_weight = j.value("mfi_weight", c.mfi_weight);
    c.psar_weight = j.value("psar_weight", c.psar_weight);
    return c;
}

nlohmann::json toJson(const SignalConfig& c) {
    return {
        {"long_rsi_min", c.long_rsi_min},
        {"long_rsi_max", c.long_rsi_max},
        {"long_adx_min", c.long_adx_min},
        {"long_volume_multiplier", c.long_volume_multiplier},
        {"short_rsi_min", c.short_rsi_min},
        {"short_rsi_max", c.short_rsi_max},
        {"short_adx_min", c.short_adx_min},
        {"short_volume_multiplier", c.short_volume_multiplier},
        {"sl_atr_multiplier", c.sl_atr_multiplier},
        {"tp_atr_multiplier", c.tp_atr_multiplier},
        {"min_confidence", c.min_confidence},
        {"max_candles_cache", c.max_candles_cache},
        {"signal_expiry_minutes", c.signal_expiry_minutes},
        {"macd_weight", c.macd_weight},
        {"rsi_weight", c.rsi_weight},
        {"price_ema_weight", c.price_ema_weight},
        {"adx_weight", c.adx_weight},
        {"ha_weight", c.ha_weight},
        {"volume_weight", c.volume_weight},
        {"ema_alignment_weight", c.ema_alignment_weight},
        {"di_weight", c.di_weight},
        {"bb_weight", c.bb_weight},
        {"volatility_weight", c.volatility_weight},
        {"supertrend_weight", c.supertrend_weight},
        {"mfi_weight", c.mfi_weight},
        {"psar_weight", c.psar_weight},
    };
}

} // namespace signal
} // namespace quantscan
