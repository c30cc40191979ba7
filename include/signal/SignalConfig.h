#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quantscan {
namespace signal {

// Empirically tuned constants. Changing any of these changes signal output.
namespace tuning {
constexpr size_t MIN_CANDLES_FOR_SIGNAL = 50;

// Hard gates applied before scoring a fresh signal
constexpr double RANGING_ADX_FLOOR = 18.0;
constexpr size_t VOLUME_MA_PERIOD = 20;
constexpr double VOLUME_SPIKE_GATE = 1.2;

// Lifecycle
constexpr double INVALIDATION_TOLERANCE = 0.70;   // invalid below min_confidence * 0.70
constexpr double UPDATE_CONFIDENCE_DELTA = 0.05;

// Confidence calibration (piecewise linear)
constexpr double CAL_HIGH_KNEE = 0.88;
constexpr double CAL_HIGH_BASE = 0.78;
constexpr double CAL_HIGH_SPAN = 0.14;            // 0.78 .. 0.92
constexpr double CAL_MID_KNEE = 0.75;
constexpr double CAL_MID_BASE = 0.68;
constexpr double CAL_MID_SPAN = 0.10;             // 0.68 .. 0.78
constexpr double CAL_LOW_SCALE = 0.91;
constexpr double CONFIDENCE_CAP = 0.92;

// Partial-credit thresholds inside the scoring function
constexpr double PARTIAL_CREDIT = 0.5;
constexpr double DI_FULL_CREDIT_GAP = 10.0;
constexpr double BB_CENTER_LOW = 0.30;
constexpr double BB_CENTER_HIGH = 0.70;
constexpr double BB_EDGE_LOW = 0.15;
constexpr double BB_EDGE_HIGH = 0.85;
constexpr double VOLATILITY_CALM_PCT = 2.0;
constexpr double VOLATILITY_ELEVATED_PCT = 4.0;
constexpr double LONG_MFI_MIN = 20.0;
constexpr double LONG_MFI_MAX = 60.0;
constexpr double SHORT_MFI_MIN = 40.0;
constexpr double SHORT_MFI_MAX = 80.0;
} // namespace tuning

struct SignalConfig {
    // LONG thresholds
    double long_rsi_min = 50.0;
    double long_rsi_max = 70.0;
    double long_adx_min = 20.0;
    double long_volume_multiplier = 1.2;

    // SHORT thresholds
    double short_rsi_min = 30.0;
    double short_rsi_max = 50.0;
    double short_adx_min = 20.0;
    double short_volume_multiplier = 1.2;

    // ATR-based exits
    double sl_atr_multiplier = 1.5;
    double tp_atr_multiplier = 2.5;

    double min_confidence = 0.7;
    int max_candles_cache = 200;
    int signal_expiry_minutes = 60;

    // Scoring weights
    double macd_weight = 2.0;
    double rsi_weight = 1.5;
    double price_ema_weight = 1.8;
    double adx_weight = 1.7;
    double ha_weight = 1.6;
    double volume_weight = 1.4;
    double ema_alignment_weight = 1.2;
    double di_weight = 1.0;
    double bb_weight = 0.8;
    double volatility_weight = 0.5;
    double supertrend_weight = 1.9;
    double mfi_weight = 1.3;
    double psar_weight = 1.1;

    double maxScore() const;

    // Empty when the configuration is usable.
    std::vector<std::string> validate() const;
};

// Overlays the keys present in `j` onto `base`; absent keys keep base values.
SignalConfig signalConfigFromJson(const nlohmann::json& j, const SignalConfig& base = SignalConfig());
nlohmann::json toJson(const SignalConfig& config);

} // namespace signal
} // namespace quantscan
