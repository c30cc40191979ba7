#include "signal/ConditionScorer.h"

#include <algorithm>

namespace quantscan {
namespace signal {

namespace {
double bollingerPosition(const Candle& c) {
    const double upper = c.indicator(indicator::BB_UPPER);
    const double lower = c.indicator(indicator::BB_LOWER);
    const double width = upper - lower;
    if (width <= 0.0) {
        return -1.0;
    }
    return (c.close - lower) / width;
}
}

double ConditionScorer::calibrateConfidence(double raw) {
    using namespace tuning;
    raw = std::clamp(raw, 0.0, 1.0);

    double calibrated = 0.0;
    if (raw > CAL_HIGH_KNEE) {
        calibrated = CAL_HIGH_BASE + (raw - CAL_HIGH_KNEE) / (1.0 - CAL_HIGH_KNEE) * CAL_HIGH_SPAN;
    } else if (raw > CAL_MID_KNEE) {
        calibrated = CAL_MID_BASE + (raw - CAL_MID_KNEE) / (CAL_HIGH_KNEE - CAL_MID_KNEE) * CAL_MID_SPAN;
    } else {
        calibrated = raw * CAL_LOW_SCALE;
    }
    return std::min(calibrated, CONFIDENCE_CAP);
}

ScoreResult ConditionScorer::evaluate(Direction direction, const Candle& current, const Candle& previous) const {
    using namespace tuning;
    const bool is_long = (direction == Direction::LONG);
    const SignalConfig& cfg = config_;

    ScoreResult r;
    r.max_score = cfg.maxScore();
    ConditionSet& c = r.conditions;
    double score = 0.0;

    // 1. MACD histogram crossing zero
    const double macd_now = current.indicator(indicator::MACD_HIST);
    const double macd_prev = previous.indicator(indicator::MACD_HIST);
    if (is_long ? (macd_prev <= 0.0 && macd_now > 0.0) : (macd_prev >= 0.0 && macd_now < 0.0)) {
        score += cfg.macd_weight;
        c.macd_crossover = true;
    }

    // 2. RSI band, half credit when moving the right way
    const double rsi = current.indicator(indicator::RSI);
    const double rsi_prev = previous.indicator(indicator::RSI);
    const double rsi_min = is_long ? cfg.long_rsi_min : cfg.short_rsi_min;
    const double rsi_max = is_long ? cfg.long_rsi_max : cfg.short_rsi_max;
    if (rsi_min < rsi && rsi < rsi_max) {
        score += cfg.rsi_weight;
        c.rsi_favorable = true;
    } else if (is_long ? (rsi > rsi_prev) : (rsi < rsi_prev)) {
        score += cfg.rsi_weight * PARTIAL_CREDIT;
        c.rsi_favorable = true;
    }

    // 3. Price vs EMA50
    const double ema_9 = current.indicator(indicator::EMA_9);
    const double ema_21 = current.indicator(indicator::EMA_21);
    const double ema_50 = current.indicator(indicator::EMA_50);
    if (is_long ? (current.close > ema_50) : (current.close < ema_50)) {
        score += cfg.price_ema_weight;
        c.price_vs_ema = true;
    }

    // 4. ADX strength
    const double adx = current.indicator(indicator::ADX);
    if (adx > (is_long ? cfg.long_adx_min : cfg.short_adx_min)) {
        score += cfg.adx_weight;
        c.strong_trend = true;
    }

    // 5. Heikin-Ashi trend
    const bool ha_bullish = current.flag(indicator::HA_BULLISH);
    if (is_long == ha_bullish) {
        score += cfg.ha_weight;
        c.heikin_ashi = true;
    }

    // 6. Volume trend vs rolling average
    const double volume_trend = current.indicator(indicator::VOLUME_TREND);
    const double volume_mult = is_long ? cfg.long_volume_multiplier : cfg.short_volume_multiplier;
    if (volume_trend > volume_mult) {
        score += cfg.volume_weight;
        c.volume_spike = true;
    } else if (volume_trend > 1.0) {
        score += cfg.volume_weight * PARTIAL_CREDIT;
        c.volume_spike = true;
    }

    // 7. EMA 9/21/50 stacking
    if (is_long ? (ema_9 > ema_21 && ema_21 > ema_50) : (ema_9 < ema_21 && ema_21 < ema_50)) {
        score += cfg.ema_alignment_weight;
        c.ema_aligned = true;
    }

    // 8. Directional index dominance, scaled by the gap
    const double plus_di = current.indicator(indicator::PLUS_DI);
    const double minus_di = current.indicator(indicator::MINUS_DI);
    const double di_gap = is_long ? (plus_di - minus_di) : (minus_di - plus_di);
    if (di_gap > 0.0) {
        const double scale = std::min(1.0, PARTIAL_CREDIT + (1.0 - PARTIAL_CREDIT) * (di_gap / DI_FULL_CREDIT_GAP));
        score += cfg.di_weight * scale;
        c.di_dominant = true;
    }

    // 9. Bollinger band position
    const double bb_pos = bollingerPosition(current);
    if (bb_pos >= 0.0) {
        if (bb_pos >= BB_CENTER_LOW && bb_pos <= BB_CENTER_HIGH) {
            score += cfg.bb_weight;
            c.bb_favorable = true;
        } else if (is_long ? (bb_pos >= BB_EDGE_LOW && bb_pos < BB_CENTER_LOW)
                           : (bb_pos > BB_CENTER_HIGH && bb_pos <= BB_EDGE_HIGH)) {
            score += cfg.bb_weight * PARTIAL_CREDIT;
            c.bb_favorable = true;
        }
    }

    // 10. ATR volatility as % of price
    const double atr = current.indicator(indicator::ATR);
    if (current.close > 0.0) {
        const double volatility_pct = atr / current.close * 100.0;
        if (volatility_pct < VOLATILITY_CALM_PCT) {
            score += cfg.volatility_weight;
            c.low_volatility = true;
        } else if (volatility_pct < VOLATILITY_ELEVATED_PCT) {
            score += cfg.volatility_weight * PARTIAL_CREDIT;
            c.low_volatility = true;
        }
    }

    // 11. SuperTrend direction
    const double st_direction = current.indicator(indicator::SUPERTREND_DIRECTION);
    if (is_long ? (st_direction > 0.0) : (st_direction < 0.0)) {
        score += cfg.supertrend_weight;
        c.supertrend_aligned = true;
    }

    // 12. Money flow zone, half credit when trending the right way
    const double mfi = current.indicator(indicator::MFI);
    const double mfi_prev = previous.indicator(indicator::MFI);
    const bool mfi_in_zone = is_long ? (mfi > LONG_MFI_MIN && mfi < LONG_MFI_MAX)
                                     : (mfi > SHORT_MFI_MIN && mfi < SHORT_MFI_MAX);
    if (mfi_in_zone) {
        score += cfg.mfi_weight;
        c.mfi_favorable = true;
    } else if (is_long ? (mfi > mfi_prev) : (mfi < mfi_prev)) {
        score += cfg.mfi_weight * PARTIAL_CREDIT;
        c.mfi_favorable = true;
    }

    // 13. Parabolic SAR side
    const bool psar_bullish = current.flag(indicator::PSAR_BULLISH);
    if (is_long == psar_bullish) {
        score += cfg.psar_weight;
        c.psar_aligned = true;
    }

    r.score = score;
    r.raw_confidence = (r.max_score > 0.0) ? std::min(score / r.max_score, 1.0) : 0.0;
    r.confidence = calibrateConfidence(r.raw_confidence);
    r.triggered = (score >= r.max_score * cfg.min_confidence) && (r.confidence >= cfg.min_confidence);
    return r;
}

} // namespace signal
} // namespace quantscan
