#pragma once

#include "common/Types.h"
#include "signal/ConditionSet.h"
#include "signal/SignalConfig.h"

namespace quantscan {
namespace signal {

struct ScoreResult {
    double score = 0.0;
    double max_score = 0.0;
    double raw_confidence = 0.0;     // score / max_score
    double confidence = 0.0;         // calibrated
    bool triggered = false;
    ConditionSet conditions;
};

// Weighted 13-check scoring of one direction against the latest two candles.
class ConditionScorer {
public:
    explicit ConditionScorer(const SignalConfig& config) : config_(config) {}

    // Throws IndicatorError when a required indicator is absent.
    ScoreResult evaluate(Direction direction, const Candle& current, const Candle& previous) const;

    // Piecewise remap keeping confidences away from 100%; result <= 0.92.
    static double calibrateConfidence(double raw_confidence);

private:
    SignalConfig config_;
};

} // namespace signal
} // namespace quantscan
