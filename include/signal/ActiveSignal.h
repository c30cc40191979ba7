#pragma once

#include "common/Decimal.h"
#include "common/Types.h"
#include "signal/ConditionSet.h"
#include <nlohmann/json.hpp>
#include <string>

namespace quantscan {
namespace signal {

struct ActiveSignal {
    std::string symbol;
    Direction direction = Direction::LONG;
    std::string timeframe;

    Decimal entry_price;
    Decimal stop_loss;
    Decimal take_profit;

    double confidence = 0.0;        // calibrated, 0..0.92
    std::string description;

    long long created_at = 0;       // epoch ms
    long long last_updated = 0;

    ConditionSet conditions;

    long long ageMs(long long now_ms) const { return now_ms - created_at; }
};

enum class SignalAction { CREATED, UPDATED, DELETED };

inline const char* signalActionToString(SignalAction a) {
    switch (a) {
        case SignalAction::CREATED: return "created";
        case SignalAction::UPDATED: return "updated";
        case SignalAction::DELETED: return "deleted";
    }
    return "unknown";
}

struct SignalEvent {
    SignalAction action;
    ActiveSignal signal;            // snapshot at the time of the event
};

// "LONG setup: macd_crossover, strong_trend, RSI 58.2, ADX 27.4 (9/13 conditions)"
std::string describeSignal(Direction direction, const ConditionSet& conditions,
                           double rsi, double adx);

nlohmann::json toJson(const ActiveSignal& signal);
nlohmann::json toJson(const SignalEvent& event);

} // namespace signal
} // namespace quantscan
