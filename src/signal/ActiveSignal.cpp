#include "signal/ActiveSignal.h"

#include <spdlog/fmt/fmt.h>

namespace quantscan {
namespace signal {

std::string describeSignal(Direction direction, const ConditionSet& conditions,
                           double rsi, double adx) {
    std::string fired;
    for (const auto& [name, met] : conditions.entries(direction)) {
        if (!met) continue;
        fired += name;
        fired += ", ";
    }
    return fmt::format("{} setup: {}RSI {:.1f}, ADX {:.1f} ({}/{} conditions)",
                       directionToString(direction), fired, rsi, adx,
                       conditions.countMet(), ConditionSet::kCount);
}

nlohmann::json toJson(const ActiveSignal& s) {
    return {
        {"symbol", s.symbol},
        {"direction", directionToString(s.direction)},
        {"timeframe", s.timeframe},
        {"entry_price", s.entry_price.toString()},
        {"stop_loss", s.stop_loss.toString()},
        {"take_profit", s.take_profit.toString()},
        {"confidence", s.confidence},
        {"description", s.description},
        {"created_at", s.created_at},
        {"last_updated", s.last_updated},
        {"conditions_met", s.conditions.toJson(s.direction)},
    };
}

nlohmann::json toJson(const SignalEvent& e) {
    return {
        {"action", signalActionToString(e.action)},
        {"signal", toJson(e.signal)},
    };
}

} // namespace signal
} // namespace quantscan
