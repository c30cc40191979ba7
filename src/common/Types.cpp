#include "common/Types.h"

#include <cmath>

namespace quantscan {

double Candle::indicator(const std::string& name) const {
    auto it = indicators.find(name);
    if (it == indicators.end()) {
        throw IndicatorError("missing indicator '" + name + "' on " + symbol +
                             " candle " + std::to_string(timestamp));
    }
    if (!std::isfinite(it->second)) {
        throw IndicatorError("non-finite indicator '" + name + "' on " + symbol +
                             " candle " + std::to_string(timestamp));
    }
    return it->second;
}

} // namespace quantscan
