#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace quantscan {
namespace analytics {

double TechnicalIndicators::calculateSMA(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        sum += values[i];
    }
    return sum / period;
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    // TR needs the previous close, so the first candle only seeds
    double tr_sum = 0.0;
    for (size_t i = candles.size() - period; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);
        tr_sum += std::max({tr1, tr2, tr3});
    }
    return tr_sum / period;
}

std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> rsi(prices.size(), nan);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return rsi;
    }

    std::vector<double> gains(prices.size(), 0.0);
    std::vector<double> losses(prices.size(), 0.0);
    for (size_t i = 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) gains[i] = change;
        else losses[i] = -change;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = 1; i < prices.size(); ++i) {
        gain_sum += gains[i];
        loss_sum += losses[i];
        if (i > static_cast<size_t>(period)) {
            gain_sum -= gains[i - period];
            loss_sum -= losses[i - period];
        }
        if (i < static_cast<size_t>(period)) continue;

        const double avg_gain = gain_sum / period;
        const double avg_loss = loss_sum / period;
        if (avg_loss < 1e-12) {
            rsi[i] = (avg_gain < 1e-12) ? nan : 100.0;
        } else {
            rsi[i] = 100.0 - (100.0 / (1.0 + avg_gain / avg_loss));
        }
    }
    return rsi;
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) return returns;
    returns.reserve(prices.size() - 1);

    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] == 0.0) continue;
        returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
    }
    return returns;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& candle : candles) {
        volumes.push_back(candle.volume);
    }
    return volumes;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean,
    int ddof
) {
    if (values.size() <= static_cast<size_t>(std::max(ddof, 0))) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / (values.size() - ddof));
}

} // namespace analytics
} // namespace quantscan
