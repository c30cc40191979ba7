#pragma once

#include <vector>
#include "common/Types.h"

namespace quantscan {
namespace analytics {

// Statistics computed directly from OHLCV. Signal scoring reads precomputed
// indicators from the candle map; these helpers serve the gates and the
// volatility classifier.
class TechnicalIndicators {
public:
    // Mean of the newest `period` values; 0 when there are fewer.
    static double calculateSMA(const std::vector<double>& values, int period);

    // Simple mean of the newest `period` true ranges; 0 when there are fewer.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    // Rolling-mean RSI for every close. Entries without a full window are NaN.
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    // Fractional change close-to-close; one element shorter than the input.
    static std::vector<double> calculateReturns(const std::vector<double>& prices);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);

    static double calculateMean(const std::vector<double>& values);
    // ddof = 0 for population, 1 for sample deviation.
    static double calculateStandardDeviation(const std::vector<double>& values, double mean, int ddof = 0);
};

} // namespace analytics
} // namespace quantscan
