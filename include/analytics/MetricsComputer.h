#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace analytics {

// Stateless indicator functions over history snapshots (oldest -> newest).
// None of them throws: short or degenerate input maps to a neutral value
// or to std::nullopt where the value is undefined.
class MetricsComputer {
public:
    // 0.0 for empty input
    static double calculateMean(const std::vector<double>& values);

    // Population standard deviation; 0.0 when fewer than 2 values
    static double calculateStdDev(const std::vector<double>& values);
    static double calculateStdDev(const std::vector<double>& values, double mean);

    // Volume weighted average price; 0.0 when total volume is zero
    static double calculateVWAP(const std::vector<double>& prices, const std::vector<double>& volumes);

    // Mean of the last `period` values (all values when fewer are available)
    static double calculateSMA(const std::vector<double>& values, int period = 20);

    // Seeded with the oldest value, k = 2 / (period + 1).
    // Falls back to the SMA when fewer than `period` values exist.
    static double calculateEMA(const std::vector<double>& values, int period = 20);

    // Simple average gain/loss over the last `period` deltas.
    // 50 when fewer than period + 1 values.
    static double calculateRSI(const std::vector<double>& values, int period = 14);

    // 0.0 when std is zero
    static double calculateZScore(double value, double mean, double std_dev);

    // Pearson coefficient; nullopt for mismatched/short series or zero std
    static std::optional<double> calculateCorrelation(const std::vector<double>& xs,
                                                      const std::vector<double>& ys);

    // UPTREND: price > sma > ema, DOWNTREND: price < sma < ema
    static Trend detectTrend(double sma, double ema, double current_price);

    // Pseudo p-value 1 / (1 + |lag-1 autocorrelation|); lower means more
    // mean-reverting. nullopt below `min_points`, 1.0 for zero variance.
    static std::optional<double> calculateStationarityPValue(const std::vector<double>& values,
                                                             size_t min_points = 10);

    // GARCH(1,1)-shaped one step volatility forecast:
    //   omega = (1 - alpha - beta) * Var(r)
    //   var   = omega + alpha * r_last^2 + beta * std(r)^2
    static std::optional<double> calculateVolatilityForecast(const std::vector<double>& returns,
                                                             double alpha = 0.1,
                                                             double beta = 0.85,
                                                             size_t min_returns = 10);

    // Prices whose |z| against the whole series exceeds the threshold
    static std::vector<double> detectAnomalies(const std::vector<double>& prices,
                                               double z_threshold = 3.0,
                                               size_t min_points = 10);
};

} // namespace analytics
} // namespace quantpulse
