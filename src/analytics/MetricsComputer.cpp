#include "analytics/MetricsComputer.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace quantpulse {
namespace analytics {

double MetricsComputer::calculateMean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double MetricsComputer::calculateStdDev(const std::vector<double>& values) {
    return calculateStdDev(values, calculateMean(values));
}

double MetricsComputer::calculateStdDev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }

    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

double MetricsComputer::calculateVWAP(const std::vector<double>& prices, const std::vector<double>& volumes) {
    if (prices.empty() || prices.size() != volumes.size()) {
        return 0.0;
    }

    double pv_sum = 0.0;
    double volume_sum = 0.0;
    for (size_t i = 0; i < prices.size(); ++i) {
        pv_sum += prices[i] * volumes[i];
        volume_sum += volumes[i];
    }

    return (volume_sum > 0.0) ? (pv_sum / volume_sum) : 0.0;
}

double MetricsComputer::calculateSMA(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return calculateMean(values);
    }
    double sum = std::accumulate(values.end() - period, values.end(), 0.0);
    return sum / period;
}

double MetricsComputer::calculateEMA(const std::vector<double>& values, int period) {
    if (values.empty()) {
        return 0.0;
    }
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return calculateSMA(values, period);
    }

    const double k = 2.0 / (period + 1);
    double ema = values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
    }
    return ema;
}

double MetricsComputer::calculateRSI(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double gain_sum = 0.0;
    double loss_sum = 0.0;

    // last `period` deltas only
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        double change = values[i] - values[i - 1];
        if (change > 0) gain_sum += change;
        else loss_sum += std::abs(change);
    }

    const double avg_gain = gain_sum / period;
    const double avg_loss = loss_sum / period;

    if (avg_loss == 0.0) {
        return (avg_gain > 0.0) ? 100.0 : 50.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double MetricsComputer::calculateZScore(double value, double mean, double std_dev) {
    if (std_dev == 0.0) {
        return 0.0;
    }
    return (value - mean) / std_dev;
}

std::optional<double> MetricsComputer::calculateCorrelation(const std::vector<double>& xs,
                                                            const std::vector<double>& ys) {
    if (xs.size() < 2 || xs.size() != ys.size()) {
        return std::nullopt;
    }

    const double x_mean = calculateMean(xs);
    const double y_mean = calculateMean(ys);

    double numerator = 0.0;
    for (size_t i = 0; i < xs.size(); ++i) {
        numerator += (xs[i] - x_mean) * (ys[i] - y_mean);
    }

    const double x_std = calculateStdDev(xs, x_mean);
    const double y_std = calculateStdDev(ys, y_mean);
    if (x_std == 0.0 || y_std == 0.0) {
        return std::nullopt;
    }

    const double denominator = static_cast<double>(xs.size()) * x_std * y_std;
    if (denominator == 0.0) {
        return std::nullopt;
    }
    return numerator / denominator;
}

Trend MetricsComputer::detectTrend(double sma, double ema, double current_price) {
    if (current_price > sma && sma > ema) {
        return Trend::UPTREND;
    }
    if (current_price < sma && sma < ema) {
        return Trend::DOWNTREND;
    }
    return Trend::NEUTRAL;
}

std::optional<double> MetricsComputer::calculateStationarityPValue(const std::vector<double>& values,
                                                                   size_t min_points) {
    if (values.size() < min_points || values.size() < 2) {
        return std::nullopt;
    }

    const double mean = calculateMean(values);
    const double n = static_cast<double>(values.size());

    double autocov = 0.0;
    for (size_t i = 1; i < values.size(); ++i) {
        autocov += (values[i] - mean) * (values[i - 1] - mean);
    }
    autocov /= n;

    double var = 0.0;
    for (double v : values) {
        var += (v - mean) * (v - mean);
    }
    var /= n;

    if (var == 0.0) {
        return 1.0;
    }

    const double autocorr = autocov / var;
    return 1.0 / (1.0 + std::abs(autocorr));
}

std::optional<double> MetricsComputer::calculateVolatilityForecast(const std::vector<double>& returns,
                                                                   double alpha,
                                                                   double beta,
                                                                   size_t min_returns) {
    if (returns.size() < min_returns || returns.empty()) {
        return std::nullopt;
    }

    const double last_return = returns.back();
    const double mean = calculateMean(returns);

    double long_term_var = 0.0;
    for (double r : returns) {
        long_term_var += (r - mean) * (r - mean);
    }
    long_term_var /= static_cast<double>(returns.size());

    const double recent_std = calculateStdDev(returns, mean);
    const double omega = (1.0 - alpha - beta) * long_term_var;

    const double forecast_var = omega + alpha * last_return * last_return + beta * recent_std * recent_std;
    return std::sqrt(std::max(forecast_var, 0.0));
}

std::vector<double> MetricsComputer::detectAnomalies(const std::vector<double>& prices,
                                                     double z_threshold,
                                                     size_t min_points) {
    std::vector<double> anomalies;
    if (prices.size() < min_points) {
        return anomalies;
    }

    const double mean = calculateMean(prices);
    const double std_dev = calculateStdDev(prices, mean);

    for (double price : prices) {
        if (std::abs(calculateZScore(price, mean, std_dev)) > z_threshold) {
            anomalies.push_back(price);
        }
    }
    return anomalies;
}

} // namespace analytics
} // namespace quantpulse
