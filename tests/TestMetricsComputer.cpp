#include "analytics/MetricsComputer.h"

#include <cmath>
#include <iostream>
#include <vector>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    using quantpulse::Trend;
    using quantpulse::analytics::MetricsComputer;

    // mean / std
    {
        const std::vector<double> prices{100.0, 101.0, 99.0};
        CHECK(near(MetricsComputer::calculateMean(prices), 100.0), "mean of [100,101,99]");
        CHECK(near(MetricsComputer::calculateStdDev(prices), std::sqrt(2.0 / 3.0)), "population std");
        CHECK(MetricsComputer::calculateMean({}) == 0.0, "mean of empty input");
        CHECK(MetricsComputer::calculateStdDev({42.0}) == 0.0, "std of a single value");
    }

    // vwap
    {
        const std::vector<double> prices{100.0, 101.0, 99.0};
        CHECK(near(MetricsComputer::calculateVWAP(prices, {1.0, 2.0, 1.0}), 100.25), "weighted vwap");
        CHECK(MetricsComputer::calculateVWAP(prices, {0.0, 0.0, 0.0}) == 0.0, "vwap with zero volume");
        CHECK(near(MetricsComputer::calculateVWAP(prices, {3.0, 3.0, 3.0}), MetricsComputer::calculateMean(prices)),
              "vwap with uniform volume should equal the mean");
    }

    // sma / ema
    {
        std::vector<double> rising;
        for (int i = 0; i <= 20; ++i) {
            rising.push_back(100.0 + i);
        }
        CHECK(near(MetricsComputer::calculateSMA(rising, 20), 110.5), "sma over last 20");
        CHECK(near(MetricsComputer::calculateSMA({1.0, 2.0, 3.0}, 20), 2.0), "sma fallback to mean");

        CHECK(MetricsComputer::calculateEMA({7.5}, 20) == 7.5, "ema of a single element");
        const std::vector<double> flat(30, 55.0);
        CHECK(near(MetricsComputer::calculateEMA(flat, 20), 55.0), "ema of a constant series");
        CHECK(near(MetricsComputer::calculateEMA({1.0, 2.0, 3.0}, 20), 2.0), "ema falls back to sma");

        // seeded with the first value, k = 2/21
        double expected = rising.front();
        for (size_t i = 1; i < rising.size(); ++i) {
            expected = rising[i] * (2.0 / 21.0) + expected * (1.0 - 2.0 / 21.0);
        }
        CHECK(near(MetricsComputer::calculateEMA(rising, 20), expected), "ema recurrence");
    }

    // rsi
    {
        std::vector<double> short_series(14, 100.0);
        short_series.back() = 130.0;
        CHECK(MetricsComputer::calculateRSI(short_series, 14) == 50.0, "rsi below period + 1 points");

        std::vector<double> rising;
        for (int i = 0; i < 15; ++i) {
            rising.push_back(100.0 + i);
        }
        CHECK(MetricsComputer::calculateRSI(rising, 14) == 100.0, "rsi with only gains");

        const std::vector<double> flat(20, 10.0);
        CHECK(MetricsComputer::calculateRSI(flat, 14) == 50.0, "rsi with no movement");

        // 7 gains of 2, 7 losses of 1 -> rs = 2 -> 66.67
        std::vector<double> mixed{100.0};
        for (int i = 0; i < 7; ++i) {
            mixed.push_back(mixed.back() + 2.0);
            mixed.push_back(mixed.back() - 1.0);
        }
        CHECK(near(MetricsComputer::calculateRSI(mixed, 14), 100.0 - 100.0 / 3.0, 1e-9), "rsi with mixed moves");
    }

    // z-score
    {
        CHECK(MetricsComputer::calculateZScore(123.0, 100.0, 0.0) == 0.0, "z-score with zero std");
        CHECK(near(MetricsComputer::calculateZScore(106.0, 100.0, 2.0), 3.0), "z-score value");
    }

    // correlation
    {
        const std::vector<double> a{1.0, 2.0, 3.0, 4.0, 5.0};
        const std::vector<double> b{2.0, 4.1, 5.9, 8.2, 9.9};
        const std::vector<double> c{5.0, 4.0, 3.0, 2.0, 1.0};

        auto ab = MetricsComputer::calculateCorrelation(a, b);
        auto ba = MetricsComputer::calculateCorrelation(b, a);
        CHECK(ab && ba, "correlation should be defined");
        CHECK(near(*ab, *ba, 1e-12), "correlation should be symmetric");
        CHECK(*ab > 0.99, "strongly correlated series, got " << *ab);

        auto ac = MetricsComputer::calculateCorrelation(a, c);
        CHECK(ac && near(*ac, -1.0, 1e-12), "perfect negative correlation");

        CHECK(!MetricsComputer::calculateCorrelation(a, {1.0, 2.0}), "length mismatch should be absent");
        CHECK(!MetricsComputer::calculateCorrelation(a, {3.0, 3.0, 3.0, 3.0, 3.0}), "flat series should be absent");
        CHECK(!MetricsComputer::calculateCorrelation({1.0}, {2.0}), "single point should be absent");
    }

    // trend
    {
        CHECK(MetricsComputer::detectTrend(110.0, 105.0, 120.0) == Trend::UPTREND, "uptrend");
        CHECK(MetricsComputer::detectTrend(110.0, 115.0, 100.0) == Trend::DOWNTREND, "downtrend");
        CHECK(MetricsComputer::detectTrend(110.0, 112.0, 120.0) == Trend::NEUTRAL, "neutral");
    }

    // stationarity heuristic
    {
        CHECK(!MetricsComputer::calculateStationarityPValue({1.0, 2.0, 3.0}, 10), "too few points");
        const std::vector<double> flat(12, 5.0);
        auto flat_p = MetricsComputer::calculateStationarityPValue(flat, 10);
        CHECK(flat_p && *flat_p == 1.0, "zero variance gives 1.0");

        std::vector<double> alternating;
        for (int i = 0; i < 20; ++i) {
            alternating.push_back(i % 2 == 0 ? 1.0 : -1.0);
        }
        auto alt_p = MetricsComputer::calculateStationarityPValue(alternating, 10);
        CHECK(alt_p && *alt_p > 0.5 && *alt_p < 0.6, "alternating series p-value " << (alt_p ? *alt_p : -1.0));
    }

    // volatility forecast
    {
        CHECK(!MetricsComputer::calculateVolatilityForecast(std::vector<double>(5, 0.01), 0.1, 0.85, 10),
              "too few returns");

        std::vector<double> returns;
        for (int i = 0; i < 12; ++i) {
            returns.push_back(i % 2 == 0 ? 0.01 : -0.01);
        }
        // var = 1e-4, omega = 0.05e-4, alpha*r^2 = 0.1e-4, beta*std^2 = 0.85e-4
        auto forecast = MetricsComputer::calculateVolatilityForecast(returns, 0.1, 0.85, 10);
        CHECK(forecast && near(*forecast, 0.01, 1e-10), "volatility forecast value");
    }

    // anomalies
    {
        std::vector<double> prices(30, 100.0);
        prices[10] = 101.0;
        prices[20] = 99.0;
        prices.push_back(150.0);
        const auto anomalies = MetricsComputer::detectAnomalies(prices, 3.0, 10);
        CHECK(anomalies.size() == 1 && anomalies.front() == 150.0, "single outlier expected");
        CHECK(MetricsComputer::detectAnomalies({100.0, 500.0}, 3.0, 10).empty(), "below min points");
    }

    std::cout << "[TEST] MetricsComputer PASSED\n";
    return 0;
}
