#pragma once

#include <string>
#include <utility>
#include <vector>

namespace quantpulse {
namespace analytics {

struct AnalyticsConfig {
    size_t history_capacity = 500;
    int zscore_window = 60;
    int sma_period = 20;
    int ema_period = 20;
    int rsi_period = 14;

    // Stationarity / volatility forecast heuristics
    size_t stationarity_min_points = 10;
    size_t garch_min_returns = 10;
    double garch_alpha = 0.1;
    double garch_beta = 0.85;

    // Instrument pairs whose correlation is attached to each snapshot
    std::vector<std::pair<std::string, std::string>> correlation_pairs{{"BTCUSDT", "ETHUSDT"}};

    double anomaly_z_threshold = 3.0;
    size_t anomaly_min_points = 10;
};

struct ClusterConfig {
    double min_correlation = 0.7;
};

} // namespace analytics
} // namespace quantpulse
