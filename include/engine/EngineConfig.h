#pragma once

#include <string>

#include "alerts/AlertEvaluator.h"
#include "analytics/AnalyticsConfig.h"
#include "backtest/BacktestSimulator.h"
#include "network/FeedConfig.h"

namespace quantpulse {
namespace engine {

struct StorageConfig {
    bool enabled = true;
    std::string directory = "data";
    std::string rules_file = "data/alert_rules.json";   // empty disables rule persistence
};

struct LoggingConfig {
    std::string directory = "logs";
    std::string level = "info";
};

// Everything the service needs, as plain values
struct EngineConfig {
    network::FeedConfig feed;
    long long flush_interval_ms = 5000;

    analytics::AnalyticsConfig analytics;
    analytics::ClusterConfig clustering;
    alerts::AlertConfig alerts;
    backtest::BacktestConfig backtest;

    StorageConfig storage;
    LoggingConfig logging;

    int status_report_interval_seconds = 30;
};

} // namespace engine
} // namespace quantpulse
