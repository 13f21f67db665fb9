#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analytics/AnalyticsConfig.h"
#include "analytics/HistoryStore.h"
#include "common/Types.h"

namespace quantpulse {
namespace analytics {

// Turns flushed windows into MetricsSnapshots: appends to the HistoryStore,
// derives indicators from the updated history and caches the latest
// snapshot per instrument.
class AnalyticsEngine {
public:
    AnalyticsEngine(HistoryStore& history, AnalyticsConfig config = AnalyticsConfig());

    // One flush: every window is appended under one history generation
    // before any snapshot is computed, so peer correlations see both sides.
    std::vector<MetricsSnapshot> processBatch(const std::vector<AggregatedWindow>& windows);

    MetricsSnapshot processWindow(const AggregatedWindow& window);

    std::optional<MetricsSnapshot> getMetrics(const std::string& instrument_id) const;
    std::map<std::string, MetricsSnapshot> getAllMetrics() const;

    std::vector<double> getPriceHistory(const std::string& instrument_id, size_t limit = 100) const;

    // "A-B" -> coefficient for every tracked pair with a defined value
    std::map<std::string, double> getCorrelationMatrix() const;

    std::vector<double> detectAnomalies(const std::string& instrument_id) const;

    const AnalyticsConfig& config() const { return config_; }

private:
    MetricsSnapshot computeSnapshot(const AggregatedWindow& window, const HistorySnapshot& history) const;
    std::optional<double> peerCorrelation(const std::string& instrument_id) const;

    HistoryStore& history_;
    AnalyticsConfig config_;

    mutable std::mutex metrics_mutex_;
    std::map<std::string, MetricsSnapshot> latest_metrics_;
};

} // namespace analytics
} // namespace quantpulse
