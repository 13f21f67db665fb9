#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "alerts/AlertRuleBook.h"
#include "common/RingBuffer.h"
#include "common/Types.h"

namespace quantpulse {
namespace alerts {

struct AlertConfig {
    size_t log_capacity = 1000;
    double equality_epsilon = 1e-6;
};

// Matches rules against fresh snapshots and keeps a bounded trailing log
// of the alerts fired (oldest evicted first).
class AlertEvaluator {
public:
    explicit AlertEvaluator(AlertConfig config = AlertConfig());

    // Fired events, also appended to the log. Unknown metric names are skipped.
    std::vector<AlertEvent> evaluate(const MetricsSnapshot& metrics, AlertRuleBook& rules);

    // Newest `limit` events, oldest first
    std::vector<AlertEvent> getHistory(size_t limit = 100) const;
    size_t historySize() const;

    static std::optional<double> resolveMetric(const MetricsSnapshot& metrics, const std::string& metric_name);
    static bool compare(double value, Comparator comparator, double threshold, double epsilon = 1e-6);

private:
    AlertConfig config_;
    mutable std::mutex log_mutex_;
    RingBuffer<AlertEvent> log_;
};

} // namespace alerts
} // namespace quantpulse
