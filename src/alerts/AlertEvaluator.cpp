#include "alerts/AlertEvaluator.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace quantpulse {
namespace alerts {

AlertEvaluator::AlertEvaluator(AlertConfig config)
    : config_(std::move(config))
    , log_(std::max<size_t>(config_.log_capacity, 1)) {}

std::optional<double> AlertEvaluator::resolveMetric(const MetricsSnapshot& metrics, const std::string& metric_name) {
    if (metric_name == "z_score") return metrics.z_score;
    if (metric_name == "volatility") return metrics.volatility;
    if (metric_name == "mean_price") return metrics.mean_price;
    if (metric_name == "rsi_14") return metrics.rsi_14;
    return std::nullopt;
}

bool AlertEvaluator::compare(double value, Comparator comparator, double threshold, double epsilon) {
    switch (comparator) {
        case Comparator::GREATER: return value > threshold;
        case Comparator::LESS: return value < threshold;
        case Comparator::GREATER_EQUAL: return value >= threshold;
        case Comparator::LESS_EQUAL: return value <= threshold;
        case Comparator::EQUAL: return std::abs(value - threshold) < epsilon;
        case Comparator::NOT_EQUAL: return std::abs(value - threshold) >= epsilon;
    }
    return false;
}

std::vector<AlertEvent> AlertEvaluator::evaluate(const MetricsSnapshot& metrics, AlertRuleBook& rules) {
    const double epsilon = config_.equality_epsilon;
    const auto fired = rules.applyTriggers(metrics.instrument_id, [&](const AlertRule& rule) {
        auto value = resolveMetric(metrics, rule.metric_name);
        return value && compare(*value, rule.comparator, rule.threshold, epsilon);
    });

    std::vector<AlertEvent> events;
    events.reserve(fired.size());
    for (const auto& rule : fired) {
        AlertEvent event;
        event.rule_id = rule.rule_id;
        event.timestamp = metrics.timestamp;
        event.instrument_id = metrics.instrument_id;
        event.metric_name = rule.metric_name;
        event.actual_value = resolveMetric(metrics, rule.metric_name).value_or(0.0);
        event.threshold = rule.threshold;
        events.push_back(event);

        LOG_WARN("Alert triggered: {} - {} {} {} (actual: {:.4f})", rule.rule_id, rule.metric_name,
                 toString(rule.comparator), rule.threshold, event.actual_value);
        Logger::getInstance().logAlert(event);
    }

    if (!events.empty()) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        for (const auto& event : events) {
            log_.push(event);
        }
    }
    return events;
}

std::vector<AlertEvent> AlertEvaluator::getHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return log_.tail(limit);
}

size_t AlertEvaluator::historySize() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return log_.size();
}

} // namespace alerts
} // namespace quantpulse
