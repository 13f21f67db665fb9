#include "storage/RecordCodec.h"

namespace quantpulse {
namespace storage {

namespace {
nlohmann::json optionalToJson(const std::optional<double>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::optional<double> optionalFromJson(const nlohmann::json& value, const char* key) {
    auto it = value.find(key);
    if (it == value.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

Trend trendFromString(const std::string& value) {
    if (value == "uptrend") return Trend::UPTREND;
    if (value == "downtrend") return Trend::DOWNTREND;
    return Trend::NEUTRAL;
}
}

nlohmann::json toJson(const AggregatedWindow& window) {
    return {
        {"timestamp", window.timestamp},
        {"symbol", window.instrument_id},
        {"mean_price", window.mean_price},
        {"std_price", window.std_price},
        {"min_price", window.min_price},
        {"max_price", window.max_price},
        {"total_volume", window.total_volume},
        {"trade_count", window.trade_count},
        {"vwap", window.vwap}
    };
}

nlohmann::json toJson(const MetricsSnapshot& metrics) {
    return {
        {"timestamp", metrics.timestamp},
        {"symbol", metrics.instrument_id},
        {"mean_price", metrics.mean_price},
        {"std_price", metrics.std_price},
        {"volatility", metrics.volatility},
        {"z_score", metrics.z_score},
        {"sma_20", metrics.sma_20},
        {"ema_20", metrics.ema_20},
        {"rsi", metrics.rsi_14},
        {"correlation", optionalToJson(metrics.correlation)},
        {"garch_forecast", optionalToJson(metrics.garch_forecast)},
        {"adf_pvalue", optionalToJson(metrics.adf_pvalue)},
        {"trend", toString(metrics.trend)}
    };
}

nlohmann::json toJson(const AlertEvent& event) {
    return {
        {"rule_id", event.rule_id},
        {"timestamp", event.timestamp},
        {"symbol", event.instrument_id},
        {"metric", event.metric_name},
        {"actual_value", event.actual_value},
        {"threshold", event.threshold}
    };
}

nlohmann::json toJson(const AlertRule& rule) {
    return {
        {"rule_id", rule.rule_id},
        {"symbol", rule.instrument_id},
        {"metric", rule.metric_name},
        {"comparator", toString(rule.comparator)},
        {"threshold", rule.threshold},
        {"enabled", rule.enabled},
        {"triggered_count", rule.triggered_count}
    };
}

MetricsSnapshot metricsFromJson(const nlohmann::json& value) {
    MetricsSnapshot metrics;
    metrics.timestamp = value.value("timestamp", 0LL);
    metrics.instrument_id = value.value("symbol", std::string());
    metrics.mean_price = value.value("mean_price", 0.0);
    metrics.std_price = value.value("std_price", 0.0);
    metrics.volatility = value.value("volatility", 0.0);
    metrics.z_score = value.value("z_score", 0.0);
    metrics.sma_20 = value.value("sma_20", 0.0);
    metrics.ema_20 = value.value("ema_20", 0.0);
    metrics.rsi_14 = value.value("rsi", 50.0);
    metrics.correlation = optionalFromJson(value, "correlation");
    metrics.garch_forecast = optionalFromJson(value, "garch_forecast");
    metrics.adf_pvalue = optionalFromJson(value, "adf_pvalue");
    metrics.trend = trendFromString(value.value("trend", std::string("neutral")));
    return metrics;
}

} // namespace storage
} // namespace quantpulse
