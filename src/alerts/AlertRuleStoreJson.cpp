#include "alerts/AlertRuleStoreJson.h"
#include "alerts/AlertRuleBook.h"
#include "common/Logger.h"
#include "storage/RecordCodec.h"

#include <chrono>
#include <fstream>
#include <system_error>

namespace quantpulse {
namespace alerts {

namespace {
long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

AlertRuleStoreJson::AlertRuleStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<std::vector<AlertRule>> AlertRuleStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const std::exception& e) {
        LOG_WARN("Alert rule file unreadable: {} - {}", file_path_.string(), e.what());
        return std::nullopt;
    }

    if (!raw.is_object() || !raw.contains("rules") || !raw["rules"].is_array()) {
        LOG_WARN("Alert rule file has no rules array: {}", file_path_.string());
        return std::nullopt;
    }

    std::vector<AlertRule> rules;
    for (const auto& item : raw["rules"]) {
        if (!item.is_object()) {
            continue;
        }
        AlertRule rule;
        std::optional<std::string> metric;
        std::optional<Comparator> comparator;
        try {
            rule.rule_id = item.value("rule_id", std::string());
            rule.instrument_id = item.value("symbol", std::string());
            rule.threshold = item.value("threshold", 0.0);
            rule.enabled = item.value("enabled", true);
            rule.triggered_count = item.value("triggered_count", 0);
            metric = AlertRuleBook::normalizeMetricName(item.value("metric", std::string()));
            comparator = parseComparator(item.value("comparator", std::string()));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed alert rule entry: {} - {}", item.dump(), e.what());
            continue;
        }

        if (rule.rule_id.empty() || rule.instrument_id.empty() || !metric || !comparator) {
            LOG_WARN("Skipping invalid alert rule entry: {}", item.dump());
            continue;
        }
        rule.metric_name = *metric;
        rule.comparator = *comparator;
        rules.push_back(rule);
    }
    return rules;
}

bool AlertRuleStoreJson::save(const std::vector<AlertRule>& rules) {
    nlohmann::json raw;
    raw["schema_version"] = 1;
    raw["saved_at_ms"] = nowMs();
    raw["rules"] = nlohmann::json::array();
    for (const auto& rule : rules) {
        raw["rules"].push_back(storage::toJson(rule));
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
    }

    ec.clear();
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        LOG_WARN("Alert rule file rename failed: {}", ec.message());
        return false;
    }
    return true;
}

} // namespace alerts
} // namespace quantpulse
