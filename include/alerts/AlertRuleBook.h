#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace alerts {

// Fields accepted by create/update
struct AlertRuleRequest {
    std::string instrument_id;
    std::string metric_name;
    std::string comparator;
    double threshold = 0.0;
    bool enabled = true;
};

struct RuleCommandResult {
    bool ok = false;
    std::string error;
    AlertRule rule;
};

// Owns the alert rule set. Management commands and the evaluator both go
// through the same lock, so a command is fully visible (or not at all) to
// the next evaluation.
class AlertRuleBook {
public:
    // Empty set accepts any instrument
    explicit AlertRuleBook(std::set<std::string> known_instruments = {});

    RuleCommandResult create(const AlertRuleRequest& request);
    RuleCommandResult update(const std::string& rule_id, const AlertRuleRequest& request);
    RuleCommandResult setEnabled(const std::string& rule_id, bool enabled);
    bool remove(const std::string& rule_id);

    std::optional<AlertRule> get(const std::string& rule_id) const;
    std::vector<AlertRule> list() const;
    size_t size() const;

    // Replaces the whole rule set (used when loading from disk)
    void replaceAll(const std::vector<AlertRule>& rules);

    // Calls `matches` for every enabled rule of the instrument; each rule it
    // accepts gets triggered_count + 1 and is returned post-increment.
    std::vector<AlertRule> applyTriggers(const std::string& instrument_id,
                                         const std::function<bool(const AlertRule&)>& matches);

    // "price" -> "mean_price", "rsi" -> "rsi_14"; nullopt if unknown
    static std::optional<std::string> normalizeMetricName(const std::string& name);
    static std::string generateRuleId();

private:
    std::optional<std::string> validate(const AlertRuleRequest& request, AlertRule& out) const;

    std::set<std::string> known_instruments_;
    mutable std::mutex mutex_;
    std::map<std::string, AlertRule> rules_;
};

} // namespace alerts
} // namespace quantpulse
