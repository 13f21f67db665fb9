#include "alerts/AlertRuleBook.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace quantpulse {
namespace alerts {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

AlertRuleBook::AlertRuleBook(std::set<std::string> known_instruments)
    : known_instruments_(std::move(known_instruments)) {}

std::optional<std::string> AlertRuleBook::normalizeMetricName(const std::string& name) {
    if (name == "z_score" || name == "volatility" || name == "mean_price" || name == "rsi_14") {
        return name;
    }
    if (name == "price") return std::string("mean_price");
    if (name == "rsi") return std::string("rsi_14");
    return std::nullopt;
}

std::string AlertRuleBook::generateRuleId() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t part1 = dis(gen);
    std::uint64_t part2 = dis(gen);
    // version 4, RFC 4122 variant
    part1 = (part1 & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    part2 = (part2 & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-" << std::setw(4) << (part1 & 0xFFFF)
        << "-" << std::setw(4) << (part2 >> 48)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::optional<std::string> AlertRuleBook::validate(const AlertRuleRequest& request, AlertRule& out) const {
    const std::string instrument = toUpperCopy(request.instrument_id);
    if (instrument.empty()) {
        return std::string("instrument is required");
    }
    if (!known_instruments_.empty() && known_instruments_.count(instrument) == 0) {
        return "unknown instrument: " + request.instrument_id;
    }

    auto metric = normalizeMetricName(request.metric_name);
    if (!metric) {
        return "unknown metric: " + request.metric_name;
    }

    auto comparator = parseComparator(request.comparator);
    if (!comparator) {
        return "unknown comparator: " + request.comparator;
    }

    if (!std::isfinite(request.threshold)) {
        return std::string("threshold must be finite");
    }

    out.instrument_id = instrument;
    out.metric_name = *metric;
    out.comparator = *comparator;
    out.threshold = request.threshold;
    out.enabled = request.enabled;
    return std::nullopt;
}

RuleCommandResult AlertRuleBook::create(const AlertRuleRequest& request) {
    RuleCommandResult result;
    AlertRule rule;
    if (auto error = validate(request, rule)) {
        result.error = *error;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        rule.rule_id = generateRuleId();
    } while (rules_.count(rule.rule_id) > 0);
    rule.triggered_count = 0;
    rules_[rule.rule_id] = rule;

    result.ok = true;
    result.rule = rule;
    LOG_INFO("Alert rule created: {} ({} {} {} {})", rule.rule_id, rule.instrument_id,
             rule.metric_name, toString(rule.comparator), rule.threshold);
    return result;
}

RuleCommandResult AlertRuleBook::update(const std::string& rule_id, const AlertRuleRequest& request) {
    RuleCommandResult result;
    AlertRule validated;
    if (auto error = validate(request, validated)) {
        result.error = *error;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(rule_id);
    if (it == rules_.end()) {
        result.error = "rule not found: " + rule_id;
        return result;
    }

    auto& rule = it->second;
    rule.instrument_id = validated.instrument_id;
    rule.metric_name = validated.metric_name;
    rule.comparator = validated.comparator;
    rule.threshold = validated.threshold;
    rule.enabled = validated.enabled;

    result.ok = true;
    result.rule = rule;
    return result;
}

RuleCommandResult AlertRuleBook::setEnabled(const std::string& rule_id, bool enabled) {
    RuleCommandResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(rule_id);
    if (it == rules_.end()) {
        result.error = "rule not found: " + rule_id;
        return result;
    }
    it->second.enabled = enabled;
    result.ok = true;
    result.rule = it->second;
    return result;
}

bool AlertRuleBook::remove(const std::string& rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.erase(rule_id) > 0;
}

std::optional<AlertRule> AlertRuleBook::get(const std::string& rule_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(rule_id);
    if (it == rules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AlertRule> AlertRuleBook::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AlertRule> out;
    out.reserve(rules_.size());
    for (const auto& entry : rules_) {
        out.push_back(entry.second);
    }
    return out;
}

size_t AlertRuleBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

void AlertRuleBook::replaceAll(const std::vector<AlertRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.clear();
    for (const auto& rule : rules) {
        if (!rule.rule_id.empty()) {
            rules_[rule.rule_id] = rule;
        }
    }
}

std::vector<AlertRule> AlertRuleBook::applyTriggers(const std::string& instrument_id,
                                                    const std::function<bool(const AlertRule&)>& matches) {
    std::vector<AlertRule> fired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : rules_) {
        auto& rule = entry.second;
        if (!rule.enabled || rule.instrument_id != instrument_id) {
            continue;
        }
        if (matches(rule)) {
            rule.triggered_count++;
            fired.push_back(rule);
        }
    }
    return fired;
}

} // namespace alerts
} // namespace quantpulse
