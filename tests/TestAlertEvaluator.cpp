#include "alerts/AlertEvaluator.h"

#include <iostream>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

namespace {
quantpulse::MetricsSnapshot makeMetrics(const std::string& id, long long ts, double z) {
    quantpulse::MetricsSnapshot m;
    m.timestamp = ts;
    m.instrument_id = id;
    m.mean_price = 100.0;
    m.volatility = 0.02;
    m.z_score = z;
    m.rsi_14 = 55.0;
    return m;
}
}

int main() {
    using quantpulse::Comparator;
    using namespace quantpulse::alerts;

    // comparator semantics
    {
        CHECK(AlertEvaluator::compare(3.1, Comparator::GREATER, 2.0), ">");
        CHECK(!AlertEvaluator::compare(2.0, Comparator::GREATER, 2.0), "> is strict");
        CHECK(AlertEvaluator::compare(2.0, Comparator::GREATER_EQUAL, 2.0), ">=");
        CHECK(AlertEvaluator::compare(1.0, Comparator::LESS, 2.0), "<");
        CHECK(AlertEvaluator::compare(2.0, Comparator::LESS_EQUAL, 2.0), "<=");
        CHECK(AlertEvaluator::compare(2.0000001, Comparator::EQUAL, 2.0, 1e-6), "== within epsilon");
        CHECK(!AlertEvaluator::compare(2.01, Comparator::EQUAL, 2.0, 1e-6), "== outside epsilon");
        CHECK(AlertEvaluator::compare(2.01, Comparator::NOT_EQUAL, 2.0, 1e-6), "!=");
    }

    // metric lookup
    {
        const auto m = makeMetrics("BTCUSDT", 1, 1.5);
        CHECK(AlertEvaluator::resolveMetric(m, "z_score") == 1.5, "z_score");
        CHECK(AlertEvaluator::resolveMetric(m, "volatility") == 0.02, "volatility");
        CHECK(AlertEvaluator::resolveMetric(m, "mean_price") == 100.0, "mean_price");
        CHECK(AlertEvaluator::resolveMetric(m, "rsi_14") == 55.0, "rsi_14");
        CHECK(!AlertEvaluator::resolveMetric(m, "unknown").has_value(), "unknown metric");
    }

    // one rule fires exactly once
    {
        AlertRuleBook book({"BTCUSDT", "ETHUSDT"});
        AlertEvaluator evaluator;

        auto rule = book.create(AlertRuleRequest{"BTCUSDT", "z_score", ">", 2.0, true});
        auto disabled = book.create(AlertRuleRequest{"BTCUSDT", "z_score", ">", 1.0, false});
        auto other = book.create(AlertRuleRequest{"ETHUSDT", "z_score", ">", 1.0, true});
        CHECK(rule.ok && disabled.ok && other.ok, "rule setup");

        auto events = evaluator.evaluate(makeMetrics("BTCUSDT", 5000, 3.1), book);
        CHECK(events.size() == 1, "exactly one alert, got " << events.size());
        CHECK(events[0].rule_id == rule.rule.rule_id, "alert from the enabled rule");
        CHECK(events[0].actual_value == 3.1 && events[0].threshold == 2.0, "alert values");
        CHECK(events[0].timestamp == 5000 && events[0].metric_name == "z_score", "alert metadata");
        CHECK(book.get(rule.rule.rule_id)->triggered_count == 1, "triggered_count incremented");
        CHECK(book.get(disabled.rule.rule_id)->triggered_count == 0, "disabled rule untouched");
        CHECK(book.get(other.rule.rule_id)->triggered_count == 0, "other instrument untouched");
        CHECK(evaluator.historySize() == 1, "alert appended to the log");

        auto quiet = evaluator.evaluate(makeMetrics("BTCUSDT", 6000, 0.5), book);
        CHECK(quiet.empty() && evaluator.historySize() == 1, "no alert below threshold");
    }

    // bounded log, newest kept, history limit
    {
        AlertConfig config;
        config.log_capacity = 3;
        AlertEvaluator evaluator(config);
        AlertRuleBook book;
        book.create(AlertRuleRequest{"BTCUSDT", "mean_price", ">", 0.0, true});

        for (long long ts = 1; ts <= 5; ++ts) {
            evaluator.evaluate(makeMetrics("BTCUSDT", ts, 0.0), book);
        }
        CHECK(evaluator.historySize() == 3, "log capped at capacity");
        const auto history = evaluator.getHistory(100);
        CHECK(history.size() == 3 && history.front().timestamp == 3 && history.back().timestamp == 5,
              "oldest alerts evicted, oldest-first order");
        const auto last_two = evaluator.getHistory(2);
        CHECK(last_two.size() == 2 && last_two.front().timestamp == 4, "history limit");
    }

    std::cout << "[TEST] AlertEvaluator PASSED\n";
    return 0;
}
