#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "alerts/AlertEvaluator.h"
#include "alerts/AlertRuleBook.h"
#include "alerts/AlertRuleStoreJson.h"
#include "analytics/AnalyticsEngine.h"
#include "analytics/Clusterer.h"
#include "analytics/HistoryStore.h"
#include "backtest/BacktestSimulator.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "feed/TradeChannel.h"
#include "feed/WindowAggregator.h"
#include "network/BinanceTradeStreamClient.h"
#include "storage/IRecordSink.h"

namespace quantpulse {
namespace engine {

// Result of one flush pass
struct FlushReport {
    std::vector<AggregatedWindow> windows;
    std::vector<MetricsSnapshot> snapshots;
    std::vector<AlertEvent> alerts;
};

// Wires the pipeline together:
//   feed client -> TradeChannel -> WindowAggregator -> (flush) ->
//   HistoryStore/AnalyticsEngine -> AlertEvaluator -> record sink
// Clustering and backtests run on demand against history snapshots.
class AnalyticsService {
public:
    AnalyticsService(const EngineConfig& config,
                     std::shared_ptr<storage::IRecordSink> sink = nullptr,
                     std::shared_ptr<alerts::AlertRuleStoreJson> rule_store = nullptr,
                     feed::WindowAggregator::Clock clock = feed::WindowAggregator::Clock());

    ~AnalyticsService();

    // ===== control =====

    // Starts the feed client plus the ingestion and flush threads
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // ===== manual path (replay, tests) =====

    void ingest(const TradeEvent& event);
    FlushReport flushNow();
    // Flushes only when the configured interval has elapsed
    std::optional<FlushReport> flushIfDue();

    // ===== queries =====

    std::optional<MetricsSnapshot> getLatestMetrics(const std::string& instrument_id) const;
    std::map<std::string, MetricsSnapshot> getAllMetrics() const;
    std::vector<double> getPriceHistory(const std::string& instrument_id, size_t limit = 100) const;
    std::map<std::string, double> getCorrelationMatrix() const;
    std::vector<std::vector<std::string>> getClusters() const;
    backtest::BacktestResult runBacktest(const std::string& instrument_id) const;
    std::vector<double> detectAnomalies(const std::string& instrument_id) const;
    network::FeedStatus getFeedStatus() const;
    std::vector<AlertEvent> getAlertHistory(size_t limit = 100) const;
    std::vector<std::string> getInstruments() const;

    // ===== alert rule management =====

    alerts::RuleCommandResult createRule(const alerts::AlertRuleRequest& request);
    alerts::RuleCommandResult updateRule(const std::string& rule_id, const alerts::AlertRuleRequest& request);
    alerts::RuleCommandResult setRuleEnabled(const std::string& rule_id, bool enabled);
    bool deleteRule(const std::string& rule_id);
    std::vector<AlertRule> listRules() const;

    void logStatus() const;

private:
    void runIngestion();
    void runFlushTimer();
    FlushReport processFlush(std::vector<AggregatedWindow> windows);
    void persistRules();

    EngineConfig config_;
    std::shared_ptr<storage::IRecordSink> sink_;
    std::shared_ptr<alerts::AlertRuleStoreJson> rule_store_;

    analytics::HistoryStore history_;
    analytics::AnalyticsEngine analytics_;
    analytics::Clusterer clusterer_;
    backtest::BacktestSimulator simulator_;
    feed::WindowAggregator aggregator_;
    feed::TradeChannel channel_;
    network::BinanceTradeStreamClient feed_client_;
    alerts::AlertRuleBook rule_book_;
    alerts::AlertEvaluator evaluator_;

    std::mutex flush_mutex_;
    std::mutex rules_io_mutex_;

    std::atomic<bool> running_{false};
    std::thread ingestion_thread_;
    std::thread flush_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace engine
} // namespace quantpulse
