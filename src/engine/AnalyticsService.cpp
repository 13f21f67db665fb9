#include "engine/AnalyticsService.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <set>

namespace quantpulse {
namespace engine {

namespace {
constexpr auto kIngestPollTimeout = std::chrono::milliseconds(200);
constexpr auto kFlushPollInterval = std::chrono::milliseconds(100);

std::set<std::string> toSet(const std::vector<std::string>& values) {
    return std::set<std::string>(values.begin(), values.end());
}
}

AnalyticsService::AnalyticsService(const EngineConfig& config,
                                   std::shared_ptr<storage::IRecordSink> sink,
                                   std::shared_ptr<alerts::AlertRuleStoreJson> rule_store,
                                   feed::WindowAggregator::Clock clock)
    : config_(config)
    , sink_(std::move(sink))
    , rule_store_(std::move(rule_store))
    , history_(config.analytics.history_capacity)
    , analytics_(history_, config.analytics)
    , clusterer_(config.clustering)
    , simulator_(config.backtest)
    , aggregator_(std::move(clock))
    , channel_(config.feed.channel_capacity)
    , feed_client_(config.feed, channel_)
    , rule_book_(toSet(config.feed.instruments))
    , evaluator_(config.alerts) {
    if (rule_store_) {
        if (auto rules = rule_store_->load()) {
            rule_book_.replaceAll(*rules);
            LOG_INFO("Loaded {} alert rules from {}", rules->size(), rule_store_->path().string());
        }
    }
}

AnalyticsService::~AnalyticsService() {
    stop();
}

bool AnalyticsService::start() {
    if (running_) {
        LOG_WARN("Analytics service already running");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("Analytics service starting");
    LOG_INFO("Instruments: {}, flush every {} ms", config_.feed.instruments.size(), config_.flush_interval_ms);
    LOG_INFO("========================================");

    running_ = true;
    ingestion_thread_ = std::thread(&AnalyticsService::runIngestion, this);
    flush_thread_ = std::thread(&AnalyticsService::runFlushTimer, this);

    if (!feed_client_.start()) {
        LOG_ERROR("Feed client failed to start");
        stop();
        return false;
    }
    return true;
}

void AnalyticsService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Analytics service stopping...");
    feed_client_.stop();
    wake_cv_.notify_all();

    if (ingestion_thread_.joinable()) {
        ingestion_thread_.join();
    }
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    const size_t pending = aggregator_.pendingCount();
    if (pending > 0) {
        LOG_INFO("Discarding {} buffered trades of the unfinished window", pending);
    }
    LOG_INFO("Analytics service stopped");
}

void AnalyticsService::runIngestion() {
    while (running_) {
        auto event = channel_.pop(kIngestPollTimeout);
        if (event) {
            aggregator_.add(*event);
        }
    }
}

void AnalyticsService::runFlushTimer() {
    auto last_status = std::chrono::steady_clock::now();
    const auto status_interval = std::chrono::seconds(std::max(config_.status_report_interval_seconds, 1));

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, kFlushPollInterval, [this] { return !running_.load(); });
        }
        if (!running_) {
            break;
        }

        try {
            flushIfDue();
        } catch (const std::exception& e) {
            LOG_ERROR("Flush failed: {}", e.what());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_status >= status_interval) {
            logStatus();
            last_status = now;
        }
    }
}

void AnalyticsService::ingest(const TradeEvent& event) {
    aggregator_.add(event);
}

FlushReport AnalyticsService::flushNow() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    return processFlush(aggregator_.flush());
}

std::optional<FlushReport> AnalyticsService::flushIfDue() {
    std::lock_guard<std::mutex> lock(flush_mutex_);
    if (!aggregator_.shouldFlush(config_.flush_interval_ms)) {
        return std::nullopt;
    }
    return processFlush(aggregator_.flush());
}

FlushReport AnalyticsService::processFlush(std::vector<AggregatedWindow> windows) {
    FlushReport report;
    if (windows.empty()) {
        return report;
    }

    report.snapshots = analytics_.processBatch(windows);
    report.windows = std::move(windows);

    if (sink_) {
        for (const auto& window : report.windows) {
            if (!sink_->appendWindow(window)) {
                LOG_WARN("Window record for {} not stored", window.instrument_id);
            }
        }
        for (const auto& metrics : report.snapshots) {
            if (!sink_->appendMetrics(metrics)) {
                LOG_WARN("Metrics record for {} not stored", metrics.instrument_id);
            }
        }
    }

    for (const auto& metrics : report.snapshots) {
        auto fired = evaluator_.evaluate(metrics, rule_book_);
        for (auto& event : fired) {
            if (sink_ && !sink_->appendAlert(event)) {
                LOG_WARN("Alert record for rule {} not stored", event.rule_id);
            }
            report.alerts.push_back(std::move(event));
        }
    }

    LOG_DEBUG("Flushed {} windows, {} alerts", report.windows.size(), report.alerts.size());
    return report;
}

std::optional<MetricsSnapshot> AnalyticsService::getLatestMetrics(const std::string& instrument_id) const {
    return analytics_.getMetrics(instrument_id);
}

std::map<std::string, MetricsSnapshot> AnalyticsService::getAllMetrics() const {
    return analytics_.getAllMetrics();
}

std::vector<double> AnalyticsService::getPriceHistory(const std::string& instrument_id, size_t limit) const {
    return analytics_.getPriceHistory(instrument_id, limit);
}

std::map<std::string, double> AnalyticsService::getCorrelationMatrix() const {
    return analytics_.getCorrelationMatrix();
}

std::vector<std::vector<std::string>> AnalyticsService::getClusters() const {
    return clusterer_.cluster(history_.snapshotAll());
}

backtest::BacktestResult AnalyticsService::runBacktest(const std::string& instrument_id) const {
    auto snapshot = history_.snapshot(instrument_id);
    if (!snapshot) {
        return backtest::BacktestResult();
    }
    return simulator_.run(snapshot->prices);
}

std::vector<double> AnalyticsService::detectAnomalies(const std::string& instrument_id) const {
    return analytics_.detectAnomalies(instrument_id);
}

network::FeedStatus AnalyticsService::getFeedStatus() const {
    return feed_client_.getStatus();
}

std::vector<AlertEvent> AnalyticsService::getAlertHistory(size_t limit) const {
    return evaluator_.getHistory(limit);
}

std::vector<std::string> AnalyticsService::getInstruments() const {
    return history_.instruments();
}

alerts::RuleCommandResult AnalyticsService::createRule(const alerts::AlertRuleRequest& request) {
    auto result = rule_book_.create(request);
    if (result.ok) {
        persistRules();
    }
    return result;
}

alerts::RuleCommandResult AnalyticsService::updateRule(const std::string& rule_id,
                                                       const alerts::AlertRuleRequest& request) {
    auto result = rule_book_.update(rule_id, request);
    if (result.ok) {
        persistRules();
    }
    return result;
}

alerts::RuleCommandResult AnalyticsService::setRuleEnabled(const std::string& rule_id, bool enabled) {
    auto result = rule_book_.setEnabled(rule_id, enabled);
    if (result.ok) {
        persistRules();
    }
    return result;
}

bool AnalyticsService::deleteRule(const std::string& rule_id) {
    if (!rule_book_.remove(rule_id)) {
        return false;
    }
    persistRules();
    return true;
}

std::vector<AlertRule> AnalyticsService::listRules() const {
    return rule_book_.list();
}

void AnalyticsService::persistRules() {
    if (!rule_store_) {
        return;
    }
    std::lock_guard<std::mutex> lock(rules_io_mutex_);
    if (!rule_store_->save(rule_book_.list())) {
        LOG_WARN("Alert rules not saved to {}", rule_store_->path().string());
    }
}

void AnalyticsService::logStatus() const {
    const auto status = feed_client_.getStatus();
    LOG_INFO("Status: feed={} uptime={:.0f}s ticks={} reconnects={} parse_failures={} dropped={} pending={}",
             network::toString(status.state), status.uptime_seconds, status.ticks_received,
             status.reconnect_attempts, status.parse_failures, status.dropped_events,
             aggregator_.pendingCount());
}

} // namespace engine
} // namespace quantpulse
