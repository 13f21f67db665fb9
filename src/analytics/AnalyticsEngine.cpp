#include "analytics/AnalyticsEngine.h"
#include "analytics/MetricsComputer.h"
#include "common/Logger.h"

#include <algorithm>

namespace quantpulse {
namespace analytics {

AnalyticsEngine::AnalyticsEngine(HistoryStore& history, AnalyticsConfig config)
    : history_(history)
    , config_(std::move(config)) {}

std::vector<MetricsSnapshot> AnalyticsEngine::processBatch(const std::vector<AggregatedWindow>& windows) {
    std::vector<MetricsSnapshot> out;
    if (windows.empty()) {
        return out;
    }

    history_.appendBatch(windows);

    out.reserve(windows.size());
    for (const auto& window : windows) {
        auto snapshot = history_.snapshot(window.instrument_id);
        if (!snapshot) {
            continue;
        }
        out.push_back(computeSnapshot(window, *snapshot));
    }

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        for (const auto& metrics : out) {
            latest_metrics_[metrics.instrument_id] = metrics;
        }
    }
    return out;
}

MetricsSnapshot AnalyticsEngine::processWindow(const AggregatedWindow& window) {
    auto batch = processBatch({window});
    return batch.empty() ? MetricsSnapshot() : batch.front();
}

MetricsSnapshot AnalyticsEngine::computeSnapshot(const AggregatedWindow& window,
                                                 const HistorySnapshot& history) const {
    const auto& prices = history.prices;

    MetricsSnapshot m;
    m.timestamp = window.timestamp;
    m.instrument_id = window.instrument_id;
    m.mean_price = MetricsComputer::calculateMean(prices);
    m.std_price = MetricsComputer::calculateStdDev(prices, m.mean_price);
    m.volatility = (m.mean_price > 0.0) ? (m.std_price / m.mean_price) : 0.0;

    // z-score of the newest window against the recent slice
    const size_t window_len = static_cast<size_t>(std::max(config_.zscore_window, 1));
    std::vector<double> recent(prices.end() - static_cast<std::ptrdiff_t>(std::min(window_len, prices.size())),
                               prices.end());
    const double recent_mean = MetricsComputer::calculateMean(recent);
    const double recent_std = MetricsComputer::calculateStdDev(recent, recent_mean);
    m.z_score = MetricsComputer::calculateZScore(window.mean_price, recent_mean, recent_std);

    m.sma_20 = MetricsComputer::calculateSMA(prices, config_.sma_period);
    m.ema_20 = MetricsComputer::calculateEMA(prices, config_.ema_period);
    m.rsi_14 = MetricsComputer::calculateRSI(prices, config_.rsi_period);
    m.trend = MetricsComputer::detectTrend(m.sma_20, m.ema_20, window.mean_price);

    m.adf_pvalue = MetricsComputer::calculateStationarityPValue(prices, config_.stationarity_min_points);
    m.garch_forecast = MetricsComputer::calculateVolatilityForecast(
        history.returns, config_.garch_alpha, config_.garch_beta, config_.garch_min_returns);
    m.correlation = peerCorrelation(window.instrument_id);

    LOG_DEBUG("{}: mean={:.4f} z={:.3f} rsi={:.1f} trend={}",
              m.instrument_id, m.mean_price, m.z_score, m.rsi_14, toString(m.trend));
    return m;
}

std::optional<double> AnalyticsEngine::peerCorrelation(const std::string& instrument_id) const {
    for (const auto& pair : config_.correlation_pairs) {
        std::string peer;
        bool self_first = true;
        if (pair.first == instrument_id) {
            peer = pair.second;
        } else if (pair.second == instrument_id) {
            peer = pair.first;
            self_first = false;
        } else {
            continue;
        }

        auto both = history_.snapshotPair(instrument_id, peer);
        if (!both) {
            continue;
        }
        const auto& self_prices = both->first.prices;
        const auto& peer_prices = both->second.prices;
        if (self_prices.size() != peer_prices.size()) {
            continue;
        }
        // keep the configured orientation so both sides report the same value
        return self_first ? MetricsComputer::calculateCorrelation(self_prices, peer_prices)
                          : MetricsComputer::calculateCorrelation(peer_prices, self_prices);
    }
    return std::nullopt;
}

std::optional<MetricsSnapshot> AnalyticsEngine::getMetrics(const std::string& instrument_id) const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    auto it = latest_metrics_.find(instrument_id);
    if (it == latest_metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, MetricsSnapshot> AnalyticsEngine::getAllMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return latest_metrics_;
}

std::vector<double> AnalyticsEngine::getPriceHistory(const std::string& instrument_id, size_t limit) const {
    return history_.getPrices(instrument_id, limit);
}

std::map<std::string, double> AnalyticsEngine::getCorrelationMatrix() const {
    std::map<std::string, double> result;
    const auto all = history_.snapshotAll();

    for (size_t i = 0; i < all.size(); ++i) {
        for (size_t j = i + 1; j < all.size(); ++j) {
            const auto& a = all[i].prices;
            const auto& b = all[j].prices;
            if (a.empty() || a.size() != b.size()) {
                continue;
            }
            auto corr = MetricsComputer::calculateCorrelation(a, b);
            if (corr) {
                result[all[i].instrument_id + "-" + all[j].instrument_id] = *corr;
            }
        }
    }
    return result;
}

std::vector<double> AnalyticsEngine::detectAnomalies(const std::string& instrument_id) const {
    const auto prices = history_.getPrices(instrument_id, history_.capacity());
    return MetricsComputer::detectAnomalies(prices, config_.anomaly_z_threshold, config_.anomaly_min_points);
}

} // namespace analytics
} // namespace quantpulse
