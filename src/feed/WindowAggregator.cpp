#include "feed/WindowAggregator.h"
#include "analytics/MetricsComputer.h"

#include <algorithm>
#include <chrono>

namespace quantpulse {
namespace feed {

namespace {
TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

using analytics::MetricsComputer;

WindowAggregator::WindowAggregator(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(nowMs))
    , last_flush_ms_(clock_()) {}

void WindowAggregator::add(const TradeEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_[event.instrument_id].push_back(event);
}

bool WindowAggregator::shouldFlush(long long interval_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (clock_() - last_flush_ms_) >= interval_ms;
}

std::vector<AggregatedWindow> WindowAggregator::flush() {
    std::map<std::string, std::vector<TradeEvent>> drained;
    TimestampMs flush_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(buffer_);
        flush_ms = clock_();
        last_flush_ms_ = flush_ms;
    }

    std::vector<AggregatedWindow> windows;
    windows.reserve(drained.size());
    for (const auto& [instrument_id, trades] : drained) {
        if (trades.empty()) {
            continue;
        }
        windows.push_back(aggregate(instrument_id, trades, flush_ms));
    }
    return windows;
}

AggregatedWindow WindowAggregator::aggregate(const std::string& instrument_id,
                                             const std::vector<TradeEvent>& trades,
                                             TimestampMs timestamp) {
    std::vector<double> prices;
    std::vector<double> quantities;
    prices.reserve(trades.size());
    quantities.reserve(trades.size());
    for (const auto& trade : trades) {
        prices.push_back(trade.price);
        quantities.push_back(trade.quantity);
    }

    AggregatedWindow window;
    window.timestamp = timestamp;
    window.instrument_id = instrument_id;
    window.min_price = *std::min_element(prices.begin(), prices.end());
    window.max_price = *std::max_element(prices.begin(), prices.end());
    // summation rounding can land just outside [min, max]
    window.mean_price = std::clamp(MetricsComputer::calculateMean(prices),
                                   window.min_price, window.max_price);
    window.std_price = MetricsComputer::calculateStdDev(prices, window.mean_price);
    for (double q : quantities) {
        window.total_volume += q;
    }
    window.trade_count = static_cast<int>(trades.size());
    window.vwap = MetricsComputer::calculateVWAP(prices, quantities);
    return window;
}

size_t WindowAggregator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : buffer_) {
        total += entry.second.size();
    }
    return total;
}

TimestampMs WindowAggregator::lastFlushMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_flush_ms_;
}

} // namespace feed
} // namespace quantpulse
