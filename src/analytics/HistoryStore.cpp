#include "analytics/HistoryStore.h"

#include <algorithm>

namespace quantpulse {
namespace analytics {

InstrumentHistory::InstrumentHistory(size_t capacity)
    : prices(std::max(capacity, kMinHistoryCapacity))
    , volumes(std::max(capacity, kMinHistoryCapacity))
    , timestamps(std::max(capacity, kMinHistoryCapacity))
    , returns(std::max(capacity, kMinHistoryCapacity) - 1) {}

HistoryStore::HistoryStore(size_t capacity)
    : capacity_(std::max(capacity, kMinHistoryCapacity)) {}

void HistoryStore::append(const AggregatedWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    appendLocked(window);
}

std::uint64_t HistoryStore::appendBatch(const std::vector<AggregatedWindow>& windows) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    for (const auto& window : windows) {
        appendLocked(window);
    }
    return generation_;
}

void HistoryStore::appendLocked(const AggregatedWindow& window) {
    auto it = histories_.find(window.instrument_id);
    if (it == histories_.end()) {
        it = histories_.emplace(window.instrument_id, InstrumentHistory(capacity_)).first;
        order_.push_back(window.instrument_id);
    }

    auto& history = it->second;
    if (!history.prices.empty()) {
        const double prev = history.prices.back();
        // zero prior price leaves the return undefined
        if (prev != 0.0) {
            history.returns.push((window.mean_price - prev) / prev);
        }
    }

    history.prices.push(window.mean_price);
    history.volumes.push(window.total_volume);
    history.timestamps.push(window.timestamp);
    history.generation = generation_;
}

std::vector<double> HistoryStore::getPrices(const std::string& instrument_id, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(instrument_id);
    if (it == histories_.end()) {
        return {};
    }
    return it->second.prices.tail(limit);
}

HistorySnapshot HistoryStore::copyLocked(const std::string& instrument_id,
                                         const InstrumentHistory& history) const {
    HistorySnapshot out;
    out.instrument_id = instrument_id;
    out.prices = history.prices.toVector();
    out.volumes = history.volumes.toVector();
    out.timestamps = history.timestamps.toVector();
    out.returns = history.returns.toVector();
    out.generation = history.generation;
    return out;
}

std::optional<HistorySnapshot> HistoryStore::snapshot(const std::string& instrument_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(instrument_id);
    if (it == histories_.end()) {
        return std::nullopt;
    }
    return copyLocked(instrument_id, it->second);
}

std::vector<HistorySnapshot> HistoryStore::snapshotAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistorySnapshot> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(copyLocked(id, histories_.at(id)));
    }
    return out;
}

std::optional<std::pair<HistorySnapshot, HistorySnapshot>> HistoryStore::snapshotPair(
    const std::string& first, const std::string& second) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto a = histories_.find(first);
    auto b = histories_.find(second);
    if (a == histories_.end() || b == histories_.end()) {
        return std::nullopt;
    }
    return std::make_pair(copyLocked(first, a->second), copyLocked(second, b->second));
}

std::vector<std::string> HistoryStore::instruments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t HistoryStore::size(const std::string& instrument_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(instrument_id);
    return (it == histories_.end()) ? 0 : it->second.prices.size();
}

std::uint64_t HistoryStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace analytics
} // namespace quantpulse
