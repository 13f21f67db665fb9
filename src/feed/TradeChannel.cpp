#include "feed/TradeChannel.h"

#include <algorithm>

namespace quantpulse {
namespace feed {

TradeChannel::TradeChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

bool TradeChannel::push(TradeEvent event) {
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_++;
            kept_all = false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return kept_all;
}

std::optional<TradeEvent> TradeChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    TradeEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<TradeEvent> TradeChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    TradeEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void TradeChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool TradeChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TradeChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t TradeChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace feed
} // namespace quantpulse
