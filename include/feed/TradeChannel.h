#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "common/Types.h"

namespace quantpulse {
namespace feed {

// Bounded multi-producer / single-consumer queue between the feed client
// and the aggregator. When full, push() evicts the oldest queued event.
class TradeChannel {
public:
    explicit TradeChannel(size_t capacity = 65536);

    // Returns false when an older event had to be dropped to make room
    bool push(TradeEvent event);

    // Waits up to `timeout` for an event; nullopt on timeout or close
    std::optional<TradeEvent> pop(std::chrono::milliseconds timeout);

    // Non-blocking
    std::optional<TradeEvent> tryPop();

    // Wakes the consumer; later pushes are ignored
    void close();
    bool isClosed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    std::uint64_t droppedCount() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TradeEvent> queue_;
    std::uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace feed
} // namespace quantpulse
