#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace feed {

// Buffers trades per instrument and turns each non-empty buffer into one
// AggregatedWindow per flush interval.
class WindowAggregator {
public:
    using Clock = std::function<TimestampMs()>;

    // Defaults to the wall clock
    explicit WindowAggregator(Clock clock = Clock());

    void add(const TradeEvent& event);

    // True once interval_ms has elapsed since the last flush
    bool shouldFlush(long long interval_ms = 5000) const;

    // Drains every buffer and resets the flush clock in one step.
    // Instruments without trades produce no window.
    std::vector<AggregatedWindow> flush();

    size_t pendingCount() const;
    TimestampMs lastFlushMs() const;

    static AggregatedWindow aggregate(const std::string& instrument_id,
                                      const std::vector<TradeEvent>& trades,
                                      TimestampMs timestamp);

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<TradeEvent>> buffer_;
    TimestampMs last_flush_ms_;
};

} // namespace feed
} // namespace quantpulse
