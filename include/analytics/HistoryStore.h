#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/RingBuffer.h"
#include "common/Types.h"

namespace quantpulse {
namespace analytics {

// Smallest capacity that still leaves room for one return
constexpr size_t kMinHistoryCapacity = 2;

// Bounded rolling sequences for one instrument. The return sequence is one
// slot shorter than the others so len(returns) == len(prices) - 1 holds
// after the buffers saturate.
struct InstrumentHistory {
    explicit InstrumentHistory(size_t capacity);

    RingBuffer<double> prices;
    RingBuffer<double> volumes;
    RingBuffer<TimestampMs> timestamps;
    RingBuffer<double> returns;
    std::uint64_t generation = 0;   // store generation of the last append
};

// Point-in-time copy of one instrument's history, oldest -> newest
struct HistorySnapshot {
    std::string instrument_id;
    std::vector<double> prices;
    std::vector<double> volumes;
    std::vector<TimestampMs> timestamps;
    std::vector<double> returns;
    std::uint64_t generation = 0;
};

// Owns every InstrumentHistory. Writes come from the flush path only;
// readers get copies taken under the same lock, so they observe either the
// state before or after a flush batch, never a half-applied one.
class HistoryStore {
public:
    explicit HistoryStore(size_t capacity = 500);

    // Appends one window as its own generation
    void append(const AggregatedWindow& window);

    // Appends every window of one flush under a single generation
    std::uint64_t appendBatch(const std::vector<AggregatedWindow>& windows);

    std::vector<double> getPrices(const std::string& instrument_id, size_t limit) const;

    std::optional<HistorySnapshot> snapshot(const std::string& instrument_id) const;

    // Consistent snapshot of all instruments, in first-seen order
    std::vector<HistorySnapshot> snapshotAll() const;

    // Both histories read under one lock; nullopt if either is unknown
    std::optional<std::pair<HistorySnapshot, HistorySnapshot>> snapshotPair(
        const std::string& first, const std::string& second) const;

    std::vector<std::string> instruments() const;
    size_t size(const std::string& instrument_id) const;
    std::uint64_t generation() const;
    size_t capacity() const { return capacity_; }

private:
    void appendLocked(const AggregatedWindow& window);
    HistorySnapshot copyLocked(const std::string& instrument_id, const InstrumentHistory& history) const;

    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<std::string, InstrumentHistory> histories_;
    std::vector<std::string> order_;
    std::uint64_t generation_ = 0;
};

} // namespace analytics
} // namespace quantpulse
