#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "storage/IRecordSink.h"

namespace quantpulse {
namespace storage {

enum class RecordKind { WINDOW, METRICS, ALERT };

struct StoredRecord {
    std::uint64_t seq = 0;
    RecordKind kind = RecordKind::WINDOW;
    nlohmann::json payload;
};

// windows.jsonl / metrics.jsonl / alerts.jsonl under one directory,
// each line {"seq": n, "record": {...}} with seq increasing per file.
class RecordJournalJsonl : public IRecordSink {
public:
    explicit RecordJournalJsonl(std::filesystem::path directory);

    bool appendWindow(const AggregatedWindow& window) override;
    bool appendMetrics(const MetricsSnapshot& metrics) override;
    bool appendAlert(const AlertEvent& event) override;

    std::vector<StoredRecord> readFrom(RecordKind kind, std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq(RecordKind kind) const;

    // CSV of one instrument's snapshots with timestamp > since_ms.
    // Returns the number of data rows written.
    size_t exportMetricsCsv(const std::string& instrument_id, TimestampMs since_ms, std::ostream& out) const;

    std::filesystem::path pathFor(RecordKind kind) const;

private:
    bool append(RecordKind kind, const nlohmann::json& record);
    static const char* fileName(RecordKind kind);
    static size_t indexOf(RecordKind kind);

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_[3] = {0, 0, 0};
};

} // namespace storage
} // namespace quantpulse
