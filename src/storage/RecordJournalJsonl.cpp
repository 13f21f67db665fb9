#include "storage/RecordJournalJsonl.h"
#include "storage/RecordCodec.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/fmt/fmt.h>

namespace quantpulse {
namespace storage {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

std::string optionalCell(const std::optional<double>& value) {
    return value ? fmt::format("{}", *value) : std::string();
}

constexpr RecordKind kAllKinds[] = {RecordKind::WINDOW, RecordKind::METRICS, RecordKind::ALERT};
}

RecordJournalJsonl::RecordJournalJsonl(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    for (auto kind : kAllKinds) {
        std::ifstream in(pathFor(kind), std::ios::binary);
        if (!in.is_open()) {
            continue;
        }

        std::string row;
        while (std::getline(in, row)) {
            if (row.empty()) {
                continue;
            }
            try {
                const auto line = nlohmann::json::parse(row);
                last_seq_[indexOf(kind)] = (std::max)(last_seq_[indexOf(kind)], parseSeq(line));
            } catch (const nlohmann::json::exception&) {
                // torn tail line from a crash; keep scanning
            }
        }
    }
}

const char* RecordJournalJsonl::fileName(RecordKind kind) {
    switch (kind) {
        case RecordKind::WINDOW: return "windows.jsonl";
        case RecordKind::METRICS: return "metrics.jsonl";
        case RecordKind::ALERT: return "alerts.jsonl";
    }
    return "windows.jsonl";
}

size_t RecordJournalJsonl::indexOf(RecordKind kind) {
    return static_cast<size_t>(kind);
}

std::filesystem::path RecordJournalJsonl::pathFor(RecordKind kind) const {
    return directory_ / fileName(kind);
}

bool RecordJournalJsonl::appendWindow(const AggregatedWindow& window) {
    return append(RecordKind::WINDOW, toJson(window));
}

bool RecordJournalJsonl::appendMetrics(const MetricsSnapshot& metrics) {
    return append(RecordKind::METRICS, toJson(metrics));
}

bool RecordJournalJsonl::appendAlert(const AlertEvent& event) {
    return append(RecordKind::ALERT, toJson(event));
}

bool RecordJournalJsonl::append(RecordKind kind, const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    std::ofstream out(pathFor(kind), std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Record journal unavailable: {}", pathFor(kind).string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_[indexOf(kind)] + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["record"] = record;

    out << line.dump() << "\n";
    if (!out) {
        LOG_WARN("Record journal write failed: {}", pathFor(kind).string());
        return false;
    }
    last_seq_[indexOf(kind)] = next_seq;
    return true;
}

std::vector<StoredRecord> RecordJournalJsonl::readFrom(RecordKind kind, std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StoredRecord> out;
    std::ifstream in(pathFor(kind), std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        StoredRecord record;
        record.seq = seq;
        record.kind = kind;
        record.payload = line.value("record", nlohmann::json::object());
        out.push_back(std::move(record));
    }

    return out;
}

std::uint64_t RecordJournalJsonl::lastSeq(RecordKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_[indexOf(kind)];
}

size_t RecordJournalJsonl::exportMetricsCsv(const std::string& instrument_id, TimestampMs since_ms,
                                            std::ostream& out) const {
    out << "timestamp,symbol,mean_price,std_price,volatility,z_score,sma_20,ema_20,rsi,"
           "correlation,garch_forecast,adf_pvalue,trend\n";

    size_t rows = 0;
    for (const auto& record : readFrom(RecordKind::METRICS, 0)) {
        const auto metrics = metricsFromJson(record.payload);
        if (metrics.instrument_id != instrument_id || metrics.timestamp <= since_ms) {
            continue;
        }
        out << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                           metrics.timestamp, metrics.instrument_id,
                           metrics.mean_price, metrics.std_price, metrics.volatility, metrics.z_score,
                           metrics.sma_20, metrics.ema_20, metrics.rsi_14,
                           optionalCell(metrics.correlation),
                           optionalCell(metrics.garch_forecast),
                           optionalCell(metrics.adf_pvalue),
                           toString(metrics.trend));
        ++rows;
    }
    return rows;
}

} // namespace storage
} // namespace quantpulse
