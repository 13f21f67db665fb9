#include "storage/RecordJournalJsonl.h"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

namespace {
quantpulse::MetricsSnapshot makeMetrics(const std::string& id, long long ts, double mean) {
    quantpulse::MetricsSnapshot m;
    m.timestamp = ts;
    m.instrument_id = id;
    m.mean_price = mean;
    m.std_price = 1.5;
    m.volatility = 0.015;
    m.z_score = 0.3;
    m.sma_20 = mean;
    m.ema_20 = mean;
    m.rsi_14 = 55.0;
    m.trend = quantpulse::Trend::UPTREND;
    return m;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}
}

int main() {
    using namespace quantpulse::storage;

    const auto dir = std::filesystem::temp_directory_path() / "quantpulse_test_journal";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    {
        RecordJournalJsonl journal(dir);

        quantpulse::AggregatedWindow window;
        window.timestamp = 1000;
        window.instrument_id = "BTCUSDT";
        window.mean_price = 100.0;
        window.trade_count = 3;
        CHECK(journal.appendWindow(window), "append window");

        CHECK(journal.appendMetrics(makeMetrics("BTCUSDT", 1000, 100.0)), "append metrics 1");
        auto with_optionals = makeMetrics("BTCUSDT", 2000, 101.0);
        with_optionals.correlation = 0.95;
        with_optionals.adf_pvalue = 0.4;
        CHECK(journal.appendMetrics(with_optionals), "append metrics 2");
        CHECK(journal.appendMetrics(makeMetrics("ETHUSDT", 2000, 3000.0)), "append metrics 3");

        quantpulse::AlertEvent alert;
        alert.rule_id = "rule-1";
        alert.timestamp = 2000;
        alert.instrument_id = "BTCUSDT";
        alert.metric_name = "z_score";
        alert.actual_value = 3.1;
        alert.threshold = 2.0;
        CHECK(journal.appendAlert(alert), "append alert");

        CHECK(journal.lastSeq(RecordKind::WINDOW) == 1, "window seq");
        CHECK(journal.lastSeq(RecordKind::METRICS) == 3, "metrics seq");
        CHECK(journal.lastSeq(RecordKind::ALERT) == 1, "alert seq");

        const auto from2 = journal.readFrom(RecordKind::METRICS, 2);
        CHECK(from2.size() == 2 && from2[0].seq == 2, "readFrom(2)");
        CHECK(from2[0].payload.value("correlation", 0.0) == 0.95, "optional value stored");
        CHECK(from2[1].payload.value("symbol", std::string()) == "ETHUSDT", "record payload");

        const auto alerts = journal.readFrom(RecordKind::ALERT, 0);
        CHECK(alerts.size() == 1 && alerts[0].payload.value("rule_id", std::string()) == "rule-1", "alert record");

        std::ostringstream csv;
        const size_t rows = journal.exportMetricsCsv("BTCUSDT", 1000, csv);
        CHECK(rows == 1, "only records newer than the cut-off, got " << rows);
        const auto csv_lines = lines(csv.str());
        CHECK(csv_lines.size() == 2, "header + one row");
        CHECK(csv_lines[0].rfind("timestamp,symbol,mean_price", 0) == 0, "csv header");
        CHECK(csv_lines[1].rfind("2000,BTCUSDT,101", 0) == 0, "csv row: " << csv_lines[1]);
        CHECK(csv_lines[1].find(",0.95,,0.4,uptrend") != std::string::npos, "empty cell for absent forecast: "
              << csv_lines[1]);
    }

    // sequence numbers continue after reopening
    {
        RecordJournalJsonl reopened(dir);
        CHECK(reopened.lastSeq(RecordKind::METRICS) == 3, "seq recovered from disk");
        CHECK(reopened.appendMetrics(makeMetrics("BTCUSDT", 3000, 102.0)), "append after reopen");
        CHECK(reopened.lastSeq(RecordKind::METRICS) == 4, "seq continues");
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] RecordJournal PASSED\n";
    return 0;
}
