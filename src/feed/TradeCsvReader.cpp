#include "feed/TradeCsvReader.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace quantpulse {
namespace feed {

namespace {
std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}
}

std::vector<TradeEvent> TradeCsvReader::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open trade file: {}", file_path);
        return {};
    }

    auto trades = parse(file);
    LOG_INFO("Loaded {} trades from {}", trades.size(), file_path);
    return trades;
}

std::vector<TradeEvent> TradeCsvReader::parse(std::istream& in) {
    std::vector<TradeEvent> trades;
    std::string line;

    while (std::getline(in, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 4) continue;
        if (row[0].empty() || !std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header or malformed row
            continue;
        }

        try {
            TradeEvent trade;
            trade.timestamp = std::stoll(row[0]);
            trade.instrument_id = row[1];
            std::transform(trade.instrument_id.begin(), trade.instrument_id.end(), trade.instrument_id.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            trade.price = std::stod(row[2]);
            trade.quantity = std::stod(row[3]);

            if (trade.instrument_id.empty() || !std::isfinite(trade.price) || trade.price <= 0.0 ||
                !std::isfinite(trade.quantity) || trade.quantity < 0.0) {
                LOG_WARN("Skipping invalid trade row: {}", line);
                continue;
            }
            trades.push_back(std::move(trade));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::stable_sort(trades.begin(), trades.end(), [](const TradeEvent& a, const TradeEvent& b) {
        return a.timestamp < b.timestamp;
    });
    return trades;
}

} // namespace feed
} // namespace quantpulse
