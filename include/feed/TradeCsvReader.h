#pragma once

#include <istream>
#include <string>
#include <vector>

#include "common/Types.h"

namespace quantpulse {
namespace feed {

// Recorded trades for replay: timestamp_ms,symbol,price,quantity per line.
// Header and malformed rows are skipped. Output is ordered by timestamp,
// keeping file order for equal timestamps.
class TradeCsvReader {
public:
    static std::vector<TradeEvent> load(const std::string& file_path);
    static std::vector<TradeEvent> parse(std::istream& in);
};

} // namespace feed
} // namespace quantpulse
