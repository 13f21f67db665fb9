#pragma once

#include <string>
#include <vector>
#include <optional>

namespace quantpulse {

using Price = double;
using Volume = double;
using TimestampMs = long long;

enum class Trend { UPTREND, DOWNTREND, NEUTRAL };
enum class Comparator { GREATER, LESS, GREATER_EQUAL, LESS_EQUAL, EQUAL, NOT_EQUAL };
enum class PositionSide { LONG, SHORT };

// Raw trade from the exchange stream
struct TradeEvent {
    TimestampMs timestamp;
    std::string instrument_id;
    Price price;
    Volume quantity;

    TradeEvent() : timestamp(0), price(0), quantity(0) {}

    TradeEvent(TimestampMs t, std::string id, Price p, Volume q)
        : timestamp(t), instrument_id(std::move(id)), price(p), quantity(q) {}
};

// One flush interval worth of trades for one instrument
struct AggregatedWindow {
    TimestampMs timestamp = 0;
    std::string instrument_id;
    double mean_price = 0.0;
    double std_price = 0.0;
    double min_price = 0.0;
    double max_price = 0.0;
    double total_volume = 0.0;
    int trade_count = 0;
    double vwap = 0.0;
};

struct MetricsSnapshot {
    TimestampMs timestamp = 0;
    std::string instrument_id;
    double mean_price = 0.0;
    double std_price = 0.0;
    double volatility = 0.0;
    double z_score = 0.0;
    double sma_20 = 0.0;
    double ema_20 = 0.0;
    double rsi_14 = 50.0;
    std::optional<double> correlation;
    std::optional<double> garch_forecast;
    std::optional<double> adf_pvalue;
    Trend trend = Trend::NEUTRAL;
};

struct AlertRule {
    std::string rule_id;
    std::string instrument_id;
    std::string metric_name;
    Comparator comparator = Comparator::GREATER;
    double threshold = 0.0;
    bool enabled = true;
    int triggered_count = 0;
};

struct AlertEvent {
    std::string rule_id;
    TimestampMs timestamp = 0;
    std::string instrument_id;
    std::string metric_name;
    double actual_value = 0.0;
    double threshold = 0.0;
};

// Backtest-only; lives for one simulation run
struct Position {
    PositionSide side = PositionSide::LONG;
    Price entry_price = 0.0;
    size_t entry_index = 0;
};

std::string toString(Trend trend);
std::string toString(Comparator comparator);
std::optional<Comparator> parseComparator(const std::string& symbol);

} // namespace quantpulse
