#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace quantpulse {
namespace network {

// Binance aggTrade payloads, raw or wrapped in a combined-stream envelope
// ({"stream": ..., "data": {...}}). Fields used: s, p, q, T.
class TradeMessageParser {
public:
    // nullopt for malformed JSON, unknown shapes, non-positive price or
    // negative quantity. Missing T falls back to `fallback_ts_ms`.
    static std::optional<TradeEvent> parse(const std::string& payload, TimestampMs fallback_ts_ms);
    static std::optional<TradeEvent> parse(const nlohmann::json& message, TimestampMs fallback_ts_ms);

    // "BTCUSDT" -> "btcusdt@aggTrade"
    static std::string streamName(const std::string& instrument, const std::string& suffix);

private:
    static std::optional<double> readNumber(const nlohmann::json& value);
};

} // namespace network
} // namespace quantpulse
