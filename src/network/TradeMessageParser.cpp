#include "network/TradeMessageParser.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace quantpulse {
namespace network {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::optional<TradeEvent> TradeMessageParser::parse(const std::string& payload, TimestampMs fallback_ts_ms) {
    const auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded()) {
        return std::nullopt;
    }
    return parse(message, fallback_ts_ms);
}

std::optional<TradeEvent> TradeMessageParser::parse(const nlohmann::json& message, TimestampMs fallback_ts_ms) {
    if (!message.is_object()) {
        return std::nullopt;
    }

    // combined stream envelope
    if (message.contains("data") && message["data"].is_object()) {
        return parse(message["data"], fallback_ts_ms);
    }

    if (!message.contains("s") || !message.contains("p") || !message.contains("q")) {
        return std::nullopt;
    }
    if (!message["s"].is_string()) {
        return std::nullopt;
    }

    const auto price = readNumber(message["p"]);
    const auto quantity = readNumber(message["q"]);
    if (!price || !quantity || *price <= 0.0 || *quantity < 0.0) {
        return std::nullopt;
    }

    const std::string symbol = toUpperCopy(message["s"].get<std::string>());
    if (symbol.empty()) {
        return std::nullopt;
    }

    TimestampMs ts = fallback_ts_ms;
    if (message.contains("T") && message["T"].is_number_integer()) {
        ts = message["T"].get<TimestampMs>();
    }

    return TradeEvent(ts, symbol, *price, *quantity);
}

std::string TradeMessageParser::streamName(const std::string& instrument, const std::string& suffix) {
    return toLowerCopy(instrument) + suffix;
}

std::optional<double> TradeMessageParser::readNumber(const nlohmann::json& value) {
    double out = 0.0;
    if (value.is_number()) {
        out = value.get<double>();
    } else if (value.is_string()) {
        try {
            size_t consumed = 0;
            const auto& text = value.get_ref<const std::string&>();
            out = std::stod(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(out)) {
        return std::nullopt;
    }
    return out;
}

} // namespace network
} // namespace quantpulse
