#pragma once

#include <string>
#include <vector>

namespace quantpulse {
namespace network {

struct FeedConfig {
    std::string host = "fstream.binance.com";
    std::string port = "443";
    std::string path_prefix = "/stream?streams=";
    std::string stream_suffix = "@aggTrade";
    std::vector<std::string> instruments{"BTCUSDT", "ETHUSDT"};

    // Reconnect policy: wait = min(base * 2^attempt, max) + U(0, 1)
    double backoff_base_seconds = 1.0;
    double backoff_max_seconds = 60.0;
    int max_reconnect_attempts = 10;

    size_t channel_capacity = 65536;
    int handshake_timeout_seconds = 15;
    int idle_timeout_seconds = 90;
};

} // namespace network
} // namespace quantpulse
