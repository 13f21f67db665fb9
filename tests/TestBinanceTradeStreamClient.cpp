#include "network/BinanceTradeStreamClient.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

namespace {
using quantpulse::network::FeedState;

// Nothing listens on port 1 locally, so every connect attempt is refused
quantpulse::network::FeedConfig refusedEndpoint(double base_seconds, int max_attempts) {
    quantpulse::network::FeedConfig config;
    config.host = "127.0.0.1";
    config.port = "1";
    config.instruments = {"BTCUSDT"};
    config.backoff_base_seconds = base_seconds;
    config.backoff_max_seconds = base_seconds;
    config.max_reconnect_attempts = max_attempts;
    config.handshake_timeout_seconds = 2;
    return config;
}

struct StateLog {
    std::mutex mutex;
    std::vector<FeedState> states;

    void record(FeedState state) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    }
    std::vector<FeedState> copy() {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        states.clear();
    }
};

long countOf(const std::vector<FeedState>& states, FeedState state) {
    return std::count(states.begin(), states.end(), state);
}

bool waitForState(const quantpulse::network::BinanceTradeStreamClient& client, FeedState state,
                  std::chrono::seconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (client.getState() == state) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return client.getState() == state;
}
}

int main() {
    using quantpulse::feed::TradeChannel;
    using quantpulse::network::BinanceTradeStreamClient;

    std::cout << "[TEST] Starting BinanceTradeStreamClient Test..." << std::endl;

    // inbound messages: counters and channel hand-off
    {
        TradeChannel channel(16);
        BinanceTradeStreamClient client(refusedEndpoint(0.0, 2), channel);

        CHECK(client.buildTarget() == "/stream?streams=btcusdt@aggTrade", "target: " << client.buildTarget());

        CHECK(client.handleMessage(
                  R"({"stream":"btcusdt@aggTrade","data":{"s":"BTCUSDT","p":"65000.1","q":"0.5","T":1700000000000}})"),
              "valid trade accepted");
        CHECK(!client.handleMessage("{ garbage"), "malformed message rejected");
        CHECK(!client.handleMessage(R"({"result":null,"id":1})"), "non-trade message rejected");

        const auto status = client.getStatus();
        CHECK(status.ticks_received == 1, "ticks_received " << status.ticks_received);
        CHECK(status.parse_failures == 2, "parse_failures " << status.parse_failures);
        CHECK(status.last_tick_timestamp == 1700000000000LL, "last tick timestamp");
        CHECK(channel.size() == 1, "one event forwarded");
        auto event = channel.tryPop();
        CHECK(event && event->instrument_id == "BTCUSDT" && event->price == 65000.1, "forwarded event");
    }

    // retry budget exhausted: CONNECTING -> RECONNECTING ... -> FAILED
    {
        TradeChannel channel(16);
        BinanceTradeStreamClient client(refusedEndpoint(0.0, 2), channel);
        StateLog log;
        client.setStateListener([&log](FeedState state) { log.record(state); });

        CHECK(client.getState() == FeedState::DISCONNECTED, "initial state is DISCONNECTED");

        client.connect();

        auto states = log.copy();
        CHECK(client.getState() == FeedState::FAILED, "state after exhausting retries: "
              << quantpulse::network::toString(client.getState()));
        CHECK(!states.empty() && states.front() == FeedState::CONNECTING, "first transition is CONNECTING");
        CHECK(states.back() == FeedState::FAILED, "last transition is FAILED");
        CHECK(countOf(states, FeedState::CONNECTING) == 2, "two connect attempts, got "
              << countOf(states, FeedState::CONNECTING));
        CHECK(countOf(states, FeedState::RECONNECTING) == 2, "each failure passes through RECONNECTING");
        CHECK(countOf(states, FeedState::CONNECTED) == 0, "never connected");
        CHECK(client.getStatus().reconnect_attempts == 2, "reconnect attempts reported");
        CHECK(!client.isConnected(), "not connected");

        // FAILED is terminal until restarted
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(client.getState() == FeedState::FAILED, "FAILED does not retry on its own");
        CHECK(log.copy().size() == states.size(), "no transitions after FAILED");

        // restart gets a fresh retry budget
        log.clear();
        CHECK(client.start(), "restart after FAILED");
        CHECK(waitForState(client, FeedState::FAILED, std::chrono::seconds(15)), "restart fails again");
        client.stop();
        states = log.copy();
        CHECK(countOf(states, FeedState::CONNECTING) == 2, "restart retries the full budget, got "
              << countOf(states, FeedState::CONNECTING));
    }

    // stop() interrupts a long backoff sleep and never hangs
    {
        TradeChannel channel(16);
        BinanceTradeStreamClient client(refusedEndpoint(30.0, 10), channel);

        const auto begin = std::chrono::steady_clock::now();
        CHECK(client.start(), "start");
        client.stop();
        CHECK(client.getState() == FeedState::CLOSED, "stop right after start closes");

        CHECK(client.start(), "second start");
        CHECK(waitForState(client, FeedState::RECONNECTING, std::chrono::seconds(10)), "waiting to reconnect");
        client.stop();
        const auto elapsed = std::chrono::steady_clock::now() - begin;
        CHECK(client.getState() == FeedState::CLOSED, "closed after stop");
        CHECK(elapsed < std::chrono::seconds(10), "stop cut the backoff sleep short");
    }

    std::cout << "[TEST] BinanceTradeStreamClient Test PASSED!" << std::endl;
    return 0;
}
