#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "common/Types.h"
#include "feed/TradeChannel.h"
#include "network/FeedConfig.h"
#include "network/ReconnectBackoff.h"

namespace quantpulse {
namespace network {

enum class FeedState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    LISTENING,
    RECONNECTING,
    FAILED,
    CLOSED
};

std::string toString(FeedState state);

struct FeedStatus {
    FeedState state = FeedState::DISCONNECTED;
    double uptime_seconds = 0.0;
    std::uint64_t ticks_received = 0;
    TimestampMs last_tick_timestamp = 0;
    int reconnect_attempts = 0;
    std::uint64_t parse_failures = 0;
    std::uint64_t dropped_events = 0;
};

// Subscribes to the combined aggTrade stream and pushes each parsed trade
// into a TradeChannel. Connection loss moves to RECONNECTING with
// exponential backoff; once the retry budget is spent the client stays in
// FAILED until started again.
class BinanceTradeStreamClient {
public:
    using StateListener = std::function<void(FeedState)>;

    BinanceTradeStreamClient(FeedConfig config, feed::TradeChannel& channel);
    ~BinanceTradeStreamClient();

    // Runs the connect loop on a worker thread; restarts the retry budget
    bool start();
    void stop();

    // Blocking connect/listen/reconnect loop on the calling thread;
    // returns on FAILED or stop()
    void connect();

    void setStateListener(StateListener listener);

    FeedState getState() const { return state_.load(); }
    bool isConnected() const;
    double getUptimeSeconds() const;
    std::uint64_t getTicksReceived() const { return ticks_received_.load(); }
    FeedStatus getStatus() const;

    // Parses one inbound payload and forwards it; used by the read loop
    bool handleMessage(const std::string& payload);

    std::string buildTarget() const;

private:
    void run();
    void connectAndReadLoop();
    void setState(FeedState state);
    bool sleepInterruptible(double seconds);
    void shutdownActiveSocket();

    FeedConfig config_;
    feed::TradeChannel& channel_;
    ReconnectBackoff backoff_;

    std::atomic<bool> running_{false};
    std::atomic<FeedState> state_{FeedState::DISCONNECTED};
    std::atomic<std::uint64_t> ticks_received_{0};
    std::atomic<std::uint64_t> parse_failures_{0};
    std::atomic<TimestampMs> last_tick_timestamp_{0};
    std::atomic<int> reconnect_attempts_{0};
    std::atomic<long long> connected_at_ms_{0};
    std::thread worker_thread_;

    // backoff sleep wakes early on stop()
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    std::mutex socket_mutex_;
    std::function<void()> socket_shutdown_;

    mutable std::mutex listener_mutex_;
    StateListener state_listener_;
};

} // namespace network
} // namespace quantpulse
