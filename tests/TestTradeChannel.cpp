#include "feed/TradeChannel.h"

#include <chrono>
#include <iostream>
#include <thread>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

int main() {
    using quantpulse::TradeEvent;
    using quantpulse::feed::TradeChannel;

    // drop-oldest when full
    {
        TradeChannel channel(3);
        for (int i = 0; i < 3; ++i) {
            CHECK(channel.push(TradeEvent(i, "BTCUSDT", 100.0 + i, 1.0)), "push within capacity");
        }
        CHECK(!channel.push(TradeEvent(3, "BTCUSDT", 103.0, 1.0)), "push on full channel reports a drop");
        CHECK(channel.size() == 3, "size stays at capacity");
        CHECK(channel.droppedCount() == 1, "dropped counter");

        auto first = channel.tryPop();
        CHECK(first && first->timestamp == 1, "oldest event was evicted");
    }

    // pop times out on an empty channel
    {
        TradeChannel channel(4);
        const auto start = std::chrono::steady_clock::now();
        auto event = channel.pop(std::chrono::milliseconds(50));
        const auto waited = std::chrono::steady_clock::now() - start;
        CHECK(!event, "empty channel yields nothing");
        CHECK(waited >= std::chrono::milliseconds(40), "pop should wait for the timeout");
    }

    // producer thread wakes a blocked consumer
    {
        TradeChannel channel(16);
        std::thread producer([&channel]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            channel.push(TradeEvent(42, "ETHUSDT", 10.0, 1.0));
        });
        auto event = channel.pop(std::chrono::seconds(5));
        producer.join();
        CHECK(event && event->timestamp == 42, "consumer should receive the produced event");
    }

    // close wakes the consumer and rejects later pushes
    {
        TradeChannel channel(4);
        std::thread closer([&channel]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            channel.close();
        });
        const auto start = std::chrono::steady_clock::now();
        auto event = channel.pop(std::chrono::seconds(5));
        closer.join();
        CHECK(!event, "closed channel yields nothing");
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(4), "close should wake the consumer");
        CHECK(channel.isClosed(), "isClosed()");
        CHECK(!channel.push(TradeEvent(1, "BTCUSDT", 1.0, 1.0)), "push after close is ignored");
        CHECK(channel.size() == 0, "nothing queued after close");
    }

    std::cout << "[TEST] TradeChannel PASSED\n";
    return 0;
}
