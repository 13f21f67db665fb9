#pragma once

#include <functional>
#include <optional>
#include <random>

namespace quantpulse {
namespace network {

// Exponential reconnect schedule with jitter and a retry ceiling.
class ReconnectBackoff {
public:
    using JitterSource = std::function<double()>;   // must return [0, 1)

    ReconnectBackoff(double base_seconds, double max_seconds, int max_attempts,
                     JitterSource jitter = JitterSource());

    // default jitter source refers to this instance's generator
    ReconnectBackoff(const ReconnectBackoff&) = delete;
    ReconnectBackoff& operator=(const ReconnectBackoff&) = delete;

    // min(base * 2^attempt, max), without jitter
    double baseDelay(int attempt) const;

    // Registers one failed attempt. Returns the wait before the next try,
    // or nullopt once the retry budget is spent.
    std::optional<double> onFailure();

    // Successful connect: next failure waits the base delay again
    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }
    int maxAttempts() const { return max_attempts_; }
    bool exhausted() const { return attempts_ >= max_attempts_; }

private:
    double base_seconds_;
    double max_seconds_;
    int max_attempts_;
    int attempts_ = 0;
    JitterSource jitter_;
    std::mt19937 rng_;
};

} // namespace network
} // namespace quantpulse
