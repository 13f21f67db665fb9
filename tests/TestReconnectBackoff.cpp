#include "network/ReconnectBackoff.h"

#include <cmath>
#include <iostream>

#define CHECK(cond, msg) \
    do { if (!(cond)) { std::cerr << "[TEST] " << msg << "\n"; return 1; } } while (0)

int main() {
    using quantpulse::network::ReconnectBackoff;

    // deterministic jitter
    {
        ReconnectBackoff backoff(1.0, 60.0, 10, []() { return 0.5; });

        CHECK(backoff.baseDelay(0) == 1.0 && backoff.baseDelay(3) == 8.0, "base delay doubles");
        CHECK(backoff.baseDelay(6) == 60.0 && backoff.baseDelay(100) == 60.0, "base delay capped at max");

        double previous = 0.0;
        for (int i = 1; i <= 9; ++i) {
            auto wait = backoff.onFailure();
            CHECK(wait.has_value(), "attempt " << i << " should be retried");
            CHECK(*wait >= previous, "backoff must be non-decreasing");
            CHECK(*wait <= 60.0 + 0.5, "backoff bounded by max + jitter");
            previous = *wait;
        }
        CHECK(std::abs(previous - 60.5) < 1e-12, "capped wait plus jitter");
        CHECK(!backoff.onFailure().has_value(), "10th failure exhausts the budget");
        CHECK(backoff.exhausted(), "exhausted()");
    }

    // reset returns to the base delay
    {
        ReconnectBackoff backoff(2.0, 30.0, 10, []() { return 0.0; });
        backoff.onFailure();
        backoff.onFailure();
        auto third = backoff.onFailure();
        CHECK(third && *third == 8.0, "third wait");

        backoff.reset();
        CHECK(backoff.attempts() == 0, "reset clears attempts");
        auto after_reset = backoff.onFailure();
        CHECK(after_reset && *after_reset == 2.0, "first wait after reset is the base delay");
    }

    // default jitter stays in [0, 1)
    {
        ReconnectBackoff backoff(1.0, 60.0, 100);
        for (int i = 0; i < 20; ++i) {
            auto wait = backoff.onFailure();
            CHECK(wait.has_value(), "retry available");
            const double base = backoff.baseDelay(backoff.attempts() - 1);
            CHECK(*wait >= base && *wait < base + 1.0, "jitter in [0, 1)");
        }
    }

    std::cout << "[TEST] ReconnectBackoff PASSED\n";
    return 0;
}
