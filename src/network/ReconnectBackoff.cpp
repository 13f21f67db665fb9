#include "network/ReconnectBackoff.h"

#include <algorithm>
#include <cmath>

namespace quantpulse {
namespace network {

ReconnectBackoff::ReconnectBackoff(double base_seconds, double max_seconds, int max_attempts,
                                   JitterSource jitter)
    : base_seconds_(std::max(0.0, base_seconds))
    , max_seconds_(std::max(0.0, max_seconds))
    , max_attempts_(std::max(1, max_attempts))
    , jitter_(std::move(jitter))
    , rng_(std::random_device{}()) {
    if (!jitter_) {
        jitter_ = [this]() {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(rng_);
        };
    }
}

double ReconnectBackoff::baseDelay(int attempt) const {
    // 2^63 already exceeds any sane ceiling
    const int exponent = std::clamp(attempt, 0, 62);
    return std::min(base_seconds_ * std::pow(2.0, exponent), max_seconds_);
}

std::optional<double> ReconnectBackoff::onFailure() {
    ++attempts_;
    if (attempts_ >= max_attempts_) {
        return std::nullopt;
    }
    return baseDelay(attempts_ - 1) + jitter_();
}

} // namespace network
} // namespace quantpulse
