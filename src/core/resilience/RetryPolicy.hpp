#pragma once

#include <chrono>
#include <cstddef>

namespace core::resilience {

struct RetryPolicy {
    std::size_t maxAttempts = 5;
    std::chrono::milliseconds baseDelay{500};
    std::chrono::milliseconds maxDelay{30'000};
    double jitter = 0.2;

    // min(baseDelay * 2^attempt, maxDelay), scaled by 1 +/- jitter. unitRandom
    // is a uniform sample in [0, 1); attempt counts from zero.
    std::chrono::milliseconds delayFor(std::size_t attempt, double unitRandom) const;

    // Throws std::invalid_argument on a policy that can never make a call.
    void validate() const;
};

}  // namespace core::resilience
