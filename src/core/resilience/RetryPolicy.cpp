#include "core/resilience/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace core::resilience {

std::chrono::milliseconds RetryPolicy::delayFor(std::size_t attempt, double unitRandom) const {
    const double base = static_cast<double>(baseDelay.count());
    const double cap = static_cast<double>(maxDelay.count());
    // 2^63 overflows long before the cap matters.
    const double exponential = attempt >= 62 ? cap : base * std::ldexp(1.0, static_cast<int>(attempt));
    const double bounded = std::min(exponential, cap);

    const double spread = std::clamp(jitter, 0.0, 1.0);
    const double factor = 1.0 + spread * (2.0 * std::clamp(unitRandom, 0.0, 1.0) - 1.0);
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::llround(bounded * factor))};
}

void RetryPolicy::validate() const {
    if (maxAttempts == 0) {
        throw std::invalid_argument("RetryPolicy.maxAttempts must be >= 1");
    }
    if (baseDelay.count() < 0 || maxDelay.count() < 0) {
        throw std::invalid_argument("RetryPolicy delays must not be negative");
    }
    if (jitter < 0.0 || jitter > 1.0) {
        throw std::invalid_argument("RetryPolicy.jitter must be within [0, 1]");
    }
}

}  // namespace core::resilience
