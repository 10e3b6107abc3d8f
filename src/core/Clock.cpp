#include "core/Clock.hpp"

#include <algorithm>
#include <limits>
#include <thread>

namespace core {

domain::TimestampMs SystemClock::nowMs() const {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

std::shared_ptr<Clock> SystemClock::shared() {
    static const std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

std::chrono::milliseconds Deadline::remaining(const Clock& clock) const {
    if (!bounded_) {
        return std::chrono::milliseconds{std::numeric_limits<std::int64_t>::max()};
    }
    return std::chrono::milliseconds{std::max<domain::TimestampMs>(0, expiresAtMs_ - clock.nowMs())};
}

std::chrono::milliseconds Deadline::clamp(const Clock& clock, std::chrono::milliseconds cap) const {
    if (!bounded_) {
        return cap;
    }
    return std::min(cap, remaining(clock));
}

}  // namespace core
