#pragma once

#include <chrono>
#include <memory>

#include "domain/Types.h"

namespace core {

// Wall clock plus the one blocking primitive the fetch path needs. Retry
// backoff, rate-limit pauses and freshness checks all go through it so tests
// can run against a manual clock.
class Clock {
public:
    virtual ~Clock() = default;

    virtual domain::TimestampMs nowMs() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
    domain::TimestampMs nowMs() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    static std::shared_ptr<Clock> shared();
};

// End-to-end budget for one caller request, shared by every retry, page and
// failover attempt made on its behalf.
class Deadline {
public:
    static Deadline unbounded() { return Deadline{}; }
    static Deadline at(domain::TimestampMs expiresAtMs) { return Deadline{expiresAtMs}; }
    static Deadline after(const Clock& clock, std::chrono::milliseconds budget) {
        return Deadline{clock.nowMs() + budget.count()};
    }

    bool bounded() const noexcept { return bounded_; }
    domain::TimestampMs expiresAtMs() const noexcept { return expiresAtMs_; }

    bool expired(const Clock& clock) const { return bounded_ && clock.nowMs() >= expiresAtMs_; }

    std::chrono::milliseconds remaining(const Clock& clock) const;

    // The smaller of the remaining budget and the given cap.
    std::chrono::milliseconds clamp(const Clock& clock, std::chrono::milliseconds cap) const;

private:
    Deadline() = default;
    explicit Deadline(domain::TimestampMs expiresAtMs) : bounded_(true), expiresAtMs_(expiresAtMs) {}

    bool bounded_{false};
    domain::TimestampMs expiresAtMs_{0};
};

}  // namespace core
