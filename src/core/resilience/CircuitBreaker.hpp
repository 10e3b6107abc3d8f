#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "core/Clock.hpp"
#include "domain/Types.h"

namespace core::resilience {

// Three-state breaker guarding one (backend, transport strategy) pair.
//   CLOSED    consecutive failures are counted; reaching failureThreshold opens.
//   OPEN      tryAcquire() refuses every call until recoveryTimeout has elapsed
//             since the last failure; the next call then moves to HALF_OPEN.
//   HALF_OPEN at most halfOpenMaxCalls probes may run. That many successes
//             close the circuit; any probe failure reopens it.
class CircuitBreaker {
public:
    struct Config {
        std::size_t failureThreshold = 5;
        std::chrono::milliseconds recoveryTimeout{60'000};
        std::size_t halfOpenMaxCalls = 2;
    };

    struct Snapshot {
        domain::CircuitState state{domain::CircuitState::Closed};
        std::size_t failures{0};
        std::size_t halfOpenSuccesses{0};
        std::size_t probesInFlight{0};
        domain::TimestampMs lastFailureMs{0};
    };

    using TransitionListener =
        std::function<void(const std::string& name, domain::CircuitState from, domain::CircuitState to)>;

    CircuitBreaker(std::string name, Config config, std::shared_ptr<Clock> clock);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // False means the caller must not touch the backend and should take its
    // fallback. A true result in HALF_OPEN reserves one probe slot, which the
    // caller releases through recordSuccess(), recordFailure() or release().
    bool tryAcquire();
    void recordSuccess();
    void recordFailure();
    // Returns a HALF_OPEN slot without counting the call either way.
    void release();

    domain::CircuitState state() const;
    // Whether tryAcquire() would currently consider a call: CLOSED, HALF_OPEN,
    // or OPEN with the recovery timeout already elapsed.
    bool admitsCalls() const;
    Snapshot snapshot() const;
    const std::string& name() const noexcept { return name_; }
    const Config& config() const noexcept { return config_; }

    void setTransitionListener(TransitionListener listener);

private:
    // Caller holds mutex_. Returns true if the state changed.
    bool transitionLocked(domain::CircuitState to);
    void notify(domain::CircuitState from, domain::CircuitState to);

    const std::string name_;
    const Config config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    domain::CircuitState state_{domain::CircuitState::Closed};
    std::size_t failures_{0};
    std::size_t halfOpenSuccesses_{0};
    std::size_t probesInFlight_{0};
    domain::TimestampMs lastFailureMs_{0};
    TransitionListener listener_;
};

}  // namespace core::resilience
