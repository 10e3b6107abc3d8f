#include "core/resilience/CircuitBreaker.hpp"

#include <stdexcept>
#include <utility>

#include "common/Log.hpp"

namespace core::resilience {

using domain::CircuitState;

CircuitBreaker::CircuitBreaker(std::string name, Config config, std::shared_ptr<Clock> clock)
    : name_(std::move(name)), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("CircuitBreaker requires a clock");
    }
    if (config_.failureThreshold == 0 || config_.halfOpenMaxCalls == 0) {
        throw std::invalid_argument("CircuitBreaker thresholds must be >= 1");
    }
}

bool CircuitBreaker::tryAcquire() {
    CircuitState from{};
    bool changed = false;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (state_ == CircuitState::Open &&
            clock_->nowMs() - lastFailureMs_ >= config_.recoveryTimeout.count()) {
            changed = transitionLocked(CircuitState::HalfOpen);
        }

        switch (state_) {
        case CircuitState::Closed:
            allowed = true;
            break;
        case CircuitState::Open:
            allowed = false;
            break;
        case CircuitState::HalfOpen:
            if (probesInFlight_ + halfOpenSuccesses_ < config_.halfOpenMaxCalls) {
                ++probesInFlight_;
                allowed = true;
            }
            break;
        }
    }
    if (changed) {
        notify(from, CircuitState::HalfOpen);
    }
    return allowed;
}

void CircuitBreaker::recordSuccess() {
    CircuitState from{};
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (state_ == CircuitState::HalfOpen) {
            if (probesInFlight_ > 0) {
                --probesInFlight_;
            }
            ++halfOpenSuccesses_;
            if (halfOpenSuccesses_ >= config_.halfOpenMaxCalls) {
                changed = transitionLocked(CircuitState::Closed);
            }
        } else if (state_ == CircuitState::Closed) {
            failures_ = 0;
        }
    }
    if (changed) {
        notify(from, CircuitState::Closed);
    }
}

void CircuitBreaker::recordFailure() {
    CircuitState from{};
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        lastFailureMs_ = clock_->nowMs();
        if (state_ == CircuitState::HalfOpen) {
            changed = transitionLocked(CircuitState::Open);
        } else if (state_ == CircuitState::Closed) {
            ++failures_;
            if (failures_ >= config_.failureThreshold) {
                changed = transitionLocked(CircuitState::Open);
            }
        }
    }
    if (changed) {
        notify(from, CircuitState::Open);
    }
}

void CircuitBreaker::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HalfOpen && probesInFlight_ > 0) {
        --probesInFlight_;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::admitsCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ != CircuitState::Open || clock_->nowMs() - lastFailureMs_ >= config_.recoveryTimeout.count();
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{state_, failures_, halfOpenSuccesses_, probesInFlight_, lastFailureMs_};
}

void CircuitBreaker::setTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

bool CircuitBreaker::transitionLocked(CircuitState to) {
    if (state_ == to) {
        return false;
    }
    state_ = to;
    halfOpenSuccesses_ = 0;
    probesInFlight_ = 0;
    if (to == CircuitState::Closed) {
        failures_ = 0;
    }
    return true;
}

void CircuitBreaker::notify(CircuitState from, CircuitState to) {
    LOG_WARN("Circuit '" << name_ << "' " << domain::circuit_state_label(from) << " -> "
                         << domain::circuit_state_label(to));
    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(name_, from, to);
    }
}

}  // namespace core::resilience
