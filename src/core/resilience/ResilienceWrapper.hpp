#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/Clock.hpp"
#include "core/resilience/CircuitBreaker.hpp"
#include "core/resilience/RetryPolicy.hpp"

namespace core::resilience {

// Runs an operation under a retry policy and a circuit breaker.
//
// Only retryable FetchError kinds are retried; every retryable failure is
// reported to the breaker, every completed call (including one that ended in
// a non-retryable response) counts as a success. Exceptions outside the
// FetchError hierarchy propagate untouched and leave the breaker's counts
// alone. A server wait hint
// (ResponseError::retryAfter) replaces the computed backoff. The deadline
// bounds all attempts together: when the next wait would cross it the call
// ends with TransportError{Timeout}. While the breaker refuses calls the
// fallback runs instead of the operation.
class ResilienceWrapper {
public:
    ResilienceWrapper(RetryPolicy policy,
                      std::shared_ptr<CircuitBreaker> breaker,
                      std::shared_ptr<Clock> clock,
                      std::uint64_t seed = std::random_device{}())
        : policy_(policy), breaker_(std::move(breaker)), clock_(std::move(clock)), rng_(seed) {
        policy_.validate();
        if (!breaker_ || !clock_) {
            throw std::invalid_argument("ResilienceWrapper requires a breaker and a clock");
        }
    }

    template <typename Operation, typename Fallback>
    auto execute(Operation&& operation, Fallback&& fallback, const Deadline& deadline, const std::string& label)
        -> decltype(operation()) {
        using kvault::common::ErrorKind;
        using kvault::common::FetchError;
        using kvault::common::ResponseError;
        using kvault::common::TransportError;

        for (std::size_t attempt = 0;; ++attempt) {
            if (deadline.expired(*clock_)) {
                throw TransportError(ErrorKind::Timeout,
                                     label + ": deadline exceeded before attempt " + std::to_string(attempt + 1),
                                     breaker_->name());
            }
            if (!breaker_->tryAcquire()) {
                LOG_DEBUG(label << ": circuit '" << breaker_->name() << "' open, taking fallback");
                return fallback();
            }

            try {
                auto result = operation();
                breaker_->recordSuccess();
                return result;
            } catch (const FetchError& ex) {
                if (!ex.retryable()) {
                    breaker_->recordSuccess();
                    throw;
                }
                breaker_->recordFailure();
                if (attempt + 1 >= policy_.maxAttempts) {
                    LOG_WARN(label << ": giving up after " << attempt + 1 << " attempt(s): " << ex.what());
                    throw;
                }

                auto delay = policy_.delayFor(attempt, nextUnit());
                if (const auto* response = dynamic_cast<const ResponseError*>(&ex)) {
                    if (response->retryAfter()) {
                        delay = *response->retryAfter();
                    }
                }
                if (deadline.bounded() && deadline.remaining(*clock_) <= delay) {
                    throw TransportError(ErrorKind::Timeout,
                                         label + ": deadline leaves no room for retry " +
                                             std::to_string(attempt + 2) + " (last error: " + ex.what() + ")",
                                         breaker_->name());
                }
                LOG_WARN(label << ": attempt " << attempt + 1 << "/" << policy_.maxAttempts << " failed ("
                               << kvault::common::errorKindToString(ex.kind()) << "), retrying in "
                               << delay.count() << " ms");
                clock_->sleepFor(delay);
            } catch (const std::exception&) {
                // Caller mistakes say nothing about the backend's health.
                breaker_->release();
                throw;
            }
        }
    }

    const RetryPolicy& policy() const noexcept { return policy_; }
    CircuitBreaker& breaker() noexcept { return *breaker_; }

private:
    double nextUnit() {
        std::lock_guard<std::mutex> lock(rngMutex_);
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }

    RetryPolicy policy_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<Clock> clock_;
    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

}  // namespace core::resilience
