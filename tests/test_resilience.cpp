#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "core/resilience/CircuitBreaker.hpp"
#include "core/resilience/ResilienceWrapper.hpp"
#include "core/resilience/RetryPolicy.hpp"
#include "support/Fakes.hpp"

using core::resilience::CircuitBreaker;
using core::resilience::ResilienceWrapper;
using core::resilience::RetryPolicy;
using domain::CircuitState;
using kvault::common::ErrorKind;
using testsupport::ManualClock;
using testsupport::run;

namespace {

constexpr domain::TimestampMs kStart = 1'709'251'200'000;

RetryPolicy noJitter(std::size_t attempts) {
    RetryPolicy policy;
    policy.maxAttempts = attempts;
    policy.baseDelay = std::chrono::milliseconds{100};
    policy.maxDelay = std::chrono::milliseconds{1'000};
    policy.jitter = 0.0;
    return policy;
}

CircuitBreaker::Config breakerConfig(std::size_t threshold) {
    CircuitBreaker::Config config;
    config.failureThreshold = threshold;
    config.recoveryTimeout = std::chrono::milliseconds{60'000};
    config.halfOpenMaxCalls = 2;
    return config;
}

}  // namespace

int main() {
    run("backoff doubles and caps", [] {
        const auto policy = noJitter(5);
        EXPECT_EQ(policy.delayFor(0, 0.5).count(), 100);
        EXPECT_EQ(policy.delayFor(1, 0.5).count(), 200);
        EXPECT_EQ(policy.delayFor(3, 0.5).count(), 800);
        EXPECT_EQ(policy.delayFor(4, 0.5).count(), 1'000);
        EXPECT_EQ(policy.delayFor(200, 0.5).count(), 1'000);
    });

    run("jitter stays within its band", [] {
        RetryPolicy policy = noJitter(5);
        policy.jitter = 0.2;
        EXPECT_EQ(policy.delayFor(0, 0.0).count(), 80);
        EXPECT_EQ(policy.delayFor(0, 1.0).count(), 120);
        EXPECT_EQ(policy.delayFor(0, 0.5).count(), 100);
    });

    run("invalid policies are rejected", [] {
        RetryPolicy zero = noJitter(0);
        EXPECT_THROWS(zero.validate(), std::invalid_argument);
        RetryPolicy wild = noJitter(3);
        wild.jitter = 1.5;
        EXPECT_THROWS(wild.validate(), std::invalid_argument);
    });

    run("breaker opens at the threshold and half-opens after recovery", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        CircuitBreaker breaker("rest/single", breakerConfig(3), clock);
        std::vector<std::pair<CircuitState, CircuitState>> transitions;
        breaker.setTransitionListener([&transitions](const std::string&, CircuitState from, CircuitState to) {
            transitions.emplace_back(from, to);
        });

        for (int i = 0; i < 3; ++i) {
            EXPECT_TRUE(breaker.tryAcquire());
            breaker.recordFailure();
        }
        EXPECT_TRUE(breaker.state() == CircuitState::Open);
        EXPECT_TRUE(!breaker.tryAcquire());
        EXPECT_TRUE(!breaker.admitsCalls());

        clock->advance(std::chrono::milliseconds{60'000});
        EXPECT_TRUE(breaker.admitsCalls());
        EXPECT_TRUE(breaker.tryAcquire());
        EXPECT_TRUE(breaker.state() == CircuitState::HalfOpen);
        EXPECT_TRUE(breaker.tryAcquire());
        // Both probe slots are taken.
        EXPECT_TRUE(!breaker.tryAcquire());

        breaker.recordSuccess();
        breaker.recordSuccess();
        EXPECT_TRUE(breaker.state() == CircuitState::Closed);
        EXPECT_EQ(transitions.size(), 3U);
        EXPECT_TRUE(transitions[0].second == CircuitState::Open);
        EXPECT_TRUE(transitions[1].second == CircuitState::HalfOpen);
        EXPECT_TRUE(transitions[2].second == CircuitState::Closed);
    });

    run("a failed probe reopens the circuit", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        CircuitBreaker breaker("vision/single", breakerConfig(1), clock);
        EXPECT_TRUE(breaker.tryAcquire());
        breaker.recordFailure();
        clock->advance(std::chrono::milliseconds{60'000});
        EXPECT_TRUE(breaker.tryAcquire());
        breaker.recordFailure();
        EXPECT_TRUE(breaker.state() == CircuitState::Open);
        EXPECT_TRUE(!breaker.tryAcquire());
    });

    run("success in CLOSED resets the failure count", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        CircuitBreaker breaker("rest/single", breakerConfig(3), clock);
        breaker.recordFailure();
        breaker.recordFailure();
        breaker.recordSuccess();
        breaker.recordFailure();
        breaker.recordFailure();
        EXPECT_TRUE(breaker.state() == CircuitState::Closed);
        EXPECT_EQ(breaker.snapshot().failures, 2U);
    });

    run("retryable failures are retried with backoff", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(10), clock);
        ResilienceWrapper wrapper(noJitter(4), breaker, clock, 7);

        int calls = 0;
        const auto result = wrapper.execute(
            [&calls]() -> int {
                if (++calls < 3) {
                    throw kvault::common::ResponseError(503, "busy", "rest");
                }
                return 42;
            },
            []() -> int { return -1; }, core::Deadline::unbounded(), "test");
        EXPECT_EQ(result, 42);
        EXPECT_EQ(calls, 3);
        EXPECT_EQ(clock->sleptMs(), 300);
        EXPECT_TRUE(breaker->state() == CircuitState::Closed);
    });

    run("non-retryable errors surface at once", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(1), clock);
        ResilienceWrapper wrapper(noJitter(5), breaker, clock, 7);

        int calls = 0;
        EXPECT_THROWS(wrapper.execute(
                          [&calls]() -> int {
                              ++calls;
                              throw kvault::common::ResponseError(400, "bad symbol", "rest");
                          },
                          []() -> int { return -1; }, core::Deadline::unbounded(), "test"),
                      kvault::common::ResponseError);
        EXPECT_EQ(calls, 1);
        EXPECT_TRUE(breaker->state() == CircuitState::Closed);
    });

    run("retry-after hint replaces the backoff", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(10), clock);
        ResilienceWrapper wrapper(noJitter(3), breaker, clock, 7);

        int calls = 0;
        wrapper.execute(
            [&calls]() -> int {
                if (++calls == 1) {
                    throw kvault::common::ResponseError(429, "slow down", "rest", std::chrono::milliseconds{2'500});
                }
                return 1;
            },
            []() -> int { return -1; }, core::Deadline::unbounded(), "test");
        EXPECT_EQ(clock->sleptMs(), 2'500);
    });

    run("exhausted retries open the breaker and later calls take the fallback", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(5), clock);
        ResilienceWrapper wrapper(noJitter(5), breaker, clock, 7);

        int calls = 0;
        EXPECT_THROWS(wrapper.execute(
                          [&calls]() -> int {
                              ++calls;
                              throw kvault::common::TransportError(ErrorKind::ConnectionFailed, "refused", "rest");
                          },
                          []() -> int { return -1; }, core::Deadline::unbounded(), "test"),
                      kvault::common::TransportError);
        EXPECT_EQ(calls, 5);
        EXPECT_TRUE(breaker->state() == CircuitState::Open);

        const auto fallback = wrapper.execute([&calls]() -> int { return ++calls; }, []() -> int { return -1; },
                                              core::Deadline::unbounded(), "test");
        EXPECT_EQ(fallback, -1);
        EXPECT_EQ(calls, 5);
    });

    run("argument errors pass through without touching the breaker counts", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(5), clock);
        ResilienceWrapper wrapper(noJitter(5), breaker, clock, 7);

        int calls = 0;
        const auto unsupported = [&calls]() -> int {
            ++calls;
            throw std::invalid_argument("Unsupported domain interval");
        };
        for (int i = 0; i < 8; ++i) {
            EXPECT_THROWS(wrapper.execute(unsupported, []() -> int { return -1; }, core::Deadline::unbounded(), "test"),
                          std::invalid_argument);
        }
        EXPECT_EQ(calls, 8);
        EXPECT_EQ(clock->sleptMs(), 0);
        EXPECT_TRUE(breaker->state() == CircuitState::Closed);
        EXPECT_EQ(breaker->snapshot().failures, 0U);
    });

    run("argument errors in HALF_OPEN give the slot back", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(1), clock);
        ResilienceWrapper wrapper(noJitter(1), breaker, clock, 7);
        breaker->recordFailure();
        clock->advance(std::chrono::milliseconds{60'000});

        int calls = 0;
        for (int i = 0; i < 3; ++i) {
            EXPECT_THROWS(wrapper.execute(
                              [&calls]() -> int {
                                  ++calls;
                                  throw std::invalid_argument("bad request");
                              },
                              []() -> int { return -1; }, core::Deadline::unbounded(), "test"),
                          std::invalid_argument);
        }
        EXPECT_EQ(calls, 3);
        EXPECT_TRUE(breaker->state() == CircuitState::HalfOpen);
        EXPECT_EQ(breaker->snapshot().probesInFlight, 0U);

        for (int i = 0; i < 2; ++i) {
            EXPECT_EQ(wrapper.execute([]() -> int { return 1; }, []() -> int { return -1; },
                                      core::Deadline::unbounded(), "test"),
                      1);
        }
        EXPECT_TRUE(breaker->state() == CircuitState::Closed);
    });

    run("a deadline too short for the next wait ends with a timeout", [] {
        auto clock = std::make_shared<ManualClock>(kStart);
        auto breaker = std::make_shared<CircuitBreaker>("rest/single", breakerConfig(10), clock);
        ResilienceWrapper wrapper(noJitter(5), breaker, clock, 7);
        const auto deadline = core::Deadline::after(*clock, std::chrono::milliseconds{250});

        int calls = 0;
        bool timedOut = false;
        try {
            wrapper.execute(
                [&calls]() -> int {
                    ++calls;
                    throw kvault::common::ResponseError(502, "gateway", "rest");
                },
                []() -> int { return -1; }, deadline, "test");
        } catch (const kvault::common::TransportError& ex) {
            timedOut = ex.kind() == ErrorKind::Timeout;
        }
        EXPECT_TRUE(timedOut);
        // 100 ms after the first attempt, then 200 ms would cross the deadline.
        EXPECT_EQ(calls, 2);
        EXPECT_TRUE(clock->nowMs() <= deadline.expiresAtMs());
    });

    return testsupport::finish("test_resilience");
}
