#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kvault::common::metrics {

// Counters, gauges and latency timers for one orchestrator. Each orchestrator
// owns its registry so parallel instances (and tests) never share counts.
class Registry {
public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimerSnapshot> timers;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the elapsed time of its scope under the given timer key.
    class ScopedTimer {
    public:
        ScopedTimer(Registry& registry, std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        Registry& registry_;
        std::string timerKey_;
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void recordLatency(const std::string& timerKey, double latencyMs);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;

    Snapshot snapshot() const;
    void reset();

private:
    struct TimerMetrics {
        mutable std::mutex samplesMutex;
        std::vector<double> samplesMs;
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    TimerMetrics& ensureTimer(const std::string& timerKey);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<TimerMetrics>> timers_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace kvault::common::metrics
