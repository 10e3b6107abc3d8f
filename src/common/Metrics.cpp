#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace kvault::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double position = std::clamp(quantile, 0.0, 1.0) * static_cast<double>(sortedValues.size() - 1U);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const auto upper = static_cast<std::size_t>(std::ceil(position));
    if (lower == upper) {
        return sortedValues[lower];
    }
    const double weight = position - static_cast<double>(lower);
    return sortedValues[lower] + weight * (sortedValues[upper] - sortedValues[lower]);
}

}  // namespace

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::ScopedTimer(Registry& registry, std::string timerKey)
    : registry_(registry), timerKey_(std::move(timerKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    registry_.recordLatency(timerKey_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

void Registry::recordLatency(const std::string& timerKey, double latencyMs) {
    auto& timer = ensureTimer(timerKey);
    std::lock_guard<std::mutex> lock(timer.samplesMutex);
    timer.samplesMs.push_back(latencyMs);
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, timer] : timers_) {
        std::vector<double> samples;
        {
            std::lock_guard<std::mutex> samplesLock(timer->samplesMutex);
            samples = timer->samplesMs;
        }
        TimerSnapshot timerSnapshot;
        timerSnapshot.samples = samples.size();
        if (!samples.empty()) {
            std::sort(samples.begin(), samples.end());
            timerSnapshot.p50Ms = computeQuantile(samples, 0.50);
            timerSnapshot.p95Ms = computeQuantile(samples, 0.95);
            timerSnapshot.maxMs = samples.back();
        }
        snapshot.timers.emplace(key, timerSnapshot);
    }
    snapshot.counters = counters_;
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }
    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    for (auto& [key, timer] : timers_) {
        std::lock_guard<std::mutex> samplesLock(timer->samplesMutex);
        timer->samplesMs.clear();
    }
}

Registry::TimerMetrics& Registry::ensureTimer(const std::string& timerKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timers_.try_emplace(timerKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimerMetrics>();
    }
    return *it->second;
}

}  // namespace kvault::common::metrics
