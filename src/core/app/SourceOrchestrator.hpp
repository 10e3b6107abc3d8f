#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Metrics.hpp"
#include "core/Clock.hpp"
#include "core/app/FetchDecision.hpp"
#include "core/boundary/BoundaryValidator.hpp"
#include "core/resilience/CircuitBreaker.hpp"
#include "core/resilience/ResilienceWrapper.hpp"
#include "core/resilience/RetryPolicy.hpp"
#include "domain/cache/ICacheStore.hpp"
#include "domain/exchange/IKlineSource.hpp"
#include "infra/http/Transport.hpp"

namespace core::app {

struct OrchestratorSettings {
    FetchPolicy policy{};
    resilience::RetryPolicy retry{};
    resilience::CircuitBreaker::Config breaker{};
    // End-to-end budget of one getData/warmMonth call.
    std::chrono::milliseconds requestDeadline{120'000};
    // Label of the transport selection strategy; breakers are kept per
    // (backend, strategy).
    std::string transportStrategy{"single"};
    bool calibrateOnOpen{true};
    std::string probeSymbol{"BTCUSDT"};
    domain::Interval probeInterval{60'000};
};

// Failover Control Protocol: serves bars for a window from cached daily
// partitions, the incremental backend or the archive backend.
//
// A window is split into UTC days. For each day a Decision is computed from
// the cache entry, the backends' breaker state and the caller's override; a
// fetched day is checked against the boundary validator before it is cached,
// and a failed or invalid fetch is retried once on the other backend.
// Concurrent requests for the same (symbol, interval, day) share one fetch.
class SourceOrchestrator {
public:
    SourceOrchestrator(OrchestratorSettings settings,
                       std::shared_ptr<domain::cache::ICacheStore> cache,
                       std::shared_ptr<boundary::BoundaryValidator> validator,
                       std::shared_ptr<Clock> clock,
                       std::vector<std::shared_ptr<infra::http::ITransport>> transports = {});
    ~SourceOrchestrator();

    SourceOrchestrator(const SourceOrchestrator&) = delete;
    SourceOrchestrator& operator=(const SourceOrchestrator&) = delete;

    // Replaces whatever was registered for the role.
    void registerBackend(const std::string& id, BackendRole role, std::shared_ptr<domain::IKlineSource> adapter);
    // Registers the archive backend and enables warmMonth().
    void registerBackend(const std::string& id, std::shared_ptr<domain::IArchiveSource> adapter);

    // Opens the owned transports and, when enabled, calibrates the boundary
    // rules against the incremental backend. close() releases the transports;
    // the destructor closes an open orchestrator.
    void open();
    void close();
    bool isOpen() const noexcept;

    // Bars opening inside the half-open window [window.start, window.end)
    // that had closed when the call started. Throws std::invalid_argument for
    // bad arguments and a FetchError subclass when no validated data exists.
    domain::BarSequence getData(const domain::Symbol& symbol,
                                const domain::TimeWindow& window,
                                domain::Interval interval,
                                domain::SourceOverride sourceOverride = domain::SourceOverride::Auto);

    domain::cache::ValidationResult validateCache(const domain::Symbol& symbol,
                                                  domain::Interval interval,
                                                  const domain::CalendarDate& date) const;

    // Downloads one monthly archive and caches each complete, valid day of it
    // that is not cached yet. Returns the number of partitions written.
    std::size_t warmMonth(const domain::Symbol& symbol, domain::Interval interval, int year, int month);

    // Decision getData would take for one day right now, without fetching.
    Decision decisionFor(const domain::Symbol& symbol,
                         domain::Interval interval,
                         const domain::CalendarDate& date,
                         domain::SourceOverride sourceOverride = domain::SourceOverride::Auto) const;

    std::optional<domain::CircuitState> breakerState(BackendRole role) const;

    kvault::common::metrics::Registry& metrics() noexcept { return metrics_; }
    const OrchestratorSettings& settings() const noexcept { return settings_; }

private:
    struct Backend {
        std::string id;
        BackendRole role{BackendRole::Incremental};
        std::shared_ptr<domain::IKlineSource> source;
        std::shared_ptr<domain::IArchiveSource> archive;
        std::shared_ptr<resilience::CircuitBreaker> breaker;
        std::shared_ptr<resilience::ResilienceWrapper> wrapper;
    };

    struct CacheLookup {
        std::optional<domain::cache::CacheEntry> entry;
        CacheState state;
    };

    std::shared_ptr<Backend> backend(BackendRole role) const;
    void requireRequest(const domain::Symbol& symbol, domain::Interval interval) const;
    std::shared_ptr<Backend> makeBackend(const std::string& id, BackendRole role);

    domain::BarSequence partition(const domain::Symbol& symbol,
                                  domain::Interval interval,
                                  const domain::CalendarDate& date,
                                  domain::SourceOverride sourceOverride,
                                  domain::TimestampMs nowMs,
                                  const Deadline& deadline);
    domain::BarSequence resolvePartition(const domain::Symbol& symbol,
                                         domain::Interval interval,
                                         const domain::CalendarDate& date,
                                         const boundary::ResolvedBoundaries& expected,
                                         domain::SourceOverride sourceOverride,
                                         domain::TimestampMs nowMs,
                                         const Deadline& deadline);
    domain::BarSequence fetchWithFailover(const domain::Symbol& symbol,
                                          domain::Interval interval,
                                          const domain::CalendarDate& date,
                                          const boundary::ResolvedBoundaries& expected,
                                          const Decision& decision,
                                          const Deadline& deadline);
    domain::BarSequence fetchFrom(Backend& backend,
                                  const domain::Symbol& symbol,
                                  domain::Interval interval,
                                  const boundary::ResolvedBoundaries& expected,
                                  const Deadline& deadline);

    CacheLookup lookupCache(const domain::Symbol& symbol,
                            domain::Interval interval,
                            const domain::CalendarDate& date,
                            bool dropInvalid) const;
    DecisionInputs decisionInputs(const CacheState& cache,
                                  const domain::CalendarDate& date,
                                  domain::SourceOverride sourceOverride,
                                  domain::TimestampMs nowMs) const;

    OrchestratorSettings settings_;
    std::shared_ptr<domain::cache::ICacheStore> cache_;
    std::shared_ptr<boundary::BoundaryValidator> validator_;
    std::shared_ptr<Clock> clock_;
    std::vector<std::shared_ptr<infra::http::ITransport>> transports_;

    mutable kvault::common::metrics::Registry metrics_;

    mutable std::mutex backendsMutex_;
    std::map<BackendRole, std::shared_ptr<Backend>> backends_;
    std::map<std::string, std::shared_ptr<resilience::CircuitBreaker>> breakers_;

    std::mutex inflightMutex_;
    std::unordered_map<std::string, std::shared_future<domain::BarSequence>> inflight_;

    mutable std::mutex lifecycleMutex_;
    bool open_{false};
};

}  // namespace core::app
