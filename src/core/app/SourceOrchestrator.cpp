#include "core/app/SourceOrchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"

namespace core::app {

using domain::BarSequence;
using domain::CalendarDate;
using domain::FetchDecision;
using domain::Interval;
using domain::TimestampMs;
using kvault::common::ErrorKind;
using kvault::common::ExhaustionError;
using kvault::common::FetchError;
using kvault::common::ResponseError;
using kvault::common::ValidationError;

namespace {

std::string counterKey(FetchDecision decision) {
    std::string key{"fcp."};
    for (const char* p = domain::fetch_decision_label(decision); *p != '\0'; ++p) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    }
    return key;
}

std::string partitionLabel(const domain::Symbol& symbol, Interval interval, const CalendarDate& date) {
    return symbol + ' ' + domain::to_string(interval) + ' ' + core::formatIsoDate(date);
}

// A 4xx other than "not published yet" is the caller's problem and would
// fail the same way on the other backend.
bool failoverEligible(const FetchError& error) {
    if (error.kind() != ErrorKind::ClientError) {
        return true;
    }
    const auto* response = dynamic_cast<const ResponseError*>(&error);
    return response != nullptr && response->status() == 404U;
}

}  // namespace

SourceOrchestrator::SourceOrchestrator(OrchestratorSettings settings,
                                       std::shared_ptr<domain::cache::ICacheStore> cache,
                                       std::shared_ptr<boundary::BoundaryValidator> validator,
                                       std::shared_ptr<Clock> clock,
                                       std::vector<std::shared_ptr<infra::http::ITransport>> transports)
    : settings_(std::move(settings)),
      cache_(std::move(cache)),
      validator_(std::move(validator)),
      clock_(std::move(clock)),
      transports_(std::move(transports)) {
    if (!cache_ || !validator_ || !clock_) {
        throw std::invalid_argument("SourceOrchestrator requires a cache store, a boundary validator and a clock");
    }
    settings_.policy.validate();
    settings_.retry.validate();
    if (settings_.requestDeadline.count() <= 0) {
        throw std::invalid_argument("SourceOrchestrator: request deadline must be positive");
    }
    transports_.erase(std::remove(transports_.begin(), transports_.end(), nullptr), transports_.end());
}

SourceOrchestrator::~SourceOrchestrator() {
    try {
        close();
    } catch (const std::exception& ex) {
        LOG_WARN("SourceOrchestrator: error while closing transports: " << ex.what());
    }
}

std::shared_ptr<SourceOrchestrator::Backend> SourceOrchestrator::makeBackend(const std::string& id, BackendRole role) {
    if (id.empty()) {
        throw std::invalid_argument("SourceOrchestrator: backend id must not be empty");
    }
    auto backend = std::make_shared<Backend>();
    backend->id = id;
    backend->role = role;

    const auto breakerKey = id + "/" + settings_.transportStrategy;
    auto& breaker = breakers_[breakerKey];
    if (!breaker) {
        breaker = std::make_shared<resilience::CircuitBreaker>(breakerKey, settings_.breaker, clock_);
        const auto gaugeKey = "breaker." + id + ".open";
        metrics_.setGauge(gaugeKey, 0.0);
        breaker->setTransitionListener(
            [this, gaugeKey](const std::string&, domain::CircuitState, domain::CircuitState to) {
                metrics_.setGauge(gaugeKey, to == domain::CircuitState::Open ? 1.0 : 0.0);
            });
    }
    backend->breaker = breaker;
    backend->wrapper = std::make_shared<resilience::ResilienceWrapper>(settings_.retry, breaker, clock_);
    return backend;
}

void SourceOrchestrator::registerBackend(const std::string& id,
                                         BackendRole role,
                                         std::shared_ptr<domain::IKlineSource> adapter) {
    if (!adapter) {
        throw std::invalid_argument("SourceOrchestrator: cannot register a null backend '" + id + "'");
    }
    std::lock_guard<std::mutex> lock(backendsMutex_);
    auto backend = makeBackend(id, role);
    backend->source = std::move(adapter);
    backends_[role] = std::move(backend);
    LOG_INFO("Registered " << backend_role_label(role) << " backend '" << id << "'");
}

void SourceOrchestrator::registerBackend(const std::string& id, std::shared_ptr<domain::IArchiveSource> adapter) {
    if (!adapter) {
        throw std::invalid_argument("SourceOrchestrator: cannot register a null backend '" + id + "'");
    }
    std::lock_guard<std::mutex> lock(backendsMutex_);
    auto backend = makeBackend(id, BackendRole::Archive);
    backend->source = adapter;
    backend->archive = std::move(adapter);
    backends_[BackendRole::Archive] = std::move(backend);
    LOG_INFO("Registered archive backend '" << id << "' (daily and monthly)");
}

// Rejected before any backend or breaker is touched: a backend that cannot
// express the interval would fail the same way on every attempt.
void SourceOrchestrator::requireRequest(const domain::Symbol& symbol, Interval interval) const {
    if (symbol.empty()) {
        throw std::invalid_argument("symbol must not be empty");
    }
    if (!interval.dividesDay()) {
        throw std::invalid_argument("interval must be positive and divide a day");
    }
    std::lock_guard<std::mutex> lock(backendsMutex_);
    for (const auto& [role, registered] : backends_) {
        if (!registered->source->supportsInterval(interval)) {
            throw std::invalid_argument("interval " + domain::to_string(interval) + " is not supported by " +
                                        backend_role_label(role) + " backend '" + registered->id + "'");
        }
    }
}

std::shared_ptr<SourceOrchestrator::Backend> SourceOrchestrator::backend(BackendRole role) const {
    std::lock_guard<std::mutex> lock(backendsMutex_);
    const auto it = backends_.find(role);
    return it == backends_.end() ? nullptr : it->second;
}

void SourceOrchestrator::open() {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (open_) {
            return;
        }
        std::size_t opened = 0;
        try {
            for (; opened < transports_.size(); ++opened) {
                transports_[opened]->open();
            }
        } catch (const std::exception&) {
            while (opened-- > 0) {
                transports_[opened]->close();
            }
            throw;
        }
        open_ = true;
    }

    if (!settings_.calibrateOnOpen) {
        return;
    }
    if (const auto incremental = backend(BackendRole::Incremental)) {
        validator_->calibrate(*incremental->source,
                              settings_.probeSymbol,
                              settings_.probeInterval,
                              *clock_,
                              Deadline::after(*clock_, settings_.requestDeadline));
    } else {
        LOG_DEBUG("No incremental backend registered, boundary rules stay at " << validator_->rules().signature());
    }
}

void SourceOrchestrator::close() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!open_) {
        return;
    }
    open_ = false;
    for (auto it = transports_.rbegin(); it != transports_.rend(); ++it) {
        (*it)->close();
    }
}

bool SourceOrchestrator::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return open_;
}

BarSequence SourceOrchestrator::getData(const domain::Symbol& symbol,
                                        const domain::TimeWindow& window,
                                        Interval interval,
                                        domain::SourceOverride sourceOverride) {
    requireRequest(symbol, interval);
    if (!window.valid()) {
        throw std::invalid_argument("window start must precede its end");
    }

    const auto nowMs = clock_->nowMs();
    const auto deadline = Deadline::after(*clock_, settings_.requestDeadline);
    const auto form = validator_->requestFormFor(window, interval);
    if (!form) {
        return {};
    }

    BarSequence result;
    const auto lastDay = core::dateOf(form->lastOpen);
    for (auto day = core::dateOf(form->firstOpen); !(lastDay < day); day = core::addDays(day, 1)) {
        if (core::dayStartMs(day) > nowMs) {
            break;
        }
        const auto bars = partition(symbol, interval, day, sourceOverride, nowMs, deadline);
        const auto clipped = validator_->clip(bars, form->effectiveStart, form->effectiveEnd, interval);
        result.insert(result.end(), clipped.begin(), clipped.end());
    }

    LOG_DEBUG("getData " << symbol << ' ' << domain::to_string(interval) << " [" << core::formatTimestamp(window.start)
                         << ", " << core::formatTimestamp(window.end) << "): " << result.size() << " bars");
    return result;
}

BarSequence SourceOrchestrator::partition(const domain::Symbol& symbol,
                                          Interval interval,
                                          const CalendarDate& date,
                                          domain::SourceOverride sourceOverride,
                                          TimestampMs nowMs,
                                          const Deadline& deadline) {
    const auto expected = validator_->partitionBoundaries(date, interval, nowMs);
    if (!expected) {
        return {};
    }

    const auto key = symbol + '|' + domain::to_string(interval) + '|' + core::formatCompactDate(date);
    std::promise<BarSequence> promise;
    std::shared_future<BarSequence> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        const auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(key, pending);
            owner = true;
        }
    }

    if (!owner) {
        metrics_.incrementCounter("fetch.dedup_wait");
        LOG_DEBUG("Waiting on in-flight fetch of " << partitionLabel(symbol, interval, date));
        if (deadline.bounded() &&
            pending.wait_for(deadline.remaining(*clock_)) != std::future_status::ready) {
            throw kvault::common::TransportError(ErrorKind::Timeout,
                                                 "deadline exceeded waiting for in-flight fetch of " +
                                                     partitionLabel(symbol, interval, date));
        }
        return pending.get();
    }

    auto finish = [this, &key]() {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        inflight_.erase(key);
    };
    try {
        auto bars = resolvePartition(symbol, interval, date, *expected, sourceOverride, nowMs, deadline);
        promise.set_value(bars);
        finish();
        return bars;
    } catch (...) {
        promise.set_exception(std::current_exception());
        finish();
        throw;
    }
}

SourceOrchestrator::CacheLookup SourceOrchestrator::lookupCache(const domain::Symbol& symbol,
                                                                Interval interval,
                                                                const CalendarDate& date,
                                                                bool dropInvalid) const {
    CacheLookup lookup;
    try {
        lookup.entry = cache_->load(symbol, interval, date);
    } catch (const ValidationError& ex) {
        lookup.state.present = true;
        metrics_.incrementCounter("cache.invalid");
        LOG_WARN("Cache partition " << partitionLabel(symbol, interval, date) << " rejected ("
                                    << kvault::common::errorKindToString(ex.kind()) << "): " << ex.what());
        if (dropInvalid) {
            cache_->remove(symbol, interval, date);
        }
        return lookup;
    }
    if (lookup.entry) {
        lookup.state.present = true;
        lookup.state.valid = true;
        lookup.state.complete = lookup.entry->info.complete;
        lookup.state.writtenAtMs = lookup.entry->info.writtenAtMs;
    }
    return lookup;
}

DecisionInputs SourceOrchestrator::decisionInputs(const CacheState& cache,
                                                  const CalendarDate& date,
                                                  domain::SourceOverride sourceOverride,
                                                  TimestampMs nowMs) const {
    DecisionInputs inputs;
    inputs.cache = cache;
    inputs.partitionEndMs = core::dayStartMs(date) + domain::kMillisPerDay;
    inputs.nowMs = nowMs;
    inputs.sourceOverride = sourceOverride;

    const auto incremental = backend(BackendRole::Incremental);
    const auto archive = backend(BackendRole::Archive);
    inputs.incrementalRegistered = incremental != nullptr;
    inputs.archiveRegistered = archive != nullptr;
    inputs.incrementalAvailable = incremental && incremental->breaker->admitsCalls();
    inputs.archiveAvailable = archive && archive->breaker->admitsCalls();
    return inputs;
}

Decision SourceOrchestrator::decisionFor(const domain::Symbol& symbol,
                                         Interval interval,
                                         const CalendarDate& date,
                                         domain::SourceOverride sourceOverride) const {
    requireRequest(symbol, interval);
    const auto nowMs = clock_->nowMs();
    const auto lookup = lookupCache(symbol, interval, date, false);
    return decideFetch(decisionInputs(lookup.state, date, sourceOverride, nowMs), settings_.policy);
}

BarSequence SourceOrchestrator::resolvePartition(const domain::Symbol& symbol,
                                                 Interval interval,
                                                 const CalendarDate& date,
                                                 const boundary::ResolvedBoundaries& expected,
                                                 domain::SourceOverride sourceOverride,
                                                 TimestampMs nowMs,
                                                 const Deadline& deadline) {
    const auto label = partitionLabel(symbol, interval, date);
    auto lookup = lookupCache(symbol, interval, date, true);
    const auto decision = decideFetch(decisionInputs(lookup.state, date, sourceOverride, nowMs), settings_.policy);

    metrics_.incrementCounter(counterKey(decision.decision));
    LOG_DEBUG("FCP " << label << ": " << domain::fetch_decision_label(decision.decision) << " ("
                     << decision.reason << ")"
                     << (decision.primary ? std::string{" via "} + backend_role_label(*decision.primary)
                                          : std::string{}));

    if (decision.decision == FetchDecision::UseCache) {
        if (!lookup.entry) {
            throw ExhaustionError(ErrorKind::AllBackendsFailed,
                                  label + ": " + decision.reason + ", network use disabled", {}, "");
        }
        return std::move(lookup.entry->bars);
    }
    if (!decision.primary) {
        throw ExhaustionError(ErrorKind::AllBackendsFailed, label + ": " + decision.reason, {}, "");
    }

    BarSequence bars;
    try {
        bars = fetchWithFailover(symbol, interval, date, expected, decision, deadline);
    } catch (const FetchError& ex) {
        if (decision.decision == FetchDecision::CacheStale && decision.staleFallbackAllowed && lookup.entry) {
            metrics_.incrementCounter("fcp.stale_fallback");
            LOG_WARN("Refetch of " << label << " failed, serving cache entry written at "
                                   << core::formatTimestamp(lookup.entry->info.writtenAtMs) << ": " << ex.what());
            return std::move(lookup.entry->bars);
        }
        throw;
    }

    try {
        cache_->save(bars, symbol, interval, date, nowMs);
        metrics_.incrementCounter("cache.write");
    } catch (const std::exception& ex) {
        LOG_ERR("Fetched " << label << " but could not cache it: " << ex.what());
    }
    return bars;
}

BarSequence SourceOrchestrator::fetchWithFailover(const domain::Symbol& symbol,
                                                  Interval interval,
                                                  const CalendarDate& date,
                                                  const boundary::ResolvedBoundaries& expected,
                                                  const Decision& decision,
                                                  const Deadline& deadline) {
    std::vector<BackendRole> order{*decision.primary};
    if (decision.alternate) {
        order.push_back(*decision.alternate);
    }

    std::vector<std::string> attempted;
    std::string lastError;
    std::exception_ptr lastValidation;
    bool allCircuitOpen = true;

    for (const auto role : order) {
        const auto candidate = backend(role);
        if (!candidate) {
            continue;
        }
        if (!attempted.empty()) {
            metrics_.incrementCounter("fcp.failover");
            LOG_WARN("FCP " << partitionLabel(symbol, interval, date) << ": failing over from '" << attempted.back()
                            << "' to '" << candidate->id << "' after: " << lastError);
        }

        try {
            return fetchFrom(*candidate, symbol, interval, expected, deadline);
        } catch (const ValidationError& ex) {
            attempted.push_back(candidate->id);
            lastError = ex.what();
            lastValidation = std::current_exception();
            allCircuitOpen = false;
        } catch (const ExhaustionError& ex) {
            attempted.push_back(candidate->id);
            lastError = ex.lastError().empty() ? ex.reason() : ex.lastError();
            lastValidation = nullptr;
            allCircuitOpen = allCircuitOpen && ex.kind() == ErrorKind::CircuitOpen;
        } catch (const FetchError& ex) {
            attempted.push_back(candidate->id);
            lastError = ex.what();
            lastValidation = nullptr;
            allCircuitOpen = false;
            if (ex.kind() == ErrorKind::Timeout && deadline.expired(*clock_)) {
                throw;
            }
            if (!failoverEligible(ex)) {
                throw;
            }
        }
    }

    if (lastValidation) {
        std::rethrow_exception(lastValidation);
    }
    throw ExhaustionError(allCircuitOpen && !attempted.empty() ? ErrorKind::CircuitOpen
                                                               : ErrorKind::AllBackendsFailed,
                          "no backend produced " + partitionLabel(symbol, interval, date),
                          attempted,
                          lastError);
}

BarSequence SourceOrchestrator::fetchFrom(Backend& backend,
                                          const domain::Symbol& symbol,
                                          Interval interval,
                                          const boundary::ResolvedBoundaries& expected,
                                          const Deadline& deadline) {
    const auto label =
        backend.id + ' ' + partitionLabel(symbol, interval, core::dateOf(expected.firstOpen));
    metrics_.incrementCounter("fetch." + backend.id);
    kvault::common::metrics::Registry::ScopedTimer timer(metrics_, "source." + backend.id);

    auto bars = backend.wrapper->execute(
        [&] {
            return backend.source->fetchKlines(symbol, interval, expected.effectiveStart, expected.effectiveEnd,
                                               deadline);
        },
        [&]() -> BarSequence {
            throw ExhaustionError(ErrorKind::CircuitOpen,
                                  "circuit for '" + backend.id + "' is open",
                                  {backend.id},
                                  "");
        },
        deadline,
        label);

    if (const auto problem = boundary::BoundaryValidator::checkStructure(bars, interval)) {
        throw ValidationError(ErrorKind::SchemaInvalid, label + ": " + *problem, backend.id);
    }
    if (!validator_->matchesExpectedRange(bars, expected.effectiveStart, expected.effectiveEnd, interval)) {
        throw ValidationError(ErrorKind::BoundaryMismatch,
                              label + ": got " + std::to_string(bars.size()) + " bars " +
                                  std::to_string(bars.front().openTime) + ".." +
                                  std::to_string(bars.back().openTime) + ", expected " +
                                  std::to_string(expected.expectedCount) + " bars " +
                                  std::to_string(expected.firstOpen) + ".." + std::to_string(expected.lastOpen),
                              backend.id);
    }
    return bars;
}

domain::cache::ValidationResult SourceOrchestrator::validateCache(const domain::Symbol& symbol,
                                                                  Interval interval,
                                                                  const CalendarDate& date) const {
    requireRequest(symbol, interval);
    return cache_->validate(symbol, interval, date);
}

std::size_t SourceOrchestrator::warmMonth(const domain::Symbol& symbol, Interval interval, int year, int month) {
    requireRequest(symbol, interval);
    if (month < 1 || month > 12) {
        throw std::invalid_argument("month out of range: " + std::to_string(month));
    }
    const auto archive = backend(BackendRole::Archive);
    if (!archive || !archive->archive) {
        throw std::runtime_error("warmMonth needs an archive backend that publishes monthly files");
    }

    const auto nowMs = clock_->nowMs();
    const auto deadline = Deadline::after(*clock_, settings_.requestDeadline);
    const auto label = archive->id + ' ' + symbol + ' ' + domain::to_string(interval) + ' ' +
                       core::formatMonth(year, month);

    BarSequence bars;
    {
        metrics_.incrementCounter("fetch." + archive->id);
        kvault::common::metrics::Registry::ScopedTimer timer(metrics_, "source." + archive->id);
        bars = archive->wrapper->execute(
            [&] { return archive->archive->fetchMonth(symbol, interval, year, month, deadline); },
            [&]() -> BarSequence {
                throw ExhaustionError(ErrorKind::CircuitOpen,
                                      "circuit for '" + archive->id + "' is open",
                                      {archive->id},
                                      "");
            },
            deadline,
            label);
    }

    std::map<CalendarDate, BarSequence> byDay;
    for (const auto& bar : bars) {
        byDay[core::dateOf(bar.openTime)].push_back(bar);
    }

    std::size_t written = 0;
    const int days = core::daysInMonth(year, month);
    for (int day = 1; day <= days; ++day) {
        const CalendarDate date{year, month, day};
        if (core::dayStartMs(date) + domain::kMillisPerDay > nowMs) {
            break;
        }
        const auto expected = validator_->partitionBoundaries(date, interval, nowMs);
        if (!expected) {
            continue;
        }
        if (lookupCache(symbol, interval, date, true).entry) {
            continue;
        }

        const auto& dayBars = byDay[date];
        const auto problem = boundary::BoundaryValidator::checkStructure(dayBars, interval);
        if (problem ||
            !validator_->matchesExpectedRange(dayBars, expected->effectiveStart, expected->effectiveEnd, interval)) {
            metrics_.incrementCounter("cache.invalid");
            LOG_WARN("Monthly archive " << label << ": day " << core::formatIsoDate(date) << " not cached ("
                                        << (problem ? *problem : std::string{"boundary mismatch"}) << ", "
                                        << dayBars.size() << " of " << expected->expectedCount << " bars)");
            continue;
        }
        cache_->save(dayBars, symbol, interval, date, nowMs);
        metrics_.incrementCounter("cache.write");
        ++written;
    }

    LOG_INFO("Warmed " << written << " daily partition(s) from " << label);
    return written;
}

std::optional<domain::CircuitState> SourceOrchestrator::breakerState(BackendRole role) const {
    const auto candidate = backend(role);
    if (!candidate) {
        return std::nullopt;
    }
    return candidate->breaker->state();
}

}  // namespace core::app
