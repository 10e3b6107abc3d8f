#include "core/app/FetchDecision.hpp"

#include <stdexcept>

namespace core::app {

using domain::FetchDecision;
using domain::SourceOverride;

namespace {

BackendRole other(BackendRole role) {
    return role == BackendRole::Incremental ? BackendRole::Archive : BackendRole::Incremental;
}

bool registered(const DecisionInputs& in, BackendRole role) {
    return role == BackendRole::Incremental ? in.incrementalRegistered : in.archiveRegistered;
}

bool available(const DecisionInputs& in, BackendRole role) {
    return registered(in, role) &&
           (role == BackendRole::Incremental ? in.incrementalAvailable : in.archiveAvailable);
}

}  // namespace

void FetchPolicy::validate() const {
    if (freshnessThreshold.count() <= 0 || openPartitionFreshness.count() <= 0) {
        throw std::invalid_argument("FetchPolicy: freshness thresholds must be positive");
    }
    if (maxStaleness < freshnessThreshold) {
        throw std::invalid_argument("FetchPolicy: maxStaleness must not be below freshnessThreshold");
    }
    if (consolidationDelay.count() < 0) {
        throw std::invalid_argument("FetchPolicy: consolidationDelay must not be negative");
    }
}

const char* backend_role_label(BackendRole role) {
    return role == BackendRole::Incremental ? "incremental" : "archive";
}

Decision decideFetch(const DecisionInputs& in, const FetchPolicy& policy) {
    Decision out;
    const bool usable = in.cache.present && in.cache.valid;
    const auto age = in.nowMs - in.cache.writtenAtMs;
    const auto threshold =
        in.cache.complete ? policy.freshnessThreshold.count() : policy.openPartitionFreshness.count();

    if (in.sourceOverride == SourceOverride::CacheOnly) {
        out.decision = FetchDecision::UseCache;
        out.reason = usable ? "cache-only request" : "cache-only request without a usable entry";
        return out;
    }

    if (usable && in.sourceOverride != SourceOverride::Refresh && age < threshold) {
        out.decision = FetchDecision::UseCache;
        out.reason = "fresh cache entry";
        return out;
    }

    if (usable) {
        out.decision = FetchDecision::CacheStale;
        out.staleFallbackAllowed = age <= policy.maxStaleness.count();
        out.reason = in.sourceOverride == SourceOverride::Refresh ? "refresh requested" : "cache entry aged out";
    } else {
        out.decision = FetchDecision::FetchFresh;
        out.reason = in.cache.present ? "cache entry failed validation" : "no cache entry";
    }

    if (in.sourceOverride == SourceOverride::Incremental || in.sourceOverride == SourceOverride::Archive) {
        // An explicit backend is used alone.
        const auto role =
            in.sourceOverride == SourceOverride::Incremental ? BackendRole::Incremental : BackendRole::Archive;
        if (registered(in, role)) {
            out.primary = role;
        } else {
            out.reason += std::string{"; "} + backend_role_label(role) + " backend not registered";
        }
        return out;
    }

    const bool consolidated = in.partitionEndMs <= in.nowMs - policy.consolidationDelay.count();
    BackendRole preferred = consolidated ? BackendRole::Archive : BackendRole::Incremental;
    if (!registered(in, preferred)) {
        preferred = other(preferred);
        if (!registered(in, preferred)) {
            out.reason += "; no backend registered";
            return out;
        }
    }
    out.primary = preferred;
    if (registered(in, other(preferred))) {
        out.alternate = other(preferred);
    }

    if (!available(in, preferred) && out.alternate && available(in, *out.alternate)) {
        out.primary = out.alternate;
        out.alternate = preferred;
        if (out.decision == FetchDecision::FetchFresh) {
            out.decision = FetchDecision::Failover;
        }
        out.reason += std::string{"; "} + backend_role_label(preferred) + " circuit open";
    }
    return out;
}

}  // namespace core::app
