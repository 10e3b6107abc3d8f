#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "domain/Types.h"

namespace core::app {

struct FetchPolicy {
    // Age after which a complete (past) day is refetched.
    std::chrono::milliseconds freshnessThreshold{30LL * 24 * 60 * 60 * 1000};
    // Age after which a partition of a day that had not ended when it was
    // written is refetched.
    std::chrono::milliseconds openPartitionFreshness{5 * 60 * 1000};
    // Oldest stale entry that may still be served when a refetch fails.
    std::chrono::milliseconds maxStaleness{90LL * 24 * 60 * 60 * 1000};
    // Days that ended longer ago than this are fetched from the archive.
    std::chrono::milliseconds consolidationDelay{48 * 60 * 60 * 1000};

    // Throws std::invalid_argument for negative or inconsistent values.
    void validate() const;
};

enum class BackendRole { Incremental, Archive };

const char* backend_role_label(BackendRole role);

struct CacheState {
    bool present{false};
    // False when the entry exists but failed its integrity or boundary checks.
    bool valid{false};
    bool complete{false};
    domain::TimestampMs writtenAtMs{0};
};

struct DecisionInputs {
    CacheState cache;
    // End of the UTC day the partition covers.
    domain::TimestampMs partitionEndMs{0};
    domain::TimestampMs nowMs{0};
    // Availability as reported by each backend's circuit breaker.
    bool incrementalAvailable{true};
    bool archiveAvailable{true};
    bool incrementalRegistered{true};
    bool archiveRegistered{true};
    domain::SourceOverride sourceOverride{domain::SourceOverride::Auto};
};

struct Decision {
    domain::FetchDecision decision{domain::FetchDecision::FetchFresh};
    // Backend to ask first; unset for USE_CACHE and for cache-only requests.
    std::optional<BackendRole> primary;
    // Backend to ask once if the first one fails.
    std::optional<BackendRole> alternate;
    // A stale entry that may be served if every fetch fails.
    bool staleFallbackAllowed{false};
    std::string reason;
};

// Pure function of its inputs.
Decision decideFetch(const DecisionInputs& inputs, const FetchPolicy& policy);

}  // namespace core::app
