#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "domain/Types.h"

namespace domain::cache {

// Footer written beside every cached partition. The expected boundaries are
// fixed when the partition is written and checked, not recomputed, on read.
struct CacheEntryInfo {
    std::size_t rowCount{0};
    std::string contentSha256;
    TimestampMs firstOpen{0};
    TimestampMs lastOpen{0};
    std::size_t expectedCount{0};
    // Bars that had not closed by asOfMs are not part of the partition.
    TimestampMs asOfMs{0};
    TimestampMs writtenAtMs{0};
    std::string boundaryRules;
    // True once the partition covers the whole UTC day.
    bool complete{false};
};

struct CacheEntry {
    BarSequence bars;
    CacheEntryInfo info;
};

struct ValidationResult {
    enum class Status { Valid, Missing, Invalid };

    Status status{Status::Missing};
    std::optional<kvault::common::ErrorKind> error;
    std::string detail;
    std::optional<CacheEntryInfo> info;

    bool ok() const noexcept { return status == Status::Valid; }
};

inline const char* validation_status_label(ValidationResult::Status status) {
    switch (status) {
    case ValidationResult::Status::Valid:
        return "VALID";
    case ValidationResult::Status::Missing:
        return "MISSING";
    case ValidationResult::Status::Invalid:
        return "INVALID";
    }
    return "UNKNOWN";
}

// Bar partitions keyed by (symbol, interval, UTC date).
//
// load() returns nullopt for a missing partition and throws ValidationError
// for one that exists but fails its integrity or boundary checks; it never
// hands back part of a partition.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    virtual CacheEntryInfo save(const BarSequence& bars,
                                const Symbol& symbol,
                                Interval interval,
                                const CalendarDate& date,
                                TimestampMs asOfMs) = 0;

    virtual std::optional<CacheEntry> load(const Symbol& symbol,
                                           Interval interval,
                                           const CalendarDate& date,
                                           const std::vector<std::string>* columns = nullptr) const = 0;

    virtual ValidationResult validate(const Symbol& symbol, Interval interval, const CalendarDate& date) const = 0;

    virtual bool remove(const Symbol& symbol, Interval interval, const CalendarDate& date) = 0;

    virtual std::vector<CalendarDate> listDates(const Symbol& symbol, Interval interval) const = 0;
};

}  // namespace domain::cache
