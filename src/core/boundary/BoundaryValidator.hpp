#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

#include "core/Clock.hpp"
#include "domain/Types.h"
#include "domain/exchange/IKlineSource.hpp"

namespace core::boundary {

enum class OffGridRounding { Up, Down };

// How the incremental backend treats one edge of a [startTime, endTime]
// request: whether a value exactly on the interval grid selects the bar that
// opens there, and which way an off-grid value snaps.
struct EdgeRule {
    bool onGridInclusive{true};
    OffGridRounding offGrid{OffGridRounding::Up};

    bool operator==(const EdgeRule& other) const noexcept {
        return onGridInclusive == other.onGridInclusive && offGrid == other.offGrid;
    }
};

struct BoundaryRules {
    EdgeRule start{true, OffGridRounding::Up};
    EdgeRule end{true, OffGridRounding::Down};

    // Both edges inclusive; off-grid start rounds up, off-grid end rounds down.
    static BoundaryRules binanceDefault() { return BoundaryRules{}; }

    // e.g. "start=incl/up;end=incl/down". Recorded in every cache footer.
    std::string signature() const;

    bool operator==(const BoundaryRules& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const BoundaryRules& other) const noexcept { return !(*this == other); }
};

struct ResolvedBoundaries {
    domain::TimestampMs firstOpen{0};
    domain::TimestampMs lastOpen{0};
    std::size_t expectedCount{0};
    // Canonical request form: the [startTime, endTime] pair that makes the
    // backend return exactly firstOpen..lastOpen. Resolving it again yields
    // the same result.
    domain::TimestampMs effectiveStart{0};
    domain::TimestampMs effectiveEnd{0};

    bool empty() const noexcept { return expectedCount == 0; }
};

// The single owner of time-window arithmetic. The incremental client sends
// windows untouched; the archive client, the cache store and the orchestrator
// ask this class what the incremental backend would have returned.
class BoundaryValidator {
public:
    explicit BoundaryValidator(BoundaryRules rules = BoundaryRules::binanceDefault());

    BoundaryRules rules() const;
    void setRules(const BoundaryRules& rules);

    // Learns the rules by issuing two small requests against a live source:
    // one with on-grid edges, one with edges 1 ms off the grid. Returns false
    // and keeps the current rules when the probe fails or is inconclusive.
    bool calibrate(domain::IKlineSource& source,
                   const std::string& symbol,
                   domain::Interval interval,
                   const Clock& clock,
                   const Deadline& deadline);

    // startTime/endTime in backend request form.
    bool isValidRange(domain::TimestampMs startTime, domain::TimestampMs endTime, domain::Interval interval) const;
    ResolvedBoundaries resolveBoundaries(domain::TimestampMs startTime,
                                         domain::TimestampMs endTime,
                                         domain::Interval interval) const;
    bool matchesExpectedRange(const domain::BarSequence& bars,
                              domain::TimestampMs startTime,
                              domain::TimestampMs endTime,
                              domain::Interval interval) const;

    // Keeps the bars a backend request for [startTime, endTime] would return.
    domain::BarSequence clip(const domain::BarSequence& bars,
                             domain::TimestampMs startTime,
                             domain::TimestampMs endTime,
                             domain::Interval interval) const;

    // Request form selecting every bar that opens inside the half-open window.
    // nullopt when no bar opens inside it.
    std::optional<ResolvedBoundaries> requestFormFor(const domain::TimeWindow& window, domain::Interval interval) const;

    // Request form for one UTC day, limited to bars that have closed by nowMs.
    std::optional<ResolvedBoundaries> partitionBoundaries(const domain::CalendarDate& date,
                                                          domain::Interval interval,
                                                          domain::TimestampMs nowMs) const;

    // Non-empty, on the interval grid, strictly increasing by open time and
    // with sane OHLC values. Returns a description of the first problem.
    static std::optional<std::string> checkStructure(const domain::BarSequence& bars, domain::Interval interval);

private:
    static domain::TimestampMs firstOpenFor(const BoundaryRules& rules,
                                            domain::TimestampMs startTime,
                                            domain::TimestampMs step);
    static domain::TimestampMs lastOpenFor(const BoundaryRules& rules,
                                           domain::TimestampMs endTime,
                                           domain::TimestampMs step);
    static ResolvedBoundaries fromOpenTimes(const BoundaryRules& rules,
                                            domain::TimestampMs firstOpen,
                                            domain::TimestampMs lastOpen,
                                            domain::TimestampMs step);

    mutable std::mutex mutex_;
    BoundaryRules rules_;
};

}  // namespace core::boundary
