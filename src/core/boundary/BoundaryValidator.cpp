#include "core/boundary/BoundaryValidator.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"

namespace core::boundary {

using domain::BarSequence;
using domain::Interval;
using domain::TimestampMs;

namespace {

const char* roundingLabel(OffGridRounding rounding) {
    return rounding == OffGridRounding::Up ? "up" : "down";
}

void requireInterval(Interval interval) {
    if (!interval.valid()) {
        throw std::invalid_argument("Interval must be positive");
    }
}

bool finite(double value) {
    return std::isfinite(value);
}

}  // namespace

std::string BoundaryRules::signature() const {
    std::ostringstream oss;
    oss << "start=" << (start.onGridInclusive ? "incl" : "excl") << '/' << roundingLabel(start.offGrid)
        << ";end=" << (end.onGridInclusive ? "incl" : "excl") << '/' << roundingLabel(end.offGrid);
    return oss.str();
}

BoundaryValidator::BoundaryValidator(BoundaryRules rules) : rules_(rules) {}

BoundaryRules BoundaryValidator::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_;
}

void BoundaryValidator::setRules(const BoundaryRules& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_ = rules;
}

TimestampMs BoundaryValidator::firstOpenFor(const BoundaryRules& rules, TimestampMs startTime, TimestampMs step) {
    if (domain::on_grid(startTime, step)) {
        return rules.start.onGridInclusive ? startTime : startTime + step;
    }
    return rules.start.offGrid == OffGridRounding::Up ? domain::align_up_ms(startTime, step)
                                                      : domain::align_down_ms(startTime, step);
}

TimestampMs BoundaryValidator::lastOpenFor(const BoundaryRules& rules, TimestampMs endTime, TimestampMs step) {
    if (domain::on_grid(endTime, step)) {
        return rules.end.onGridInclusive ? endTime : endTime - step;
    }
    return rules.end.offGrid == OffGridRounding::Down ? domain::align_down_ms(endTime, step)
                                                      : domain::align_up_ms(endTime, step);
}

ResolvedBoundaries BoundaryValidator::fromOpenTimes(const BoundaryRules& rules,
                                                    TimestampMs firstOpen,
                                                    TimestampMs lastOpen,
                                                    TimestampMs step) {
    ResolvedBoundaries resolved;
    resolved.firstOpen = firstOpen;
    resolved.lastOpen = lastOpen;
    resolved.expectedCount = static_cast<std::size_t>((lastOpen - firstOpen) / step + 1);

    const TimestampMs startCandidates[] = {firstOpen, firstOpen - 1, firstOpen + 1, firstOpen - step};
    resolved.effectiveStart = firstOpen;
    for (const auto candidate : startCandidates) {
        if (firstOpenFor(rules, candidate, step) == firstOpen) {
            resolved.effectiveStart = candidate;
            break;
        }
    }

    const TimestampMs endCandidates[] = {lastOpen, lastOpen + 1, lastOpen - 1, lastOpen + step};
    resolved.effectiveEnd = lastOpen;
    for (const auto candidate : endCandidates) {
        if (lastOpenFor(rules, candidate, step) == lastOpen) {
            resolved.effectiveEnd = candidate;
            break;
        }
    }
    return resolved;
}

bool BoundaryValidator::calibrate(domain::IKlineSource& source,
                                  const std::string& symbol,
                                  Interval interval,
                                  const Clock& clock,
                                  const Deadline& deadline) {
    requireInterval(interval);
    const TimestampMs step = interval.ms;
    const TimestampMs reference = domain::align_down_ms(clock.nowMs(), step) - 4 * step;

    BarSequence onGrid;
    BarSequence offGrid;
    try {
        onGrid = source.fetchKlines(symbol, interval, reference, reference + 2 * step, deadline);
        offGrid = source.fetchKlines(symbol, interval, reference + 1, reference + 2 * step - 1, deadline);
    } catch (const kvault::common::FetchError& ex) {
        LOG_WARN("Boundary probe against '" << source.id() << "' failed, keeping "
                                            << rules().signature() << ": " << ex.what());
        return false;
    }
    if (onGrid.empty() || offGrid.empty()) {
        LOG_WARN("Boundary probe against '" << source.id() << "' returned no bars, keeping "
                                            << rules().signature());
        return false;
    }

    BoundaryRules learned;
    bool conclusive = true;

    const auto onFirst = onGrid.front().openTime;
    const auto onLast = onGrid.back().openTime;
    const auto offFirst = offGrid.front().openTime;
    const auto offLast = offGrid.back().openTime;

    if (onFirst == reference || onFirst == reference + step) {
        learned.start.onGridInclusive = onFirst == reference;
    } else {
        conclusive = false;
    }
    if (onLast == reference + 2 * step || onLast == reference + step) {
        learned.end.onGridInclusive = onLast == reference + 2 * step;
    } else {
        conclusive = false;
    }
    if (offFirst == reference + step || offFirst == reference) {
        learned.start.offGrid = offFirst == reference + step ? OffGridRounding::Up : OffGridRounding::Down;
    } else {
        conclusive = false;
    }
    if (offLast == reference + step || offLast == reference + 2 * step) {
        learned.end.offGrid = offLast == reference + step ? OffGridRounding::Down : OffGridRounding::Up;
    } else {
        conclusive = false;
    }

    if (!conclusive) {
        LOG_WARN("Boundary probe against '" << source.id() << "' was inconclusive (on-grid " << onFirst << ".."
                                            << onLast << ", off-grid " << offFirst << ".." << offLast
                                            << "), keeping " << rules().signature());
        return false;
    }

    setRules(learned);
    LOG_INFO("Boundary rules calibrated against '" << source.id() << "': " << learned.signature());
    return true;
}

bool BoundaryValidator::isValidRange(TimestampMs startTime, TimestampMs endTime, Interval interval) const {
    if (!interval.valid() || startTime >= endTime) {
        return false;
    }
    return !resolveBoundaries(startTime, endTime, interval).empty();
}

ResolvedBoundaries BoundaryValidator::resolveBoundaries(TimestampMs startTime,
                                                        TimestampMs endTime,
                                                        Interval interval) const {
    requireInterval(interval);
    const auto current = rules();
    const auto firstOpen = firstOpenFor(current, startTime, interval.ms);
    const auto lastOpen = lastOpenFor(current, endTime, interval.ms);
    if (lastOpen < firstOpen) {
        ResolvedBoundaries empty;
        empty.firstOpen = firstOpen;
        empty.lastOpen = lastOpen;
        empty.effectiveStart = startTime;
        empty.effectiveEnd = endTime;
        return empty;
    }
    return fromOpenTimes(current, firstOpen, lastOpen, interval.ms);
}

bool BoundaryValidator::matchesExpectedRange(const BarSequence& bars,
                                             TimestampMs startTime,
                                             TimestampMs endTime,
                                             Interval interval) const {
    const auto expected = resolveBoundaries(startTime, endTime, interval);
    if (expected.empty()) {
        return bars.empty();
    }
    return bars.size() == expected.expectedCount && bars.front().openTime == expected.firstOpen &&
           bars.back().openTime == expected.lastOpen;
}

BarSequence BoundaryValidator::clip(const BarSequence& bars,
                                    TimestampMs startTime,
                                    TimestampMs endTime,
                                    Interval interval) const {
    const auto expected = resolveBoundaries(startTime, endTime, interval);
    BarSequence clipped;
    if (expected.empty()) {
        return clipped;
    }
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(clipped), [&expected](const domain::Bar& bar) {
        return bar.openTime >= expected.firstOpen && bar.openTime <= expected.lastOpen;
    });
    return clipped;
}

std::optional<ResolvedBoundaries> BoundaryValidator::requestFormFor(const domain::TimeWindow& window,
                                                                    Interval interval) const {
    requireInterval(interval);
    if (!window.valid()) {
        throw std::invalid_argument("Time window start must precede its end");
    }
    const auto step = interval.ms;
    const auto firstOpen = domain::align_up_ms(window.start, step);
    const auto lastOpen = domain::align_up_ms(window.end, step) - step;
    if (lastOpen < firstOpen) {
        return std::nullopt;
    }
    return fromOpenTimes(rules(), firstOpen, lastOpen, step);
}

std::optional<ResolvedBoundaries> BoundaryValidator::partitionBoundaries(const domain::CalendarDate& date,
                                                                         Interval interval,
                                                                         TimestampMs nowMs) const {
    requireInterval(interval);
    const auto dayStart = core::dayStartMs(date);
    const auto dayEnd = dayStart + domain::kMillisPerDay;
    const auto closedBefore = std::min(dayEnd, domain::align_down_ms(nowMs, interval.ms));
    if (closedBefore <= dayStart) {
        return std::nullopt;
    }
    return requestFormFor(domain::TimeWindow{dayStart, closedBefore}, interval);
}

std::optional<std::string> BoundaryValidator::checkStructure(const BarSequence& bars, Interval interval) {
    if (bars.empty()) {
        return std::string{"sequence is empty"};
    }
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        std::ostringstream where;
        where << "row " << i << " (open_time " << bar.openTime << "): ";

        if (interval.valid() && !domain::on_grid(bar.openTime, interval.ms)) {
            return where.str() + "open_time is off the interval grid";
        }
        if (i > 0 && bar.openTime <= bars[i - 1].openTime) {
            return where.str() + "open_time does not increase";
        }
        if (bar.closeTime < bar.openTime) {
            return where.str() + "close_time precedes open_time";
        }
        if (!finite(bar.open) || !finite(bar.high) || !finite(bar.low) || !finite(bar.close) ||
            !finite(bar.volume)) {
            return where.str() + "non-finite OHLCV value";
        }
        if (bar.low > bar.high || bar.open < bar.low || bar.open > bar.high || bar.close < bar.low ||
            bar.close > bar.high) {
            return where.str() + "OHLC outside [low, high]";
        }
        if (bar.volume < 0.0) {
            return where.str() + "negative volume";
        }
    }
    return std::nullopt;
}

}  // namespace core::boundary
