#pragma once

#include <string>

#include "core/Clock.hpp"
#include "domain/Types.h"

namespace domain {

// A backend that serves bars for a symbol/interval over a time range.
//
// startTime and endTime are passed through exactly as given: which edges are
// inclusive, and how off-grid values round, is the backend's own behaviour.
// Implementations throw kvault::common::FetchError subclasses for backend
// failures and std::invalid_argument for requests they cannot express, such
// as an interval for which supportsInterval() is false.
class IKlineSource {
public:
    virtual ~IKlineSource() = default;

    virtual const std::string& id() const noexcept = 0;

    virtual bool supportsInterval(Interval interval) const noexcept { return interval.dividesDay(); }

    virtual BarSequence fetchKlines(const std::string& symbol,
                                    Interval interval,
                                    TimestampMs startTime,
                                    TimestampMs endTime,
                                    const core::Deadline& deadline) = 0;
};

// A bulk backend that also publishes whole months in one file.
class IArchiveSource : public IKlineSource {
public:
    virtual BarSequence fetchMonth(const std::string& symbol,
                                   Interval interval,
                                   int year,
                                   int month,
                                   const core::Deadline& deadline) = 0;
};

std::string to_string(Interval interval);
// Throws std::invalid_argument for labels that are not a positive duration
// whose length divides one day.
Interval interval_from_string(const std::string& value);

}  // namespace domain
