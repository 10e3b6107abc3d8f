#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace core {

namespace TimeUtils {
constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerDay = domain::kMillisPerDay;
// Values at or above this are microsecond epochs, not milliseconds.
constexpr std::int64_t kMicrosecondThreshold = 1'000'000'000'000'000LL;
}  // namespace TimeUtils

domain::TimestampMs dayStartMs(const domain::CalendarDate& date);
domain::CalendarDate dateOf(domain::TimestampMs ts);
domain::CalendarDate addDays(const domain::CalendarDate& date, int days);
int daysInMonth(int year, int month);

// "2024-03-01"
std::string formatIsoDate(const domain::CalendarDate& date);
// "20240301", used in cache file names.
std::string formatCompactDate(const domain::CalendarDate& date);
// "2024-03"
std::string formatMonth(int year, int month);
std::string formatTimestamp(domain::TimestampMs ts);

// Accepts YYYY-MM-DD or YYYYMMDD.
std::optional<domain::CalendarDate> parseDate(std::string_view text);

// Accepts "now", a date (midnight UTC), YYYY-MM-DDTHH:MM[:SS] or a raw
// millisecond epoch. Returns nullopt when the text matches none of them.
std::optional<domain::TimestampMs> parseTimestamp(std::string_view text, domain::TimestampMs nowMs);

inline domain::TimestampMs normalizeEpochMs(std::int64_t raw) {
    return raw >= TimeUtils::kMicrosecondThreshold ? raw / 1000 : raw;
}

}  // namespace core
