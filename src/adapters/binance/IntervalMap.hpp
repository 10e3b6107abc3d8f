#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

std::string binance_interval(domain::Interval interval);
domain::Interval from_binance_interval(const std::string &value);

namespace detail {

struct IntervalEntry {
    std::string_view literal;
    domain::TimestampMs ms;
};

// Binance intervals that fit whole into a UTC day. 3d, 1w and 1M exist on the
// exchange but cannot be held by daily partitions.
inline constexpr std::array<IntervalEntry, 13> kIntervals{{
    {"1s", 1'000},
    {"1m", 60'000},
    {"3m", 3 * 60'000},
    {"5m", 5 * 60'000},
    {"15m", 15 * 60'000},
    {"30m", 30 * 60'000},
    {"1h", 60 * 60'000},
    {"2h", 2 * 60 * 60'000},
    {"4h", 4 * 60 * 60'000},
    {"6h", 6 * 60 * 60'000},
    {"8h", 8 * 60 * 60'000},
    {"12h", 12 * 60 * 60'000},
    {"1d", 24 * 60 * 60'000},
}};

constexpr std::string_view binance_interval_literal(domain::Interval interval) {
    for (const auto &entry : kIntervals) {
        if (entry.ms == interval.ms) {
            return entry.literal;
        }
    }
    throw std::invalid_argument("Unsupported domain interval");
}

constexpr domain::Interval from_binance_interval_literal(std::string_view value) {
    for (const auto &entry : kIntervals) {
        if (entry.literal == value) {
            return domain::Interval{entry.ms};
        }
    }
    throw std::invalid_argument("Unsupported Binance interval");
}

} // namespace detail

static_assert(detail::binance_interval_literal(domain::Interval{60'000}) == std::string_view{"1m"});
static_assert(detail::binance_interval_literal(domain::Interval{4 * 60 * 60'000}) == std::string_view{"4h"});
static_assert(detail::from_binance_interval_literal("1s").ms == 1'000);
static_assert(detail::from_binance_interval_literal("1d").ms == 24 * 60 * 60'000);

bool is_supported_interval(domain::Interval interval) noexcept;

} // namespace adapters::binance
