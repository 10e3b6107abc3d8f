#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = std::int64_t;
using TradeCount = std::int64_t;
using Symbol = std::string;

constexpr TimestampMs kMillisPerDay = 86'400'000;

struct Interval {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
    // Daily partitions need every bar of a day to open inside that day.
    constexpr bool dividesDay() const noexcept { return valid() && kMillisPerDay % ms == 0; }
    constexpr bool operator==(const Interval& other) const noexcept { return ms == other.ms; }
    constexpr bool operator!=(const Interval& other) const noexcept { return ms != other.ms; }
};

inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    if (step <= 0) {
        return t;
    }
    const auto rem = t % step;
    return rem < 0 ? t - rem - step : t - rem;
}

inline TimestampMs align_up_ms(TimestampMs t, TimestampMs step) {
    const auto down = align_down_ms(t, step);
    return down == t ? t : down + step;
}

inline bool on_grid(TimestampMs t, TimestampMs step) {
    return step > 0 && align_down_ms(t, step) == t;
}

// A requested span of time. Which of the two edges is inclusive is decided by
// the boundary rules of the incremental backend, never by this type.
struct TimeWindow {
    TimestampMs start{0};
    TimestampMs end{0};
    bool valid() const noexcept { return start < end; }
};

struct Bar {
    TimestampMs openTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
    TimestampMs closeTime{0};
    double quoteVolume{0};
    TradeCount trades{0};
    double takerBuyBaseVolume{0};
    double takerBuyQuoteVolume{0};
};

using BarSequence = std::vector<Bar>;

// A UTC calendar day. Cache partitions are keyed by it.
struct CalendarDate {
    int year{1970};
    int month{1};
    int day{1};

    bool operator==(const CalendarDate& other) const noexcept {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const noexcept { return !(*this == other); }
    bool operator<(const CalendarDate& other) const noexcept {
        if (year != other.year) {
            return year < other.year;
        }
        if (month != other.month) {
            return month < other.month;
        }
        return day < other.day;
    }
};

enum class MarketType { Spot, FuturesUsdt, FuturesCoin };

inline const char* market_type_label(MarketType type) {
    switch (type) {
    case MarketType::Spot:
        return "spot";
    case MarketType::FuturesUsdt:
        return "um";
    case MarketType::FuturesCoin:
        return "cm";
    }
    return "spot";
}

inline std::optional<MarketType> market_type_from_label(std::string_view label) {
    std::string lower{label};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "spot") {
        return MarketType::Spot;
    }
    if (lower == "um" || lower == "futures_usdt" || lower == "usdt") {
        return MarketType::FuturesUsdt;
    }
    if (lower == "cm" || lower == "futures_coin" || lower == "coin") {
        return MarketType::FuturesCoin;
    }
    return std::nullopt;
}

// Caller-side override of the source selection.
enum class SourceOverride { Auto, Incremental, Archive, CacheOnly, Refresh };

enum class FetchDecision { UseCache, CacheStale, FetchFresh, Failover };

enum class CircuitState { Closed, Open, HalfOpen };

inline const char* fetch_decision_label(FetchDecision decision) {
    switch (decision) {
    case FetchDecision::UseCache:
        return "USE_CACHE";
    case FetchDecision::CacheStale:
        return "CACHE_STALE";
    case FetchDecision::FetchFresh:
        return "FETCH_FRESH";
    case FetchDecision::Failover:
        return "FAILOVER";
    }
    return "UNKNOWN";
}

inline const char* circuit_state_label(CircuitState state) {
    switch (state) {
    case CircuitState::Closed:
        return "CLOSED";
    case CircuitState::Open:
        return "OPEN";
    case CircuitState::HalfOpen:
        return "HALF_OPEN";
    }
    return "UNKNOWN";
}

inline std::string interval_label(const Interval& interval) {
    if (!interval.valid()) {
        return "";
    }

    const auto ms = interval.ms;
    if (ms % 86'400'000 == 0) {
        const auto days = ms / 86'400'000;
        return std::to_string(days) + "d";
    }
    if (ms % 3'600'000 == 0) {
        const auto hours = ms / 3'600'000;
        return std::to_string(hours) + "h";
    }
    if (ms % 60'000 == 0) {
        const auto minutes = ms / 60'000;
        return std::to_string(minutes) + "m";
    }
    if (ms % 1'000 == 0) {
        const auto seconds = ms / 1'000;
        return std::to_string(seconds) + "s";
    }
    return std::to_string(ms) + "ms";
}

inline Interval interval_from_label(std::string_view label) {
    Interval interval{};
    if (label.empty()) {
        return interval;
    }

    std::size_t idx = 0;
    while (idx < label.size() && std::isspace(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }

    std::size_t startDigits = idx;
    while (idx < label.size() && std::isdigit(static_cast<unsigned char>(label[idx])) != 0) {
        ++idx;
    }
    if (startDigits == idx || idx - startDigits > 9) {
        return interval;
    }

    const long long value = std::stoll(std::string(label.substr(startDigits, idx - startDigits)));
    if (value <= 0) {
        return interval;
    }

    if (idx >= label.size()) {
        return interval;
    }

    long long multiplier = 0;
    // Case matters: "1M" is a calendar month, which no day-partitioned cache can hold.
    switch (label[idx]) {
    case 's':
        multiplier = 1'000;
        break;
    case 'm':
        multiplier = 60'000;
        break;
    case 'h':
        multiplier = 3'600'000;
        break;
    case 'd':
        multiplier = 86'400'000;
        break;
    default:
        return interval;
    }
    if (idx + 1 != label.size()) {
        return interval;
    }

    interval.ms = value * multiplier;
    return interval;
}

}  // namespace domain
