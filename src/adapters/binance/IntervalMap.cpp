#include "adapters/binance/IntervalMap.hpp"

#include <algorithm>

namespace adapters::binance {

std::string binance_interval(domain::Interval interval) {
    return std::string(detail::binance_interval_literal(interval));
}

domain::Interval from_binance_interval(const std::string &value) {
    return detail::from_binance_interval_literal(value);
}

bool is_supported_interval(domain::Interval interval) noexcept {
    return std::any_of(detail::kIntervals.begin(), detail::kIntervals.end(),
                       [&](const detail::IntervalEntry &entry) { return entry.ms == interval.ms; });
}

} // namespace adapters::binance
