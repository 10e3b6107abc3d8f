#include "domain/exchange/IKlineSource.hpp"

#include <stdexcept>

namespace domain {

std::string to_string(Interval interval) {
    return interval_label(interval);
}

Interval interval_from_string(const std::string& value) {
    const Interval parsed = interval_from_label(value);
    if (!parsed.valid()) {
        throw std::invalid_argument("Unsupported interval string: " + value);
    }
    if (!parsed.dividesDay()) {
        throw std::invalid_argument("Interval does not divide a day: " + value);
    }
    return parsed;
}

}  // namespace domain
