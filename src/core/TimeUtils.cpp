#include "core/TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::tm gmtime_compat(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool allDigits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::optional<std::int64_t> parseWithFormat(const std::string& text, const char* format) {
    std::tm tm{};
    std::istringstream input(text);
    input >> std::get_time(&tm, format);
    if (input.fail()) {
        return std::nullopt;
    }
    input >> std::ws;
    if (!input.eof()) {
        return std::nullopt;
    }
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    if (raw < 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(raw) * TimeUtils::kMillisPerSecond;
}

}  // namespace

int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

domain::TimestampMs dayStartMs(const domain::CalendarDate& date) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day;
    tm.tm_isdst = 0;
    return static_cast<domain::TimestampMs>(timegm_compat(&tm)) * TimeUtils::kMillisPerSecond;
}

domain::CalendarDate dateOf(domain::TimestampMs ts) {
    const auto dayStart = domain::align_down_ms(ts, TimeUtils::kMillisPerDay);
    const auto tm = gmtime_compat(static_cast<std::time_t>(dayStart / TimeUtils::kMillisPerSecond));
    return domain::CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

domain::CalendarDate addDays(const domain::CalendarDate& date, int days) {
    return dateOf(dayStartMs(date) + static_cast<domain::TimestampMs>(days) * TimeUtils::kMillisPerDay);
}

std::string formatIsoDate(const domain::CalendarDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

std::string formatCompactDate(const domain::CalendarDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << std::setw(2) << date.month << std::setw(2)
        << date.day;
    return oss.str();
}

std::string formatMonth(int year, int month) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month;
    return oss.str();
}

std::string formatTimestamp(domain::TimestampMs ts) {
    const auto seconds = domain::align_down_ms(ts, TimeUtils::kMillisPerSecond) / TimeUtils::kMillisPerSecond;
    const auto millis = ts - seconds * TimeUtils::kMillisPerSecond;
    const auto tm = gmtime_compat(static_cast<std::time_t>(seconds));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
        << 'Z';
    return oss.str();
}

std::optional<domain::CalendarDate> parseDate(std::string_view text) {
    domain::CalendarDate date{};
    if (text.size() == 8 && allDigits(text)) {
        date.year = std::stoi(std::string(text.substr(0, 4)));
        date.month = std::stoi(std::string(text.substr(4, 2)));
        date.day = std::stoi(std::string(text.substr(6, 2)));
    } else if (text.size() == 10 && text[4] == '-' && text[7] == '-' && allDigits(text.substr(0, 4)) &&
               allDigits(text.substr(5, 2)) && allDigits(text.substr(8, 2))) {
        date.year = std::stoi(std::string(text.substr(0, 4)));
        date.month = std::stoi(std::string(text.substr(5, 2)));
        date.day = std::stoi(std::string(text.substr(8, 2)));
    } else {
        return std::nullopt;
    }

    if (date.year < 1970 || date.month < 1 || date.month > 12 || date.day < 1 ||
        date.day > daysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

std::optional<domain::TimestampMs> parseTimestamp(std::string_view text, domain::TimestampMs nowMs) {
    std::string value{text};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (value.empty()) {
        return std::nullopt;
    }
    if (value == "now") {
        return nowMs;
    }
    if (auto date = parseDate(value)) {
        return dayStartMs(*date);
    }
    if (allDigits(value)) {
        if (value.size() > 18) {
            return std::nullopt;
        }
        return normalizeEpochMs(std::stoll(value));
    }
    if (!value.empty() && value.back() == 'z') {
        value.pop_back();
    }
    std::replace(value.begin(), value.end(), 't', ' ');
    if (auto parsed = parseWithFormat(value, "%Y-%m-%d %H:%M:%S")) {
        return parsed;
    }
    return parseWithFormat(value, "%Y-%m-%d %H:%M");
}

}  // namespace core
