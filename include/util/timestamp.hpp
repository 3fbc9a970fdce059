#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace wb::util {

using Clock = std::chrono::system_clock;

// ISO 8601 UTC with millisecond precision, e.g. 2026-10-18T07:16:02.123Z
inline std::string toIso8601(const Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t secs = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff…][Z]". Fractions beyond milliseconds are truncated;
// a missing zone designator is read as UTC.
inline Clock::time_point parseIso8601(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    long millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        int digits = 0;
        while (std::isdigit(ss.peek())) {
            const int d = ss.get() - '0';
            if (digits < 3) millis = millis * 10 + d;
            ++digits;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }

    return Clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

inline int64_t toEpochMillis(const Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

}
