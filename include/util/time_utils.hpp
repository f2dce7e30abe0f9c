#pragma once

/**
 * Time utilities
 *
 * Store timestamps are ISO-8601 UTC strings ("2026-03-01T12:00:00Z" or
 * "2026-03-01 12:00:00"). Helpers here convert between those strings and
 * Unix seconds without relying on the process time zone.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace edgeloop {
namespace util {

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic, for elapsed-time measurement only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline int64_t wall_clock_seconds() {
    return static_cast<int64_t>(wall_clock_ns() / 1'000'000'000ULL);
}

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

inline void civil_from_days(int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

/**
 * Format Unix seconds as "YYYY-MM-DDTHH:MM:SSZ".
 */
inline std::string format_iso8601(int64_t epoch_seconds) {
    int64_t days = epoch_seconds / 86400;
    int64_t rem = epoch_seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    unsigned month = 0, day = 0;
    civil_from_days(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", year, month, day, static_cast<int>(rem / 3600),
                  static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    return buf;
}

inline std::string utc_now_iso8601() {
    return format_iso8601(wall_clock_seconds());
}

/**
 * Parse an ISO-8601 timestamp into Unix seconds.
 *
 * Accepts a bare date, a 'T' or ' ' separator, optional fractional seconds
 * and an optional 'Z' or +HH:MM / -HH:MM offset. Returns false on anything
 * else; fractional seconds are truncated.
 */
inline bool parse_iso8601(const std::string& text, int64_t& epoch_seconds) {
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 || consumed != 10)
        return false;
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return false;

    size_t pos = 10;
    int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        int n = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &n) != 3 || n != 8)
            return false;
        pos += 1 + static_cast<size_t>(n);

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
                ++pos;
        }

        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                int oh = 0, om = 0, m = 0;
                if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &m) != 2 || m != 5)
                    return false;
                offset_seconds = (oh * 3600 + om * 60) * (c == '+' ? 1 : -1);
                pos += 1 + static_cast<size_t>(m);
            }
        }
    }
    if (pos != text.size())
        return false;
    if (hour > 23 || minute > 59 || second > 60)
        return false;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    epoch_seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return true;
}

/**
 * Calendar date ("YYYY-MM-DD") of a timestamp, in UTC.
 * Falls back to the first ten characters when the text does not parse.
 */
inline std::string calendar_date(const std::string& timestamp) {
    int64_t secs = 0;
    if (parse_iso8601(timestamp, secs))
        return format_iso8601(secs).substr(0, 10);
    return timestamp.substr(0, 10);
}

} // namespace util
} // namespace edgeloop
