#pragma once

/**
 * Time utilities for the session orchestrator
 *
 * Wall-clock timestamps, civil-date arithmetic and US Eastern session time
 * conversion. Exchange calendars publish open/close as New York wall-clock
 * times; everything inside the system is UTC nanoseconds.
 */

#include "../types.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace mpt {
namespace util {

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline Timestamp wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

// ============================================================================
// Civil dates (proleptic Gregorian, days since 1970-01-01)
// ============================================================================

struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const CivilDate&) const = default;
    auto operator<=>(const CivilDate&) const = default;
};

constexpr int64_t days_from_civil(int year, unsigned month, unsigned day) {
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

constexpr CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

// 0 = Sunday
constexpr unsigned weekday_from_days(int64_t z) {
    return static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

constexpr int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

// Day number of the n-th Sunday (1-based) of a month
constexpr int64_t nth_sunday(int year, unsigned month, int n) {
    const int64_t first = days_from_civil(year, month, 1);
    const int64_t first_sunday = first + (7 - weekday_from_days(first)) % 7;
    return first_sunday + 7 * (n - 1);
}

// ============================================================================
// US Eastern time
// ============================================================================

/**
 * Whether US Eastern daylight time is in effect at a UTC instant.
 * Rule in force since 2007: second Sunday of March 02:00 EST (07:00 UTC)
 * through first Sunday of November 02:00 EDT (06:00 UTC).
 */
constexpr bool is_eastern_dst(int64_t utc_seconds) {
    const int year = civil_from_days(floor_div(utc_seconds, 86400)).year;
    const int64_t start = nth_sunday(year, 3, 2) * 86400 + 7 * 3600;
    const int64_t end = nth_sunday(year, 11, 1) * 86400 + 6 * 3600;
    return utc_seconds >= start && utc_seconds < end;
}

constexpr int64_t eastern_offset_seconds(int64_t utc_seconds) {
    return is_eastern_dst(utc_seconds) ? -4 * 3600 : -5 * 3600;
}

/**
 * Convert a New York wall-clock time to UTC nanoseconds.
 */
constexpr Timestamp eastern_to_utc_ns(const CivilDate& date, int hour, int minute) {
    const int64_t local = days_from_civil(date.year, date.month, date.day) * 86400 + hour * 3600 + minute * 60;
    const int64_t as_edt = local + 4 * 3600;
    const int64_t utc = is_eastern_dst(as_edt) ? as_edt : local + 5 * 3600;
    return utc * NS_PER_SECOND;
}

/**
 * Calendar date in New York at a UTC instant ("today" for the exchange).
 */
constexpr CivilDate eastern_date(Timestamp utc_ns) {
    const int64_t utc_s = floor_div(utc_ns, NS_PER_SECOND);
    const int64_t local = utc_s + eastern_offset_seconds(utc_s);
    return civil_from_days(floor_div(local, 86400));
}

// ============================================================================
// Formatting / parsing
// ============================================================================

inline std::string format_date(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", d.year, d.month, d.day);
    return buf;
}

/**
 * UTC timestamp as "YYYY-MM-DDTHH:MM:SSZ" (RFC 3339, second precision).
 */
inline std::string format_utc(Timestamp ns) {
    const int64_t secs = floor_div(ns, NS_PER_SECOND);
    const int64_t days = floor_div(secs, 86400);
    const int64_t sod = secs - days * 86400;
    const CivilDate d = civil_from_days(days);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", d.year, d.month, d.day,
                  static_cast<int>(sod / 3600), static_cast<int>((sod % 3600) / 60), static_cast<int>(sod % 60));
    return buf;
}

/**
 * Parse "YYYY-MM-DD".
 */
inline std::optional<CivilDate> parse_date(const std::string& s) {
    int y = 0;
    unsigned m = 0, d = 0;
    if (s.size() < 10 || std::sscanf(s.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }
    return CivilDate{y, m, d};
}

/**
 * Parse "HH:MM" into minutes since midnight.
 */
inline std::optional<int> parse_hhmm(const std::string& s) {
    int h = 0, m = 0;
    if (std::sscanf(s.c_str(), "%2d:%2d", &h, &m) != 2) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || m < 0 || m > 59) {
        return std::nullopt;
    }
    return h * 60 + m;
}

/**
 * Parse an RFC 3339 timestamp ("2024-03-11T13:30:00Z",
 * "2024-03-11T09:30:00.123-04:00") to UTC nanoseconds.
 */
inline std::optional<Timestamp> parse_rfc3339(const std::string& s) {
    int y = 0, hh = 0, mm = 0, ss = 0;
    unsigned mo = 0, d = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &y, &mo, &d, &hh, &mm, &ss, &consumed) != 6) {
        return std::nullopt;
    }

    int64_t frac_ns = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        int64_t scale = 100'000'000;
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            frac_ns += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    int64_t offset = 0;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
            return std::nullopt;
        }
        offset = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
    } else if (pos >= s.size() || (s[pos] != 'Z' && s[pos] != 'z')) {
        return std::nullopt;
    }

    const int64_t secs = days_from_civil(y, mo, d) * 86400 + hh * 3600 + mm * 60 + ss - offset;
    return secs * NS_PER_SECOND + frac_ns;
}

} // namespace util
} // namespace mpt
