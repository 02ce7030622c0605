#pragma once

/**
 * Time utilities for the monitoring client
 *
 * Wall-clock helpers for message timestamps: ISO-8601 parsing and local
 * HH:MM:SS rendering.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace exomon {
namespace util {

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Render a Unix time as local "HH:MM:SS".
 */
inline std::string format_local_hms(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

inline std::string now_local_hms() {
    return format_local_hms(std::time(nullptr));
}

namespace detail {

// Reads exactly `count` digits at `pos`, advancing it.
inline bool read_digits(std::string_view s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size())
        return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

inline bool expect(std::string_view s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

inline int days_in_month(int year, int month) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : days[month - 1];
}

} // namespace detail

/**
 * Parse an ISO-8601 instant into Unix time.
 *
 * Accepted: YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]][Z|+HH:MM|-HH:MM|+HHMM|+HH]]
 * A bare date is local midnight. A timestamp without a zone designator is
 * taken as local wall time. The day must exist in its month.
 * Fractional seconds are truncated.
 *
 * @return nullopt if the text is not a valid instant
 */
inline std::optional<std::time_t> parse_iso8601(std::string_view text) {
    using detail::expect;
    using detail::read_digits;

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > detail::days_in_month(year, month))
        return std::nullopt;

    bool date_only = pos == text.size();
    if (!date_only) {
        if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')
            return std::nullopt;
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') || !read_digits(text, pos, 2, minute))
            return std::nullopt;
    }

    if (!date_only && pos < text.size() && text[pos] == ':') {
        ++pos;
        if (!read_digits(text, pos, 2, second))
            return std::nullopt;
        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            ++pos;
            size_t frac_start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
                ++pos;
            if (pos == frac_start)
                return std::nullopt;
        }
    }

    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    if (pos == text.size()) {
        // No zone designator: local wall time
        tm.tm_isdst = -1;
        std::time_t local = std::mktime(&tm);
        if (local == static_cast<std::time_t>(-1))
            return std::nullopt;
        return local;
    }

    int offset_seconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        ++pos;
        int off_h = 0, off_m = 0;
        if (!read_digits(text, pos, 2, off_h))
            return std::nullopt;
        if (pos < text.size()) {
            if (text[pos] == ':')
                ++pos;
            if (!read_digits(text, pos, 2, off_m))
                return std::nullopt;
        }
        if (off_h > 23 || off_m > 59)
            return std::nullopt;
        offset_seconds = (off_h * 3600 + off_m * 60) * (zone == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    if (pos != text.size())
        return std::nullopt;

    std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1))
        return std::nullopt;
    return utc - offset_seconds;
}

}  // namespace util
}  // namespace exomon
