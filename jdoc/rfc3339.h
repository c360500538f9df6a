#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace jdoc {

using Timestamp = std::chrono::system_clock::time_point;

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian date.
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr bool is_leap(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr unsigned days_in_month(int y, unsigned m) noexcept {
    constexpr unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : table[m - 1];
}

inline bool read_digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
    if (pos + n > s.size()) return false;
    out = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

} // namespace detail

/**
 * Parse an RFC 3339 timestamp such as "2019-10-12T07:20:50.52Z" or
 * "2019-10-12T09:20:50+02:00". Fractional seconds are kept to nanosecond
 * precision.
 *
 * Returns std::nullopt if the text is not a valid RFC 3339 date-time.
 */
inline std::optional<Timestamp> parse_rfc3339(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!detail::read_digits(s, 0, 4, year) || s.size() < 20 || s[4] != '-'
        || !detail::read_digits(s, 5, 2, month) || s[7] != '-'
        || !detail::read_digits(s, 8, 2, day) || s[10] != 'T'
        || !detail::read_digits(s, 11, 2, hour) || s[13] != ':'
        || !detail::read_digits(s, 14, 2, minute) || s[16] != ':'
        || !detail::read_digits(s, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || static_cast<unsigned>(day) > detail::days_in_month(year, static_cast<unsigned>(month))) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (s[pos] == '.') {
        ++pos;
        std::size_t start = pos;
        std::int64_t scale = 100000000;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            nanos += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    std::int64_t offset_seconds = 0;
    if (pos < s.size() && s[pos] == 'Z') {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int oh = 0, om = 0;
        if (!detail::read_digits(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':'
            || !detail::read_digits(s, pos + 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::int64_t days = detail::days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

} // namespace jdoc
