#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace ModelFusion {

namespace datetime_detail {

constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Reads exactly `count` digits at `pos`
constexpr bool read_fixed(std::string_view s, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < count; i ++) {
        char c = s[pos + i];
        if (!is_digit(c)) return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

constexpr bool expect(std::string_view s, std::size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        pos ++;
        return true;
    }
    return false;
}

constexpr bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr int days_in_month(int y, int m) {
    constexpr int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
}

} // namespace datetime_detail


// Calendar timestamp with microsecond resolution. Naive unless utcOffsetMinutes is set.
struct DateTime {
    int year        = 1970;
    int month       = 1;
    int day         = 1;
    int hour        = 0;
    int minute      = 0;
    int second      = 0;
    int microsecond = 0;
    std::optional<int> utcOffsetMinutes;

    // Offset-carrying values compare as instants; a naive value never equals an aware one
    friend bool operator==(const DateTime& lhs, const DateTime& rhs) {
        if (lhs.utcOffsetMinutes.has_value() != rhs.utcOffsetMinutes.has_value()) {
            return false;
        }
        if (lhs.utcOffsetMinutes) {
            return lhs.toTimePoint() == rhs.toTimePoint();
        }
        return std::tie(lhs.year, lhs.month, lhs.day, lhs.hour, lhs.minute, lhs.second, lhs.microsecond)
            == std::tie(rhs.year, rhs.month, rhs.day, rhs.hour, rhs.minute, rhs.second, rhs.microsecond);
    }

    // YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|+HH:MM|-HH:MM|+HHMM|-HHMM]
    static constexpr std::optional<DateTime> parse(std::string_view s) {
        using namespace datetime_detail;
        DateTime dt;
        std::size_t pos = 0;

        if (!read_fixed(s, pos, 4, dt.year) || !expect(s, pos, '-')
            || !read_fixed(s, pos, 2, dt.month) || !expect(s, pos, '-')
            || !read_fixed(s, pos, 2, dt.day)) {
            return std::nullopt;
        }
        if (dt.year < 1 || dt.month < 1 || dt.month > 12
            || dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) {
            return std::nullopt;
        }
        if (pos == s.size()) {
            return dt;
        }

        const char sep = s[pos ++];
        if (sep != 'T' && sep != 't' && sep != ' ') {
            return std::nullopt;
        }
        if (!read_fixed(s, pos, 2, dt.hour) || !expect(s, pos, ':')
            || !read_fixed(s, pos, 2, dt.minute)) {
            return std::nullopt;
        }
        if (expect(s, pos, ':')) {
            if (!read_fixed(s, pos, 2, dt.second)) {
                return std::nullopt;
            }
            if (expect(s, pos, '.') || expect(s, pos, ',')) {
                std::size_t digits = 0;
                int micro = 0;
                while (pos < s.size() && is_digit(s[pos])) {
                    if (digits < 6) {
                        micro = micro * 10 + (s[pos] - '0');
                    }
                    digits ++;
                    pos ++;
                }
                if (digits == 0 || digits > 9) {
                    return std::nullopt;
                }
                for (std::size_t d = digits; d < 6; d ++) micro *= 10;
                dt.microsecond = micro;
            }
        }
        if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) {
            return std::nullopt;
        }

        if (pos < s.size()) {
            const char tz = s[pos];
            if (tz == 'Z' || tz == 'z') {
                pos ++;
                dt.utcOffsetMinutes = 0;
            } else if (tz == '+' || tz == '-') {
                pos ++;
                int hh = 0, mm = 0;
                if (!read_fixed(s, pos, 2, hh)) return std::nullopt;
                expect(s, pos, ':');
                if (!read_fixed(s, pos, 2, mm)) return std::nullopt;
                if (hh > 23 || mm > 59) return std::nullopt;
                dt.utcOffsetMinutes = (tz == '-' ? -1 : 1) * (hh * 60 + mm);
            } else {
                return std::nullopt;
            }
        }
        if (pos != s.size()) {
            return std::nullopt;
        }
        return dt;
    }

    std::string toIsoString() const {
        std::string out = std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                                      year, month, day, hour, minute, second);
        if (microsecond != 0) {
            out += std::format(".{:06}", microsecond);
        }
        if (utcOffsetMinutes) {
            const int off = *utcOffsetMinutes;
            const int abs = off < 0 ? -off : off;
            out += std::format("{}{:02}:{:02}", off < 0 ? '-' : '+', abs / 60, abs % 60);
        }
        return out;
    }

    // Naive UTC timestamp, truncated to microseconds
    static DateTime fromTimePoint(std::chrono::system_clock::time_point tp) {
        using namespace std::chrono;
        const auto us   = floor<microseconds>(tp);
        const auto days = floor<std::chrono::days>(us);
        const year_month_day ymd{days};
        const hh_mm_ss hms{us - days};

        DateTime dt;
        dt.year        = static_cast<int>(ymd.year());
        dt.month       = static_cast<int>(static_cast<unsigned>(ymd.month()));
        dt.day         = static_cast<int>(static_cast<unsigned>(ymd.day()));
        dt.hour        = static_cast<int>(hms.hours().count());
        dt.minute      = static_cast<int>(hms.minutes().count());
        dt.second      = static_cast<int>(hms.seconds().count());
        dt.microsecond = static_cast<int>(hms.subseconds().count());
        return dt;
    }

    // Naive values are taken as UTC
    std::chrono::system_clock::time_point toTimePoint() const {
        using namespace std::chrono;
        const sys_days d{std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)}
                         / std::chrono::day{static_cast<unsigned>(day)}};
        sys_time<microseconds> t = d + hours{hour} + minutes{minute} + seconds{second}
                                   + microseconds{microsecond};
        if (utcOffsetMinutes) {
            t -= minutes{*utcOffsetMinutes};
        }
        return time_point_cast<system_clock::duration>(t);
    }

    static DateTime now() {
        return fromTimePoint(std::chrono::system_clock::now());
    }
};

} // namespace ModelFusion
