#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Time constants and civil-calendar utilities for wall-clock nanosecond
// timestamps (market-local time; zone-aware inputs are shifted onto it)
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int64_t NS_PER_SEC    = 1'000'000'000LL;
constexpr int64_t NS_PER_MINUTE = 60LL * NS_PER_SEC;
constexpr int64_t NS_PER_HOUR   = 60LL * NS_PER_MINUTE;
constexpr int64_t NS_PER_DAY    = 24LL * NS_PER_HOUR;

struct CivilDate {
    int year = 1970;
    int month = 1;  // 1..12
    int day = 1;    // 1..31
};

// Days since 1970-01-01 for a proleptic Gregorian date.
inline int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

inline CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    CivilDate cd;
    cd.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    cd.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    cd.year = static_cast<int>(yoe + era * 400 + (cd.month <= 2 ? 1 : 0));
    return cd;
}

// Floor division so pre-1970 timestamps land on the correct day.
inline int64_t days_since_epoch(int64_t ts) {
    int64_t d = ts / NS_PER_DAY;
    if (ts < 0 && ts % NS_PER_DAY != 0) d -= 1;
    return d;
}

inline int64_t day_floor(int64_t ts) {
    return days_since_epoch(ts) * NS_PER_DAY;
}

inline int64_t make_timestamp(int y, int m, int d, int hh = 0, int mm = 0, int ss = 0) {
    return days_from_civil(y, m, d) * NS_PER_DAY
         + hh * NS_PER_HOUR + mm * NS_PER_MINUTE + ss * NS_PER_SEC;
}

inline int64_t month_floor(int64_t ts) {
    CivilDate cd = civil_from_days(days_since_epoch(ts));
    return days_from_civil(cd.year, cd.month, 1) * NS_PER_DAY;
}

// Calendar-month offset. The day-of-month and time of day are preserved, so
// callers are expected to pass first-of-month anchors.
inline int64_t add_months(int64_t ts, int months) {
    int64_t day = days_since_epoch(ts);
    int64_t time_of_day = ts - day * NS_PER_DAY;
    CivilDate cd = civil_from_days(day);
    int total = cd.year * 12 + (cd.month - 1) + months;
    int y = total / 12;
    int m = total % 12;
    if (m < 0) { m += 12; y -= 1; }
    return days_from_civil(y, m + 1, cd.day) * NS_PER_DAY + time_of_day;
}

// Inclusive count of calendar days touched by [first_ts, last_ts].
inline int64_t calendar_days_spanned(int64_t first_ts, int64_t last_ts) {
    if (last_ts < first_ts) return 0;
    return days_since_epoch(last_ts) - days_since_epoch(first_ts) + 1;
}

namespace detail {

inline bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += n;
    return true;
}

}  // namespace detail

// Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.fffffffff]]" or the same with a
// 'T' separator. A trailing 'Z' or +HH:MM / -HH:MM offset is accepted and the
// wall-clock value is kept.
inline int64_t parse_iso8601(const std::string& text) {
    std::string s = text;
    while (!s.empty() && (s.back() == ' ' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    size_t start = s.find_first_not_of(' ');
    if (start == std::string::npos) throw SchemaError("Empty timestamp");
    s = s.substr(start);

    auto fail = [&]() -> int64_t {
        throw SchemaError("Malformed ISO-8601 timestamp: '" + text + "'");
    };

    size_t pos = 0;
    int y = 0, mo = 0, d = 0, hh = 0, mi = 0, ss = 0;
    int64_t frac_ns = 0;
    if (!detail::read_digits(s, pos, 4, y)) return fail();
    if (pos >= s.size() || s[pos++] != '-') return fail();
    if (!detail::read_digits(s, pos, 2, mo)) return fail();
    if (pos >= s.size() || s[pos++] != '-') return fail();
    if (!detail::read_digits(s, pos, 2, d)) return fail();
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return fail();

    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        ++pos;
        if (!detail::read_digits(s, pos, 2, hh)) return fail();
        if (pos >= s.size() || s[pos++] != ':') return fail();
        if (!detail::read_digits(s, pos, 2, mi)) return fail();
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!detail::read_digits(s, pos, 2, ss)) return fail();
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                int64_t scale = NS_PER_SEC / 10;
                size_t digits = 0;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                    frac_ns += (s[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                    ++digits;
                }
                if (digits == 0) return fail();
            }
        }
        if (hh > 23 || mi > 59 || ss > 60) return fail();
    }

    if (pos < s.size()) {
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!detail::read_digits(s, pos, 2, oh)) return fail();
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!detail::read_digits(s, pos, 2, om)) return fail();
        }
        if (pos != s.size()) return fail();
    }

    return make_timestamp(y, mo, d, hh, mi, ss) + frac_ns;
}

// Fixed UTC offset of a zone label: "UTC", "Z", "+HH:MM", "-HHMM" or "+HH".
// Returns false for anything else (an IANA zone name).
inline bool parse_utc_offset(const std::string& tz, int64_t& offset_ns) {
    if (tz == "UTC" || tz == "Z" || tz == "Etc/UTC" || tz == "GMT") {
        offset_ns = 0;
        return true;
    }
    if (tz.size() < 3 || (tz[0] != '+' && tz[0] != '-')) return false;
    size_t pos = 1;
    int oh = 0, om = 0;
    if (!detail::read_digits(tz, pos, 2, oh)) return false;
    if (pos < tz.size() && tz[pos] == ':') ++pos;
    if (pos < tz.size() && !detail::read_digits(tz, pos, 2, om)) return false;
    if (pos != tz.size() || oh > 23 || om > 59) return false;
    offset_ns = (tz[0] == '-' ? -1 : 1) * (oh * NS_PER_HOUR + om * NS_PER_MINUTE);
    return true;
}

// Convert a UTC instant to the wall clock of `tz`. Named zones resolve through
// the system time-zone database, so DST transitions are honoured.
inline int64_t utc_to_local(int64_t utc_ns, const std::string& tz) {
    int64_t offset = 0;
    if (parse_utc_offset(tz, offset)) return utc_ns + offset;

    const std::chrono::time_zone* zone = nullptr;
    try {
        zone = std::chrono::locate_zone(tz);
    } catch (const std::runtime_error& e) {
        throw SchemaError("Unknown time zone '" + tz + "': " + e.what());
    }
    std::chrono::sys_time<std::chrono::nanoseconds> instant{std::chrono::nanoseconds(utc_ns)};
    auto info = zone->get_info(instant);
    return utc_ns + std::chrono::duration_cast<std::chrono::nanoseconds>(info.offset).count();
}

// "YYYY-MM-DDTHH:MM:SS", with fractional seconds only when present.
inline std::string format_iso8601(int64_t ts) {
    int64_t day = days_since_epoch(ts);
    int64_t rem = ts - day * NS_PER_DAY;
    CivilDate cd = civil_from_days(day);
    int hh = static_cast<int>(rem / NS_PER_HOUR);
    int mi = static_cast<int>((rem % NS_PER_HOUR) / NS_PER_MINUTE);
    int ss = static_cast<int>((rem % NS_PER_MINUTE) / NS_PER_SEC);
    int64_t frac = rem % NS_PER_SEC;

    char buf[48];
    if (frac == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                      cd.year, cd.month, cd.day, hh, mi, ss);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%09lld",
                      cd.year, cd.month, cd.day, hh, mi, ss,
                      static_cast<long long>(frac));
    }
    return buf;
}

}  // namespace time_utils
