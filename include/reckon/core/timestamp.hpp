#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <cctype>

namespace reckon::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;


// ============================================================================
// Helper: convert fixed-width digit run → integer safely
// ============================================================================
[[nodiscard]] inline bool parse_digits(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    int v = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}


// ============================================================================
// RFC3339 / ISO-8601 parser (example: 2023-01-02T10:22:33.123Z)
//
// Supports:
//   YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]
//   'T', 't' or ' ' as the date/time separator
//   no zone designator (interpreted as UTC)
//
// Always returns Timestamp in UTC (sys_time).
// ============================================================================
[[nodiscard]] inline bool parse_rfc3339(std::string_view sv, Timestamp& out) noexcept {
    using namespace std::chrono;

    // Minimum length: "YYYY-MM-DDTHH:MM:SS" (19 chars)
    if (sv.size() < 19) return false;

    // ---- Parse date ----
    int year = 0, mon = 0, day = 0;

    if (!parse_digits(sv.substr(0, 4), year)) return false;
    if (sv[4] != '-') return false;
    if (!parse_digits(sv.substr(5, 2), mon)) return false;
    if (sv[7] != '-') return false;
    if (!parse_digits(sv.substr(8, 2), day)) return false;

    // ---- Parse time ----
    if (sv[10] != 'T' && sv[10] != 't' && sv[10] != ' ') return false;

    int hour = 0, minute = 0, sec = 0;

    if (!parse_digits(sv.substr(11, 2), hour)) return false;
    if (sv[13] != ':') return false;
    if (!parse_digits(sv.substr(14, 2), minute)) return false;
    if (sv[16] != ':') return false;
    if (!parse_digits(sv.substr(17, 2), sec)) return false;

    if (hour > 23 || minute > 59 || sec > 60) return false;

    // ---- Fractional seconds (optional) ----
    nanoseconds extra_ns{0};

    size_t pos = 19;
    if (pos < sv.size() && (sv[pos] == '.' || sv[pos] == ',')) {
        size_t start = ++pos;
        while (pos < sv.size() && std::isdigit(static_cast<unsigned char>(sv[pos])))
            pos++;

        size_t digits = pos - start;
        if (digits == 0) return false;

        long long frac = 0;
        for (size_t i = 0; i < digits && i < 9; ++i) {
            frac = frac * 10 + (sv[start + i] - '0');
        }
        for (size_t i = digits; i < 9; ++i) {
            frac *= 10;
        }
        extra_ns = nanoseconds(frac);
    }

    // ---- Time-zone: Z, numeric offset, or absent (UTC) ----
    minutes offset{0};
    if (pos < sv.size()) {
        const char z = sv[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        }
        else if (z == '+' || z == '-') {
            // ±HH:MM or ±HHMM
            int oh = 0, om = 0;
            std::string_view rest = sv.substr(pos + 1);
            if (rest.size() == 5 && rest[2] == ':') {
                if (!parse_digits(rest.substr(0, 2), oh) || !parse_digits(rest.substr(3, 2), om)) return false;
            } else if (rest.size() == 4) {
                if (!parse_digits(rest.substr(0, 2), oh) || !parse_digits(rest.substr(2, 2), om)) return false;
            } else {
                return false;
            }
            if (oh > 23 || om > 59) return false;
            offset = hours(oh) + minutes(om);
            if (z == '-') offset = -offset;
            pos = sv.size();
        }
        else {
            return false;
        }
    }
    if (pos != sv.size()) return false;

    // =====================================================================
    // Build chrono date/time (narrowing-safe)
    // =====================================================================
    year_month_day ymd =
        std::chrono::year{year} /
        std::chrono::month{static_cast<unsigned>(mon)} /
        std::chrono::day{static_cast<unsigned>(day)};

    if (!ymd.ok()) return false;

    sys_days d{ymd};

    out = d +
          hours(hour) +
          minutes(minute) +
          seconds(sec) +
          extra_ns -
          offset;

    return true;
}


// ============================================================================
// Epoch milliseconds (integer timestamps emitted by some log sources)
// ============================================================================
// False when the instant does not fit the nanosecond clock (about year 1677..2262)
[[nodiscard]] inline bool from_epoch_ms(std::int64_t ms, Timestamp& out) noexcept {
    constexpr std::int64_t limit = std::chrono::nanoseconds::max().count() / 1'000'000;
    if (ms > limit || ms < -limit) {
        return false;
    }
    out = Timestamp{std::chrono::milliseconds(ms)};
    return true;
}


// ============================================================================
// RFC3339 Formatter (always UTC)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.sssZ        (millisecond precision values)
//   YYYY-MM-DDTHH:MM:SS.sssssssssZ  (otherwise)
// ============================================================================

[[nodiscard]] inline std::string to_string(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d; // time of day
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ns = duration_cast<nanoseconds>(tod - h - m - s).count();

    int year = int(ymd.year());
    unsigned mon = unsigned(ymd.month());
    unsigned day = unsigned(ymd.day());
    int hour = int(h.count());
    int minute = int(m.count());
    int sec = int(s.count());

    char buf[64];
    if (ns % 1'000'000 == 0) {
        std::snprintf(buf, sizeof(buf),
                      "%04d-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                      year, mon, day, hour, minute, sec,
                      static_cast<long long>(ns / 1'000'000));
    } else {
        std::snprintf(buf, sizeof(buf),
                      "%04d-%02u-%02uT%02d:%02d:%02d.%09lldZ",
                      year, mon, day, hour, minute, sec,
                      static_cast<long long>(ns));
    }

    return std::string(buf);
}

} // namespace reckon::core
