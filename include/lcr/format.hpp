#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format a duration given in nanoseconds into a human-readable string
// Examples:
//   42        -> "42.00 ns"
//   1'234     -> "1.23 us"
//   12'345'678 -> "12.3 ms"
//   3'456'000'000 -> "3.46 s"
inline std::string format_duration(std::uint64_t ns) {
    double value = static_cast<double>(ns);
    const char* unit = "ns";

    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "us";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "ms";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "s";
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format a ratio as a percentage with one decimal
// Example: (3, 40) -> "7.5%"
inline std::string format_percent(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0) {
        return "0.0%";
    }
    return std::format("{:.1f}%", 100.0 * static_cast<double>(part) / static_cast<double>(whole));
}

} // namespace lcr
