#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <ostream>
#include <string>

#include "reckon/config/error.hpp"
#include "reckon/core/decimal.hpp"


namespace reckon::config {

/*
===============================================================================
Engine defaults
===============================================================================

All defaults are compile-time constants; a run may override them through a
JSON config file and command-line options. Once validated, an Engine value is
immutable for the duration of the run.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Balance comparison (0.005 absolute)
// -----------------------------------------------------------------------------
inline constexpr core::Decimal DEFAULT_TOLERANCE = core::Decimal::from_units(5, 3);

// -----------------------------------------------------------------------------
// Rounding policy
// -----------------------------------------------------------------------------
inline constexpr int DEFAULT_DECIMALS = 2;
inline constexpr core::RoundingMode DEFAULT_ROUNDING_MODE = core::RoundingMode::HalfUp;

// -----------------------------------------------------------------------------
// Detectors
// -----------------------------------------------------------------------------
inline constexpr double DEFAULT_MAD_THRESHOLD = 6.0;
inline constexpr std::chrono::milliseconds DEFAULT_BURST_WINDOW{1000};
inline constexpr std::chrono::seconds DEFAULT_RAPID_REPEAT_WINDOW{60};
// Widest rapid-repeat window (either sign) whose millisecond count fits int64
inline constexpr std::int64_t MAX_RAPID_REPEAT_WINDOW_S = std::numeric_limits<std::int64_t>::max() / 1000;
inline constexpr int DEFAULT_BUSINESS_START_HOUR = 8;
inline constexpr int DEFAULT_BUSINESS_END_HOUR = 18;
inline constexpr std::size_t DEFAULT_ROUNDING_PATTERN_MIN_OCCURRENCES = 3;
inline constexpr core::Decimal DEFAULT_ROUNDING_PATTERN_MAX_MAGNITUDE = core::Decimal::from_int(1);

// Currencies whose minor unit differs from the default
inline std::map<std::string, int> default_currency_decimals() {
    return {{"SAR", 3}, {"BHD", 4}};
}

// Currencies recognized at the default precision (no unknown-currency signal)
inline std::set<std::string> default_known_currencies() {
    return {"AED", "EGP", "EUR", "GBP", "QAR", "USD"};
}


// Window during which balance activity is expected (local time = UTC + offset)
struct BusinessHours {
    int start_hour = DEFAULT_BUSINESS_START_HOUR;  // inclusive
    int end_hour = DEFAULT_BUSINESS_END_HOUR;      // exclusive
    int utc_offset_minutes = 0;
    bool flag_weekends = true;
};


struct Engine {
    // Ledger
    core::Decimal tolerance = DEFAULT_TOLERANCE;
    int default_decimals = DEFAULT_DECIMALS;
    core::RoundingMode rounding_mode = DEFAULT_ROUNDING_MODE;
    std::map<std::string, int> currency_decimals = default_currency_decimals();
    std::set<std::string> known_currencies = default_known_currencies();

    // Anomaly detection
    double mad_threshold = DEFAULT_MAD_THRESHOLD;
    std::chrono::milliseconds burst_window = DEFAULT_BURST_WINDOW;
    std::chrono::milliseconds rapid_repeat_window = DEFAULT_RAPID_REPEAT_WINDOW;
    BusinessHours business_hours{};
    std::size_t rounding_pattern_min_occurrences = DEFAULT_ROUNDING_PATTERN_MIN_OCCURRENCES;
    core::Decimal rounding_pattern_max_magnitude = DEFAULT_ROUNDING_PATTERN_MAX_MAGNITUDE;

    // Execution
    unsigned workers = 1;

    void dump(const std::string& header, std::ostream& os) const;
};

// Structural validation; must pass before any ledger is built
[[nodiscard]] Error validate(const Engine& cfg) noexcept;

} // namespace reckon::config
