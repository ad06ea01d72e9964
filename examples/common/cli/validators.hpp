#pragma once

#include <charconv>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "reckon/core/decimal.hpp"
#include "lcr/log/logger.hpp"


namespace reckon::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level level;
        if (lcr::log::parse_level(value, level)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Exact decimal validator (e.g. 0.005)
// -------------------------------------------------------------
inline auto decimal_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::Decimal d;
        if (core::Decimal::parse(value, d)) {
            return {};
        }
        return "Value must be a plain decimal number (e.g. 0.005)";
    },
    "Decimal validator"
);


// -------------------------------------------------------------
// Rounding mode validator
// -------------------------------------------------------------
inline auto rounding_mode_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::RoundingMode mode;
        if (core::parse_rounding_mode(value, mode)) {
            return {};
        }
        return "Rounding mode must be one of: half_up, half_even, down";
    },
    "Rounding mode validator"
);


// -------------------------------------------------------------
// Currency precision override validator (CODE=PLACES, e.g. KWD=3)
// -------------------------------------------------------------
[[nodiscard]]
inline bool split_currency_override(std::string_view value, std::string& code, int& places) {
    const auto eq = value.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 >= value.size()) {
        return false;
    }
    const std::string_view digits = value.substr(eq + 1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), places);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return false;
    }
    code.assign(value.substr(0, eq));
    return true;
}

inline auto currency_override_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        std::string code;
        int places = 0;
        if (split_currency_override(value, code, places)) {
            return {};
        }
        return "Currency override must be CODE=PLACES (e.g. KWD=3)";
    },
    "Currency override validator"
);

} // namespace reckon::examples::cli
