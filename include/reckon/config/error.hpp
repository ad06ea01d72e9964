#pragma once

#include <string_view>

namespace reckon::config {

/*
===============================================================================
 config::Error
===============================================================================

Structural configuration problems. Any value other than None is fatal: the
engine cannot produce trustworthy numbers and refuses to build a ledger.

Per-record data problems are NOT reported here (see normalizer::Result).
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Rounding policy ----------------------------------------------------
    NegativeDecimals,       // default or per-currency decimal places < 0
    DecimalsTooLarge,       // decimal places beyond Decimal::MAX_SCALE
    InvalidCurrencyCode,    // empty override key

    // --- Comparison ---------------------------------------------------------
    NegativeTolerance,      // tolerance < 0

    // --- Detectors ----------------------------------------------------------
    InvalidMadThreshold,    // MAD multiplier k <= 0 or not finite
    InvalidWindow,          // burst / rapid-repeat window < 0
    InvalidBusinessHours,   // hours outside 0..24, start >= end, offset beyond ±18h
    InvalidRoundingPattern, // min occurrences < 2 or negative magnitude

    // --- Execution ----------------------------------------------------------
    InvalidWorkers,         // worker count == 0

    // --- Config file --------------------------------------------------------
    FileUnreadable,         // config file missing or unreadable
    FileInvalid,            // config file is not valid JSON or has wrong types

    // --- Command line -------------------------------------------------------
    InvalidOption           // option value cannot be parsed
};


/// Helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                   return "None";
    case Error::NegativeDecimals:       return "NegativeDecimals";
    case Error::DecimalsTooLarge:       return "DecimalsTooLarge";
    case Error::InvalidCurrencyCode:    return "InvalidCurrencyCode";
    case Error::NegativeTolerance:      return "NegativeTolerance";
    case Error::InvalidMadThreshold:    return "InvalidMadThreshold";
    case Error::InvalidWindow:          return "InvalidWindow";
    case Error::InvalidBusinessHours:   return "InvalidBusinessHours";
    case Error::InvalidRoundingPattern: return "InvalidRoundingPattern";
    case Error::InvalidWorkers:         return "InvalidWorkers";
    case Error::FileUnreadable:         return "FileUnreadable";
    case Error::FileInvalid:            return "FileInvalid";
    case Error::InvalidOption:          return "InvalidOption";
    default:                            return "Unknown";
    }
}

} // namespace reckon::config
