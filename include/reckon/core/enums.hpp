#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/*
===============================================================================
Reckon - Domain Enums
===============================================================================

Closed sets of values that raw log fields are normalized into.

  - Action     : what the subscription service did to the balance
  - Direction  : the ledger direction recorded in the log ("type" field)
  - Overdraft  : which of the expected / actual balances went below zero

Unknown or blank raw values are never rejected here. They map to explicit
members (Action::Unrecognized, Action::Missing, Direction::Unspecified) so the
anomaly detectors can report them.
===============================================================================
*/

namespace reckon::core {

// -----------------------------
// Balance action
// -----------------------------
enum class Action : std::uint8_t {
    Deduct,
    Debit,
    Credit,
    Adjustment,
    Refund,
    TopUp,
    Reversal,
    Invalid,        // explicitly invalid marker (INVALID, or the INVAILID typo seen in logs)
    Unrecognized,   // any other non-blank name
    Missing         // blank or absent
};

// -----------------------------
// Ledger direction ("type")
// -----------------------------
enum class Direction : std::uint8_t {
    Credit,
    Debit,
    Unspecified
};

// -----------------------------
// Overdraft classification
// -----------------------------
enum class Overdraft : std::uint8_t {
    None,
    Expected,   // only the expected balance is negative
    Actual,     // only the logged balance is negative
    Both
};

[[nodiscard]] std::string_view to_string(Action a) noexcept;
[[nodiscard]] std::string_view to_string(Direction d) noexcept;
[[nodiscard]] std::string_view to_string(Overdraft o) noexcept;

// Upper-case ASCII copy with surrounding whitespace removed
[[nodiscard]] std::string upper_trimmed(std::string_view sv);

// Case-insensitive, surrounding whitespace ignored
[[nodiscard]] Action parse_action(std::string_view sv);
[[nodiscard]] Direction parse_direction(std::string_view sv);

[[nodiscard]] constexpr bool is_recognized(Action a) noexcept {
    return a != Action::Invalid && a != Action::Unrecognized && a != Action::Missing;
}

[[nodiscard]] constexpr Overdraft classify_overdraft(bool expected_negative, bool actual_negative) noexcept {
    if (expected_negative && actual_negative) return Overdraft::Both;
    if (expected_negative) return Overdraft::Expected;
    if (actual_negative) return Overdraft::Actual;
    return Overdraft::None;
}

} // namespace reckon::core
