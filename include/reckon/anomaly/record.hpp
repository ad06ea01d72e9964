#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "reckon/core/timestamp.hpp"


namespace reckon::anomaly {

// ===============================================
// DETECTOR SET (declaration order is the fixed merge order)
// ===============================================
enum class Type : std::uint8_t {
    InvalidAction = 0,
    MadSpike,
    DuplicateId,
    RapidRepeatedDeduction,
    Burst,
    AfterHours,
    RoundingPattern,
    CurrencyMismatch,
    MixedCurrency,
    MissingField,
    BalanceMismatch,
    ContinuityBreak
};

inline constexpr std::size_t TYPE_COUNT = 12;

enum class Severity : std::uint8_t {
    Low,
    Medium,
    High,
    Critical
};

// -----------------------------------------------------------------------------
// Convert enum → string (for reports / logging)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Type t) noexcept {
    switch (t) {
        case Type::InvalidAction:           return "InvalidAction";
        case Type::MadSpike:                return "MADSpike";
        case Type::DuplicateId:             return "DuplicateId";
        case Type::RapidRepeatedDeduction:  return "RapidRepeatedDeduction";
        case Type::Burst:                   return "Burst";
        case Type::AfterHours:              return "AfterHours";
        case Type::RoundingPattern:         return "RoundingPattern";
        case Type::CurrencyMismatch:        return "CurrencyMismatch";
        case Type::MixedCurrency:           return "MixedCurrency";
        case Type::MissingField:            return "MissingField";
        case Type::BalanceMismatch:         return "BalanceMismatch";
        case Type::ContinuityBreak:         return "ContinuityBreak";
        default:                            return "unknown";
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(Severity s) noexcept {
    switch (s) {
        case Severity::Low:       return "LOW";
        case Severity::Medium:    return "MEDIUM";
        case Severity::High:      return "HIGH";
        case Severity::Critical:  return "CRITICAL";
        default:                  return "unknown";
    }
}


// Ordered key/value pair attached to an anomaly ("median" -> "12.5", ...)
struct Detail {
    std::string key;
    std::string value;
};

// -----------------------------
// One finding of one detector
// -----------------------------
//
// Subject is the user and/or the transaction id (either may be empty for
// group-level findings). `related` holds ledger indices, ascending; they are
// lookups only, never ownership.
struct AnomalyRecord {
    Type type = Type::InvalidAction;
    Severity severity = Severity::Low;
    std::string user_id;
    std::string transaction_id;
    core::Timestamp timestamp{};
    std::string message;
    std::vector<Detail> details;
    std::vector<std::size_t> related;
};

using Anomalies = std::vector<AnomalyRecord>;

std::ostream& operator<<(std::ostream& os, const AnomalyRecord& a);

} // namespace reckon::anomaly
