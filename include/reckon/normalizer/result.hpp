#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace reckon::normalizer {

// ===============================================
// NORMALIZER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Ignored        = 0,            // Not a balance transaction (e.g. skip markers)
    InvalidJson    = 1,            // Not a JSON object
    MissingField   = 2,            // Required field absent, null or blank
    InvalidValue   = 3,            // Field present but cannot be coerced (amount, timestamp, ...)
    Normalized     = 4             // Typed event produced
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:        return "Ignored";
        case Result::InvalidJson:    return "InvalidJson";
        case Result::MissingField:   return "MissingField";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Normalized:     return "Normalized";
        default:                     return "unknown";
    }
}


// -----------------------------
// Triage item for one rejected record
// -----------------------------
struct NormalizationFailure {
    std::uint64_t line = 0;
    std::string raw;        // offending record, verbatim
    Result code = Result::InvalidJson;
    std::string field;      // offending field, empty for structural failures
    std::string reason;     // human-readable explanation
};

} // namespace reckon::normalizer
