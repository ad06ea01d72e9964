#pragma once

#include <map>
#include <ostream>
#include <string>
#include <string_view>

#include "reckon/config/engine.hpp"
#include "reckon/core/decimal.hpp"
#include "reckon/core/enums.hpp"


namespace reckon::core {

// -----------------------------
// Rounding rule for one currency
// -----------------------------
struct CurrencyRoundingRule {
    std::string currency;
    int decimal_places = config::DEFAULT_DECIMALS;
    RoundingMode mode = RoundingMode::HalfUp;
};

// Result of a table lookup. `resolved == false` means the fallback rule was
// applied and the caller must surface the unknown currency.
struct RoundingLookup {
    CurrencyRoundingRule rule;
    bool resolved = false;
};


/*
===============================================================================
CurrencyRoundingTable
===============================================================================

Process-wide policy: currency code → decimal places + rounding mode.

  • Built once from a validated config::Engine, never mutated afterwards
  • Lookups are const and safe from any number of threads
  • Codes are matched case-insensitively (stored upper-case)
  • Unknown codes never fail: they resolve to the default rule with
    resolved = false
===============================================================================
*/
class CurrencyRoundingTable {
public:
    CurrencyRoundingTable() = default;

    // Builds the table, refusing structurally invalid decimal counts
    [[nodiscard]] static config::Error make(const config::Engine& cfg, CurrencyRoundingTable& out);

    [[nodiscard]] RoundingLookup rule(std::string_view currency) const;

    [[nodiscard]] int default_decimals() const noexcept { return default_decimals_; }
    [[nodiscard]] RoundingMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::size_t size() const noexcept { return decimals_.size(); }

private:
    std::map<std::string, int, std::less<>> decimals_;
    int default_decimals_ = config::DEFAULT_DECIMALS;
    RoundingMode mode_ = config::DEFAULT_ROUNDING_MODE;
};

std::ostream& operator<<(std::ostream& os, const CurrencyRoundingRule& r);

// Lookup key for a currency code (upper-case, trimmed)
[[nodiscard]] std::string canonical_currency(std::string_view currency);

} // namespace reckon::core
