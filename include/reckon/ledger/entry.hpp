#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "reckon/core/decimal.hpp"
#include "reckon/core/enums.hpp"
#include "reckon/core/event.hpp"


namespace reckon::ledger {

// -----------------------------
// One verified ledger row (one per normalized event)
// -----------------------------
//
// Value object produced by the builder. The only field written after
// construction is `anomalies`, attached once detection has finished.
struct LedgerEntry {
    core::TransactionEvent event;

    core::Decimal prior_balance;
    bool prior_logged = false;              // prior taken from the logged oldBalance

    core::Decimal expected_new_balance;     // round(prior + amount)
    core::Decimal actual_new_balance;       // logged newBalance, else expected
    bool actual_logged = false;

    bool mismatch = false;                  // |actual - expected| > tolerance
    core::Decimal mismatch_delta;           // actual - expected
    bool within_tolerance = true;

    core::Overdraft overdraft = core::Overdraft::None;
    bool continuity_break = false;          // prior != previous actual (same user)
    std::optional<core::Decimal> suggested_adjustment;   // expected - actual, mismatches only

    int decimal_places = 0;
    bool currency_resolved = true;
    core::RoundingMode rounding_mode = core::RoundingMode::HalfUp;

    std::size_t sequence = 0;               // 1-based position within the user
    std::vector<std::size_t> anomalies;     // indices into the anomaly table
};

using Ledger = std::vector<LedgerEntry>;


// -----------------------------
// Arithmetic failure confined to one user partition
// -----------------------------
struct PartitionFault {
    std::string user_id;
    std::uint64_t line = 0;                 // input line of the event that failed
    std::string reason;
};

std::ostream& operator<<(std::ostream& os, const LedgerEntry& e);
std::ostream& operator<<(std::ostream& os, const PartitionFault& f);

} // namespace reckon::ledger
