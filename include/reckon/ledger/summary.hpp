#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reckon/core/decimal.hpp"
#include "reckon/core/enums.hpp"
#include "reckon/core/timestamp.hpp"
#include "reckon/ledger/entry.hpp"


namespace reckon::ledger {

// -----------------------------
// Run-wide totals
// -----------------------------
struct Totals {
    std::size_t transactions = 0;
    std::size_t unique_users = 0;
    core::Decimal total_debit;          // sum of |negative amounts|
    core::Decimal total_credit;         // sum of positive amounts
    std::size_t mismatches = 0;
    std::size_t overdrafts = 0;
    std::size_t continuity_breaks = 0;
    bool precision_reduced = false;     // sums rounded half-even to stay in range
};

// -----------------------------
// Per-user row (ascending userId)
// -----------------------------
struct UserSummary {
    std::string user_id;
    std::size_t transactions = 0;
    core::Decimal total_debit;
    core::Decimal total_credit;
    core::Decimal net_change;           // credit - debit
    core::Decimal opening_balance;      // prior of the first entry
    core::Decimal closing_balance;      // actual of the last entry
    std::size_t overdrafts = 0;
    std::size_t mismatches = 0;
    std::size_t continuity_breaks = 0;
    bool precision_reduced = false;
};

// -----------------------------
// Per-source row (ascending source tag; blank source reported as "")
// -----------------------------
struct SourceSummary {
    std::string source;
    std::size_t transactions = 0;
    core::Decimal total_debit;
    core::Decimal total_credit;
    std::size_t mismatches = 0;
    bool precision_reduced = false;
};

// -----------------------------
// Fixed projection of a ledger row for accountants
// -----------------------------
struct ReconciliationRow {
    core::Timestamp timestamp{};
    std::string user_id;
    std::string id;
    core::Direction direction = core::Direction::Unspecified;
    std::string source;
    std::string action;
    core::Decimal prior_balance;
    core::Decimal amount;
    std::optional<core::Decimal> logged_new_balance;
    core::Decimal expected_new_balance;
    bool mismatch = false;
    bool continuity_break = false;
    core::Overdraft overdraft = core::Overdraft::None;
    std::optional<core::Decimal> suggested_adjustment;
};

// -----------------------------
// A sum that could not hold an amount even at scale 0
// -----------------------------
enum class AggregateScope : std::uint8_t {
    Run,
    User,
    Source
};

[[nodiscard]] std::string_view to_string(AggregateScope scope) noexcept;

struct AggregateOverflow {
    AggregateScope scope = AggregateScope::Run;
    std::string key;                    // user or source; empty for the run
    std::uint64_t line = 0;             // input line of the amount left out (0: net change)
};

struct Summary {
    Totals totals;
    std::vector<UserSummary> by_user;
    std::vector<SourceSummary> by_source;
    std::vector<std::size_t> overdrafts;            // ledger indices, ledger order
    std::vector<ReconciliationRow> reconciliation;  // one per ledger entry, ledger order
    std::vector<AggregateOverflow> overflows;
};

// Pure aggregation of a finished ledger. Never fails: a sum that cannot hold an
// amount records an AggregateOverflow and the aggregation goes on.
void summarize(const Ledger& ledger, Summary& out);

} // namespace reckon::ledger
