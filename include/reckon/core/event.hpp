#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "reckon/core/decimal.hpp"
#include "reckon/core/enums.hpp"
#include "reckon/core/timestamp.hpp"


namespace reckon::core {

// -----------------------------
// Raw record (as delivered by the log parser)
// -----------------------------
// One JSON object, still loosely typed. `line` is the 1-based position in the
// input and is carried through to triage and ledger rows for traceability.
struct RawRecord {
    std::uint64_t line = 0;
    std::string text;
};


// -----------------------------
// Normalized transaction event
// -----------------------------
struct TransactionEvent {
    std::string user_id;
    Timestamp timestamp{};
    std::string id;
    std::string message_id;

    Action action = Action::Missing;
    std::string action_text;        // as logged, for reporting
    Direction direction = Direction::Unspecified;
    std::string direction_text;     // "type" as logged

    Decimal amount;                 // signed change applied to the balance
    Decimal gross_amount;           // amount as logged
    std::optional<Decimal> vat;

    std::string currency;           // upper-case; "UNKNOWN" when absent
    std::optional<Decimal> logged_old_balance;
    std::optional<Decimal> logged_new_balance;
    std::string source;             // upper-case tag, may be empty

    std::uint64_t line = 0;
};

// Canonical per-user order: (timestamp, id, messageId) ascending
[[nodiscard]] bool sequence_less(const TransactionEvent& a, const TransactionEvent& b) noexcept;

// Signed change for a logged amount: CREDIT +(amount - vat), DEBIT -(amount - vat),
// otherwise the amount is already signed and vat is not applied
[[nodiscard]] bool signed_amount(Direction direction, const Decimal& gross,
                                 const std::optional<Decimal>& vat, Decimal& out) noexcept;

std::ostream& operator<<(std::ostream& os, const TransactionEvent& e);

} // namespace reckon::core
