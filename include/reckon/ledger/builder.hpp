#pragma once

#include <optional>
#include <string>
#include <vector>

#include "reckon/config/engine.hpp"
#include "reckon/core/event.hpp"
#include "reckon/core/rounding_table.hpp"
#include "reckon/ledger/entry.hpp"


namespace reckon::ledger {

// Events of one user, in canonical (timestamp, id, messageId) order
struct Partition {
    std::string user_id;
    std::vector<core::TransactionEvent> events;
};

// Groups by userId (ascending) and sorts each group; exact ties keep input order
[[nodiscard]] std::vector<Partition> partition_by_user(std::vector<core::TransactionEvent> events);


/*
===============================================================================
Ledger Builder
===============================================================================

Folds each user's events into LedgerEntry rows with a running balance:

  prior     = logged oldBalance
            | previous entry's actual balance
            | first entry: logged newBalance - amount, else 0
  expected  = round(prior + amount, decimals(currency), mode)
  actual    = logged newBalance | expected
  mismatch  = |actual - expected| > tolerance
  continuity break (n > 1) = |prior(n) - actual(n-1)| > tolerance

Users are independent: partitions are folded across `workers` threads and
concatenated in ascending userId order, so the ledger does not depend on the
worker count. An overflow inside one partition stops that partition only and
is reported as a PartitionFault.
===============================================================================
*/
class Builder {
public:
    struct Build {
        Ledger entries;
        std::vector<PartitionFault> faults;
    };

    // Both references must outlive the builder
    Builder(const config::Engine& cfg, const core::CurrencyRoundingTable& table) noexcept
        : cfg_(cfg), table_(table) {}

    [[nodiscard]] Build build(std::vector<core::TransactionEvent> events) const;

    // Folds one partition into `out`; false (fault filled) on arithmetic overflow
    [[nodiscard]] bool fold(const Partition& partition, Ledger& out, PartitionFault& fault) const;

private:
    const config::Engine& cfg_;
    const core::CurrencyRoundingTable& table_;
};

} // namespace reckon::ledger
