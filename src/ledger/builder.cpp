#include "reckon/ledger/builder.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

#include "reckon/core/parallel.hpp"
#include "lcr/log/logger.hpp"


namespace reckon::ledger {

std::vector<Partition> partition_by_user(std::vector<core::TransactionEvent> events) {
    std::map<std::string, std::vector<core::TransactionEvent>> groups;
    for (auto& e : events) {
        groups[e.user_id].push_back(std::move(e));
    }

    std::vector<Partition> partitions;
    partitions.reserve(groups.size());
    for (auto& [user, group] : groups) {
        std::stable_sort(group.begin(), group.end(), core::sequence_less);
        partitions.push_back(Partition{user, std::move(group)});
    }
    return partitions;
}


namespace {

[[nodiscard]]
inline bool overflow(const core::TransactionEvent& e, const char* step, PartitionFault& fault) {
    fault.user_id = e.user_id;
    fault.line = e.line;
    fault.reason = std::string("decimal overflow computing ") + step + " for transaction '" + e.id + "'";
    return false;
}

} // namespace


bool Builder::fold(const Partition& partition, Ledger& out, PartitionFault& fault) const {
    std::optional<core::Decimal> previous_actual;   // actual balance of the preceding entry
    std::size_t sequence = 0;

    for (const auto& event : partition.events) {
        LedgerEntry entry;
        entry.event = event;
        entry.sequence = ++sequence;

        const core::RoundingLookup lookup = table_.rule(event.currency);
        entry.decimal_places = lookup.rule.decimal_places;
        entry.rounding_mode = lookup.rule.mode;
        entry.currency_resolved = lookup.resolved;

        // ---- prior balance ----
        if (event.logged_old_balance) {
            entry.prior_balance = *event.logged_old_balance;
            entry.prior_logged = true;
        }
        else if (previous_actual) {
            entry.prior_balance = *previous_actual;
        }
        else if (event.logged_new_balance) {
            if (!core::subtract(*event.logged_new_balance, event.amount, entry.prior_balance)) {
                return overflow(event, "opening balance", fault);
            }
        }
        else {
            entry.prior_balance = core::Decimal{};
        }

        // ---- expected / actual ----
        core::Decimal raw;
        if (!core::add(entry.prior_balance, event.amount, raw)) {
            return overflow(event, "expected balance", fault);
        }
        if (!raw.rescale(entry.decimal_places, entry.rounding_mode, entry.expected_new_balance)) {
            return overflow(event, "rounded balance", fault);
        }

        if (event.logged_new_balance) {
            entry.actual_new_balance = *event.logged_new_balance;
            entry.actual_logged = true;
        } else {
            entry.actual_new_balance = entry.expected_new_balance;
        }

        // ---- mismatch ----
        if (!core::subtract(entry.actual_new_balance, entry.expected_new_balance, entry.mismatch_delta)) {
            return overflow(event, "mismatch delta", fault);
        }
        entry.mismatch = entry.mismatch_delta.abs() > cfg_.tolerance;
        entry.within_tolerance = !entry.mismatch;
        if (entry.mismatch) {
            entry.suggested_adjustment = -entry.mismatch_delta;
        }

        entry.overdraft = core::classify_overdraft(entry.expected_new_balance.is_negative(),
                                                   entry.actual_new_balance.is_negative());

        // ---- continuity vs the previous entry of this user ----
        if (previous_actual) {
            core::Decimal gap;
            if (!core::subtract(entry.prior_balance, *previous_actual, gap)) {
                return overflow(event, "continuity gap", fault);
            }
            entry.continuity_break = gap.abs() > cfg_.tolerance;
        }

        previous_actual = entry.actual_new_balance;
        out.push_back(std::move(entry));
    }
    return true;
}


Builder::Build Builder::build(std::vector<core::TransactionEvent> events) const {
    const std::size_t event_count = events.size();
    const std::vector<Partition> partitions = partition_by_user(std::move(events));

    struct Slot {
        Ledger entries;
        std::optional<PartitionFault> fault;
    };
    std::vector<Slot> slots(partitions.size());

    core::parallel_for(partitions.size(), cfg_.workers, [&](std::size_t i) {
        Slot& slot = slots[i];
        slot.entries.reserve(partitions[i].events.size());
        PartitionFault fault;
        if (!fold(partitions[i], slot.entries, fault)) {
            slot.fault = std::move(fault);
        }
    });

    Build result;
    result.entries.reserve(event_count);
    for (auto& slot : slots) {
        std::move(slot.entries.begin(), slot.entries.end(), std::back_inserter(result.entries));
        if (slot.fault) {
            RK_ERROR("[LEDGER] Partition fault: " << *slot.fault);
            result.faults.push_back(std::move(*slot.fault));
        }
    }

    RK_INFO("[LEDGER] Built " << result.entries.size() << " entries for "
            << partitions.size() << " users ("
            << result.faults.size() << " partition faults, workers=" << cfg_.workers << ")");
    return result;
}

} // namespace reckon::ledger
