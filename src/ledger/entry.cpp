#include "reckon/ledger/entry.hpp"

#include <ostream>


namespace reckon::ledger {

// ---------------------------------
// Debug / logging helpers
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const LedgerEntry& e) {
    os << "[LedgerEntry] {"
       << "user=" << e.event.user_id
       << ", seq=" << e.sequence
       << ", id=" << e.event.id
       << ", prior=" << e.prior_balance
       << ", amount=" << e.event.amount
       << ", expected=" << e.expected_new_balance
       << ", actual=" << e.actual_new_balance
       << ", mismatch=" << (e.mismatch ? "yes" : "no")
       << ", overdraft=" << core::to_string(e.overdraft)
       << ", continuity_break=" << (e.continuity_break ? "yes" : "no");

    if (e.suggested_adjustment) {
        os << ", adjust=" << *e.suggested_adjustment;
    }
    if (!e.anomalies.empty()) {
        os << ", anomalies=" << e.anomalies.size();
    }
    os << "}";

    return os;
}

std::ostream& operator<<(std::ostream& os, const PartitionFault& f) {
    return os << "[PartitionFault] {user=" << f.user_id
              << ", line=" << f.line
              << ", reason=" << f.reason << "}";
}

} // namespace reckon::ledger
