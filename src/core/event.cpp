#include "reckon/core/event.hpp"

#include <ostream>
#include <tuple>


namespace reckon::core {

bool sequence_less(const TransactionEvent& a, const TransactionEvent& b) noexcept {
    return std::tie(a.timestamp, a.id, a.message_id) < std::tie(b.timestamp, b.id, b.message_id);
}

bool signed_amount(Direction direction, const Decimal& gross,
                   const std::optional<Decimal>& vat, Decimal& out) noexcept {
    if (direction == Direction::Unspecified) {
        out = gross;
        return true;
    }
    Decimal net = gross;
    if (vat && !subtract(gross, *vat, net)) {
        return false;
    }
    out = (direction == Direction::Debit) ? -net : net;
    return true;
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const TransactionEvent& e) {
    os << "[Event] {"
       << "user=" << e.user_id
       << ", ts=" << to_string(e.timestamp)
       << ", id=" << e.id
       << ", msg=" << e.message_id
       << ", action=" << to_string(e.action)
       << ", dir=" << to_string(e.direction)
       << ", amount=" << e.amount
       << ", ccy=" << e.currency;

    if (e.logged_old_balance) {
        os << ", old=" << *e.logged_old_balance;
    }
    if (e.logged_new_balance) {
        os << ", new=" << *e.logged_new_balance;
    }
    os << ", src=" << e.source
       << ", line=" << e.line
       << "}";

    return os;
}

} // namespace reckon::core
