#include "reckon/anomaly/detectors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>

#include "reckon/anomaly/detail/make_record.hpp"


namespace reckon::anomaly {

// ============================================================================
// Duplicate transaction id (one record per user and id)
// ============================================================================
Anomalies detect_duplicate_id(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    for (const auto& [user, indices] : ctx.users) {
        std::map<std::string, std::vector<std::size_t>> by_id;
        for (std::size_t idx : indices) {
            by_id[ledger[idx].event.id].push_back(idx);
        }

        for (const auto& [id, members] : by_id) {
            if (members.size() < 2) {
                continue;
            }

            AnomalyRecord rec;
            rec.type = Type::DuplicateId;
            rec.severity = Severity::High;
            rec.user_id = user;
            rec.transaction_id = id;
            rec.timestamp = ledger[members.front()].event.timestamp;   // entries are in sequence order
            rec.message = "transaction id '" + id + "' appears " + std::to_string(members.size()) + " times";
            rec.related = members;
            detail::add_detail(rec, "occurrences", std::to_string(members.size()));
            out.push_back(std::move(rec));
        }
    }
    return out;
}


// ============================================================================
// Mixed currency (one record per user)
// ============================================================================
Anomalies detect_mixed_currency(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    for (const auto& [user, indices] : ctx.users) {
        std::set<std::string> currencies;
        for (std::size_t idx : indices) {
            currencies.insert(ledger[idx].event.currency);
        }
        if (currencies.size() < 2) {
            continue;
        }

        std::string list;
        for (const auto& c : currencies) {
            if (!list.empty()) list += ',';
            list += c;
        }

        AnomalyRecord rec;
        rec.type = Type::MixedCurrency;
        rec.severity = Severity::Low;
        rec.user_id = user;
        rec.timestamp = ledger[indices.front()].event.timestamp;
        rec.message = "user transacts in " + std::to_string(currencies.size()) + " currencies: " + list;
        rec.related = indices;
        detail::add_detail(rec, "currencies", list);
        out.push_back(std::move(rec));
    }
    return out;
}

} // namespace reckon::anomaly
