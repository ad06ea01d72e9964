#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "reckon/anomaly/record.hpp"
#include "reckon/core/decimal.hpp"
#include "reckon/ledger/entry.hpp"


namespace reckon::anomaly::detail {

// Record anchored on one ledger entry (subject = user + transaction id)
[[nodiscard]]
inline AnomalyRecord make_record(Type type, Severity severity, const ledger::Ledger& ledger,
                                 std::size_t index, std::string message) {
    const ledger::LedgerEntry& e = ledger[index];

    AnomalyRecord rec;
    rec.type = type;
    rec.severity = severity;
    rec.user_id = e.event.user_id;
    rec.transaction_id = e.event.id;
    rec.timestamp = e.event.timestamp;
    rec.message = std::move(message);
    rec.related.push_back(index);
    return rec;
}

inline void add_detail(AnomalyRecord& rec, std::string key, std::string value) {
    rec.details.push_back(Detail{std::move(key), std::move(value)});
}

inline void add_detail(AnomalyRecord& rec, std::string key, const core::Decimal& value) {
    rec.details.push_back(Detail{std::move(key), value.to_string()});
}

} // namespace reckon::anomaly::detail
