#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "reckon/core/decimal.hpp"
#include "reckon/core/event.hpp"
#include "reckon/core/timestamp.hpp"
#include "reckon/config/engine.hpp"
#include "reckon/core/rounding_table.hpp"
#include "reckon/ledger/builder.hpp"

#include "common/test_check.hpp"

// ----------------------------------------------------------------------------
// Helpers to build events and ledgers without going through JSON
// ----------------------------------------------------------------------------

namespace fixture {

static reckon::core::Decimal dec(std::string_view text) {
    reckon::core::Decimal d;
    TEST_CHECK(reckon::core::Decimal::parse(text, d));
    return d;
}

static reckon::core::Timestamp ts(std::string_view text) {
    reckon::core::Timestamp t;
    TEST_CHECK(reckon::core::parse_rfc3339(text, t));
    return t;
}

// Text form of one event; empty balance strings mean "not logged"
struct Event {
    std::string user = "u1";
    std::string id = "tx";
    std::string time = "2024-01-03T10:00:00Z";   // Wednesday, inside business hours
    std::string amount = "0";
    std::string currency = "USD";
    std::string old_balance;
    std::string new_balance;
    std::string action = "DEDUCT";
    std::string type = "DEBIT";
    std::string source = "APP";
    std::string message_id;
};

static reckon::core::TransactionEvent make(const Event& row) {
    static std::uint64_t line = 0;

    reckon::core::TransactionEvent e;
    e.user_id = row.user;
    e.id = row.id;
    e.message_id = row.message_id;
    e.timestamp = ts(row.time);
    e.action_text = row.action;
    e.action = reckon::core::parse_action(row.action);
    e.direction_text = row.type;
    e.direction = reckon::core::parse_direction(row.type);
    e.amount = dec(row.amount);
    e.gross_amount = e.amount.abs();
    e.currency = row.currency.empty() ? "UNKNOWN" : reckon::core::canonical_currency(row.currency);
    if (!row.old_balance.empty()) e.logged_old_balance = dec(row.old_balance);
    if (!row.new_balance.empty()) e.logged_new_balance = dec(row.new_balance);
    e.source = row.source;
    e.line = ++line;
    return e;
}

static std::vector<reckon::core::TransactionEvent> make_all(const std::vector<Event>& rows) {
    std::vector<reckon::core::TransactionEvent> events;
    events.reserve(rows.size());
    for (const auto& s : rows) {
        events.push_back(make(s));
    }
    return events;
}

// Folds `rows` with the given configuration (defaults when omitted)
static reckon::ledger::Builder::Build build(const std::vector<Event>& rows,
                                            const reckon::config::Engine& cfg = {}) {
    reckon::core::CurrencyRoundingTable table;
    TEST_CHECK(reckon::core::CurrencyRoundingTable::make(cfg, table) == reckon::config::Error::None);
    reckon::ledger::Builder builder(cfg, table);
    return builder.build(make_all(rows));
}

} // namespace fixture
