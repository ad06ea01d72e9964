#include "reckon/ledger/summary.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "lcr/log/logger.hpp"


namespace reckon::ledger {

namespace {

// Exact sum when it fits; otherwise both operands are rounded half-even to
// the widest scale at which the sum fits. False only when even the integral
// sum overflows, in which case `acc` is left as it was.
[[nodiscard]]
inline bool add_into(core::Decimal& acc, const core::Decimal& x, bool& reduced) noexcept {
    if (core::add(acc, x, acc)) {
        return true;
    }
    for (int places = std::max(acc.scale(), x.scale()) - 1; places >= 0; --places) {
        core::Decimal a, b, sum;
        if (acc.rescale(places, core::RoundingMode::HalfEven, a) &&
            x.rescale(places, core::RoundingMode::HalfEven, b) &&
            core::add(a, b, sum)) {
            acc = sum;
            reduced = true;
            return true;
        }
    }
    return false;
}

// Adds |amount| to debit (negative) or credit (positive)
[[nodiscard]]
inline bool accumulate(const core::Decimal& amount, core::Decimal& debit, core::Decimal& credit, bool& reduced) noexcept {
    if (amount.is_negative()) {
        return add_into(debit, amount.abs(), reduced);
    }
    return add_into(credit, amount, reduced);
}

[[nodiscard]]
inline ReconciliationRow project(const LedgerEntry& e) {
    ReconciliationRow row;
    row.timestamp = e.event.timestamp;
    row.user_id = e.event.user_id;
    row.id = e.event.id;
    row.direction = e.event.direction;
    row.source = e.event.source;
    row.action = e.event.action_text.empty() ? std::string(core::to_string(e.event.action))
                                             : e.event.action_text;
    row.prior_balance = e.prior_balance;
    row.amount = e.event.amount;
    row.logged_new_balance = e.event.logged_new_balance;
    row.expected_new_balance = e.expected_new_balance;
    row.mismatch = e.mismatch;
    row.continuity_break = e.continuity_break;
    row.overdraft = e.overdraft;
    row.suggested_adjustment = e.suggested_adjustment;
    return row;
}

} // namespace


void summarize(const Ledger& ledger, Summary& out) {
    out = Summary{};

    const auto overflow = [&out](AggregateScope scope, const std::string& key, std::uint64_t line) {
        RK_ERROR("[SUMMARY] Decimal overflow in " << to_string(scope) << " totals"
                 << (key.empty() ? std::string() : " of '" + key + "'") << " at line " << line
                 << ", amount left out of the sum");
        out.overflows.push_back(AggregateOverflow{scope, key, line});
    };

    std::map<std::string, UserSummary> users;
    std::map<std::string, SourceSummary> sources;

    out.reconciliation.reserve(ledger.size());

    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const LedgerEntry& e = ledger[i];
        const core::Decimal& amount = e.event.amount;

        // ---- totals ----
        ++out.totals.transactions;
        if (!accumulate(amount, out.totals.total_debit, out.totals.total_credit, out.totals.precision_reduced)) {
            overflow(AggregateScope::Run, {}, e.event.line);
        }
        if (e.mismatch) ++out.totals.mismatches;
        if (e.continuity_break) ++out.totals.continuity_breaks;
        if (e.overdraft != core::Overdraft::None) {
            ++out.totals.overdrafts;
            out.overdrafts.push_back(i);
        }

        // ---- per user ----
        auto [uit, first] = users.try_emplace(e.event.user_id);
        UserSummary& u = uit->second;
        if (first) {
            u.user_id = e.event.user_id;
            u.opening_balance = e.prior_balance;
        }
        ++u.transactions;
        if (!accumulate(amount, u.total_debit, u.total_credit, u.precision_reduced)) {
            overflow(AggregateScope::User, u.user_id, e.event.line);
        }
        u.closing_balance = e.actual_new_balance;
        if (e.overdraft != core::Overdraft::None) ++u.overdrafts;
        if (e.mismatch) ++u.mismatches;
        if (e.continuity_break) ++u.continuity_breaks;

        // ---- per source ----
        auto [sit, sfirst] = sources.try_emplace(e.event.source);
        SourceSummary& s = sit->second;
        if (sfirst) {
            s.source = e.event.source;
        }
        ++s.transactions;
        if (!accumulate(amount, s.total_debit, s.total_credit, s.precision_reduced)) {
            overflow(AggregateScope::Source, s.source, e.event.line);
        }
        if (e.mismatch) ++s.mismatches;

        out.reconciliation.push_back(project(e));
    }

    out.totals.unique_users = users.size();

    out.by_user.reserve(users.size());
    for (auto& [id, u] : users) {
        u.net_change = u.total_credit;
        if (!add_into(u.net_change, -u.total_debit, u.precision_reduced)) {
            overflow(AggregateScope::User, id, 0);
            u.net_change = core::Decimal{};
        }
        out.by_user.push_back(std::move(u));
    }

    out.by_source.reserve(sources.size());
    for (auto& [tag, s] : sources) {
        out.by_source.push_back(std::move(s));
    }

    RK_INFO("[SUMMARY] " << out.totals.transactions << " transactions, "
            << out.totals.unique_users << " users, "
            << out.totals.mismatches << " mismatches, "
            << out.totals.overdrafts << " overdrafts, "
            << out.totals.continuity_breaks << " continuity breaks");
    if (out.totals.precision_reduced) {
        RK_WARN("[SUMMARY] Run totals rounded below the input precision to stay in range");
    }
}


std::string_view to_string(AggregateScope scope) noexcept {
    switch (scope) {
        case AggregateScope::Run:    return "run";
        case AggregateScope::User:   return "user";
        case AggregateScope::Source: return "source";
    }
    return "unknown";
}

} // namespace reckon::ledger
