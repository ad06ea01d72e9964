#include "reckon/anomaly/detectors.hpp"

#include <string>
#include <utility>

#include "reckon/anomaly/detail/make_record.hpp"


namespace reckon::anomaly {

// ============================================================================
// Per-entry detectors (one record per flagged ledger row)
// ============================================================================

Anomalies detect_invalid_action(const ledger::Ledger& ledger, const Context&) {
    Anomalies out;
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const auto& e = ledger[i].event;
        if (e.action != core::Action::Invalid && e.action != core::Action::Unrecognized) {
            continue;
        }
        auto rec = detail::make_record(Type::InvalidAction, Severity::Medium, ledger, i,
            e.action == core::Action::Invalid
                ? "action is marked invalid: '" + e.action_text + "'"
                : "action is not recognized: '" + e.action_text + "'");
        detail::add_detail(rec, "action", e.action_text);
        out.push_back(std::move(rec));
    }
    return out;
}


Anomalies detect_currency_mismatch(const ledger::Ledger& ledger, const Context&) {
    Anomalies out;
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const auto& entry = ledger[i];
        if (entry.currency_resolved) {
            continue;
        }
        auto rec = detail::make_record(Type::CurrencyMismatch, Severity::Medium, ledger, i,
            "currency '" + entry.event.currency + "' has no rounding rule; default precision applied");
        detail::add_detail(rec, "currency", entry.event.currency);
        detail::add_detail(rec, "decimal_places", std::to_string(entry.decimal_places));
        out.push_back(std::move(rec));
    }
    return out;
}


Anomalies detect_missing_field(const ledger::Ledger& ledger, const Context&) {
    Anomalies out;
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const auto& e = ledger[i].event;

        // Fixed field order: action, source, type
        const std::pair<const char*, const std::string*> fields[] = {
            {"action", &e.action_text},
            {"source", &e.source},
            {"type", &e.direction_text},
        };
        for (const auto& [name, value] : fields) {
            if (!value->empty()) {
                continue;
            }
            auto rec = detail::make_record(Type::MissingField, Severity::Low, ledger, i,
                                           std::string(name) + " is blank");
            detail::add_detail(rec, "field", name);
            out.push_back(std::move(rec));
        }
    }
    return out;
}


Anomalies detect_balance_mismatch(const ledger::Ledger& ledger, const Context&) {
    Anomalies out;
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const auto& entry = ledger[i];
        if (!entry.mismatch) {
            continue;
        }
        // A wrong logged balance that also shows the account overdrawn is escalated
        const Severity severity = entry.actual_new_balance.is_negative() ? Severity::Critical : Severity::High;

        auto rec = detail::make_record(Type::BalanceMismatch, severity, ledger, i,
            "expected " + entry.expected_new_balance.to_string()
            + " but logged " + entry.actual_new_balance.to_string());
        detail::add_detail(rec, "expected", entry.expected_new_balance);
        detail::add_detail(rec, "actual", entry.actual_new_balance);
        detail::add_detail(rec, "delta", entry.mismatch_delta);
        if (entry.suggested_adjustment) {
            detail::add_detail(rec, "suggested_adjustment", *entry.suggested_adjustment);
        }
        out.push_back(std::move(rec));
    }
    return out;
}


Anomalies detect_continuity_break(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    for (const auto& [user, indices] : ctx.users) {
        for (std::size_t j = 1; j < indices.size(); ++j) {
            const auto& entry = ledger[indices[j]];
            if (!entry.continuity_break) {
                continue;
            }
            const auto& previous = ledger[indices[j - 1]];

            auto rec = detail::make_record(Type::ContinuityBreak, Severity::High, ledger, indices[j],
                "opening balance " + entry.prior_balance.to_string()
                + " does not continue previous balance " + previous.actual_new_balance.to_string());
            rec.related = {indices[j - 1], indices[j]};
            detail::add_detail(rec, "prior", entry.prior_balance);
            detail::add_detail(rec, "previous_actual", previous.actual_new_balance);
            detail::add_detail(rec, "previous_id", previous.event.id);
            out.push_back(std::move(rec));
        }
    }
    return out;
}

} // namespace reckon::anomaly
