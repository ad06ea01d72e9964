#include "reckon/anomaly/detectors.hpp"

#include <cmath>
#include <format>
#include <map>
#include <string>
#include <utility>

#include "reckon/anomaly/detail/make_record.hpp"


namespace reckon::anomaly {

// ============================================================================
// MAD spike
// ============================================================================
//
// Per (user, action) group, two passes over the complete group:
//   1) median of the signed amounts
//   2) MAD = median(|amount - median|)
// An entry is a spike when |amount - median| > k * MAD. Groups with MAD == 0
// carry no dispersion signal and are skipped.
//
Anomalies detect_mad_spike(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    const double k = ctx.cfg.mad_threshold;

    for (const auto& [user, indices] : ctx.users) {
        std::map<core::Action, std::vector<std::size_t>> groups;
        for (std::size_t idx : indices) {
            groups[ledger[idx].event.action].push_back(idx);
        }

        for (const auto& [action, members] : groups) {
            std::vector<double> amounts;
            amounts.reserve(members.size());
            for (std::size_t idx : members) {
                amounts.push_back(ledger[idx].event.amount.to_double());
            }

            const double med = median(amounts);
            std::vector<double> deviations;
            deviations.reserve(amounts.size());
            for (double a : amounts) {
                deviations.push_back(std::fabs(a - med));
            }
            const double mad = median(deviations);
            if (mad == 0.0 || !std::isfinite(mad)) {
                continue;
            }

            for (std::size_t m = 0; m < members.size(); ++m) {
                if (!(deviations[m] > k * mad)) {
                    continue;
                }
                const double score = deviations[m] / mad;
                auto rec = detail::make_record(Type::MadSpike, Severity::High, ledger, members[m],
                    std::format("amount deviates {:.2f} MADs from the {} median of user", score,
                                core::to_string(action)));
                detail::add_detail(rec, "action", std::string(core::to_string(action)));
                detail::add_detail(rec, "amount", ledger[members[m]].event.amount);
                detail::add_detail(rec, "median", std::format("{}", med));
                detail::add_detail(rec, "mad", std::format("{}", mad));
                detail::add_detail(rec, "score", std::format("{:.2f}", score));
                detail::add_detail(rec, "threshold", std::format("{}", k));
                out.push_back(std::move(rec));
            }
        }
    }
    return out;
}


// ============================================================================
// Rounding pattern
// ============================================================================
//
// The same small non-zero correction recurring for one (user, currency)
// suggests a systematic rounding defect rather than isolated noise.
//
Anomalies detect_rounding_pattern(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    const std::size_t min_occurrences = ctx.cfg.rounding_pattern_min_occurrences;
    const core::Decimal& max_magnitude = ctx.cfg.rounding_pattern_max_magnitude;

    for (const auto& [user, indices] : ctx.users) {
        // currency -> adjustment -> entries (numeric key: 0.01 == 0.010)
        std::map<std::string, std::map<core::Decimal, std::vector<std::size_t>>> groups;
        for (std::size_t idx : indices) {
            const auto& entry = ledger[idx];
            if (!entry.suggested_adjustment) {
                continue;
            }
            const core::Decimal& adj = *entry.suggested_adjustment;
            if (adj.is_zero() || adj.abs() > max_magnitude) {
                continue;
            }
            groups[entry.event.currency][adj].push_back(idx);
        }

        for (const auto& [currency, by_value] : groups) {
            for (const auto& [adjustment, members] : by_value) {
                if (members.size() < min_occurrences) {
                    continue;
                }
                AnomalyRecord rec;
                rec.type = Type::RoundingPattern;
                rec.severity = Severity::Medium;
                rec.user_id = user;
                rec.timestamp = ledger[members.front()].event.timestamp;
                rec.message = "adjustment " + adjustment.normalized().to_string() + " " + currency
                            + " recurs " + std::to_string(members.size()) + " times";
                rec.related = members;
                detail::add_detail(rec, "currency", currency);
                detail::add_detail(rec, "adjustment", adjustment.normalized());
                detail::add_detail(rec, "occurrences", std::to_string(members.size()));
                out.push_back(std::move(rec));
            }
        }
    }
    return out;
}

} // namespace reckon::anomaly
