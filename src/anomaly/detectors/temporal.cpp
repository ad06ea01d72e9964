#include "reckon/anomaly/detectors.hpp"

#include <chrono>
#include <map>
#include <string>
#include <utility>

#include "reckon/anomaly/detail/make_record.hpp"


namespace reckon::anomaly {

namespace {

[[nodiscard]]
inline std::string format_gap(std::chrono::nanoseconds gap) {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(gap).count()) + "ms";
}

} // namespace


// ============================================================================
// Rapid repeated deduction
// ============================================================================
//
// Same user, same action, same negative amount, within the window of the
// previous matching entry. The later entry is flagged; both are referenced.
//
Anomalies detect_rapid_repeated_deduction(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    const auto window = std::chrono::duration_cast<std::chrono::nanoseconds>(ctx.cfg.rapid_repeat_window);

    for (const auto& [user, indices] : ctx.users) {
        // (action, amount) -> most recent matching entry
        std::map<std::pair<core::Action, core::Decimal>, std::size_t> last;

        for (std::size_t idx : indices) {
            const auto& e = ledger[idx].event;
            if (!e.amount.is_negative()) {
                continue;
            }
            const auto key = std::make_pair(e.action, e.amount);
            auto it = last.find(key);
            if (it != last.end()) {
                const auto& prev = ledger[it->second].event;
                const auto gap = e.timestamp - prev.timestamp;
                if (gap <= window) {
                    auto rec = detail::make_record(Type::RapidRepeatedDeduction, Severity::High, ledger, idx,
                        "repeated " + std::string(core::to_string(e.action)) + " of " + e.amount.to_string()
                        + " within " + format_gap(gap) + " of transaction '" + prev.id + "'");
                    rec.related = {it->second, idx};
                    detail::add_detail(rec, "amount", e.amount);
                    detail::add_detail(rec, "gap", format_gap(gap));
                    detail::add_detail(rec, "previous_id", prev.id);
                    out.push_back(std::move(rec));
                }
                it->second = idx;
            } else {
                last.emplace(key, idx);
            }
        }
    }
    return out;
}


// ============================================================================
// Burst
// ============================================================================
Anomalies detect_burst(const ledger::Ledger& ledger, const Context& ctx) {
    Anomalies out;
    const auto window = std::chrono::duration_cast<std::chrono::nanoseconds>(ctx.cfg.burst_window);

    for (const auto& [user, indices] : ctx.users) {
        for (std::size_t j = 1; j < indices.size(); ++j) {
            const auto& prev = ledger[indices[j - 1]].event;
            const auto& e = ledger[indices[j]].event;
            const auto gap = e.timestamp - prev.timestamp;
            if (gap >= window) {
                continue;
            }
            auto rec = detail::make_record(Type::Burst, Severity::Low, ledger, indices[j],
                "transaction " + format_gap(gap) + " after '" + prev.id + "'");
            rec.related = {indices[j - 1], indices[j]};
            detail::add_detail(rec, "gap", format_gap(gap));
            detail::add_detail(rec, "previous_id", prev.id);
            out.push_back(std::move(rec));
        }
    }
    return out;
}


// ============================================================================
// After hours
// ============================================================================
Anomalies detect_after_hours(const ledger::Ledger& ledger, const Context& ctx) {
    using namespace std::chrono;

    Anomalies out;
    const config::BusinessHours& hours_cfg = ctx.cfg.business_hours;

    for (std::size_t i = 0; i < ledger.size(); ++i) {
        const auto local = ledger[i].event.timestamp + minutes(hours_cfg.utc_offset_minutes);
        const sys_days day = floor<days>(local);
        const int hour = static_cast<int>(floor<hours>(local - day).count());
        const weekday wd{day};
        const bool weekend = (wd == Saturday || wd == Sunday);

        const bool outside = hour < hours_cfg.start_hour || hour >= hours_cfg.end_hour;
        if (!outside && !(hours_cfg.flag_weekends && weekend)) {
            continue;
        }

        auto rec = detail::make_record(Type::AfterHours, Severity::Low, ledger, i,
            weekend && hours_cfg.flag_weekends
                ? "transaction on a weekend"
                : "transaction at " + std::to_string(hour) + "h local, outside business hours");
        detail::add_detail(rec, "local_hour", std::to_string(hour));
        detail::add_detail(rec, "weekday", std::to_string(wd.c_encoding()));
        out.push_back(std::move(rec));
    }
    return out;
}

} // namespace reckon::anomaly
