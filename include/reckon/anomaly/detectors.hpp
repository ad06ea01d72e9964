#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "reckon/anomaly/record.hpp"
#include "reckon/config/engine.hpp"
#include "reckon/ledger/entry.hpp"


namespace reckon::anomaly {

/*
===============================================================================
Anomaly Detectors
===============================================================================

Each detector is a pure function of the finished ledger and a read-only
context. Detectors never touch the ledger and never see each other's output,
so they can run in any order or concurrently.

Within one detector, records are emitted in ledger order (or group key order
for group-level findings). The engine merges detectors in the fixed Type order
and then sorts by (timestamp, Type, first related index).
===============================================================================
*/

// Shared, immutable inputs prepared once per run
struct Context {
    Context(const ledger::Ledger& ledger, const config::Engine& engine);

    const config::Engine& cfg;

    // Ledger indices per user, in ledger (= sequence) order
    std::map<std::string, std::vector<std::size_t>> users;
};

using Detector = Anomalies (*)(const ledger::Ledger&, const Context&);

[[nodiscard]] Anomalies detect_invalid_action(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_mad_spike(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_duplicate_id(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_rapid_repeated_deduction(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_burst(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_after_hours(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_rounding_pattern(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_currency_mismatch(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_mixed_currency(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_missing_field(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_balance_mismatch(const ledger::Ledger& ledger, const Context& ctx);
[[nodiscard]] Anomalies detect_continuity_break(const ledger::Ledger& ledger, const Context& ctx);

// Indexed by Type
inline constexpr std::array<Detector, TYPE_COUNT> DETECTORS = {
    &detect_invalid_action,
    &detect_mad_spike,
    &detect_duplicate_id,
    &detect_rapid_repeated_deduction,
    &detect_burst,
    &detect_after_hours,
    &detect_rounding_pattern,
    &detect_currency_mismatch,
    &detect_mixed_currency,
    &detect_missing_field,
    &detect_balance_mismatch,
    &detect_continuity_break,
};

// Median of a non-empty sample (mean of the two middle values for even sizes)
[[nodiscard]] double median(std::vector<double> values);

} // namespace reckon::anomaly
