#pragma once

#include "reckon/anomaly/detectors.hpp"
#include "reckon/anomaly/record.hpp"
#include "reckon/config/engine.hpp"
#include "reckon/ledger/entry.hpp"


namespace reckon::anomaly {

// Runs every detector over the finished ledger (cfg.workers threads), merges
// their output in fixed detector order and sorts by
// (timestamp, detector order, first related entry).
[[nodiscard]] Anomalies detect_all(const ledger::Ledger& ledger, const config::Engine& cfg);

// Attaches back-references: entry.anomalies gets the index of every anomaly
// that relates to it. Runs once, after detection is complete.
void annotate(ledger::Ledger& ledger, const Anomalies& anomalies);

} // namespace reckon::anomaly
