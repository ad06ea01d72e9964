#pragma once

#include <cstddef>
#include <vector>

#include "reckon/anomaly/record.hpp"
#include "reckon/config/engine.hpp"
#include "reckon/config/error.hpp"
#include "reckon/core/event.hpp"
#include "reckon/core/rounding_table.hpp"
#include "reckon/ledger/entry.hpp"
#include "reckon/ledger/summary.hpp"
#include "reckon/normalizer/result.hpp"


namespace reckon {

// -----------------------------
// Everything one run produces
// -----------------------------
struct Report {
    // Boundary
    std::size_t records = 0;
    std::size_t ignored = 0;
    std::vector<normalizer::NormalizationFailure> triage;

    // Ledger (entries carry anomaly back-references)
    ledger::Ledger ledger;
    std::vector<ledger::PartitionFault> faults;

    // Views
    ledger::Summary summary;
    anomaly::Anomalies anomalies;
};


/*
===============================================================================
Reconciler
===============================================================================

One batch run:

  raw records ─► EventNormalizer ─► LedgerBuilder ─► ledger
                                                  ├─► summarize
                                                  └─► detect_all ─► annotate

The configuration is validated (and the rounding table built) in make();
an invalid configuration is fatal and nothing is computed. Runs are
deterministic: the same input yields the same report for any worker count.
===============================================================================
*/
class Reconciler {
public:
    Reconciler() = default;

    [[nodiscard]] static config::Error make(const config::Engine& cfg, Reconciler& out);

    // Full pipeline from raw JSON records. Bad records land in triage and
    // faulted partitions in faults; the run itself always completes.
    void run(const std::vector<core::RawRecord>& records, Report& out) const;

    // Pipeline from already normalized events (boundary fields left empty)
    void reconcile(std::vector<core::TransactionEvent> events, Report& out) const;

    [[nodiscard]] const config::Engine& engine() const noexcept { return cfg_; }
    [[nodiscard]] const core::CurrencyRoundingTable& rounding_table() const noexcept { return table_; }

private:
    config::Engine cfg_;
    core::CurrencyRoundingTable table_;
};

} // namespace reckon
