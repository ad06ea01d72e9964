#include "reckon/reconciler.hpp"

#include <chrono>
#include <cstdint>
#include <utility>

#include "reckon/anomaly/engine.hpp"
#include "reckon/ledger/builder.hpp"
#include "reckon/normalizer/normalizer.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace reckon {

config::Error Reconciler::make(const config::Engine& cfg, Reconciler& out) {
    if (auto err = config::validate(cfg); err != config::Error::None) {
        RK_ERROR("[RECONCILER] Invalid configuration: " << config::to_string(err));
        return err;
    }

    Reconciler r;
    r.cfg_ = cfg;
    if (auto err = core::CurrencyRoundingTable::make(r.cfg_, r.table_); err != config::Error::None) {
        RK_ERROR("[RECONCILER] Invalid currency rounding table: " << config::to_string(err));
        return err;
    }

    out = std::move(r);
    return config::Error::None;
}


void Reconciler::run(const std::vector<core::RawRecord>& records, Report& out) const {
    normalizer::EventNormalizer normalizer;
    auto batch = normalizer.normalize_all(records);

    reconcile(std::move(batch.events), out);

    out.records = records.size();
    out.ignored = batch.ignored;
    out.triage = std::move(batch.failures);
}


void Reconciler::reconcile(std::vector<core::TransactionEvent> events, Report& out) const {
    const auto started = std::chrono::steady_clock::now();
    out = Report{};
    out.records = events.size();

    ledger::Builder builder(cfg_, table_);
    auto build = builder.build(std::move(events));
    out.ledger = std::move(build.entries);
    out.faults = std::move(build.faults);

    ledger::summarize(out.ledger, out.summary);

    out.anomalies = anomaly::detect_all(out.ledger, cfg_);
    anomaly::annotate(out.ledger, out.anomalies);

    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started);
    RK_INFO("[RECONCILER] Done: " << out.ledger.size() << " entries, "
            << out.anomalies.size() << " anomalies, "
            << out.faults.size() << " partition faults in "
            << lcr::format_duration(static_cast<std::uint64_t>(elapsed.count())));
}

} // namespace reckon
