#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "reckon/anomaly/record.hpp"
#include "reckon/ledger/entry.hpp"
#include "reckon/ledger/summary.hpp"
#include "reckon/normalizer/result.hpp"
#include "reckon/reconciler.hpp"


namespace reckon::io {

/*
===============================================================================
Output tables (JSON Lines)
===============================================================================

One JSON object per row. Decimals are written as exact JSON numbers with the
value's own scale ("75.000"), absent optionals as null, timestamps as
RFC 3339 UTC strings.

  ledger.jsonl          one row per ledger entry (with anomaly indices)
  reconciliation.jsonl  accountant projection of the ledger
  by_user.jsonl         per-user summary
  by_source.jsonl       per-source summary
  overdrafts.jsonl      ledger rows whose overdraft kind is not NONE
  anomalies.jsonl       anomaly table (index = position in file)
  triage.jsonl          normalization failures
  faults.jsonl          partition faults
  totals.json           run totals (single object)
===============================================================================
*/

// Row serializers (no trailing newline)
void append_row(std::string& out, const ledger::LedgerEntry& e, std::size_t index);
void append_row(std::string& out, const ledger::ReconciliationRow& r);
void append_row(std::string& out, const ledger::UserSummary& u);
void append_row(std::string& out, const ledger::SourceSummary& s);
void append_row(std::string& out, const anomaly::AnomalyRecord& a, std::size_t index);
void append_row(std::string& out, const normalizer::NormalizationFailure& f);
void append_row(std::string& out, const ledger::PartitionFault& f);
void append_totals(std::string& out, const ledger::Totals& t, const Report& report);

// Writes every table into `directory` (created if missing). False on I/O failure.
[[nodiscard]] bool write_report(const Report& report, const std::string& directory);

} // namespace reckon::io
