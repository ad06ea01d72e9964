#include "reckon/io/table_writer.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace reckon::io {

namespace {

using lcr::json::ObjectWriter;

inline void decimal(ObjectWriter& w, std::string_view key, const core::Decimal& d) {
    w.raw_number(key, d.to_string());
}

inline void decimal(ObjectWriter& w, std::string_view key, const std::optional<core::Decimal>& d) {
    if (d) {
        w.raw_number(key, d->to_string());
    } else {
        w.null(key);
    }
}

inline void count(ObjectWriter& w, std::string_view key, std::size_t n) {
    w.number(key, static_cast<std::uint64_t>(n));
}

[[nodiscard]]
inline std::string index_array(const std::vector<std::size_t>& indices) {
    std::string out = "[";
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i) out += ',';
        lcr::json::append(out, static_cast<std::uint64_t>(indices[i]));
    }
    out += ']';
    return out;
}

// Writes rows produced by `fn(out, row, index)` one per line
template <typename Rows, typename Fn>
[[nodiscard]] bool write_lines(const std::filesystem::path& path, const Rows& rows, Fn&& fn) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        RK_ERROR("[OUTPUT] Cannot open '" << path.string() << "' for writing");
        return false;
    }

    std::string line;
    std::size_t index = 0;
    for (const auto& row : rows) {
        line.clear();
        fn(line, row, index++);
        line += '\n';
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
    }
    out.flush();
    if (!out) {
        RK_ERROR("[OUTPUT] Write error on '" << path.string() << "'");
        return false;
    }
    RK_DEBUG("[OUTPUT] " << rows.size() << " rows -> " << path.string());
    return true;
}

} // namespace


// ============================================================================
// Row serializers
// ============================================================================

void append_row(std::string& out, const ledger::LedgerEntry& e, std::size_t index) {
    ObjectWriter w(out);
    count(w, "index", index);
    w.string("userId", e.event.user_id);
    count(w, "sequence", e.sequence);
    w.string("timestamp", core::to_string(e.event.timestamp));
    w.string("id", e.event.id);
    w.string("messageId", e.event.message_id);
    w.string("action", core::to_string(e.event.action));
    w.string("actionText", e.event.action_text);
    w.string("direction", core::to_string(e.event.direction));
    w.string("source", e.event.source);
    w.string("currency", e.event.currency);
    decimal(w, "amount", e.event.amount);
    decimal(w, "grossAmount", e.event.gross_amount);
    decimal(w, "vat", e.event.vat);
    decimal(w, "priorBalance", e.prior_balance);
    w.boolean("priorLogged", e.prior_logged);
    decimal(w, "expectedNewBalance", e.expected_new_balance);
    decimal(w, "actualNewBalance", e.actual_new_balance);
    w.boolean("actualLogged", e.actual_logged);
    w.boolean("mismatch", e.mismatch);
    decimal(w, "mismatchDelta", e.mismatch_delta);
    w.boolean("withinTolerance", e.within_tolerance);
    w.string("overdraftKind", core::to_string(e.overdraft));
    w.boolean("continuityBreak", e.continuity_break);
    decimal(w, "suggestedAdjustment", e.suggested_adjustment);
    w.number("decimalPlaces", static_cast<std::int64_t>(e.decimal_places));
    w.boolean("currencyResolved", e.currency_resolved);
    w.number("line", e.event.line);
    w.raw("anomalies", index_array(e.anomalies));
}

void append_row(std::string& out, const ledger::ReconciliationRow& r) {
    ObjectWriter w(out);
    w.string("timestamp", core::to_string(r.timestamp));
    w.string("userId", r.user_id);
    w.string("id", r.id);
    w.string("type", core::to_string(r.direction));
    w.string("source", r.source);
    w.string("action", r.action);
    decimal(w, "oldBalance", r.prior_balance);
    decimal(w, "amount", r.amount);
    decimal(w, "newBalance", r.logged_new_balance);
    decimal(w, "expectedNewBalance", r.expected_new_balance);
    w.boolean("balanceMismatch", r.mismatch);
    w.boolean("continuityBreak", r.continuity_break);
    w.string("overdraft", core::to_string(r.overdraft));
    decimal(w, "suggestedAdjustment", r.suggested_adjustment);
}

void append_row(std::string& out, const ledger::UserSummary& u) {
    ObjectWriter w(out);
    w.string("userId", u.user_id);
    count(w, "transactions", u.transactions);
    decimal(w, "totalDebit", u.total_debit);
    decimal(w, "totalCredit", u.total_credit);
    decimal(w, "netChange", u.net_change);
    decimal(w, "openingBalance", u.opening_balance);
    decimal(w, "closingBalance", u.closing_balance);
    count(w, "overdrafts", u.overdrafts);
    count(w, "mismatches", u.mismatches);
    count(w, "continuityBreaks", u.continuity_breaks);
}

void append_row(std::string& out, const ledger::SourceSummary& s) {
    ObjectWriter w(out);
    w.string("source", s.source);
    count(w, "transactions", s.transactions);
    decimal(w, "totalDebit", s.total_debit);
    decimal(w, "totalCredit", s.total_credit);
    count(w, "mismatches", s.mismatches);
}

void append_row(std::string& out, const anomaly::AnomalyRecord& a, std::size_t index) {
    std::string details;
    {
        ObjectWriter d(details);
        for (const auto& kv : a.details) {
            d.string(kv.key, kv.value);
        }
    }

    ObjectWriter w(out);
    count(w, "index", index);
    w.string("anomalyType", anomaly::to_string(a.type));
    w.string("severity", anomaly::to_string(a.severity));
    w.string("timestamp", core::to_string(a.timestamp));
    w.string("userId", a.user_id);
    w.string("id", a.transaction_id);
    w.string("message", a.message);
    w.raw("details", details);
    w.raw("relatedEntries", index_array(a.related));
}

void append_row(std::string& out, const normalizer::NormalizationFailure& f) {
    ObjectWriter w(out);
    w.number("line", f.line);
    w.string("code", normalizer::to_string(f.code));
    w.string("field", f.field);
    w.string("reason", f.reason);
    w.string("raw", f.raw);
}

void append_row(std::string& out, const ledger::PartitionFault& f) {
    ObjectWriter w(out);
    w.string("userId", f.user_id);
    w.number("line", f.line);
    w.string("reason", f.reason);
}

void append_totals(std::string& out, const ledger::Totals& t, const Report& report) {
    ObjectWriter w(out);
    count(w, "records", report.records);
    count(w, "ignored", report.ignored);
    count(w, "normalizationFailures", report.triage.size());
    count(w, "partitionFaults", report.faults.size());
    count(w, "transactions", t.transactions);
    count(w, "uniqueUsers", t.unique_users);
    decimal(w, "totalDebit", t.total_debit);
    decimal(w, "totalCredit", t.total_credit);
    count(w, "mismatches", t.mismatches);
    count(w, "overdrafts", t.overdrafts);
    count(w, "continuityBreaks", t.continuity_breaks);
    count(w, "anomalies", report.anomalies.size());
    w.boolean("precisionReduced", t.precision_reduced);
    count(w, "sumOverflows", report.summary.overflows.size());
}


// ============================================================================
// Report
// ============================================================================

bool write_report(const Report& report, const std::string& directory) {
    namespace fs = std::filesystem;

    const fs::path dir(directory);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        RK_ERROR("[OUTPUT] Cannot create directory '" << directory << "': " << ec.message());
        return false;
    }

    const ledger::Ledger& entries = report.ledger;

    std::vector<const ledger::LedgerEntry*> overdrafts;
    overdrafts.reserve(report.summary.overdrafts.size());
    for (std::size_t idx : report.summary.overdrafts) {
        overdrafts.push_back(&entries[idx]);
    }

    bool ok = true;
    ok = write_lines(dir / "ledger.jsonl", entries,
        [](std::string& out, const ledger::LedgerEntry& e, std::size_t i) { append_row(out, e, i); }) && ok;
    ok = write_lines(dir / "reconciliation.jsonl", report.summary.reconciliation,
        [](std::string& out, const ledger::ReconciliationRow& r, std::size_t) { append_row(out, r); }) && ok;
    ok = write_lines(dir / "by_user.jsonl", report.summary.by_user,
        [](std::string& out, const ledger::UserSummary& u, std::size_t) { append_row(out, u); }) && ok;
    ok = write_lines(dir / "by_source.jsonl", report.summary.by_source,
        [](std::string& out, const ledger::SourceSummary& s, std::size_t) { append_row(out, s); }) && ok;
    ok = write_lines(dir / "overdrafts.jsonl", overdrafts,
        [&](std::string& out, const ledger::LedgerEntry* e, std::size_t) {
            append_row(out, *e, static_cast<std::size_t>(e - entries.data()));
        }) && ok;
    ok = write_lines(dir / "anomalies.jsonl", report.anomalies,
        [](std::string& out, const anomaly::AnomalyRecord& a, std::size_t i) { append_row(out, a, i); }) && ok;
    ok = write_lines(dir / "triage.jsonl", report.triage,
        [](std::string& out, const normalizer::NormalizationFailure& f, std::size_t) { append_row(out, f); }) && ok;
    ok = write_lines(dir / "faults.jsonl", report.faults,
        [](std::string& out, const ledger::PartitionFault& f, std::size_t) { append_row(out, f); }) && ok;

    std::string totals;
    append_totals(totals, report.summary.totals, report);
    totals += '\n';
    std::ofstream tf(dir / "totals.json", std::ios::binary | std::ios::trunc);
    tf.write(totals.data(), static_cast<std::streamsize>(totals.size()));
    tf.flush();
    if (!tf) {
        RK_ERROR("[OUTPUT] Write error on '" << (dir / "totals.json").string() << "'");
        ok = false;
    }

    if (ok) {
        RK_INFO("[OUTPUT] Report written to " << directory);
    }
    return ok;
}

} // namespace reckon::io
