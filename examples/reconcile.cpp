#include <cstdlib>
#include <iostream>
#include <vector>

#include "reckon.hpp"

#include "common/cli/reconcile_params.hpp"

using namespace reckon;


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = examples::cli::reconcile::configure(argc, argv,
        "Reckon - Ledger Reconciliation & Anomaly Detection\n"
        "Rebuilds per-user balances from logged transactions, certifies every\n"
        "balance change and reports anomalies.\n");
    params.dump("Parameters", std::cout);

    // -------------------------------------------------------------
    // Configuration: defaults < config file < command line
    // -------------------------------------------------------------
    config::Engine cfg;
    if (!params.config_file.empty()) {
        if (auto err = config::load_file(params.config_file, cfg); err != config::Error::None) {
            std::cerr << "Configuration file rejected: " << config::to_string(err) << std::endl;
            return EXIT_FAILURE;
        }
    }
    if (auto err = params.apply(cfg); err != config::Error::None) {
        std::cerr << "Command-line configuration rejected: " << config::to_string(err) << std::endl;
        return EXIT_FAILURE;
    }

    Reconciler reconciler;
    if (auto err = Reconciler::make(cfg, reconciler); err != config::Error::None) {
        std::cerr << "Invalid configuration: " << config::to_string(err) << std::endl;
        return EXIT_FAILURE;
    }
    reconciler.engine().dump("Engine", std::cout);

    // -------------------------------------------------------------
    // Run
    // -------------------------------------------------------------
    std::vector<core::RawRecord> records;
    if (!io::read_records_file(params.input, records)) {
        return EXIT_FAILURE;
    }

    Report report;
    reconciler.run(records, report);

    if (!io::write_report(report, params.output_dir)) {
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Summary
    // -------------------------------------------------------------
    const auto& t = report.summary.totals;
    std::cout << "\n=== Reconciliation ===\n"
              << "  Records            : " << lcr::format_number_exact(report.records) << "\n"
              << "  Ignored            : " << lcr::format_number_exact(report.ignored) << "\n"
              << "  Triage             : " << lcr::format_number_exact(report.triage.size()) << "\n"
              << "  Transactions       : " << lcr::format_number_exact(t.transactions) << "\n"
              << "  Users              : " << lcr::format_number_exact(t.unique_users) << "\n"
              << "  Total debit        : " << t.total_debit << "\n"
              << "  Total credit       : " << t.total_credit << "\n"
              << "  Mismatches         : " << t.mismatches
              << " (" << lcr::format_percent(t.mismatches, t.transactions) << ")\n"
              << "  Overdrafts         : " << t.overdrafts << "\n"
              << "  Continuity breaks  : " << t.continuity_breaks << "\n"
              << "  Anomalies          : " << report.anomalies.size() << "\n"
              << "  Partition faults   : " << report.faults.size() << "\n"
              << "  Sum overflows      : " << report.summary.overflows.size() << "\n"
              << "  Output             : " << params.output_dir << "\n";

    return report.faults.empty() ? EXIT_SUCCESS : 2;
}
