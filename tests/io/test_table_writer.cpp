#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "reckon/io/record_reader.hpp"
#include "reckon/io/table_writer.hpp"
#include "reckon/ledger/summary.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"

#include "common/ledger_fixtures.hpp"

using namespace reckon;

/*
================================================================================
JSON Lines I/O - Unit Tests
================================================================================

  • Input line numbers are physical (blank lines counted, not returned)
  • Every output row is a valid JSON object
  • Decimals keep their scale ("75.000"), absent optionals are null
================================================================================
*/

static bool valid_object(const std::string& row, simdjson::dom::parser& parser) {
    simdjson::dom::element doc;
    if (parser.parse(row).get(doc)) {
        return false;
    }
    return doc.type() == simdjson::dom::element_type::OBJECT;
}

static bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

// ------------------------------------------------------------
// Reader
// ------------------------------------------------------------

void test_read_records() {
    std::cout << "[TEST] Read JSON Lines..." << std::endl;

    std::istringstream in("{\"a\":1}\r\n\n   \n{\"b\":2}\n{\"c\":3}");
    const auto records = io::read_records(in);

    TEST_CHECK(records.size() == 3);
    TEST_CHECK(records[0].line == 1);
    TEST_CHECK(records[0].text == "{\"a\":1}");
    TEST_CHECK(records[1].line == 4);
    TEST_CHECK(records[2].line == 5);
    TEST_CHECK(records[2].text == "{\"c\":3}");

    std::vector<core::RawRecord> out;
    TEST_CHECK(!io::read_records_file("/nonexistent/reckon/input.jsonl", out));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Row serializers
// ------------------------------------------------------------

void test_ledger_row() {
    std::cout << "[TEST] Ledger row..." << std::endl;

    auto result = fixture::build({
        {.id = "t\"1", .amount = "-25.0005", .currency = "SAR", .old_balance = "100.000", .new_balance = "75.000"},
    });
    result.entries[0].anomalies = {3, 5};

    std::string row;
    io::append_row(row, result.entries[0], 0);

    simdjson::dom::parser parser;
    TEST_CHECK(valid_object(row, parser));
    TEST_CHECK(contains(row, R"("index":0)"));
    TEST_CHECK(contains(row, R"("id":"t\"1")"));
    TEST_CHECK(contains(row, R"("amount":-25.0005)"));
    TEST_CHECK(contains(row, R"("expectedNewBalance":75.000)"));
    TEST_CHECK(contains(row, R"("vat":null)"));
    TEST_CHECK(contains(row, R"("suggestedAdjustment":null)"));
    TEST_CHECK(contains(row, R"("overdraftKind":"NONE")"));
    TEST_CHECK(contains(row, R"("decimalPlaces":3)"));
    TEST_CHECK(contains(row, R"("anomalies":[3,5])"));

    std::cout << "[TEST] OK\n";
}

void test_anomaly_row() {
    std::cout << "[TEST] Anomaly row..." << std::endl;

    anomaly::AnomalyRecord a;
    a.type = anomaly::Type::BalanceMismatch;
    a.severity = anomaly::Severity::Critical;
    a.user_id = "u1";
    a.transaction_id = "t1";
    a.timestamp = fixture::ts("2024-01-03T10:00:00Z");
    a.message = "expected 1.00 but logged -1.00";
    a.details = {{"expected", "1.00"}, {"actual", "-1.00"}};
    a.related = {7};

    std::string row;
    io::append_row(row, a, 2);

    simdjson::dom::parser parser;
    TEST_CHECK(valid_object(row, parser));
    TEST_CHECK(contains(row, R"("anomalyType":"BalanceMismatch")"));
    TEST_CHECK(contains(row, R"("severity":"CRITICAL")"));
    TEST_CHECK(contains(row, R"("details":{"expected":"1.00","actual":"-1.00"})"));
    TEST_CHECK(contains(row, R"("relatedEntries":[7])"));
    TEST_CHECK(contains(row, R"("timestamp":"2024-01-03T10:00:00.000Z")"));

    std::cout << "[TEST] OK\n";
}

void test_triage_row() {
    std::cout << "[TEST] Triage row escapes the raw record..." << std::endl;

    normalizer::NormalizationFailure f;
    f.line = 12;
    f.raw = "{\"userId\":\n";
    f.code = normalizer::Result::InvalidJson;
    f.reason = "malformed JSON";

    std::string row;
    io::append_row(row, f);

    simdjson::dom::parser parser;
    TEST_CHECK(valid_object(row, parser));
    TEST_CHECK(contains(row, R"("line":12)"));
    TEST_CHECK(contains(row, R"("code":"InvalidJson")"));
    TEST_CHECK(contains(row, R"("raw":"{\"userId\":\n")"));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Report directory
// ------------------------------------------------------------

void test_write_report() {
    std::cout << "[TEST] Write report tables..." << std::endl;

    auto result = fixture::build({
        {.id = "t1", .amount = "-5.00", .old_balance = "0.00", .new_balance = "-5.00"},
        {.user = "u2", .id = "t2", .amount = "3.00", .type = "CREDIT"},
    });

    Report report;
    report.records = 3;
    report.ignored = 1;
    report.ledger = std::move(result.entries);
    ledger::summarize(report.ledger, report.summary);

    const auto dir = std::filesystem::temp_directory_path() / "reckon_test_report";
    std::filesystem::remove_all(dir);
    TEST_CHECK(io::write_report(report, dir.string()));

    const char* tables[] = {"ledger.jsonl", "reconciliation.jsonl", "by_user.jsonl", "by_source.jsonl",
                            "overdrafts.jsonl", "anomalies.jsonl", "triage.jsonl", "faults.jsonl", "totals.json"};
    for (const char* name : tables) {
        TEST_CHECK(std::filesystem::exists(dir / name));
    }

    std::ifstream ledger_file(dir / "ledger.jsonl");
    std::vector<std::string> lines;
    for (std::string line; std::getline(ledger_file, line);) {
        lines.push_back(line);
    }
    TEST_CHECK(lines.size() == 2);

    simdjson::dom::parser parser;
    for (const auto& line : lines) {
        TEST_CHECK(valid_object(line, parser));
    }

    std::ifstream overdraft_file(dir / "overdrafts.jsonl");
    std::string overdraft;
    TEST_CHECK(std::getline(overdraft_file, overdraft));
    TEST_CHECK(contains(overdraft, R"("overdraftKind":"BOTH")"));

    std::ifstream totals_file(dir / "totals.json");
    std::string totals;
    TEST_CHECK(std::getline(totals_file, totals));
    TEST_CHECK(contains(totals, R"("records":3)"));
    TEST_CHECK(contains(totals, R"("uniqueUsers":2)"));
    TEST_CHECK(contains(totals, R"("precisionReduced":false,"sumOverflows":0)"));
    TEST_CHECK(contains(totals, R"("totalDebit":5.00)"));

    std::filesystem::remove_all(dir);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_read_records();
    test_ledger_row();
    test_anomaly_row();
    test_triage_row();
    test_write_report();

    std::cout << "\n[TEST] ALL I/O TESTS PASSED!\n";
    return 0;
}
