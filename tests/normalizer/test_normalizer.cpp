#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "reckon/normalizer/normalizer.hpp"
#include "lcr/log/logger.hpp"

#include "common/test_check.hpp"

using namespace reckon;
using namespace reckon::normalizer;

/*
================================================================================
Event Normalizer - Unit Tests
================================================================================

These tests validate the boundary between raw log records and typed events.

Design goals enforced by this test suite:
  • Required vs optional field correctness
  • String, integer and float spellings of the same value are equivalent
  • null and blank behave as absent
  • Malformed records become one explicit failure, never an exception
  • Records of other event types are ignored, not failed
================================================================================
*/

static core::Decimal dec(std::string_view text) {
    core::Decimal d;
    TEST_CHECK(core::Decimal::parse(text, d));
    return d;
}

static Result normalize(std::string_view json, core::TransactionEvent& out, NormalizationFailure& failure) {
    EventNormalizer normalizer;
    return normalizer.normalize(core::RawRecord{7, std::string(json)}, out, failure);
}

// ------------------------------------------------------------
// POSITIVE CASES
// ------------------------------------------------------------

void test_full_record() {
    std::cout << "[TEST] Full balance record..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "eventType": "BALANCE_SYNC",
        "userId": "u-100",
        "id": "tx1",
        "messageId": "m1",
        "timestamp": "2024-03-01T12:30:00Z",
        "action": "deduct",
        "type": "DEBIT",
        "amount": "10.50",
        "vat": "0.50",
        "currency": "sar",
        "oldBalance": "100.000",
        "newBalance": 90.0,
        "source": " app "
    }
    )json";

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(json, e, failure) == Result::Normalized);

    TEST_CHECK(e.user_id == "u-100");
    TEST_CHECK(e.id == "tx1");
    TEST_CHECK(e.message_id == "m1");
    TEST_CHECK(core::to_string(e.timestamp) == "2024-03-01T12:30:00.000Z");
    TEST_CHECK(e.action == core::Action::Deduct);
    TEST_CHECK(e.action_text == "deduct");
    TEST_CHECK(e.direction == core::Direction::Debit);
    TEST_CHECK(e.direction_text == "DEBIT");
    TEST_CHECK(e.gross_amount == dec("10.50"));
    TEST_CHECK(e.amount == dec("-10.00"));
    TEST_CHECK(e.vat && *e.vat == dec("0.5"));
    TEST_CHECK(e.currency == "SAR");
    TEST_CHECK(e.logged_old_balance && e.logged_old_balance->to_string() == "100.000");
    TEST_CHECK(e.logged_new_balance && *e.logged_new_balance == dec("90"));
    TEST_CHECK(e.source == "APP");
    TEST_CHECK(e.line == 7);

    std::cout << "[TEST] OK\n";
}

void test_float_amount_exact() {
    std::cout << "[TEST] Float amounts keep their decimal digits..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":1700000000000,"amount":-25.0005})", e, failure)
               == Result::Normalized);

    TEST_CHECK(e.amount.to_string() == "-25.0005");
    TEST_CHECK(e.direction == core::Direction::Unspecified);
    TEST_CHECK(core::to_string(e.timestamp) == "2023-11-14T22:13:20.000Z");

    std::cout << "[TEST] OK\n";
}

void test_credit_and_aliases() {
    std::cout << "[TEST] Credit direction and snake_case aliases..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(R"({"user_id":42,"transactionId":"t9","timestamp":"1700000000000",)"
                         R"("amount":20,"vat":"2","type":"credit","old_balance":"5","new_balance":null})",
                         e, failure) == Result::Normalized);

    TEST_CHECK(e.user_id == "42");
    TEST_CHECK(e.id == "t9");
    TEST_CHECK(e.amount == dec("18"));
    TEST_CHECK(e.logged_old_balance && *e.logged_old_balance == dec("5"));
    TEST_CHECK(!e.logged_new_balance);

    std::cout << "[TEST] OK\n";
}

void test_optional_defaults() {
    std::cout << "[TEST] Optional fields default..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z","amount":"1",)"
                         R"("currency":null,"action":"  ","newBalance":"n/a"})",
                         e, failure) == Result::Normalized);

    TEST_CHECK(e.currency == "UNKNOWN");
    TEST_CHECK(e.action == core::Action::Missing);
    TEST_CHECK(e.action_text.empty());
    TEST_CHECK(e.source.empty());
    TEST_CHECK(!e.vat);
    TEST_CHECK(!e.logged_old_balance);
    TEST_CHECK(!e.logged_new_balance);     // unparseable -> absent

    std::cout << "[TEST] OK\n";
}

void test_invalid_action_kept() {
    std::cout << "[TEST] Invalid actions are kept for detection..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z","amount":"-1","action":"INVAILID_DEDUCT"})",
                         e, failure) == Result::Normalized);
    TEST_CHECK(e.action == core::Action::Invalid);
    TEST_CHECK(e.action_text == "INVAILID_DEDUCT");

    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z","amount":"-1","action":"GIFT"})",
                         e, failure) == Result::Normalized);
    TEST_CHECK(e.action == core::Action::Unrecognized);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// IGNORED / FAILURES
// ------------------------------------------------------------

void test_other_event_types_ignored() {
    std::cout << "[TEST] Non balance events are ignored..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;
    TEST_CHECK(normalize(R"({"eventType":"LOGIN","userId":"u"})", e, failure) == Result::Ignored);
    TEST_CHECK(normalize(R"({"eventType":"balance_sync","userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z","amount":1})",
                         e, failure) == Result::Normalized);

    std::cout << "[TEST] OK\n";
}

void test_malformed_records() {
    std::cout << "[TEST] Malformed records..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;

    TEST_CHECK(normalize("{\"userId\":", e, failure) == Result::InvalidJson);
    TEST_CHECK(failure.line == 7);
    TEST_CHECK(failure.raw == "{\"userId\":");
    TEST_CHECK(!failure.reason.empty());

    TEST_CHECK(normalize("[1,2,3]", e, failure) == Result::InvalidJson);

    TEST_CHECK(normalize(R"({"id":"t","timestamp":"2024-01-01T00:00:00Z","amount":1})", e, failure) == Result::MissingField);
    TEST_CHECK(failure.field == "userId");

    TEST_CHECK(normalize(R"({"userId":"u","id":"","timestamp":"2024-01-01T00:00:00Z","amount":1})", e, failure) == Result::MissingField);
    TEST_CHECK(failure.field == "id");

    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"yesterday","amount":1})", e, failure) == Result::InvalidValue);
    TEST_CHECK(failure.field == "timestamp");

    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z","amount":"ten"})", e, failure) == Result::InvalidValue);
    TEST_CHECK(failure.field == "amount");
    TEST_CHECK(failure.code == Result::InvalidValue);

    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"2024-01-01T00:00:00Z"})", e, failure) == Result::MissingField);
    TEST_CHECK(failure.field == "amount");

    TEST_CHECK(to_string(Result::InvalidJson) == "InvalidJson");

    std::cout << "[TEST] OK\n";
}

void test_timestamp_range() {
    std::cout << "[TEST] Out-of-range and compact timestamps..." << std::endl;

    core::TransactionEvent e;
    NormalizationFailure failure;

    // Epoch milliseconds past the nanosecond clock (year 2262)
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":99999999999999,"amount":1})", e, failure) == Result::InvalidValue);
    TEST_CHECK(failure.field == "timestamp");
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":-99999999999999,"amount":1})", e, failure) == Result::InvalidValue);
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"99999999999999","amount":1})", e, failure) == Result::InvalidValue);
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":18446744073709551615,"amount":1})", e, failure) == Result::InvalidValue);

    // A compact date is not epoch milliseconds
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"20240103","amount":1})", e, failure) == Result::InvalidValue);
    TEST_CHECK(failure.field == "timestamp");

    // Ten digits and more still read as epoch milliseconds
    TEST_CHECK(normalize(R"({"userId":"u","id":"t","timestamp":"1700000000000","amount":1})", e, failure) == Result::Normalized);
    TEST_CHECK(core::to_string(e.timestamp) == "2023-11-14T22:13:20.000Z");

    std::cout << "[TEST] OK\n";
}

void test_batch() {
    std::cout << "[TEST] Batch never stops at a bad record..." << std::endl;

    const std::vector<core::RawRecord> records = {
        {1, R"({"userId":"u","id":"a","timestamp":"2024-01-01T00:00:00Z","amount":1})"},
        {2, "not json"},
        {3, R"({"eventType":"HEARTBEAT"})"},
        {4, R"({"userId":"u","id":"b","timestamp":"2024-01-01T00:00:01Z","amount":2})"},
    };

    EventNormalizer normalizer;
    const auto batch = normalizer.normalize_all(records);

    TEST_CHECK(batch.events.size() == 2);
    TEST_CHECK(batch.events[0].id == "a");
    TEST_CHECK(batch.events[1].id == "b");
    TEST_CHECK(batch.failures.size() == 1);
    TEST_CHECK(batch.failures[0].line == 2);
    TEST_CHECK(batch.failures[0].code == Result::InvalidJson);
    TEST_CHECK(batch.ignored == 1);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_full_record();
    test_float_amount_exact();
    test_credit_and_aliases();
    test_optional_defaults();
    test_invalid_action_kept();
    test_other_event_types_ignored();
    test_malformed_records();
    test_timestamp_range();
    test_batch();

    std::cout << "\n[TEST] ALL NORMALIZER TESTS PASSED!\n";
    return 0;
}
