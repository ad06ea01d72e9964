#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>

#include "reckon/core/decimal.hpp"

#include "common/test_check.hpp"

using namespace reckon::core;

/*
================================================================================
Decimal - Unit Tests
================================================================================

Exact fixed-point money arithmetic:
  • Parsing keeps every digit ("25.0005" is not a binary approximation)
  • Rounding modes at ties and for negative values
  • Overflow is reported, never wrapped
  • Comparison is numeric across scales
================================================================================
*/

static Decimal dec(std::string_view text) {
    Decimal d;
    TEST_CHECK(Decimal::parse(text, d));
    return d;
}

static Decimal rounded(std::string_view text, int places, RoundingMode mode) {
    Decimal out;
    TEST_CHECK(dec(text).rescale(places, mode, out));
    return out;
}

// ------------------------------------------------------------
// Parsing
// ------------------------------------------------------------

void test_parse_exact() {
    std::cout << "[TEST] Decimal parse keeps every digit..." << std::endl;

    Decimal d = dec("25.0005");
    TEST_CHECK(d.units() == 250005);
    TEST_CHECK(d.scale() == 4);
    TEST_CHECK(d.to_string() == "25.0005");

    TEST_CHECK(dec("-0.50").to_string() == "-0.50");
    TEST_CHECK(dec("+7").to_string() == "7");
    TEST_CHECK(dec(".5").to_string() == "0.5");
    TEST_CHECK(dec("1.5e2").to_string() == "150");
    TEST_CHECK(dec("125e-3").to_string() == "0.125");
    TEST_CHECK(dec("0.005").to_string() == "0.005");

    std::cout << "[TEST] OK\n";
}

void test_parse_rejects_garbage() {
    std::cout << "[TEST] Decimal parse rejects malformed text..." << std::endl;

    Decimal d;
    TEST_CHECK(!Decimal::parse("", d));
    TEST_CHECK(!Decimal::parse("-", d));
    TEST_CHECK(!Decimal::parse("abc", d));
    TEST_CHECK(!Decimal::parse("1.2.3", d));
    TEST_CHECK(!Decimal::parse("12x", d));
    TEST_CHECK(!Decimal::parse("99999999999999999999", d));

    std::cout << "[TEST] OK\n";
}

void test_from_double_shortest() {
    std::cout << "[TEST] Decimal from double uses the shortest text..." << std::endl;

    Decimal d;
    TEST_CHECK(Decimal::from_double(25.0005, d));
    TEST_CHECK(d == dec("25.0005"));
    TEST_CHECK(d.to_string() == "25.0005");

    TEST_CHECK(Decimal::from_double(0.1, d));
    TEST_CHECK(d.to_string() == "0.1");

    TEST_CHECK(!Decimal::from_double(std::numeric_limits<double>::infinity(), d));
    TEST_CHECK(!Decimal::from_double(std::numeric_limits<double>::quiet_NaN(), d));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Rounding
// ------------------------------------------------------------

void test_rescale_half_up() {
    std::cout << "[TEST] Rescale half up..." << std::endl;

    TEST_CHECK(rounded("74.9995", 3, RoundingMode::HalfUp).to_string() == "75.000");
    TEST_CHECK(rounded("74.9994", 3, RoundingMode::HalfUp).to_string() == "74.999");
    TEST_CHECK(rounded("2.5", 0, RoundingMode::HalfUp).to_string() == "3");
    TEST_CHECK(rounded("-2.5", 0, RoundingMode::HalfUp).to_string() == "-3");
    TEST_CHECK(rounded("-0.005", 2, RoundingMode::HalfUp).to_string() == "-0.01");

    std::cout << "[TEST] OK\n";
}

void test_rescale_half_even() {
    std::cout << "[TEST] Rescale half even..." << std::endl;

    TEST_CHECK(rounded("2.5", 0, RoundingMode::HalfEven).to_string() == "2");
    TEST_CHECK(rounded("3.5", 0, RoundingMode::HalfEven).to_string() == "4");
    TEST_CHECK(rounded("-2.5", 0, RoundingMode::HalfEven).to_string() == "-2");
    TEST_CHECK(rounded("2.51", 0, RoundingMode::HalfEven).to_string() == "3");
    TEST_CHECK(rounded("0.125", 2, RoundingMode::HalfEven).to_string() == "0.12");

    std::cout << "[TEST] OK\n";
}

void test_rescale_down_and_extend() {
    std::cout << "[TEST] Rescale down / extend..." << std::endl;

    TEST_CHECK(rounded("2.99", 0, RoundingMode::Down).to_string() == "2");
    TEST_CHECK(rounded("-2.99", 0, RoundingMode::Down).to_string() == "-2");
    TEST_CHECK(rounded("1.5", 3, RoundingMode::HalfUp).to_string() == "1.500");

    Decimal out;
    TEST_CHECK(!Decimal::from_units(std::numeric_limits<std::int64_t>::max(), 0)
                    .rescale(2, RoundingMode::HalfUp, out));

    std::cout << "[TEST] OK\n";
}

void test_rescale_full_scale_range() {
    std::cout << "[TEST] Rescale between scale 18 and scale 0..." << std::endl;

    TEST_CHECK(rounded("1.500000000000000000", 0, RoundingMode::HalfUp).to_string() == "2");
    TEST_CHECK(rounded("0.500000000000000000", 0, RoundingMode::HalfEven).to_string() == "0");
    TEST_CHECK(rounded("-2.999999999999999999", 0, RoundingMode::Down).to_string() == "-2");
    TEST_CHECK(rounded("7", 18, RoundingMode::HalfUp).to_string() == "7.000000000000000000");

    // 10 x 10^18 no longer fits the mantissa
    Decimal out;
    TEST_CHECK(!dec("10").rescale(18, RoundingMode::HalfUp, out));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Arithmetic / comparison
// ------------------------------------------------------------

void test_add_aligns_scales() {
    std::cout << "[TEST] Add / subtract align scales..." << std::endl;

    Decimal sum;
    TEST_CHECK(add(dec("100.000"), dec("-25.0005"), sum));
    TEST_CHECK(sum.to_string() == "74.9995");

    Decimal diff;
    TEST_CHECK(subtract(dec("9.00"), dec("9.005"), diff));
    TEST_CHECK(diff.to_string() == "-0.005");

    // Aliased output
    Decimal acc = dec("1.25");
    TEST_CHECK(add(acc, acc, acc));
    TEST_CHECK(acc.to_string() == "2.50");

    std::cout << "[TEST] OK\n";
}

void test_overflow_reported() {
    std::cout << "[TEST] Overflow is reported and leaves the output untouched..." << std::endl;

    const Decimal max = Decimal::from_units(std::numeric_limits<std::int64_t>::max(), 0);
    Decimal out = dec("42");
    TEST_CHECK(!add(max, Decimal::from_int(1), out));
    TEST_CHECK(out.to_string() == "42");

    TEST_CHECK(!subtract(-max, Decimal::from_int(1), out));
    TEST_CHECK(!add(max, dec("0.1"), out));

    std::cout << "[TEST] OK\n";
}

void test_numeric_comparison() {
    std::cout << "[TEST] Comparison is numeric..." << std::endl;

    TEST_CHECK(dec("1.5") == dec("1.50"));
    TEST_CHECK(dec("0.005") < dec("0.006"));
    TEST_CHECK(dec("-1") < dec("0.001"));
    TEST_CHECK(dec("0.0050").abs() > dec("0.00499"));
    TEST_CHECK(dec("1.500").normalized().to_string() == "1.5");
    TEST_CHECK(dec("100.000").normalized().to_string() == "100");

    std::ostringstream os;
    os << dec("-3.10");
    TEST_CHECK(os.str() == "-3.10");

    std::cout << "[TEST] OK\n";
}

void test_rounding_mode_names() {
    std::cout << "[TEST] Rounding mode names..." << std::endl;

    RoundingMode mode;
    TEST_CHECK(parse_rounding_mode("HALF_EVEN", mode));
    TEST_CHECK(mode == RoundingMode::HalfEven);
    TEST_CHECK(parse_rounding_mode("down", mode));
    TEST_CHECK(mode == RoundingMode::Down);
    TEST_CHECK(!parse_rounding_mode("ceiling", mode));
    TEST_CHECK(to_string(RoundingMode::HalfUp) == "half_up");

    std::cout << "[TEST] OK\n";
}


int main() {
    test_parse_exact();
    test_parse_rejects_garbage();
    test_from_double_shortest();
    test_rescale_half_up();
    test_rescale_half_even();
    test_rescale_down_and_extend();
    test_rescale_full_scale_range();
    test_add_aligns_scales();
    test_overflow_reported();
    test_numeric_comparison();
    test_rounding_mode_names();

    std::cout << "\n[TEST] ALL DECIMAL TESTS PASSED!\n";
    return 0;
}
