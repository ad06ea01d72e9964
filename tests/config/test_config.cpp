#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>

#include "reckon/config/engine.hpp"
#include "reckon/config/loader.hpp"
#include "lcr/log/logger.hpp"

#include "common/test_check.hpp"

using namespace reckon;
using namespace reckon::config;

/*
================================================================================
Engine Configuration - Unit Tests
================================================================================

  • Defaults are valid
  • Every structural error is detected by validate()
  • JSON overlay: present keys overwrite, absent keys keep their value
  • Wrongly typed documents are rejected as a whole
================================================================================
*/

static core::Decimal dec(std::string_view text) {
    core::Decimal d;
    TEST_CHECK(core::Decimal::parse(text, d));
    return d;
}

// ------------------------------------------------------------
// validate()
// ------------------------------------------------------------

void test_defaults_valid() {
    std::cout << "[TEST] Defaults are valid..." << std::endl;

    Engine cfg;
    TEST_CHECK(validate(cfg) == Error::None);
    TEST_CHECK(cfg.tolerance == dec("0.005"));
    TEST_CHECK(cfg.default_decimals == 2);
    TEST_CHECK(cfg.currency_decimals.at("SAR") == 3);
    TEST_CHECK(cfg.currency_decimals.at("BHD") == 4);
    TEST_CHECK(cfg.mad_threshold == 6.0);
    TEST_CHECK(cfg.burst_window == std::chrono::milliseconds(1000));
    TEST_CHECK(cfg.rapid_repeat_window == std::chrono::seconds(60));
    TEST_CHECK(cfg.workers == 1);

    std::cout << "[TEST] OK\n";
}

void test_validate_errors() {
    std::cout << "[TEST] Structural errors are fatal..." << std::endl;

    {
        Engine cfg;
        cfg.tolerance = dec("-0.001");
        TEST_CHECK(validate(cfg) == Error::NegativeTolerance);
    }
    {
        Engine cfg;
        cfg.default_decimals = -2;
        TEST_CHECK(validate(cfg) == Error::NegativeDecimals);
    }
    {
        Engine cfg;
        cfg.currency_decimals["KWD"] = 40;
        TEST_CHECK(validate(cfg) == Error::DecimalsTooLarge);
    }
    {
        Engine cfg;
        cfg.currency_decimals[""] = 2;
        TEST_CHECK(validate(cfg) == Error::InvalidCurrencyCode);
    }
    {
        Engine cfg;
        cfg.mad_threshold = 0.0;
        TEST_CHECK(validate(cfg) == Error::InvalidMadThreshold);
        cfg.mad_threshold = std::numeric_limits<double>::quiet_NaN();
        TEST_CHECK(validate(cfg) == Error::InvalidMadThreshold);
    }
    {
        Engine cfg;
        cfg.burst_window = std::chrono::milliseconds(-1);
        TEST_CHECK(validate(cfg) == Error::InvalidWindow);
    }
    {
        Engine cfg;
        cfg.business_hours.start_hour = 18;
        cfg.business_hours.end_hour = 8;
        TEST_CHECK(validate(cfg) == Error::InvalidBusinessHours);
    }
    {
        Engine cfg;
        cfg.business_hours.utc_offset_minutes = 19 * 60;
        TEST_CHECK(validate(cfg) == Error::InvalidBusinessHours);
    }
    {
        Engine cfg;
        cfg.rounding_pattern_min_occurrences = 1;
        TEST_CHECK(validate(cfg) == Error::InvalidRoundingPattern);
    }
    {
        Engine cfg;
        cfg.workers = 0;
        TEST_CHECK(validate(cfg) == Error::InvalidWorkers);
    }

    TEST_CHECK(to_string(Error::InvalidWorkers) == "InvalidWorkers");

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// load_json() / load_file()
// ------------------------------------------------------------

void test_load_json_overlay() {
    std::cout << "[TEST] JSON overlay..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "tolerance": "0.01",
        "rounding_mode": "half_even",
        "currency_decimals": {"KWD": 3},
        "mad_threshold": 4,
        "burst_window_ms": 250,
        "rapid_repeat_window_s": 30,
        "business_hours": {"start_hour": 9, "utc_offset_minutes": 180, "flag_weekends": false},
        "rounding_pattern_max_magnitude": 0.5,
        "workers": 4
    }
    )json";

    Engine cfg;
    TEST_CHECK(load_json(json, cfg) == Error::None);
    TEST_CHECK(validate(cfg) == Error::None);

    TEST_CHECK(cfg.tolerance == dec("0.01"));
    TEST_CHECK(cfg.rounding_mode == core::RoundingMode::HalfEven);
    TEST_CHECK(cfg.currency_decimals.at("KWD") == 3);
    TEST_CHECK(cfg.currency_decimals.at("SAR") == 3);           // merged, not replaced
    TEST_CHECK(cfg.mad_threshold == 4.0);
    TEST_CHECK(cfg.burst_window == std::chrono::milliseconds(250));
    TEST_CHECK(cfg.rapid_repeat_window == std::chrono::seconds(30));
    TEST_CHECK(cfg.business_hours.start_hour == 9);
    TEST_CHECK(cfg.business_hours.end_hour == 18);              // untouched
    TEST_CHECK(cfg.business_hours.utc_offset_minutes == 180);
    TEST_CHECK(!cfg.business_hours.flag_weekends);
    TEST_CHECK(cfg.rounding_pattern_max_magnitude == dec("0.5"));
    TEST_CHECK(cfg.workers == 4);
    TEST_CHECK(cfg.default_decimals == 2);                      // untouched

    std::cout << "[TEST] OK\n";
}

void test_known_currencies_replace() {
    std::cout << "[TEST] known_currencies replaces the list..." << std::endl;

    Engine cfg;
    TEST_CHECK(load_json(R"({"known_currencies": ["JPY"]})", cfg) == Error::None);
    TEST_CHECK(cfg.known_currencies.size() == 1);
    TEST_CHECK(cfg.known_currencies.count("JPY") == 1);

    std::cout << "[TEST] OK\n";
}

void test_load_json_rejects() {
    std::cout << "[TEST] Invalid documents are rejected..." << std::endl;

    Engine cfg;
    TEST_CHECK(load_json("{", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json("[1, 2]", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json(R"({"tolerance": "abc"})", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json(R"({"rounding_mode": "ceiling"})", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json(R"({"workers": -1})", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json(R"({"currency_decimals": {"KWD": "three"}})", cfg) == Error::FileInvalid);
    TEST_CHECK(load_json(R"({"business_hours": {"flag_weekends": "yes"}})", cfg) == Error::FileInvalid);

    // Rapid-repeat window must still fit in milliseconds
    const std::string too_wide = "{\"rapid_repeat_window_s\": " + std::to_string(MAX_RAPID_REPEAT_WINDOW_S + 1) + "}";
    TEST_CHECK(load_json(too_wide, cfg) == Error::FileInvalid);
    Engine widest;
    const std::string fits = "{\"rapid_repeat_window_s\": " + std::to_string(MAX_RAPID_REPEAT_WINDOW_S) + "}";
    TEST_CHECK(load_json(fits, widest) == Error::None);
    TEST_CHECK(widest.rapid_repeat_window == std::chrono::seconds(MAX_RAPID_REPEAT_WINDOW_S));

    std::cout << "[TEST] OK\n";
}

void test_load_file() {
    std::cout << "[TEST] Config file..." << std::endl;

    const auto path = std::filesystem::temp_directory_path() / "reckon_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"default_decimals": 3})";
    }

    Engine cfg;
    TEST_CHECK(load_file(path.string(), cfg) == Error::None);
    TEST_CHECK(cfg.default_decimals == 3);
    std::filesystem::remove(path);

    TEST_CHECK(load_file(path.string(), cfg) == Error::FileUnreadable);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Off);

    test_defaults_valid();
    test_validate_errors();
    test_load_json_overlay();
    test_known_currencies_replace();
    test_load_json_rejects();
    test_load_file();

    std::cout << "\n[TEST] ALL CONFIG TESTS PASSED!\n";
    return 0;
}
