#include "reckon/config/loader.hpp"

#include <chrono>
#include <cstdint>
#include <limits>

#include "reckon/normalizer/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace reckon::config {

namespace {

namespace helper = normalizer::helper;

[[nodiscard]]
inline Error invalid(std::string_view key, std::string_view expected) {
    RK_ERROR("[CONFIG] Field '" << key << "' must be " << expected);
    return Error::FileInvalid;
}

[[nodiscard]]
inline bool get_int(const simdjson::dom::element& el, std::int64_t& out) noexcept {
    return el.get(out) == simdjson::SUCCESS;
}

// Integer field bounded to int
[[nodiscard]]
inline Error read_int(const simdjson::dom::element& obj, const char* key, int& out) {
    simdjson::dom::element el;
    if (!helper::lookup(obj, {key}, el)) {
        return Error::None;
    }
    std::int64_t v = 0;
    if (!get_int(el, v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return invalid(key, "an integer");
    }
    out = static_cast<int>(v);
    return Error::None;
}

// Non-negative integer field
[[nodiscard]]
inline Error read_count(const simdjson::dom::element& obj, const char* key, std::int64_t& out, bool& present) {
    present = false;
    simdjson::dom::element el;
    if (!helper::lookup(obj, {key}, el)) {
        return Error::None;
    }
    if (!get_int(el, out) || out < 0) {
        return invalid(key, "a non-negative integer");
    }
    present = true;
    return Error::None;
}

[[nodiscard]]
inline Error read_decimal(const simdjson::dom::element& obj, const char* key, core::Decimal& out) {
    simdjson::dom::element el;
    if (!helper::lookup(obj, {key}, el)) {
        return Error::None;
    }
    bool blank = false;
    if (!helper::element_to_decimal(el, out, blank)) {
        return invalid(key, "a decimal number or decimal string");
    }
    return Error::None;
}

[[nodiscard]]
inline Error read_business_hours(const simdjson::dom::element& root, BusinessHours& bh) {
    simdjson::dom::element el;
    if (!helper::lookup(root, {"business_hours"}, el)) {
        return Error::None;
    }
    if (helper::require_object(el) != normalizer::Result::Normalized) {
        return invalid("business_hours", "an object");
    }
    if (auto e = read_int(el, "start_hour", bh.start_hour); e != Error::None) return e;
    if (auto e = read_int(el, "end_hour", bh.end_hour); e != Error::None) return e;
    if (auto e = read_int(el, "utc_offset_minutes", bh.utc_offset_minutes); e != Error::None) return e;

    simdjson::dom::element flag;
    if (helper::lookup(el, {"flag_weekends"}, flag)) {
        if (flag.get(bh.flag_weekends) != simdjson::SUCCESS) {
            return invalid("business_hours.flag_weekends", "a boolean");
        }
    }
    return Error::None;
}

[[nodiscard]]
Error apply(const simdjson::dom::element& root, Engine& cfg) {
    if (helper::require_object(root) != normalizer::Result::Normalized) {
        return invalid("<root>", "an object");
    }

    // ---- ledger ----
    if (auto e = read_decimal(root, "tolerance", cfg.tolerance); e != Error::None) return e;
    if (auto e = read_int(root, "default_decimals", cfg.default_decimals); e != Error::None) return e;

    simdjson::dom::element el;
    if (helper::lookup(root, {"rounding_mode"}, el)) {
        std::string_view sv;
        if (el.get(sv) != simdjson::SUCCESS || !core::parse_rounding_mode(sv, cfg.rounding_mode)) {
            return invalid("rounding_mode", "one of half_up, half_even, down");
        }
    }

    if (helper::lookup(root, {"currency_decimals"}, el)) {
        simdjson::dom::object overrides;
        if (el.get(overrides) != simdjson::SUCCESS) {
            return invalid("currency_decimals", "an object of currency -> decimal places");
        }
        for (auto field : overrides) {
            std::int64_t places = 0;
            if (!get_int(field.value, places) ||
                places < std::numeric_limits<int>::min() || places > std::numeric_limits<int>::max()) {
                return invalid("currency_decimals", "an object of currency -> integer");
            }
            cfg.currency_decimals[std::string(field.key)] = static_cast<int>(places);
        }
    }

    if (helper::lookup(root, {"known_currencies"}, el)) {
        simdjson::dom::array codes;
        if (el.get(codes) != simdjson::SUCCESS) {
            return invalid("known_currencies", "an array of currency codes");
        }
        cfg.known_currencies.clear();
        for (simdjson::dom::element item : codes) {
            std::string_view code;
            if (item.get(code) != simdjson::SUCCESS) {
                return invalid("known_currencies", "an array of strings");
            }
            cfg.known_currencies.insert(std::string(code));
        }
    }

    // ---- detectors ----
    if (helper::lookup(root, {"mad_threshold"}, el)) {
        if (el.get(cfg.mad_threshold) != simdjson::SUCCESS) {
            return invalid("mad_threshold", "a number");
        }
    }

    std::int64_t count = 0;
    bool present = false;
    if (auto e = read_count(root, "burst_window_ms", count, present); e != Error::None) return e;
    if (present) cfg.burst_window = std::chrono::milliseconds(count);

    if (auto e = read_count(root, "rapid_repeat_window_s", count, present); e != Error::None) return e;
    if (present) {
        if (count > MAX_RAPID_REPEAT_WINDOW_S) {
            return invalid("rapid_repeat_window_s", "a window that fits in milliseconds");
        }
        cfg.rapid_repeat_window = std::chrono::seconds(count);
    }

    if (auto e = read_business_hours(root, cfg.business_hours); e != Error::None) return e;

    if (auto e = read_count(root, "rounding_pattern_min_occurrences", count, present); e != Error::None) return e;
    if (present) cfg.rounding_pattern_min_occurrences = static_cast<std::size_t>(count);

    if (auto e = read_decimal(root, "rounding_pattern_max_magnitude", cfg.rounding_pattern_max_magnitude); e != Error::None) return e;

    // ---- execution ----
    if (auto e = read_count(root, "workers", count, present); e != Error::None) return e;
    if (present) {
        if (count > std::numeric_limits<unsigned>::max()) {
            return invalid("workers", "a reasonable thread count");
        }
        cfg.workers = static_cast<unsigned>(count);
    }

    return Error::None;
}

} // namespace


Error load_json(std::string_view json, Engine& cfg) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json);

    simdjson::dom::element root;
    if (auto err = parser.parse(padded).get(root); err) {
        RK_ERROR("[CONFIG] Malformed JSON: " << simdjson::error_message(err));
        return Error::FileInvalid;
    }
    return apply(root, cfg);
}


Error load_file(const std::string& path, Engine& cfg) {
    simdjson::padded_string content;
    if (auto err = simdjson::padded_string::load(path).get(content); err) {
        RK_ERROR("[CONFIG] Cannot read '" << path << "': " << simdjson::error_message(err));
        return Error::FileUnreadable;
    }

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (auto err = parser.parse(content).get(root); err) {
        RK_ERROR("[CONFIG] Malformed JSON in '" << path << "': " << simdjson::error_message(err));
        return Error::FileInvalid;
    }

    auto result = apply(root, cfg);
    if (result == Error::None) {
        RK_INFO("[CONFIG] Loaded " << path);
    }
    return result;
}

} // namespace reckon::config
