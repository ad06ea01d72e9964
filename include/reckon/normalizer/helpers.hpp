#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "reckon/normalizer/result.hpp"
#include "reckon/core/decimal.hpp"
#include "reckon/core/timestamp.hpp"

#include "simdjson.h"

/*
================================================================================
Raw Record Coercion Helpers (Low-Level Primitives)
================================================================================

This header defines the helper functions the EventNormalizer uses to pull
loosely-typed values out of simdjson DOM elements.

Log parsers are not consistent about types: the same field may arrive as a
JSON string, an integer or a floating point number, and "absent" may be
spelled as a missing key, null, or an empty string. These helpers collapse
those spellings into one typed value or one failure code.

Responsibilities:
  • Enforce basic JSON structural rules (object presence)
  • Treat missing / null / blank uniformly as "not present"
  • Coerce strings and numbers into text, Decimal and Timestamp
  • Never log or report errors
  • Never throw exceptions on malformed input

Design principles:
  • Helpers are field-agnostic; field names are passed in as alias lists
  • Required-field helpers return MissingField / InvalidValue
  • Optional-field helpers report presence separately from validity

IMPORTANT:
  - Helpers MUST NOT interpret values semantically (actions, currencies, ...)
  - Helpers MUST NOT emit logs

================================================================================
*/


namespace reckon::normalizer::helper {

using Keys = std::initializer_list<const char*>;

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Normalized : Result::InvalidJson;
}

[[nodiscard]]
inline std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n')) sv.remove_suffix(1);
    return sv;
}

// ------------------------------------------------------------
// FIELD LOOKUP (first alias that is present and not null)
// ------------------------------------------------------------
[[nodiscard]]
inline bool lookup(const simdjson::dom::element& obj, Keys keys, simdjson::dom::element& out) noexcept {
    for (const char* key : keys) {
        simdjson::dom::element field;
        if (obj[key].get(field)) {
            continue; // not present under this alias
        }
        if (field.is_null()) {
            continue;
        }
        out = field;
        return true;
    }
    return false;
}


// ============================================================================
// TEXT
// ============================================================================

// String, integer, float or bool rendered as text. False for arrays/objects.
[[nodiscard]]
inline bool element_to_text(const simdjson::dom::element& el, std::string& out) {
    switch (el.type()) {
        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (el.get(sv)) return false;
            out.assign(trim(sv));
            return true;
        }
        case simdjson::dom::element_type::INT64: {
            std::int64_t v = 0;
            if (el.get(v)) return false;
            out = std::to_string(v);
            return true;
        }
        case simdjson::dom::element_type::UINT64: {
            std::uint64_t v = 0;
            if (el.get(v)) return false;
            out = std::to_string(v);
            return true;
        }
        case simdjson::dom::element_type::DOUBLE: {
            double v = 0.0;
            if (el.get(v)) return false;
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            if (ec != std::errc{}) return false;
            out.assign(buf, ptr);
            return true;
        }
        case simdjson::dom::element_type::BOOL: {
            bool v = false;
            if (el.get(v)) return false;
            out = v ? "true" : "false";
            return true;
        }
        default:
            return false;
    }
}

[[nodiscard]]
inline Result parse_text_required(const simdjson::dom::element& obj, Keys keys, std::string& out) {
    simdjson::dom::element el;
    if (!lookup(obj, keys, el)) {
        return Result::MissingField;
    }
    if (!element_to_text(el, out)) {
        return Result::InvalidValue;
    }
    return out.empty() ? Result::MissingField : Result::Normalized;
}

// Absent, null and non-scalar values all leave `out` empty
[[nodiscard]]
inline bool parse_text_optional(const simdjson::dom::element& obj, Keys keys, std::string& out) {
    out.clear();
    simdjson::dom::element el;
    if (!lookup(obj, keys, el)) {
        return false;
    }
    if (!element_to_text(el, out)) {
        out.clear();
        return false;
    }
    return !out.empty();
}


// ============================================================================
// DECIMAL
// ============================================================================

[[nodiscard]]
inline bool element_to_decimal(const simdjson::dom::element& el, core::Decimal& out, bool& blank) noexcept {
    blank = false;
    switch (el.type()) {
        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (el.get(sv)) return false;
            sv = trim(sv);
            if (sv.empty()) {
                blank = true;
                return false;
            }
            return core::Decimal::parse(sv, out);
        }
        case simdjson::dom::element_type::INT64: {
            std::int64_t v = 0;
            if (el.get(v)) return false;
            if (v == INT64_MIN) return false;
            out = core::Decimal::from_int(v);
            return true;
        }
        case simdjson::dom::element_type::UINT64: {
            std::uint64_t v = 0;
            if (el.get(v)) return false;
            if (v > static_cast<std::uint64_t>(INT64_MAX)) return false;
            out = core::Decimal::from_int(static_cast<std::int64_t>(v));
            return true;
        }
        case simdjson::dom::element_type::DOUBLE: {
            double v = 0.0;
            if (el.get(v)) return false;
            return core::Decimal::from_double(v, out);
        }
        default:
            return false;
    }
}

[[nodiscard]]
inline Result parse_decimal_required(const simdjson::dom::element& obj, Keys keys, core::Decimal& out) noexcept {
    simdjson::dom::element el;
    if (!lookup(obj, keys, el)) {
        return Result::MissingField;
    }
    bool blank = false;
    if (!element_to_decimal(el, out, blank)) {
        return blank ? Result::MissingField : Result::InvalidValue;
    }
    return Result::Normalized;
}

// Result::Normalized when absent (out reset) or valid, InvalidValue when present but unparseable
[[nodiscard]]
inline Result parse_decimal_optional(const simdjson::dom::element& obj, Keys keys, std::optional<core::Decimal>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!lookup(obj, keys, el)) {
        return Result::Normalized;
    }
    core::Decimal value;
    bool blank = false;
    if (!element_to_decimal(el, value, blank)) {
        return blank ? Result::Normalized : Result::InvalidValue;
    }
    out = value;
    return Result::Normalized;
}


// ============================================================================
// TIMESTAMP
// ============================================================================

// Digit-only strings shorter than this are not taken as epoch milliseconds,
// so a compact date such as "20240103" is rejected instead of landing in 1970
constexpr std::size_t MIN_EPOCH_MS_DIGITS = 10;

// RFC 3339 text, or epoch milliseconds as integer / digit-only string of at
// least MIN_EPOCH_MS_DIGITS digits
[[nodiscard]]
inline Result parse_timestamp_required(const simdjson::dom::element& obj, Keys keys, core::Timestamp& out) noexcept {
    simdjson::dom::element el;
    if (!lookup(obj, keys, el)) {
        return Result::MissingField;
    }
    switch (el.type()) {
        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (el.get(sv)) return Result::InvalidValue;
            sv = trim(sv);
            if (sv.empty()) return Result::MissingField;

            const bool digits_only = std::all_of(sv.begin(), sv.end(),
                [](char c) { return c >= '0' && c <= '9'; });
            if (digits_only) {
                if (sv.size() < MIN_EPOCH_MS_DIGITS) return Result::InvalidValue;
                std::int64_t ms = 0;
                auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), ms);
                if (ec != std::errc{} || ptr != sv.data() + sv.size()) return Result::InvalidValue;
                return core::from_epoch_ms(ms, out) ? Result::Normalized : Result::InvalidValue;
            }
            return core::parse_rfc3339(sv, out) ? Result::Normalized : Result::InvalidValue;
        }
        case simdjson::dom::element_type::INT64: {
            std::int64_t ms = 0;
            if (el.get(ms)) return Result::InvalidValue;
            return core::from_epoch_ms(ms, out) ? Result::Normalized : Result::InvalidValue;
        }
        case simdjson::dom::element_type::UINT64: {
            std::uint64_t ms = 0;
            if (el.get(ms) || ms > static_cast<std::uint64_t>(INT64_MAX)) return Result::InvalidValue;
            return core::from_epoch_ms(static_cast<std::int64_t>(ms), out) ? Result::Normalized : Result::InvalidValue;
        }
        default:
            return Result::InvalidValue;
    }
}

} // namespace reckon::normalizer::helper
