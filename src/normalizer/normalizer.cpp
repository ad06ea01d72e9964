#include "reckon/normalizer/normalizer.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "reckon/normalizer/helpers.hpp"
#include "reckon/core/rounding_table.hpp"
#include "lcr/log/logger.hpp"


namespace reckon::normalizer {

namespace {

constexpr std::string_view BALANCE_SYNC = "BALANCE_SYNC";

[[nodiscard]]
inline Result fail(const core::RawRecord& raw, Result code, std::string_view field,
                   std::string reason, NormalizationFailure& failure) {
    failure.line = raw.line;
    failure.raw = raw.text;
    failure.code = code;
    failure.field.assign(field);
    failure.reason = std::move(reason);
    RK_DEBUG("[NORMALIZER] line " << raw.line << ": " << to_string(code)
             << (field.empty() ? "" : " '") << field << (field.empty() ? "" : "'")
             << " -> " << failure.reason);
    return code;
}

// Optional money field: a present but unparseable value is dropped
inline void optional_decimal(const simdjson::dom::element& root, helper::Keys keys,
                             std::string_view name, std::uint64_t line,
                             std::optional<core::Decimal>& out) {
    if (helper::parse_decimal_optional(root, keys, out) != Result::Normalized) {
        out.reset();
        RK_DEBUG("[NORMALIZER] line " << line << ": field '" << name << "' unparseable -> treated as absent");
    }
}

} // namespace


Result EventNormalizer::normalize(const core::RawRecord& raw,
                                  core::TransactionEvent& out,
                                  NormalizationFailure& failure) {
    out = core::TransactionEvent{};
    out.line = raw.line;

    simdjson::dom::element root;
    if (auto err = parser_.parse(raw.text).get(root); err) {
        return fail(raw, Result::InvalidJson, {}, std::string("malformed JSON: ") + simdjson::error_message(err), failure);
    }

    // Root must be object
    if (helper::require_object(root) != Result::Normalized) {
        return fail(raw, Result::InvalidJson, {}, "record is not a JSON object", failure);
    }

    // eventType (optional): only balance transactions are reconciled
    std::string event_type;
    if (helper::parse_text_optional(root, {"eventType", "event_type"}, event_type)) {
        if (core::upper_trimmed(event_type) != BALANCE_SYNC) {
            RK_TRACE("[NORMALIZER] line " << raw.line << ": eventType '" << event_type << "' -> ignore record.");
            return Result::Ignored;
        }
    }

    // userId (required)
    auto r = helper::parse_text_required(root, {"userId", "user_id"}, out.user_id);
    if (r != Result::Normalized) {
        return fail(raw, r, "userId", "user id missing or not a scalar", failure);
    }

    // id (required)
    r = helper::parse_text_required(root, {"id", "transactionId"}, out.id);
    if (r != Result::Normalized) {
        return fail(raw, r, "id", "transaction id missing or not a scalar", failure);
    }

    // timestamp (required)
    r = helper::parse_timestamp_required(root, {"timestamp"}, out.timestamp);
    if (r != Result::Normalized) {
        return fail(raw, r, "timestamp",
                    r == Result::MissingField ? "timestamp missing" : "timestamp is neither RFC 3339 nor epoch milliseconds",
                    failure);
    }

    // amount (required)
    r = helper::parse_decimal_required(root, {"amount"}, out.gross_amount);
    if (r != Result::Normalized) {
        return fail(raw, r, "amount",
                    r == Result::MissingField ? "amount missing" : "amount is not a decimal number",
                    failure);
    }

    // messageId (optional)
    (void)helper::parse_text_optional(root, {"messageId", "message_id"}, out.message_id);

    // action (optional): blank maps to Action::Missing
    (void)helper::parse_text_optional(root, {"action"}, out.action_text);
    out.action = core::parse_action(out.action_text);

    // type (optional)
    (void)helper::parse_text_optional(root, {"type"}, out.direction_text);
    out.direction = core::parse_direction(out.direction_text);

    // vat / oldBalance / newBalance (optional, lenient)
    optional_decimal(root, {"vat"}, "vat", raw.line, out.vat);
    optional_decimal(root, {"oldBalance", "old_balance"}, "oldBalance", raw.line, out.logged_old_balance);
    optional_decimal(root, {"newBalance", "new_balance"}, "newBalance", raw.line, out.logged_new_balance);

    // currency (optional)
    std::string currency;
    (void)helper::parse_text_optional(root, {"currency"}, currency);
    out.currency = currency.empty() ? std::string("UNKNOWN") : core::canonical_currency(currency);

    // source (optional)
    std::string source;
    (void)helper::parse_text_optional(root, {"source"}, source);
    out.source = core::upper_trimmed(source);

    // signed amount
    if (!core::signed_amount(out.direction, out.gross_amount, out.vat, out.amount)) {
        return fail(raw, Result::InvalidValue, "vat", "amount minus vat overflows", failure);
    }

    return Result::Normalized;
}


EventNormalizer::Batch EventNormalizer::normalize_all(const std::vector<core::RawRecord>& records) {
    Batch batch;
    batch.events.reserve(records.size());

    for (const auto& raw : records) {
        core::TransactionEvent event;
        NormalizationFailure failure;
        switch (normalize(raw, event, failure)) {
            case Result::Normalized:
                batch.events.push_back(std::move(event));
                break;
            case Result::Ignored:
                ++batch.ignored;
                break;
            default:
                batch.failures.push_back(std::move(failure));
                break;
        }
    }

    RK_INFO("[NORMALIZER] " << records.size() << " records -> "
            << batch.events.size() << " events, "
            << batch.failures.size() << " failures, "
            << batch.ignored << " ignored");
    return batch;
}

} // namespace reckon::normalizer
