#pragma once

#include <cstddef>
#include <vector>

#include "reckon/core/event.hpp"
#include "reckon/normalizer/result.hpp"

#include "simdjson.h"


namespace reckon::normalizer {

/*
================================================================================
Event Normalizer
================================================================================

Boundary between the external log parser and the engine. Each raw record is a
JSON object whose fields may be strings, numbers or null. The normalizer turns
it into a strongly-typed TransactionEvent or one explicit failure.

Field rules:
  • Required : userId, id, timestamp, amount
  • Optional : messageId, action, type, vat, oldBalance, newBalance,
               currency, source, eventType
  • null is the same as absent
  • Unparseable optional balances / vat are dropped (logged at DEBUG)
  • eventType present and not BALANCE_SYNC → Result::Ignored

Threading:
  • One normalizer per thread (the simdjson parser owns reusable buffers)
================================================================================
*/
class EventNormalizer {
public:
    struct Batch {
        std::vector<core::TransactionEvent> events;
        std::vector<NormalizationFailure> failures;
        std::size_t ignored = 0;
    };

    EventNormalizer() = default;

    // Returns Normalized (out filled), Ignored, or a failure code (failure filled)
    [[nodiscard]] Result normalize(const core::RawRecord& raw,
                                   core::TransactionEvent& out,
                                   NormalizationFailure& failure);

    // Never stops at a malformed record
    [[nodiscard]] Batch normalize_all(const std::vector<core::RawRecord>& records);

private:
    simdjson::dom::parser parser_;
};

} // namespace reckon::normalizer
