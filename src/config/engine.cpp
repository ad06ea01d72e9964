#include "reckon/config/engine.hpp"

#include <cmath>


namespace reckon::config {

namespace {

constexpr int kMaxUtcOffsetMinutes = 18 * 60;

[[nodiscard]] Error validate_decimals(int places) noexcept {
    if (places < 0) return Error::NegativeDecimals;
    if (places > core::Decimal::MAX_SCALE) return Error::DecimalsTooLarge;
    return Error::None;
}

} // namespace


Error validate(const Engine& cfg) noexcept {
    if (auto e = validate_decimals(cfg.default_decimals); e != Error::None) {
        return e;
    }
    for (const auto& [currency, places] : cfg.currency_decimals) {
        if (currency.empty()) {
            return Error::InvalidCurrencyCode;
        }
        if (auto e = validate_decimals(places); e != Error::None) {
            return e;
        }
    }

    for (const auto& currency : cfg.known_currencies) {
        if (currency.empty()) {
            return Error::InvalidCurrencyCode;
        }
    }

    if (cfg.tolerance.is_negative()) {
        return Error::NegativeTolerance;
    }

    if (!std::isfinite(cfg.mad_threshold) || cfg.mad_threshold <= 0.0) {
        return Error::InvalidMadThreshold;
    }
    if (cfg.burst_window.count() < 0 || cfg.rapid_repeat_window.count() < 0) {
        return Error::InvalidWindow;
    }

    const auto& bh = cfg.business_hours;
    if (bh.start_hour < 0 || bh.start_hour > 24 || bh.end_hour < 0 || bh.end_hour > 24 ||
        bh.start_hour >= bh.end_hour ||
        bh.utc_offset_minutes < -kMaxUtcOffsetMinutes || bh.utc_offset_minutes > kMaxUtcOffsetMinutes) {
        return Error::InvalidBusinessHours;
    }

    if (cfg.rounding_pattern_min_occurrences < 2 || cfg.rounding_pattern_max_magnitude.is_negative()) {
        return Error::InvalidRoundingPattern;
    }

    if (cfg.workers == 0) {
        return Error::InvalidWorkers;
    }
    return Error::None;
}


void Engine::dump(const std::string& header, std::ostream& os) const {
    os << header << ":\n"
       << "  Tolerance          : " << tolerance << "\n"
       << "  Default decimals   : " << default_decimals << "\n"
       << "  Rounding mode      : " << core::to_string(rounding_mode) << "\n"
       << "  Currency decimals  : ";
    bool first = true;
    for (const auto& [currency, places] : currency_decimals) {
        if (!first) os << ", ";
        os << currency << "=" << places;
        first = false;
    }
    os << "\n"
       << "  Known currencies   : ";
    first = true;
    for (const auto& currency : known_currencies) {
        if (!first) os << ", ";
        os << currency;
        first = false;
    }
    os << "\n"
       << "  MAD threshold (k)  : " << mad_threshold << "\n"
       << "  Burst window       : " << burst_window.count() << " ms\n"
       << "  Rapid-repeat window: " << rapid_repeat_window.count() << " ms\n"
       << "  Business hours     : " << business_hours.start_hour << "-" << business_hours.end_hour
       << " (UTC" << (business_hours.utc_offset_minutes >= 0 ? "+" : "") << business_hours.utc_offset_minutes << "m"
       << (business_hours.flag_weekends ? ", weekends flagged" : "") << ")\n"
       << "  Rounding pattern   : >= " << rounding_pattern_min_occurrences
       << " occurrences, |delta| <= " << rounding_pattern_max_magnitude << "\n"
       << "  Workers            : " << workers << "\n";
}

} // namespace reckon::config
