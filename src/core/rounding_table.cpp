#include "reckon/core/rounding_table.hpp"

#include "lcr/log/logger.hpp"


namespace reckon::core {

std::string canonical_currency(std::string_view currency) {
    return upper_trimmed(currency);
}


config::Error CurrencyRoundingTable::make(const config::Engine& cfg, CurrencyRoundingTable& out) {
    if (cfg.default_decimals < 0) return config::Error::NegativeDecimals;
    if (cfg.default_decimals > Decimal::MAX_SCALE) return config::Error::DecimalsTooLarge;

    CurrencyRoundingTable table;
    table.default_decimals_ = cfg.default_decimals;
    table.mode_ = cfg.rounding_mode;

    for (const auto& [code, places] : cfg.currency_decimals) {
        std::string key = canonical_currency(code);
        if (key.empty()) return config::Error::InvalidCurrencyCode;
        if (places < 0) return config::Error::NegativeDecimals;
        if (places > Decimal::MAX_SCALE) return config::Error::DecimalsTooLarge;
        table.decimals_[std::move(key)] = places;
    }
    for (const auto& code : cfg.known_currencies) {
        std::string key = canonical_currency(code);
        if (key.empty()) return config::Error::InvalidCurrencyCode;
        // explicit overrides win
        table.decimals_.emplace(std::move(key), cfg.default_decimals);
    }

    RK_DEBUG("[ROUNDING] Table built with " << table.decimals_.size()
             << " currencies, default=" << table.default_decimals_
             << " mode=" << to_string(table.mode_));

    out = std::move(table);
    return config::Error::None;
}


RoundingLookup CurrencyRoundingTable::rule(std::string_view currency) const {
    RoundingLookup lookup;
    lookup.rule.currency = canonical_currency(currency);
    lookup.rule.mode = mode_;

    auto it = decimals_.find(lookup.rule.currency);
    if (it != decimals_.end()) {
        lookup.rule.decimal_places = it->second;
        lookup.resolved = true;
    } else {
        lookup.rule.decimal_places = default_decimals_;
        lookup.resolved = false;
    }
    return lookup;
}


std::ostream& operator<<(std::ostream& os, const CurrencyRoundingRule& r) {
    return os << "[Rule] {currency=" << r.currency
              << ", decimals=" << r.decimal_places
              << ", mode=" << to_string(r.mode) << "}";
}

} // namespace reckon::core
