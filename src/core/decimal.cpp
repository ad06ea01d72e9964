#include "reckon/core/decimal.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <ostream>
#include <system_error>


namespace reckon::core {

namespace {

__extension__ typedef __int128 int128;

constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();

constexpr std::array<std::int64_t, Decimal::MAX_SCALE + 1> kPow10 = [] {
    std::array<std::int64_t, Decimal::MAX_SCALE + 1> t{};
    std::int64_t v = 1;
    for (std::size_t i = 0; i < t.size(); ++i) {
        t[i] = v;
        if (i + 1 < t.size()) {
            v *= 10;
        }
    }
    return t;
}();

// Keep the mantissa inside (INT64_MIN, INT64_MAX]
[[nodiscard]] inline bool narrow(int128 v, std::int64_t& out) noexcept {
    if (v > kMaxUnits || v < -static_cast<int128>(kMaxUnits)) {
        return false;
    }
    out = static_cast<std::int64_t>(v);
    return true;
}

[[nodiscard]] inline int128 widen(const Decimal& d, int scale) noexcept {
    return static_cast<int128>(d.units()) * kPow10[static_cast<std::size_t>(scale - d.scale())];
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace


// ============================================================================
// RoundingMode
// ============================================================================

std::string_view to_string(RoundingMode mode) noexcept {
    switch (mode) {
        case RoundingMode::HalfUp:   return "half_up";
        case RoundingMode::HalfEven: return "half_even";
        case RoundingMode::Down:     return "down";
    }
    return "unknown";
}

bool parse_rounding_mode(std::string_view sv, RoundingMode& out) noexcept {
    if (iequals(sv, "half_up"))   { out = RoundingMode::HalfUp;   return true; }
    if (iequals(sv, "half_even")) { out = RoundingMode::HalfEven; return true; }
    if (iequals(sv, "down"))      { out = RoundingMode::Down;     return true; }
    return false;
}


// ============================================================================
// Construction
// ============================================================================

bool Decimal::parse(std::string_view sv, Decimal& out) noexcept {
    std::size_t i = 0;
    const std::size_t n = sv.size();

    bool negative = false;
    if (i < n && (sv[i] == '+' || sv[i] == '-')) {
        negative = (sv[i] == '-');
        ++i;
    }

    std::int64_t mantissa = 0;
    int frac_digits = 0;
    int exponent = 0;
    bool any_digit = false;
    bool seen_dot = false;

    for (; i < n; ++i) {
        const char c = sv[i];
        if (c >= '0' && c <= '9') {
            any_digit = true;
            if (seen_dot) {
                ++frac_digits;
            }
            const int digit = c - '0';
            if (mantissa > (kMaxUnits - digit) / 10) {
                return false;
            }
            mantissa = mantissa * 10 + digit;
        }
        else if (c == '.' && !seen_dot) {
            seen_dot = true;
        }
        else if ((c == 'e' || c == 'E') && any_digit) {
            ++i;
            bool exp_negative = false;
            if (i < n && (sv[i] == '+' || sv[i] == '-')) {
                exp_negative = (sv[i] == '-');
                ++i;
            }
            if (i >= n) {
                return false;
            }
            for (; i < n; ++i) {
                if (sv[i] < '0' || sv[i] > '9') {
                    return false;
                }
                exponent = exponent * 10 + (sv[i] - '0');
                if (exponent > 400) {
                    return false;
                }
            }
            if (exp_negative) {
                exponent = -exponent;
            }
            break;
        }
        else {
            return false;
        }
    }

    if (!any_digit) {
        return false;
    }

    int scale = frac_digits - exponent;

    // Drop trailing zeros that push the scale past the supported precision
    while (scale > MAX_SCALE && mantissa % 10 == 0) {
        mantissa /= 10;
        --scale;
    }
    if (scale > MAX_SCALE) {
        if (mantissa != 0) {
            return false;
        }
        scale = 0;
    }
    if (scale < 0) {
        if (mantissa != 0) {
            if (-scale > MAX_SCALE) {
                return false;
            }
            std::int64_t widened = 0;
            if (!narrow(static_cast<int128>(mantissa) * kPow10[static_cast<std::size_t>(-scale)], widened)) {
                return false;
            }
            mantissa = widened;
        }
        scale = 0;
    }

    out = from_units(negative ? -mantissa : mantissa, scale);
    return true;
}

bool Decimal::from_double(double value, Decimal& out) noexcept {
    if (!std::isfinite(value)) {
        return false;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return false;
    }
    return parse(std::string_view(buf, static_cast<std::size_t>(ptr - buf)), out);
}


// ============================================================================
// Rounding
// ============================================================================

bool Decimal::rescale(int places, RoundingMode mode, Decimal& out) const noexcept {
    if (places < 0 || places > MAX_SCALE) {
        return false;
    }
    if (places >= scale_) {
        std::int64_t widened = 0;
        if (!narrow(widen(*this, places), widened)) {
            return false;
        }
        out = from_units(widened, places);
        return true;
    }

    const std::int64_t divisor = kPow10[static_cast<std::size_t>(scale_ - places)];
    std::int64_t q = units_ / divisor;
    const std::int64_t r = units_ % divisor;
    const std::int64_t step = units_ < 0 ? -1 : 1;
    const int128 twice_r = static_cast<int128>(r < 0 ? -r : r) * 2;

    switch (mode) {
        case RoundingMode::HalfUp:
            if (twice_r >= divisor) q += step;
            break;
        case RoundingMode::HalfEven:
            if (twice_r > divisor || (twice_r == divisor && (q % 2) != 0)) q += step;
            break;
        case RoundingMode::Down:
            break;
    }

    out = from_units(q, places);
    return true;
}

Decimal Decimal::normalized() const noexcept {
    std::int64_t u = units_;
    int s = scale_;
    while (s > 0 && u % 10 == 0) {
        u /= 10;
        --s;
    }
    return from_units(u, s);
}


// ============================================================================
// Conversion
// ============================================================================

double Decimal::to_double() const noexcept {
    return static_cast<double>(static_cast<long double>(units_) / static_cast<long double>(kPow10[scale_]));
}

std::string Decimal::to_string() const {
    const std::uint64_t magnitude = units_ < 0
        ? static_cast<std::uint64_t>(-units_)
        : static_cast<std::uint64_t>(units_);

    std::string digits = std::to_string(magnitude);
    if (scale_ > 0) {
        if (digits.size() <= scale_) {
            digits.insert(0, scale_ + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - scale_, 1, '.');
    }
    if (units_ < 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}


// ============================================================================
// Comparison & arithmetic
// ============================================================================

std::strong_ordering operator<=>(const Decimal& a, const Decimal& b) noexcept {
    const int s = a.scale() > b.scale() ? a.scale() : b.scale();
    const int128 va = widen(a, s);
    const int128 vb = widen(b, s);
    if (va < vb) return std::strong_ordering::less;
    if (va > vb) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

bool operator==(const Decimal& a, const Decimal& b) noexcept {
    return (a <=> b) == std::strong_ordering::equal;
}

bool add(const Decimal& a, const Decimal& b, Decimal& out) noexcept {
    const int s = a.scale() > b.scale() ? a.scale() : b.scale();
    std::int64_t units = 0;
    if (!narrow(widen(a, s) + widen(b, s), units)) {
        return false;
    }
    out = Decimal::from_units(units, s);
    return true;
}

bool subtract(const Decimal& a, const Decimal& b, Decimal& out) noexcept {
    return add(a, -b, out);
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

} // namespace reckon::core
