#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>


namespace reckon::core {

/*
===============================================================================
Exact fixed-point decimal
===============================================================================

Money values are carried as a signed 64-bit mantissa and a decimal scale
(number of fractional digits, 0..18). The value is units * 10^-scale.

  • Parsing is exact: "25.0005" is 250005 x 10^-4, never a binary approximation
  • Arithmetic aligns scales through 128-bit intermediates
  • Every operation that can overflow reports it through a bool result
  • Comparison is numeric: 1.5 == 1.50

Invariant: units is never INT64_MIN, so negation cannot overflow.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Rounding applied when a value is reduced to fewer fractional digits
// -----------------------------------------------------------------------------
enum class RoundingMode : std::uint8_t {
    HalfUp,     // ties away from zero (accounting default)
    HalfEven,   // ties to the even neighbour
    Down        // truncate toward zero
};

[[nodiscard]] std::string_view to_string(RoundingMode mode) noexcept;

// Accepts "half_up" | "half_even" | "down" (case-insensitive)
[[nodiscard]] bool parse_rounding_mode(std::string_view sv, RoundingMode& out) noexcept;


class Decimal {
public:
    static constexpr int MAX_SCALE = 18;

    constexpr Decimal() noexcept = default;

    // Caller guarantees 0 <= scale <= MAX_SCALE and units != INT64_MIN
    [[nodiscard]] static constexpr Decimal from_units(std::int64_t units, int scale) noexcept {
        Decimal d;
        d.units_ = units;
        d.scale_ = static_cast<std::uint8_t>(scale);
        return d;
    }

    [[nodiscard]] static constexpr Decimal from_int(std::int64_t value) noexcept {
        return from_units(value, 0);
    }

    // Plain decimal text: [+-]digits[.digits][e[+-]digits]
    [[nodiscard]] static bool parse(std::string_view sv, Decimal& out) noexcept;

    // Uses the shortest round-trip text of the double, so 0.1 becomes exactly 0.1
    [[nodiscard]] static bool from_double(double value, Decimal& out) noexcept;

    [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
    [[nodiscard]] constexpr int scale() const noexcept { return scale_; }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }
    [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }
    [[nodiscard]] constexpr int signum() const noexcept { return (units_ > 0) - (units_ < 0); }

    [[nodiscard]] constexpr Decimal operator-() const noexcept {
        return from_units(-units_, scale_);
    }

    [[nodiscard]] constexpr Decimal abs() const noexcept {
        return units_ < 0 ? -*this : *this;
    }

    // Reduce or extend to `places` fractional digits
    [[nodiscard]] bool rescale(int places, RoundingMode mode, Decimal& out) const noexcept;

    // Same value with trailing fractional zeros removed
    [[nodiscard]] Decimal normalized() const noexcept;

    [[nodiscard]] double to_double() const noexcept;

    // Fixed notation with exactly scale() fractional digits
    [[nodiscard]] std::string to_string() const;

    friend std::strong_ordering operator<=>(const Decimal& a, const Decimal& b) noexcept;
    friend bool operator==(const Decimal& a, const Decimal& b) noexcept;

private:
    std::int64_t units_ = 0;
    std::uint8_t scale_ = 0;
};

// Checked arithmetic: false on overflow, `out` untouched
[[nodiscard]] bool add(const Decimal& a, const Decimal& b, Decimal& out) noexcept;
[[nodiscard]] bool subtract(const Decimal& a, const Decimal& b, Decimal& out) noexcept;

std::ostream& operator<<(std::ostream& os, const Decimal& d);

} // namespace reckon::core
