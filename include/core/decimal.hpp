#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace orabridge {

/**
 * @brief Arbitrary-precision decimal held as text
 *
 * Value = (-1)^negative * unscaled * 10^(-scale). The unscaled digits carry
 * no leading zeros ("0" for zero); trailing zeros are kept so that
 * "12345678.90" renders back unchanged.
 *
 * Accepts: [+-]digits[.digits][(e|E)[+-]digits], with either side of the
 * point allowed to be empty (".5", "5.") but not both.
 */
class Decimal {
public:
    Decimal() = default;

    [[nodiscard]] static Result<Decimal> parse(std::string_view text);

    [[nodiscard]] bool is_negative() const { return negative_; }
    [[nodiscard]] bool is_zero() const { return unscaled_ == "0"; }

    /// Number of digits after the decimal point (negative: implied trailing zeros)
    [[nodiscard]] int64_t scale() const { return scale_; }

    /// Digit count of the unscaled value ("12.30" -> 4)
    [[nodiscard]] size_t digits() const { return unscaled_.size(); }

    /// True if no non-zero digit sits right of the decimal point
    [[nodiscard]] bool is_integer() const;

    /**
     * @brief Integer rendering with the fraction dropped ("-120.00" -> "-120")
     *
     * Only meaningful when is_integer() holds.
     */
    [[nodiscard]] std::string to_integer_string() const;

    /// Plain (never scientific) rendering, preserving scale
    [[nodiscard]] std::string to_string() const;

private:
    bool negative_ = false;
    std::string unscaled_ = "0";
    int64_t scale_ = 0;
};

} // namespace orabridge
