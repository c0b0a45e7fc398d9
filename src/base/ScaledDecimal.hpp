/**
 * @file        ScaledDecimal.hpp
 * @brief       Exact signed decimal arithmetic using arbitrary precision scaled integers.
 */

#pragma once

#include <cstdint>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>
#include "outcome/outcome.hpp"

namespace selsum
{
    /**
     * @brief Errors raised while building or rescaling a ScaledDecimal.
     */
    enum class ScaledDecimalError
    {
        INVALID_LITERAL = 1, ///< text is not [sign]digits[.digits][E[sign]digits]
        VALUE_TOO_LARGE,     ///< exact expansion needs more digit positions than allowed
        PRECISION_LOSS,      ///< rescaling would drop non-zero digits
    };

    /**
     * @class ScaledDecimal
     * @brief Represents an exact decimal value using an unbounded integer scaled by 10^precision.
     *
     * Internally stores the decimal as a signed integer multiplied by 10^precision.
     * Example: raw_value = -12345, precision = 2 => decimal value -123.45
     * No operation ever rounds, so sums of any length stay exact.
     */
    class ScaledDecimal
    {
    public:
        using Integer = boost::multiprecision::cpp_int;

        /// Digit positions a single literal may expand to unless the caller says otherwise
        static constexpr uint64_t kDefaultMaxExpansion = 4096;

        /**
         * @brief Construct the value zero.
         */
        ScaledDecimal();

        /**
         * @brief Create a ScaledDecimal from a raw integer and precision.
         * @param[in] raw_value  Integer representation scaled by 10^precision.
         * @param[in] precision  Number of decimal places (scale factor).
         */
        ScaledDecimal( Integer raw_value, uint64_t precision );

        /**
         * @brief Parse a normalized decimal literal.
         *
         * Accepts an optional sign, integer digits, an optional fraction and an optional
         * exponent, e.g. "-1200.50", ".5", "7E2", "2.5e-3". The exponent is applied exactly.
         * @param[in] str            Literal text.
         * @param[in] max_expansion  Upper bound on the digit positions the exact value may span.
         * @return Outcome containing the exact value or error.
         */
        static outcome::result<ScaledDecimal> FromString( const std::string &str,
                                                          uint64_t           max_expansion = kDefaultMaxExpansion );

        /**
         * @brief Compute 10^precision as the scale factor.
         * @param[in] precision  Number of decimal places.
         * @return Scale factor (10^precision).
         */
        static Integer ScaleFactor( uint64_t precision );

        /**
         * @brief Get the raw scaled integer value.
         */
        const Integer &Value() const noexcept;

        /**
         * @brief Get the precision (number of decimal places).
         */
        uint64_t Precision() const noexcept;

        bool IsZero() const;
        bool IsNegative() const;

        /**
         * @brief True if the value has no non-zero fractional digit.
         */
        bool IsInteger() const;

        /**
         * @brief Drop trailing fractional zeros; the value is unchanged.
         * @return Same value at the smallest precision that represents it exactly.
         */
        ScaledDecimal Normalized() const;

        /**
         * @brief Number of digits of the normalized raw value, e.g. 3 for 0.00123 and 5 for 123.45.
         * Zero has no significant digit.
         */
        uint64_t SignificantDigits() const;

        /**
         * @brief Exact sum of two values of any precision.
         * @param[in] other      ScaledDecimal to add.
         * @return Sum at the larger of both precisions.
         */
        ScaledDecimal Add( const ScaledDecimal &other ) const;

        /**
         * @brief Convert this ScaledDecimal to a different precision.
         * @param[in] to         Target number of decimal places.
         * @return Outcome containing the rescaled value, or PRECISION_LOSS if non-zero digits would be dropped.
         */
        outcome::result<ScaledDecimal> ConvertPrecision( uint64_t to ) const;

        /**
         * @brief  Return this value as a plain decimal string.
         * @param  fixedDecimals
         *         - true: always show all fractional digits (pad with zeros up to Precision())
         *         - false: trim trailing '0's in the fractional part (and drop the '.' if no fraction remains)
         * @return formatted string
         */
        std::string ToString( bool fixedDecimals = true ) const;

        /**
         * @brief  Return this value in normalized scientific notation, e.g. "1.2345E+7".
         * @param  max_digits Significant digits kept in the mantissa; extra digits are rounded half to even.
         * @return formatted string, "0E+0" for zero
         */
        std::string ToScientific( uint64_t max_digits ) const;

    private:
        Integer  value_;
        uint64_t precision_;
    };

} // namespace selsum

OUTCOME_HPP_DECLARE_ERROR_2( selsum, ScaledDecimalError );
