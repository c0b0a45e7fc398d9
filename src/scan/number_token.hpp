#ifndef SELSUM_SCAN_NUMBER_TOKEN_HPP
#define SELSUM_SCAN_NUMBER_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace selsum::scan
{
    enum class Sign
    {
        POSITIVE,
        NEGATIVE
    };

    /**
     * @brief Outcome of validating one candidate run.
     *
     * An accepted token is stripped of every decoration ($, brackets, footnote asterisks,
     * grouping commas) and describes exactly one decimal value:
     * sign * (digit groups . fractional digits) * 10^exponent
     */
    struct NumberToken
    {
        bool                     accepted = false;
        std::error_code          rejection;         ///< first failing rule, set only when rejected
        Sign                     sign     = Sign::POSITIVE;
        std::vector<std::string> digit_groups;      ///< integer digits as written between commas
        std::string              fractional_digits; ///< may be empty
        std::optional<int64_t>   exponent;

        bool IsNegative() const
        {
            return sign == Sign::NEGATIVE;
        }

        /// @return integer digits with the grouping removed, "" if the number starts at the point
        std::string IntegerDigits() const;

        /// @return mantissa digits between the first and the last non-zero digit, 0 for zero
        uint64_t SignificantDigits() const;

        /// @return plain literal such as "-1200.00" or "2.5E5", readable by ScaledDecimal::FromString
        std::string NormalizedLiteral() const;
    };
} // namespace selsum::scan

#endif // SELSUM_SCAN_NUMBER_TOKEN_HPP
