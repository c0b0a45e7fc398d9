#ifndef SELSUM_SUM_SUM_FORMATTER_HPP
#define SELSUM_SUM_SUM_FORMATTER_HPP

#include <cstdint>
#include <string>

#include "base/ScaledDecimal.hpp"

namespace selsum::sum
{
    /// Rendering branch picked for a final sum, in priority order
    enum class SumFormat
    {
        INTEGER,      ///< "100"
        TWO_DECIMALS, ///< "100.50"
        FULL_DECIMAL, ///< "100.507"
        SCIENTIFIC,   ///< "1.00507E+2"
    };

    struct RenderedSum
    {
        std::string text;
        SumFormat   format;
    };

    /**
     * @brief pick the first rendering branch that fits the sum
     * @param sum exact total
     * @param precision_limit significant digits the full decimal form may show
     */
    SumFormat ChooseSumFormat( const ScaledDecimal &sum, uint64_t precision_limit );

    /**
     * @brief render the sum deterministically
     * @param sum exact total
     * @param precision_limit significant digits kept before falling back to scientific notation
     * @return text and the branch used
     */
    RenderedSum FormatSum( const ScaledDecimal &sum, uint64_t precision_limit );
} // namespace selsum::sum

#endif // SELSUM_SUM_SUM_FORMATTER_HPP
