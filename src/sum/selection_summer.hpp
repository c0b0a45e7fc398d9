#ifndef SELSUM_SUM_SELECTION_SUMMER_HPP
#define SELSUM_SUM_SELECTION_SUMMER_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"
#include "scan/number_token.hpp"
#include "sum/running_total.hpp"
#include "sum/sum_formatter.hpp"
#include "sum/summer_config.hpp"

namespace selsum::sum
{
    /**
     * @brief Result of one summation, immutable once produced.
     */
    struct FormattedResult
    {
        std::string rendered_sum;
        uint64_t    negative_count = 0; ///< negative tokens seen, overflowed ones included
        uint64_t    overflow_count = 0; ///< accepted tokens left out for their size
        uint64_t    summed_count   = 0; ///< tokens actually added
        uint64_t    rejected_count = 0; ///< rejected runs holding at least one digit
        SumFormat   format         = SumFormat::INTEGER;
    };

    /**
     * @brief sum validated tokens and render the total
     * @param tokens tokens to fold in; every rejected one is counted
     * @param config validated settings
     * @return running total and the result formatted from it
     */
    std::pair<RunningTotal, FormattedResult> Accumulate( const std::vector<scan::NumberToken> &tokens,
                                                         const SummerConfig                   &config );

    /**
     * @brief sum every plausible number found in a block of text
     * @param text selection to scan
     * @param config limits, defaulting to a precision limit of 200 digits. The log level is only
     * checked here; applying it with base::setLogLevel is left to the host.
     * @return result, or SummerError when the configuration is unusable
     */
    outcome::result<FormattedResult> SumSelection( std::string_view text, const SummerConfig &config = SummerConfig() );
} // namespace selsum::sum

#endif // SELSUM_SUM_SELECTION_SUMMER_HPP
