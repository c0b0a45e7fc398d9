#ifndef SELSUM_SUM_SUMMER_ERROR_HPP
#define SELSUM_SUM_SUMMER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace selsum::sum
{
    /**
     * Codes for errors caused by misuse of the summation interface or its configuration,
     * as opposed to ambiguous numbers in the input which are never errors
     */
    enum class SummerError
    {
        NON_POSITIVE_PRECISION_LIMIT = 1,
        NON_POSITIVE_EXPANSION_LIMIT,
        UNKNOWN_LOG_LEVEL,
        CONFIG_FILE_UNREADABLE,
        CONFIG_PARSE_FAILED,
    };
} // namespace selsum::sum

OUTCOME_HPP_DECLARE_ERROR_2( selsum::sum, SummerError );

#endif // SELSUM_SUM_SUMMER_ERROR_HPP
