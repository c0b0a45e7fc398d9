#ifndef SELSUM_SUM_SELECTION_REPORT_HPP
#define SELSUM_SUM_SELECTION_REPORT_HPP

#include <string>
#include <vector>

#include "sum/selection_summer.hpp"

namespace selsum::sum
{
    /**
     * @brief Lines an editor host shows after a summation.
     */
    struct SelectionReport
    {
        std::string              clipboard_line; ///< always "Selected Sum = <sum>"
        std::string              display_line;   ///< clipboard line, or a "nothing found" message
        std::vector<std::string> notices;        ///< advisory lines about negatives and overflow
    };

    /**
     * @brief compose the host report for a result
     * @param result summation result
     * @param precision_limit limit the result was computed with, quoted in the overflow notice
     */
    SelectionReport ComposeReport( const FormattedResult &result, int64_t precision_limit );
} // namespace selsum::sum

#endif // SELSUM_SUM_SELECTION_REPORT_HPP
