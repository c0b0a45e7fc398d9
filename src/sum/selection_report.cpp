#include "sum/selection_report.hpp"

#include <fmt/format.h>

namespace selsum::sum
{
    SelectionReport ComposeReport( const FormattedResult &result, int64_t precision_limit )
    {
        SelectionReport report;
        report.clipboard_line = fmt::format( "Selected Sum = {}", result.rendered_sum );
        report.display_line   = result.summed_count == 0 ? "No selected valid numbers were found."
                                                         : report.clipboard_line;
        if ( result.negative_count > 0 )
        {
            report.notices.push_back(
                fmt::format( "Note: {} negative numbers were evaluated and subtracted.", result.negative_count ) );
        }
        if ( result.overflow_count > 0 )
        {
            report.notices.push_back( fmt::format( "{} numbers ignored due to digit length exceeding {}",
                                                   result.overflow_count,
                                                   precision_limit ) );
        }
        return report;
    }
} // namespace selsum::sum
