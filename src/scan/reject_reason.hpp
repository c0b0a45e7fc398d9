#ifndef SELSUM_SCAN_REJECT_REASON_HPP
#define SELSUM_SCAN_REJECT_REASON_HPP

#include "outcome/outcome.hpp"

namespace selsum::scan
{
    /**
     * @brief Why a candidate run is not a number. Only used for diagnostics, the summation
     * result counts rejections without telling them apart.
     */
    enum class RejectReason
    {
        AMBIGUOUS_SIGN = 1,    ///< more than one sign indicator, e.g. -(5), --5, +-5
        MISPLACED_CURRENCY,    ///< '$' repeated or not leading
        MISPLACED_FOOTNOTE,    ///< '*' anywhere but trailing
        UNBALANCED_BRACKETS,   ///< unmatched, nested or inner brackets
        INVALID_GROUPING,      ///< commas not placed as thousands separators
        INVALID_DECIMAL_POINT, ///< more than one '.'
        NO_DIGITS,             ///< nothing left but decoration
        MALFORMED_EXPONENT,    ///< exponent marker without digits or with trailing text
        STRAY_CHARACTER,       ///< leftover character inside the number
        ADJACENT_TEXT,         ///< run glued to a letter or a disqualifying symbol
    };
} // namespace selsum::scan

OUTCOME_HPP_DECLARE_ERROR_2( selsum::scan, RejectReason );

#endif // SELSUM_SCAN_REJECT_REASON_HPP
