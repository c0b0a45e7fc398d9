#include "scan/reject_reason.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( selsum::scan, RejectReason, e )
{
    using E = selsum::scan::RejectReason;
    switch ( e )
    {
        case E::AMBIGUOUS_SIGN:
            return "More than one sign indicator";
        case E::MISPLACED_CURRENCY:
            return "Currency sign repeated or not leading";
        case E::MISPLACED_FOOTNOTE:
            return "Footnote marker not trailing";
        case E::UNBALANCED_BRACKETS:
            return "Brackets unbalanced or nested";
        case E::INVALID_GROUPING:
            return "Commas are not thousands separators";
        case E::INVALID_DECIMAL_POINT:
            return "More than one decimal point";
        case E::NO_DIGITS:
            return "No digits around the decimal point";
        case E::MALFORMED_EXPONENT:
            return "Exponent is not <mantissa>E<sign><digits>";
        case E::STRAY_CHARACTER:
            return "Unexpected character inside the number";
        case E::ADJACENT_TEXT:
            return "Number is glued to surrounding text";
    }
    return "unknown RejectReason";
}
