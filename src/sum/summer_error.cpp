#include "sum/summer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3( selsum::sum, SummerError, e )
{
    using E = selsum::sum::SummerError;
    switch ( e )
    {
        case E::NON_POSITIVE_PRECISION_LIMIT:
            return "Precision limit must be a positive number of digits";
        case E::NON_POSITIVE_EXPANSION_LIMIT:
            return "Expansion limit must be a positive number of digits";
        case E::UNKNOWN_LOG_LEVEL:
            return "Unknown log level";
        case E::CONFIG_FILE_UNREADABLE:
            return "Config file cannot be opened";
        case E::CONFIG_PARSE_FAILED:
            return "Config file is not valid JSON or holds a value of the wrong type";
    }
    return "unknown SummerError";
}
