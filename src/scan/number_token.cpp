#include "scan/number_token.hpp"

namespace selsum::scan
{
    std::string NumberToken::IntegerDigits() const
    {
        std::string digits;
        for ( const auto &group : digit_groups )
        {
            digits += group;
        }
        return digits;
    }

    uint64_t NumberToken::SignificantDigits() const
    {
        std::string digits = IntegerDigits() + fractional_digits;
        auto        first  = digits.find_first_not_of( '0' );
        if ( first == std::string::npos )
        {
            return 0;
        }
        auto last = digits.find_last_not_of( '0' );
        return last - first + 1;
    }

    std::string NumberToken::NormalizedLiteral() const
    {
        std::string literal = IsNegative() ? "-" : "";
        std::string integer = IntegerDigits();
        literal += integer.empty() ? "0" : integer;
        if ( !fractional_digits.empty() )
        {
            literal += "." + fractional_digits;
        }
        if ( exponent )
        {
            literal += "E" + std::to_string( *exponent );
        }
        return literal;
    }
} // namespace selsum::scan
