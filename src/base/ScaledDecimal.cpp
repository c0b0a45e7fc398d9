/**
 * @file        ScaledDecimal.cpp
 * @brief       Exact signed decimal arithmetic (Implementation file)
 */

#include "base/ScaledDecimal.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>

namespace selsum
{
    namespace
    {
        /// Exponents beyond this can never describe a value within any expansion bound
        constexpr int64_t kExponentBound = 1'000'000'000'000'000LL;

        bool AllDigits( std::string_view text )
        {
            return std::all_of( text.begin(),
                                text.end(),
                                []( char c ) { return std::isdigit( static_cast<unsigned char>( c ) ) != 0; } );
        }

        /// cpp_int reads a leading '0' as an octal prefix, so only hand it canonical digits
        ScaledDecimal::Integer DigitsToInteger( std::string_view digits )
        {
            auto first = digits.find_first_not_of( '0' );
            if ( first == std::string_view::npos )
            {
                return ScaledDecimal::Integer( 0 );
            }
            return ScaledDecimal::Integer( std::string( digits.substr( first ) ) );
        }
    } // namespace

    ScaledDecimal::ScaledDecimal() : value_( 0 ), precision_( 0 ) {}

    ScaledDecimal::ScaledDecimal( Integer raw_value, uint64_t precision ) :
        value_( std::move( raw_value ) ), precision_( precision )
    {
    }

    outcome::result<ScaledDecimal> ScaledDecimal::FromString( const std::string &str_value, uint64_t max_expansion )
    {
        std::string_view text( str_value );
        bool             negative = false;
        if ( !text.empty() && ( text.front() == '-' || text.front() == '+' ) )
        {
            negative = text.front() == '-';
            text.remove_prefix( 1 );
        }

        int64_t exponent = 0;
        size_t  exp_pos  = text.find_first_of( "eE" );
        if ( exp_pos != std::string_view::npos )
        {
            std::string_view exponent_str = text.substr( exp_pos + 1 );
            text                          = text.substr( 0, exp_pos );

            bool exponent_negative = false;
            if ( !exponent_str.empty() && ( exponent_str.front() == '-' || exponent_str.front() == '+' ) )
            {
                exponent_negative = exponent_str.front() == '-';
                exponent_str.remove_prefix( 1 );
            }
            if ( exponent_str.empty() || !AllDigits( exponent_str ) )
            {
                return ScaledDecimalError::INVALID_LITERAL;
            }
            auto [ptr_exp, ec_exp] = std::from_chars( exponent_str.data(),
                                                      exponent_str.data() + exponent_str.size(),
                                                      exponent );
            if ( ec_exp == std::errc::result_out_of_range || exponent > kExponentBound )
            {
                exponent = kExponentBound + 1;
            }
            else if ( ec_exp != std::errc() || ptr_exp != exponent_str.data() + exponent_str.size() )
            {
                return ScaledDecimalError::INVALID_LITERAL;
            }
            if ( exponent_negative )
            {
                exponent = -exponent;
            }
        }

        size_t           dot_pos = text.find( '.' );
        std::string_view integer_str, fractional_str;
        if ( dot_pos != std::string_view::npos )
        {
            integer_str    = text.substr( 0, dot_pos );
            fractional_str = text.substr( dot_pos + 1 );
        }
        else
        {
            integer_str = text;
        }

        if ( ( integer_str.empty() && fractional_str.empty() ) || !AllDigits( integer_str ) ||
             !AllDigits( fractional_str ) )
        {
            return ScaledDecimalError::INVALID_LITERAL;
        }

        std::string digits( integer_str );
        digits.append( fractional_str );

        auto first = digits.find_first_not_of( '0' );
        if ( first == std::string::npos )
        {
            return outcome::success( ScaledDecimal() );
        }
        if ( exponent > kExponentBound || exponent < -kExponentBound )
        {
            return ScaledDecimalError::VALUE_TOO_LARGE;
        }

        // value = digits * 10^-scale, with trailing zeros folded into the scale
        auto    last  = digits.find_last_not_of( '0' );
        int64_t scale = static_cast<int64_t>( fractional_str.size() ) - exponent -
                        static_cast<int64_t>( digits.size() - 1 - last );
        digits        = digits.substr( first, last - first + 1 );

        int64_t length        = static_cast<int64_t>( digits.size() );
        int64_t integer_span  = std::max<int64_t>( length - scale, 0 );
        int64_t fraction_span = std::max<int64_t>( scale, 0 );
        if ( static_cast<uint64_t>( integer_span + fraction_span ) > max_expansion )
        {
            return ScaledDecimalError::VALUE_TOO_LARGE;
        }

        Integer value = DigitsToInteger( digits );
        if ( scale < 0 )
        {
            value *= ScaleFactor( static_cast<uint64_t>( -scale ) );
            scale  = 0;
        }
        if ( negative )
        {
            value = -value;
        }
        return outcome::success( ScaledDecimal( std::move( value ), static_cast<uint64_t>( scale ) ) );
    }

    ScaledDecimal::Integer ScaledDecimal::ScaleFactor( uint64_t precision )
    {
        return boost::multiprecision::pow( Integer( 10 ), static_cast<unsigned>( precision ) );
    }

    const ScaledDecimal::Integer &ScaledDecimal::Value() const noexcept
    {
        return value_;
    }

    uint64_t ScaledDecimal::Precision() const noexcept
    {
        return precision_;
    }

    bool ScaledDecimal::IsZero() const
    {
        return value_.is_zero();
    }

    bool ScaledDecimal::IsNegative() const
    {
        return value_.sign() < 0;
    }

    bool ScaledDecimal::IsInteger() const
    {
        return Normalized().precision_ == 0;
    }

    ScaledDecimal ScaledDecimal::Normalized() const
    {
        if ( value_.is_zero() )
        {
            return ScaledDecimal();
        }
        Integer  value     = value_;
        uint64_t precision = precision_;
        Integer  quotient, remainder;
        while ( precision > 0 )
        {
            boost::multiprecision::divide_qr( value, Integer( 10 ), quotient, remainder );
            if ( !remainder.is_zero() )
            {
                break;
            }
            value = quotient;
            --precision;
        }
        return ScaledDecimal( std::move( value ), precision );
    }

    uint64_t ScaledDecimal::SignificantDigits() const
    {
        if ( value_.is_zero() )
        {
            return 0;
        }
        Integer magnitude = boost::multiprecision::abs( Normalized().value_ );
        return magnitude.str().size();
    }

    ScaledDecimal ScaledDecimal::Add( const ScaledDecimal &other ) const
    {
        if ( precision_ == other.precision_ )
        {
            return ScaledDecimal( value_ + other.value_, precision_ );
        }
        if ( precision_ > other.precision_ )
        {
            return ScaledDecimal( value_ + other.value_ * ScaleFactor( precision_ - other.precision_ ), precision_ );
        }
        return ScaledDecimal( value_ * ScaleFactor( other.precision_ - precision_ ) + other.value_,
                              other.precision_ );
    }

    outcome::result<ScaledDecimal> ScaledDecimal::ConvertPrecision( uint64_t to ) const
    {
        if ( to == precision_ )
        {
            return outcome::success( *this );
        }
        if ( to > precision_ )
        {
            return outcome::success( ScaledDecimal( value_ * ScaleFactor( to - precision_ ), to ) );
        }
        Integer quotient, remainder;
        boost::multiprecision::divide_qr( value_, ScaleFactor( precision_ - to ), quotient, remainder );
        if ( !remainder.is_zero() )
        {
            return ScaledDecimalError::PRECISION_LOSS;
        }
        return outcome::success( ScaledDecimal( std::move( quotient ), to ) );
    }

    std::string ScaledDecimal::ToString( bool fixedDecimals ) const
    {
        Integer     magnitude = boost::multiprecision::abs( value_ );
        std::string digits    = magnitude.str();
        std::string s         = IsNegative() ? "-" : "";

        if ( precision_ == 0 )
        {
            return s + digits;
        }
        if ( digits.size() <= precision_ )
        {
            digits.insert( 0, precision_ - digits.size() + 1, '0' );
        }
        size_t point = digits.size() - precision_;
        s += digits.substr( 0, point ) + "." + digits.substr( point );

        if ( !fixedDecimals )
        {
            auto lastNonZero = s.find_last_not_of( '0' );
            if ( lastNonZero != std::string::npos )
            {
                s.erase( lastNonZero + 1 );
            }
            if ( !s.empty() && s.back() == '.' )
            {
                s.pop_back();
            }
        }

        return s;
    }

    std::string ScaledDecimal::ToScientific( uint64_t max_digits ) const
    {
        if ( value_.is_zero() )
        {
            return "0E+0";
        }
        max_digits = std::max<uint64_t>( max_digits, 1 );

        ScaledDecimal normalized = Normalized();
        Integer       magnitude  = boost::multiprecision::abs( normalized.value_ );
        uint64_t      length     = magnitude.str().size();
        int64_t       exponent   = static_cast<int64_t>( length ) - 1 - static_cast<int64_t>( normalized.precision_ );

        if ( length > max_digits )
        {
            Integer divisor = ScaleFactor( length - max_digits );
            Integer quotient, remainder;
            boost::multiprecision::divide_qr( magnitude, divisor, quotient, remainder );

            Integer twice = remainder * 2;
            if ( twice > divisor || ( twice == divisor && boost::multiprecision::bit_test( quotient, 0 ) ) )
            {
                ++quotient;
            }
            magnitude = quotient;
            if ( magnitude.str().size() > max_digits )
            {
                // 9.99..9 rounded up to 10.00..0
                magnitude /= 10;
                ++exponent;
            }
        }

        std::string digits = magnitude.str();
        auto        last   = digits.find_last_not_of( '0' );
        digits.erase( last + 1 );

        std::string s = IsNegative() ? "-" : "";
        s += digits.substr( 0, 1 );
        if ( digits.size() > 1 )
        {
            s += "." + digits.substr( 1 );
        }
        s += exponent < 0 ? "E-" : "E+";
        s += std::to_string( exponent < 0 ? -exponent : exponent );
        return s;
    }
} // namespace selsum

OUTCOME_CPP_DEFINE_CATEGORY_3( selsum, ScaledDecimalError, e )
{
    using E = selsum::ScaledDecimalError;
    switch ( e )
    {
        case E::INVALID_LITERAL:
            return "Literal is not a plain decimal number";
        case E::VALUE_TOO_LARGE:
            return "Exact value needs more digits than allowed";
        case E::PRECISION_LOSS:
            return "Conversion would drop non-zero digits";
    }
    return "unknown ScaledDecimalError";
}
