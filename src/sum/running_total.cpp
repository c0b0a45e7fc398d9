#include "sum/running_total.hpp"

namespace selsum::sum
{
    RunningTotal::RunningTotal( uint64_t precision_limit, uint64_t expansion_limit ) :
        precision_limit_( precision_limit ), expansion_limit_( expansion_limit )
    {
    }

    TokenFate RunningTotal::Apply( const scan::NumberToken &token )
    {
        if ( !token.accepted )
        {
            ++rejected_count_;
            return TokenFate::REJECTED;
        }
        if ( token.IsNegative() )
        {
            ++negative_count_;
        }

        auto literal = token.NormalizedLiteral();
        if ( token.SignificantDigits() > precision_limit_ )
        {
            logger_->debug( "{} has {} significant digits, limit is {}",
                            literal,
                            token.SignificantDigits(),
                            precision_limit_ );
            ++overflow_count_;
            return TokenFate::OVERFLOWED;
        }

        auto value = ScaledDecimal::FromString( literal, expansion_limit_ );
        if ( !value )
        {
            if ( value.error() == make_error_code( ScaledDecimalError::VALUE_TOO_LARGE ) )
            {
                logger_->debug( "{} expands beyond {} digit positions", literal, expansion_limit_ );
                ++overflow_count_;
                return TokenFate::OVERFLOWED;
            }
            logger_->error( "Accepted token {} cannot be converted: {}", literal, value.error().message() );
            ++rejected_count_;
            return TokenFate::REJECTED;
        }

        sum_ = sum_.Add( value.value() );
        ++summed_count_;
        return TokenFate::SUMMED;
    }
} // namespace selsum::sum
