#include "sum/selection_summer.hpp"

#include "base/logger.hpp"
#include "scan/candidate_scanner.hpp"
#include "scan/candidate_validator.hpp"

namespace selsum::sum
{
    std::pair<RunningTotal, FormattedResult> Accumulate( const std::vector<scan::NumberToken> &tokens,
                                                         const SummerConfig                   &config )
    {
        auto         precision_limit = static_cast<uint64_t>( config.precision_limit );
        RunningTotal total( precision_limit, config.EffectiveExpansionLimit() );
        for ( const auto &token : tokens )
        {
            total.Apply( token );
        }

        auto            rendered = FormatSum( total.Sum(), precision_limit );
        FormattedResult result;
        result.rendered_sum   = std::move( rendered.text );
        result.format         = rendered.format;
        result.negative_count = total.NegativeCount();
        result.overflow_count = total.OverflowCount();
        result.summed_count   = total.SummedCount();
        result.rejected_count = total.RejectedCount();
        return { std::move( total ), std::move( result ) };
    }

    outcome::result<FormattedResult> SumSelection( std::string_view text, const SummerConfig &config )
    {
        OUTCOME_TRY( ValidateSummerConfig( config ) );

        auto logger = base::createLogger( "SelectionSummer" );

        scan::CandidateScanner          scanner( text );
        scan::CandidateValidator        validator;
        std::vector<scan::NumberToken> tokens;
        while ( auto candidate = scanner.Next() )
        {
            auto token = validator.Validate( *candidate );
            // runs such as "--" or "(*)" are punctuation, not failed numbers
            if ( !token.accepted && !candidate->ContainsDigit() )
            {
                continue;
            }
            tokens.push_back( std::move( token ) );
        }

        auto [total, result] = Accumulate( tokens, config );
        logger->debug( "Summed {} of {} numbers to {} ({} negative, {} overflowed, {} rejected)",
                       result.summed_count,
                       tokens.size(),
                       result.rendered_sum,
                       result.negative_count,
                       result.overflow_count,
                       result.rejected_count );
        return result;
    }
} // namespace selsum::sum
