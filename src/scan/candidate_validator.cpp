#include "scan/candidate_validator.hpp"

#include "scan/validation_rules.hpp"

namespace selsum::scan
{
    NumberToken CandidateValidator::Validate( const RawCandidate &candidate ) const
    {
        NumberToken token;
        TokenDraft  draft = SplitDecorations( candidate );

        for ( const auto &[name, rule] : OrderedRules() )
        {
            auto checked = rule( std::move( draft ) );
            if ( !checked )
            {
                token.rejection = checked.error();
                logger_->trace( "Rejected '{}' at offset {} by {} rule: {}",
                                candidate.text,
                                candidate.begin,
                                name,
                                token.rejection.message() );
                return token;
            }
            draft = std::move( checked.value() );
        }

        token.accepted          = true;
        token.sign              = draft.sign;
        token.digit_groups      = std::move( draft.digit_groups );
        token.fractional_digits = std::move( draft.fractional_digits );
        token.exponent          = draft.exponent;
        logger_->trace( "Accepted '{}' as {}", candidate.text, token.NormalizedLiteral() );
        return token;
    }
} // namespace selsum::scan
