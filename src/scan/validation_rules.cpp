#include "scan/validation_rules.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <iterator>
#include <limits>

namespace selsum::scan
{
    namespace
    {
        bool IsPrefixDecoration( char c )
        {
            return c == '+' || c == '-' || c == '$' || c == '(' || c == '[';
        }

        bool IsSuffixDecoration( char c )
        {
            return c == ')' || c == ']' || c == '*';
        }

        bool IsDigit( char c )
        {
            return std::isdigit( static_cast<unsigned char>( c ) ) != 0;
        }

        bool AllDigits( std::string_view text )
        {
            return std::all_of( text.begin(), text.end(), IsDigit );
        }

        bool IsBracket( char c )
        {
            return c == '(' || c == ')' || c == '[' || c == ']';
        }

        /// "$1,200.00," and "(5)." end a clause, the punctuation is not part of the number
        std::string_view TrimTrailingPunctuation( std::string_view run )
        {
            while ( !run.empty() )
            {
                if ( run.back() == ',' )
                {
                    run.remove_suffix( 1 );
                }
                else if ( run.back() == '.' && run.size() > 1 && IsSuffixDecoration( run[run.size() - 2] ) )
                {
                    run.remove_suffix( 1 );
                }
                else
                {
                    break;
                }
            }
            return run;
        }
    } // namespace

    bool IsDisqualifyingNeighbour( char c )
    {
        static constexpr char kDisqualifiers[] = "!#%&:;<>?@_|^\\/";
        if ( c == kNoNeighbour )
        {
            return false;
        }
        if ( static_cast<unsigned char>( c ) >= 0x80 || std::isalpha( static_cast<unsigned char>( c ) ) )
        {
            return true;
        }
        return std::strchr( kDisqualifiers, c ) != nullptr;
    }

    TokenDraft SplitDecorations( const RawCandidate &candidate )
    {
        TokenDraft draft;
        draft.candidate = candidate;
        draft.run       = TrimTrailingPunctuation( candidate.text );

        const auto &run          = draft.run;
        size_t      prefix_end   = 0;
        size_t      suffix_begin = run.size();
        while ( prefix_end < run.size() && IsPrefixDecoration( run[prefix_end] ) )
        {
            ++prefix_end;
        }
        while ( suffix_begin > prefix_end && IsSuffixDecoration( run[suffix_begin - 1] ) )
        {
            --suffix_begin;
        }
        draft.prefix = run.substr( 0, prefix_end );
        draft.body   = run.substr( prefix_end, suffix_begin - prefix_end );
        draft.suffix = run.substr( suffix_begin );

        std::string_view mantissa = draft.body;
        size_t           exp_pos  = draft.body.find_first_of( "Ee" );
        if ( exp_pos != std::string_view::npos )
        {
            draft.has_exponent  = true;
            mantissa            = draft.body.substr( 0, exp_pos );
            draft.exponent_part = draft.body.substr( exp_pos + 1 );
        }

        size_t dot_pos     = mantissa.find( '.' );
        draft.integer_part = mantissa.substr( 0, dot_pos );
        if ( dot_pos != std::string_view::npos )
        {
            draft.has_point     = true;
            draft.fraction_part = mantissa.substr( dot_pos + 1 );
        }
        return draft;
    }

    outcome::result<TokenDraft> CheckSignMarkers( TokenDraft draft )
    {
        auto minus     = std::count( draft.prefix.begin(), draft.prefix.end(), '-' );
        auto plus      = std::count( draft.prefix.begin(), draft.prefix.end(), '+' );
        bool bracketed = draft.prefix.find_first_of( "([" ) != std::string_view::npos;

        // "(3.5*)" is a parenthetical remark around a footnoted figure, "(3.5)*" an accounting negative
        bool footnote_inside = false;
        if ( bracketed )
        {
            size_t close    = draft.suffix.find_first_of( ")]" );
            size_t asterisk = draft.suffix.find( '*' );
            footnote_inside = asterisk != std::string_view::npos &&
                              ( close == std::string_view::npos || asterisk < close );
        }
        draft.bracket_negation = bracketed && !footnote_inside;

        auto negatives = minus + ( draft.bracket_negation ? 1 : 0 );
        if ( negatives > 1 || minus + plus > 1 || ( plus > 0 && draft.bracket_negation ) )
        {
            return RejectReason::AMBIGUOUS_SIGN;
        }
        draft.sign = negatives == 1 ? Sign::NEGATIVE : Sign::POSITIVE;
        return draft;
    }

    outcome::result<TokenDraft> CheckCurrency( TokenDraft draft )
    {
        auto dollars = std::count( draft.run.begin(), draft.run.end(), '$' );
        if ( dollars > 1 || ( dollars == 1 && draft.prefix.find( '$' ) == std::string_view::npos ) )
        {
            return RejectReason::MISPLACED_CURRENCY;
        }
        return draft;
    }

    outcome::result<TokenDraft> CheckFootnotes( TokenDraft draft )
    {
        if ( draft.prefix.find( '*' ) != std::string_view::npos || draft.body.find( '*' ) != std::string_view::npos )
        {
            return RejectReason::MISPLACED_FOOTNOTE;
        }
        return draft;
    }

    outcome::result<TokenDraft> CheckBrackets( TokenDraft draft )
    {
        if ( std::any_of( draft.body.begin(), draft.body.end(), IsBracket ) )
        {
            return RejectReason::UNBALANCED_BRACKETS;
        }

        std::string opens;
        std::string closes;
        std::copy_if( draft.prefix.begin(), draft.prefix.end(), std::back_inserter( opens ), IsBracket );
        std::copy_if( draft.suffix.begin(), draft.suffix.end(), std::back_inserter( closes ), IsBracket );
        if ( opens.size() != closes.size() || opens.size() > 1 )
        {
            return RejectReason::UNBALANCED_BRACKETS;
        }
        if ( !opens.empty() && ( ( opens[0] == '(' ) != ( closes[0] == ')' ) ) )
        {
            return RejectReason::UNBALANCED_BRACKETS;
        }
        return draft;
    }

    outcome::result<TokenDraft> CheckGrouping( TokenDraft draft )
    {
        if ( draft.fraction_part.find( ',' ) != std::string_view::npos ||
             draft.exponent_part.find( ',' ) != std::string_view::npos )
        {
            return RejectReason::INVALID_GROUPING;
        }

        draft.digit_groups.clear();
        std::string_view integer = draft.integer_part;
        if ( integer.find( ',' ) == std::string_view::npos )
        {
            if ( !integer.empty() )
            {
                draft.digit_groups.emplace_back( integer );
            }
            return draft;
        }

        while ( true )
        {
            size_t           comma      = integer.find( ',' );
            std::string_view group      = integer.substr( 0, comma );
            bool             leftmost   = draft.digit_groups.empty();
            bool             well_sized = leftmost ? ( !group.empty() && group.size() <= 3 ) : group.size() == 3;
            if ( !well_sized || !AllDigits( group ) )
            {
                return RejectReason::INVALID_GROUPING;
            }
            draft.digit_groups.emplace_back( group );
            if ( comma == std::string_view::npos )
            {
                break;
            }
            integer.remove_prefix( comma + 1 );
        }
        return draft;
    }

    outcome::result<TokenDraft> CheckDecimalPoint( TokenDraft draft )
    {
        std::string_view fraction = draft.fraction_part;
        if ( fraction.find( '.' ) != std::string_view::npos )
        {
            return RejectReason::INVALID_DECIMAL_POINT;
        }

        // accounting placeholder: "700.--" reads as 700, "100.0--" as 100.0
        if ( draft.has_point && !draft.has_exponent )
        {
            auto last_digit = fraction.find_last_not_of( '-' );
            fraction        = last_digit == std::string_view::npos ? std::string_view()
                                                                   : fraction.substr( 0, last_digit + 1 );
        }

        if ( draft.digit_groups.empty() && fraction.empty() )
        {
            return RejectReason::NO_DIGITS;
        }
        draft.fractional_digits = std::string( fraction );
        return draft;
    }

    outcome::result<TokenDraft> CheckExponent( TokenDraft draft )
    {
        if ( !draft.has_exponent )
        {
            return draft;
        }

        std::string_view exponent = draft.exponent_part;
        bool             negative = false;
        if ( !exponent.empty() && ( exponent.front() == '-' || exponent.front() == '+' ) )
        {
            negative = exponent.front() == '-';
            exponent.remove_prefix( 1 );
        }
        if ( exponent.empty() || !AllDigits( exponent ) )
        {
            return RejectReason::MALFORMED_EXPONENT;
        }

        int64_t value  = 0;
        auto [ptr, ec] = std::from_chars( exponent.data(), exponent.data() + exponent.size(), value );
        if ( ec == std::errc::result_out_of_range )
        {
            // saturate, the accumulator reports such a value as overflow
            value = std::numeric_limits<int64_t>::max();
        }
        draft.exponent = negative ? -value : value;
        return draft;
    }

    outcome::result<TokenDraft> CheckResidual( TokenDraft draft )
    {
        for ( const auto &group : draft.digit_groups )
        {
            if ( !AllDigits( group ) )
            {
                return RejectReason::STRAY_CHARACTER;
            }
        }
        if ( !AllDigits( draft.fractional_digits ) )
        {
            return RejectReason::STRAY_CHARACTER;
        }
        if ( IsDisqualifyingNeighbour( draft.candidate.leading_neighbour ) ||
             IsDisqualifyingNeighbour( draft.candidate.trailing_neighbour ) )
        {
            return RejectReason::ADJACENT_TEXT;
        }
        return draft;
    }

    const std::vector<NamedRule> &OrderedRules()
    {
        static const std::vector<NamedRule> rules{
            { "sign markers", CheckSignMarkers },   //
            { "currency", CheckCurrency },          //
            { "footnotes", CheckFootnotes },        //
            { "brackets", CheckBrackets },          //
            { "grouping", CheckGrouping },          //
            { "decimal point", CheckDecimalPoint }, //
            { "exponent", CheckExponent },          //
            { "residual", CheckResidual },          //
        };
        return rules;
    }
} // namespace selsum::scan
