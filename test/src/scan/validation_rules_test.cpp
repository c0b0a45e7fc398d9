#include <gtest/gtest.h>

#include <string>

#include "scan/validation_rules.hpp"
#include "testutil/outcome.hpp"

using namespace selsum::scan;

namespace
{
    RawCandidate Candidate( std::string_view text )
    {
        RawCandidate candidate;
        candidate.text = text;
        candidate.end  = text.size();
        return candidate;
    }
} // namespace

/**
 * @given a fully decorated run
 * @when it is split
 * @then the prefix, body and suffix zones and the number parts are located
 */
TEST( SplitDecorationsTest, LocatesZones )
{
    auto draft = SplitDecorations( Candidate( "-$(1,234.50E+2*)," ) );

    EXPECT_EQ( draft.run, "-$(1,234.50E+2*)" );
    EXPECT_EQ( draft.prefix, "-$(" );
    EXPECT_EQ( draft.body, "1,234.50E+2" );
    EXPECT_EQ( draft.suffix, "*)" );
    EXPECT_EQ( draft.integer_part, "1,234" );
    EXPECT_EQ( draft.fraction_part, "50" );
    EXPECT_EQ( draft.exponent_part, "+2" );
    EXPECT_TRUE( draft.has_point );
    EXPECT_TRUE( draft.has_exponent );
}

TEST( SplitDecorationsTest, PlainNumberHasEmptyZones )
{
    auto draft = SplitDecorations( Candidate( "42" ) );

    EXPECT_TRUE( draft.prefix.empty() );
    EXPECT_TRUE( draft.suffix.empty() );
    EXPECT_EQ( draft.body, "42" );
    EXPECT_EQ( draft.integer_part, "42" );
    EXPECT_FALSE( draft.has_point );
    EXPECT_FALSE( draft.has_exponent );
}

/**
 * @given runs ending in sentence punctuation
 * @when they are split
 * @then trailing commas are dropped, a trailing point only after a closing decoration
 */
TEST( SplitDecorationsTest, TrimsTrailingPunctuation )
{
    EXPECT_EQ( SplitDecorations( Candidate( "$1,200.00," ) ).run, "$1,200.00" );
    EXPECT_EQ( SplitDecorations( Candidate( "5,," ) ).run, "5" );
    EXPECT_EQ( SplitDecorations( Candidate( "(5)." ) ).run, "(5)" );
    EXPECT_EQ( SplitDecorations( Candidate( "12*." ) ).run, "12*" );
    EXPECT_EQ( SplitDecorations( Candidate( "7." ) ).run, "7." );
}

TEST( CheckSignMarkersTest, BracketsNegate )
{
    EXPECT_OUTCOME_TRUE( draft, CheckSignMarkers( SplitDecorations( Candidate( "[5]" ) ) ) );
    EXPECT_TRUE( draft.bracket_negation );
    EXPECT_EQ( draft.sign, Sign::NEGATIVE );
}

TEST( CheckSignMarkersTest, FootnotedAsideIsNeutral )
{
    EXPECT_OUTCOME_TRUE( aside, CheckSignMarkers( SplitDecorations( Candidate( "(3.5*)" ) ) ) );
    EXPECT_FALSE( aside.bracket_negation );
    EXPECT_EQ( aside.sign, Sign::POSITIVE );

    EXPECT_OUTCOME_TRUE( negated_aside, CheckSignMarkers( SplitDecorations( Candidate( "-(3.5*)" ) ) ) );
    EXPECT_EQ( negated_aside.sign, Sign::NEGATIVE );
}

TEST( CheckSignMarkersTest, NoCancellation )
{
    EXPECT_OUTCOME_ERROR( twice, CheckSignMarkers( SplitDecorations( Candidate( "-(5)" ) ) ), RejectReason::AMBIGUOUS_SIGN );
    EXPECT_OUTCOME_ERROR( mixed, CheckSignMarkers( SplitDecorations( Candidate( "+-5" ) ) ), RejectReason::AMBIGUOUS_SIGN );
}

TEST( CheckGroupingTest, SplitsThousands )
{
    EXPECT_OUTCOME_TRUE( draft, CheckGrouping( SplitDecorations( Candidate( "12,345,678" ) ) ) );
    EXPECT_EQ( draft.digit_groups, ( std::vector<std::string>{ "12", "345", "678" } ) );

    EXPECT_OUTCOME_TRUE( ungrouped, CheckGrouping( SplitDecorations( Candidate( "12345678" ) ) ) );
    EXPECT_EQ( ungrouped.digit_groups, ( std::vector<std::string>{ "12345678" } ) );

    EXPECT_OUTCOME_ERROR( wide, CheckGrouping( SplitDecorations( Candidate( "1234,567" ) ) ), RejectReason::INVALID_GROUPING );
    EXPECT_OUTCOME_ERROR( empty, CheckGrouping( SplitDecorations( Candidate( "1,,234" ) ) ), RejectReason::INVALID_GROUPING );
}

/**
 * @given a run whose fraction is written as dashes
 * @when the decimal point rule reads it
 * @then the fraction is empty, but only when there is no exponent
 */
TEST( CheckDecimalPointTest, DashedFractionIsZeroCents )
{
    auto split = SplitDecorations( Candidate( "700.--" ) );
    EXPECT_OUTCOME_TRUE( grouped, CheckGrouping( split ) );
    EXPECT_OUTCOME_TRUE( draft, CheckDecimalPoint( grouped ) );
    EXPECT_TRUE( draft.fractional_digits.empty() );

    auto exponent_split = SplitDecorations( Candidate( "700.--E2" ) );
    EXPECT_OUTCOME_TRUE( exponent_grouped, CheckGrouping( exponent_split ) );
    EXPECT_OUTCOME_TRUE( exponent_draft, CheckDecimalPoint( exponent_grouped ) );
    EXPECT_EQ( exponent_draft.fractional_digits, "--" );
    EXPECT_OUTCOME_ERROR( stray, CheckResidual( exponent_draft ), RejectReason::STRAY_CHARACTER );
}

TEST( CheckDecimalPointTest, TrailingDashesAfterFractionDigits )
{
    auto split = SplitDecorations( Candidate( "100.0--" ) );
    EXPECT_OUTCOME_TRUE( grouped, CheckGrouping( split ) );
    EXPECT_OUTCOME_TRUE( draft, CheckDecimalPoint( grouped ) );
    EXPECT_EQ( draft.fractional_digits, "0" );
    EXPECT_OUTCOME_TRUE_1( CheckResidual( draft ) );

    auto inner_split = SplitDecorations( Candidate( "1.5-3" ) );
    EXPECT_OUTCOME_TRUE( inner_grouped, CheckGrouping( inner_split ) );
    EXPECT_OUTCOME_TRUE( inner_draft, CheckDecimalPoint( inner_grouped ) );
    EXPECT_EQ( inner_draft.fractional_digits, "5-3" );
}

TEST( CheckExponentTest, ParsesSignedExponent )
{
    EXPECT_OUTCOME_TRUE( positive, CheckExponent( SplitDecorations( Candidate( "7E+2" ) ) ) );
    ASSERT_TRUE( positive.exponent );
    EXPECT_EQ( *positive.exponent, 2 );

    EXPECT_OUTCOME_TRUE( negative, CheckExponent( SplitDecorations( Candidate( "7e-12" ) ) ) );
    ASSERT_TRUE( negative.exponent );
    EXPECT_EQ( *negative.exponent, -12 );

    EXPECT_OUTCOME_TRUE( none, CheckExponent( SplitDecorations( Candidate( "7" ) ) ) );
    EXPECT_FALSE( none.exponent );
}

TEST( IsDisqualifyingNeighbourTest, ClassifiesAdjacentCharacters )
{
    for ( char c : std::string( "aZx!#%&:;<>?@_|^\\/" ) )
    {
        EXPECT_TRUE( IsDisqualifyingNeighbour( c ) ) << c;
    }
    for ( char c : std::string( " \t\n\"'={}~`" ) )
    {
        EXPECT_FALSE( IsDisqualifyingNeighbour( c ) ) << c;
    }
    EXPECT_FALSE( IsDisqualifyingNeighbour( kNoNeighbour ) );
    EXPECT_TRUE( IsDisqualifyingNeighbour( static_cast<char>( 0xC2 ) ) );
}

TEST( OrderedRulesTest, FixedOrder )
{
    const auto &rules = OrderedRules();

    ASSERT_EQ( rules.size(), 8 );
    EXPECT_STREQ( rules.front().name, "sign markers" );
    EXPECT_EQ( rules.front().rule, &CheckSignMarkers );
    EXPECT_EQ( rules[4].rule, &CheckGrouping );
    EXPECT_EQ( rules.back().rule, &CheckResidual );
}
