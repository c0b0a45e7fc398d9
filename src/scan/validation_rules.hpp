#ifndef SELSUM_SCAN_VALIDATION_RULES_HPP
#define SELSUM_SCAN_VALIDATION_RULES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"
#include "scan/number_token.hpp"
#include "scan/raw_candidate.hpp"
#include "scan/reject_reason.hpp"

namespace selsum::scan
{
    /**
     * @brief Candidate run taken apart into decoration zones and number parts.
     *
     * The prefix zone is the leading run of `+ - $ ( [`, the suffix zone the trailing run of
     * `) ] *`, the body is what lies between. The body is further split at the first exponent
     * marker and at the first decimal point. Each rule reads the draft and either rejects it or
     * hands on a refined copy.
     */
    struct TokenDraft
    {
        RawCandidate     candidate;
        std::string_view run; ///< candidate text without trailing punctuation
        std::string_view prefix;
        std::string_view body;
        std::string_view suffix;

        std::string_view integer_part;
        std::string_view fraction_part;
        std::string_view exponent_part;
        bool             has_point    = false;
        bool             has_exponent = false;

        Sign                     sign              = Sign::POSITIVE;
        bool                     bracket_negation  = false;
        std::vector<std::string> digit_groups;
        std::string              fractional_digits;
        std::optional<int64_t>   exponent;
    };

    /**
     * @brief trim trailing punctuation and locate the decoration zones and number parts
     * @param candidate scanned run
     * @return draft ready for the rules; this step never rejects
     */
    TokenDraft SplitDecorations( const RawCandidate &candidate );

    /// Rule 1: at most one sign indicator among leading -/+ and accounting brackets
    outcome::result<TokenDraft> CheckSignMarkers( TokenDraft draft );

    /// Rule 2: a single '$', only in the prefix zone
    outcome::result<TokenDraft> CheckCurrency( TokenDraft draft );

    /// Rule 3: '*' only in the suffix zone
    outcome::result<TokenDraft> CheckFootnotes( TokenDraft draft );

    /// Rule 4: zero or one matching bracket pair around the whole body
    outcome::result<TokenDraft> CheckBrackets( TokenDraft draft );

    /// Rule 5: commas only as thousands separators left of the point
    outcome::result<TokenDraft> CheckGrouping( TokenDraft draft );

    /// Rule 6: one decimal point at most, with digits on at least one side
    outcome::result<TokenDraft> CheckDecimalPoint( TokenDraft draft );

    /// Rule 7: at most one exponent marker followed by an optional sign and digits only
    outcome::result<TokenDraft> CheckExponent( TokenDraft draft );

    /// Rule 8: nothing left but digits, and no text glued to the run
    outcome::result<TokenDraft> CheckResidual( TokenDraft draft );

    /**
     * @param c character right next to a candidate run
     * @return true for letters, non-ASCII bytes and symbols that make a number ambiguous (5%, 1:30, 7/8)
     */
    bool IsDisqualifyingNeighbour( char c );

    using ValidationRule = outcome::result<TokenDraft> ( * )( TokenDraft );

    struct NamedRule
    {
        const char    *name;
        ValidationRule rule;
    };

    /// @return rules 1 to 8 in the order they must be applied
    const std::vector<NamedRule> &OrderedRules();
} // namespace selsum::scan

#endif // SELSUM_SCAN_VALIDATION_RULES_HPP
