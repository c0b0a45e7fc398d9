#ifndef SELSUM_SCAN_CANDIDATE_VALIDATOR_HPP
#define SELSUM_SCAN_CANDIDATE_VALIDATOR_HPP

#include "base/logger.hpp"
#include "scan/number_token.hpp"
#include "scan/raw_candidate.hpp"

namespace selsum::scan
{
    /**
     * @class CandidateValidator decides whether a scanned run is a number by applying the
     * tolerance rules in their fixed order. The first failing rule rejects the run; there is
     * no partial acceptance. Accepted runs come back normalized (no $, brackets, asterisks or
     * grouping commas).
     */
    class CandidateValidator
    {
    public:
        /**
         * @param candidate run produced by the CandidateScanner
         * @return accepted token with sign, digits and exponent, or rejected token carrying the
         * RejectReason of the first failing rule
         */
        NumberToken Validate( const RawCandidate &candidate ) const;

    private:
        base::Logger logger_ = base::createLogger( "CandidateValidator" );
    };
} // namespace selsum::scan

#endif // SELSUM_SCAN_CANDIDATE_VALIDATOR_HPP
