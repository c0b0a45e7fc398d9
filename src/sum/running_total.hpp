#ifndef SELSUM_SUM_RUNNING_TOTAL_HPP
#define SELSUM_SUM_RUNNING_TOTAL_HPP

#include <cstdint>

#include "base/ScaledDecimal.hpp"
#include "base/logger.hpp"
#include "scan/number_token.hpp"

namespace selsum::sum
{
    /// What became of a token handed to RunningTotal::Apply
    enum class TokenFate
    {
        SUMMED,
        OVERFLOWED,
        REJECTED,
    };

    /**
     * @class RunningTotal exact sum and counters of one summation pass.
     * Created per pass and never shared, so it needs no locking.
     */
    class RunningTotal
    {
    public:
        /**
         * @param precision_limit significant digits a token may carry
         * @param expansion_limit digit positions a token may expand to once its exponent is applied
         */
        RunningTotal( uint64_t precision_limit, uint64_t expansion_limit );

        /**
         * @brief fold one validated token into the total
         * @param token accepted or rejected token
         * @return fate of the token. A negative token is counted even when it overflows.
         */
        TokenFate Apply( const scan::NumberToken &token );

        const ScaledDecimal &Sum() const
        {
            return sum_;
        }

        uint64_t NegativeCount() const
        {
            return negative_count_;
        }

        uint64_t OverflowCount() const
        {
            return overflow_count_;
        }

        uint64_t SummedCount() const
        {
            return summed_count_;
        }

        uint64_t RejectedCount() const
        {
            return rejected_count_;
        }

    private:
        uint64_t      precision_limit_;
        uint64_t      expansion_limit_;
        ScaledDecimal sum_;
        uint64_t      negative_count_ = 0;
        uint64_t      overflow_count_ = 0;
        uint64_t      summed_count_   = 0;
        uint64_t      rejected_count_ = 0;
        base::Logger  logger_         = base::createLogger( "RunningTotal" );
    };
} // namespace selsum::sum

#endif // SELSUM_SUM_RUNNING_TOTAL_HPP
