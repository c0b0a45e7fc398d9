#ifndef SELSUM_SCAN_RAW_CANDIDATE_HPP
#define SELSUM_SCAN_RAW_CANDIDATE_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>

namespace selsum::scan
{
    /// Placed in RawCandidate neighbour fields when the run touches the text boundary
    constexpr char kNoNeighbour = '\0';

    /**
     * @brief A maximal run of number-constituent characters, viewed in place in the scanned text.
     */
    struct RawCandidate
    {
        std::string_view text;                           ///< the run itself
        size_t           begin              = 0;         ///< offset of the first character
        size_t           end                = 0;         ///< offset one past the last character
        char             leading_neighbour  = kNoNeighbour; ///< separator right before the run
        char             trailing_neighbour = kNoNeighbour; ///< separator right after the run

        /**
         * @return true if the run holds at least one decimal digit; runs without one are plain punctuation
         */
        bool ContainsDigit() const
        {
            return std::any_of( text.begin(),
                                text.end(),
                                []( char c ) { return std::isdigit( static_cast<unsigned char>( c ) ) != 0; } );
        }
    };
} // namespace selsum::scan

#endif // SELSUM_SCAN_RAW_CANDIDATE_HPP
