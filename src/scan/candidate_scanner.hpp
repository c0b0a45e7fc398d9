#ifndef SELSUM_SCAN_CANDIDATE_SCANNER_HPP
#define SELSUM_SCAN_CANDIDATE_SCANNER_HPP

#include <optional>
#include <string_view>
#include <vector>

#include "scan/raw_candidate.hpp"

namespace selsum::scan
{
    /**
     * @class CandidateScanner splits text into maximal runs of characters that may belong to a
     * number: digits . , - + $ ( ) [ ] * E e. Every other character separates runs. The scanner
     * only delimits, it never judges whether a run is a valid number.
     *
     * The scanner does not own the text, which must outlive it and every candidate it returns.
     */
    class CandidateScanner
    {
    public:
        explicit CandidateScanner( std::string_view text );

        /**
         * @brief advance to the next run
         * @return next candidate, or nullopt once the end of the text is reached
         */
        std::optional<RawCandidate> Next();

        /**
         * @brief rewind to the start of the text, the following Next() yields the first run again
         */
        void Reset();

        /**
         * @param c character to classify
         * @return true if c can be part of a candidate run
         */
        static bool IsNumberConstituent( char c );

    private:
        std::string_view text_;
        size_t           position_ = 0;
    };

    /**
     * @brief scan the whole text at once
     * @param text text to split
     * @return every candidate run in order of appearance
     */
    std::vector<RawCandidate> ScanAll( std::string_view text );
} // namespace selsum::scan

#endif // SELSUM_SCAN_CANDIDATE_SCANNER_HPP
