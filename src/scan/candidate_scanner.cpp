#include "scan/candidate_scanner.hpp"

#include <cctype>

namespace selsum::scan
{
    CandidateScanner::CandidateScanner( std::string_view text ) : text_( text ) {}

    bool CandidateScanner::IsNumberConstituent( char c )
    {
        if ( std::isdigit( static_cast<unsigned char>( c ) ) )
        {
            return true;
        }
        switch ( c )
        {
            case '.':
            case ',':
            case '-':
            case '+':
            case '$':
            case '(':
            case ')':
            case '[':
            case ']':
            case '*':
            case 'E':
            case 'e':
                return true;
            default:
                return false;
        }
    }

    std::optional<RawCandidate> CandidateScanner::Next()
    {
        while ( position_ < text_.size() && !IsNumberConstituent( text_[position_] ) )
        {
            ++position_;
        }
        if ( position_ >= text_.size() )
        {
            return std::nullopt;
        }

        size_t begin = position_;
        while ( position_ < text_.size() && IsNumberConstituent( text_[position_] ) )
        {
            ++position_;
        }

        RawCandidate candidate;
        candidate.text               = text_.substr( begin, position_ - begin );
        candidate.begin              = begin;
        candidate.end                = position_;
        candidate.leading_neighbour  = begin > 0 ? text_[begin - 1] : kNoNeighbour;
        candidate.trailing_neighbour = position_ < text_.size() ? text_[position_] : kNoNeighbour;
        return candidate;
    }

    void CandidateScanner::Reset()
    {
        position_ = 0;
    }

    std::vector<RawCandidate> ScanAll( std::string_view text )
    {
        std::vector<RawCandidate> candidates;
        CandidateScanner          scanner( text );
        while ( auto candidate = scanner.Next() )
        {
            candidates.push_back( *candidate );
        }
        return candidates;
    }
} // namespace selsum::scan
