#include "sum/sum_formatter.hpp"

namespace selsum::sum
{
    SumFormat ChooseSumFormat( const ScaledDecimal &sum, uint64_t precision_limit )
    {
        auto normalized = sum.Normalized();
        if ( normalized.Precision() == 0 )
        {
            return SumFormat::INTEGER;
        }
        if ( normalized.Precision() <= 2 )
        {
            return SumFormat::TWO_DECIMALS;
        }
        if ( normalized.SignificantDigits() <= precision_limit )
        {
            return SumFormat::FULL_DECIMAL;
        }
        return SumFormat::SCIENTIFIC;
    }

    RenderedSum FormatSum( const ScaledDecimal &sum, uint64_t precision_limit )
    {
        auto normalized = sum.Normalized();
        auto format     = ChooseSumFormat( normalized, precision_limit );
        switch ( format )
        {
            case SumFormat::TWO_DECIMALS:
            {
                // widening never loses digits
                auto cents = normalized.ConvertPrecision( 2 );
                if ( cents )
                {
                    return { cents.value().ToString(), format };
                }
                return { normalized.ToString(), SumFormat::FULL_DECIMAL };
            }
            case SumFormat::SCIENTIFIC:
                return { normalized.ToScientific( precision_limit ), format };
            case SumFormat::INTEGER:
            case SumFormat::FULL_DECIMAL:
                break;
        }
        return { normalized.ToString(), format };
    }
} // namespace selsum::sum
