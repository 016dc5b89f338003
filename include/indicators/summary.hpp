#pragma once
#include "core/types.hpp"
#include "indicators/indicator_frame.hpp"

namespace ind {

struct SummaryStats {
    double current_price{0.0};
    double all_time_high{0.0};
    double all_time_low{0.0};
    double mean_return_pct{0.0};   // mean period-over-period close change, %
    double volatility_pct{0.0};    // sample std-dev of the same, %
    double last_volume{0.0};
    core::TrendLabel trend{core::TrendLabel::Neutral};
};

// Headline numbers for the last candle. Empty series -> all zero / Neutral.
SummaryStats summarize(const core::CandleSeries& series, const IndicatorFrame& frame);

} // namespace ind
