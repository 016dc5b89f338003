#include "strategy/trend_detector.hpp"

namespace strategy {

core::TrendLabel classify(const ind::IndicatorFrame& f, std::size_t i){
    using core::TrendLabel;
    if (i >= f.size() || f.ma.size() < 2) return TrendLabel::Neutral;

    const auto& s   = f.ma[0][i];
    const auto& l   = f.ma[1][i];
    const auto& rsi = f.rsi[i];
    const auto& m   = f.macd[i];
    const auto& sig = f.macd_signal[i];
    if (!s || !l || !rsi || !m || !sig) return TrendLabel::Neutral;

    if (*s > *l && *rsi > 50.0 && *m > *sig) return TrendLabel::Bullish;
    if (*s < *l && *rsi < 50.0 && *m < *sig) return TrendLabel::Bearish;
    return TrendLabel::Neutral;
}

} // namespace strategy
