#include "indicators/summary.hpp"
#include "strategy/trend_detector.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace ind {

SummaryStats summarize(const core::CandleSeries& s, const IndicatorFrame& frame){
    SummaryStats out;
    if (s.empty()) return out;

    out.current_price = s.candles.back().close;
    out.last_volume   = s.candles.back().volume;
    out.all_time_high = s.candles.front().high;
    out.all_time_low  = s.candles.front().low;
    for (auto& c : s.candles){
        out.all_time_high = std::max(out.all_time_high, c.high);
        out.all_time_low  = std::min(out.all_time_low, c.low);
    }

    std::vector<double> r;
    for (std::size_t i = 1; i < s.size(); ++i){
        const double prev = s.candles[i-1].close;
        if (prev != 0.0) r.push_back((s.candles[i].close / prev - 1.0) * 100.0);
    }
    if (!r.empty()){
        out.mean_return_pct = std::accumulate(r.begin(), r.end(), 0.0) / static_cast<double>(r.size());
        if (r.size() > 1){
            double var = 0.0;
            for (double x : r) var += (x - out.mean_return_pct) * (x - out.mean_return_pct);
            out.volatility_pct = std::sqrt(var / static_cast<double>(r.size() - 1));
        }
    }
    if (!frame.empty()) out.trend = strategy::classify(frame, frame.size() - 1);
    return out;
}

} // namespace ind
