#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "indicators/indicator_frame.hpp"

namespace strategy {

// Fixed decision table over one IndicatorFrame row (not a learned model):
//   Bullish  short MA > long MA  and RSI > 50 and MACD > signal
//   Bearish  short MA < long MA  and RSI < 50 and MACD < signal
//   Neutral  anything else, including ties, warm-up rows and i >= frame.size()
// Short/long MA are the first two configured MA windows.
core::TrendLabel classify(const ind::IndicatorFrame& frame, std::size_t i);

} // namespace strategy
