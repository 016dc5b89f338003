#pragma once
#include <vector>
#include "indicators/column.hpp"

namespace ind {

struct Macd { Column line, signal, hist; };

// line = EMA(fast) - EMA(slow), signal = EMA(signal) of line, hist = line - signal
Macd compute_macd(const std::vector<double>& closes, std::size_t fast = 12,
                  std::size_t slow = 26, std::size_t signal = 9);

} // namespace ind
