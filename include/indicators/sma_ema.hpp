#pragma once
#include <vector>
#include "indicators/column.hpp"

namespace ind {

// Trailing simple mean; undefined for i < p-1.
Column compute_sma(const std::vector<double>& v, std::size_t p);

// Recursive EMA, alpha = 2/(p+1), seeded with the mean of the first p values;
// undefined for i < p-1.
Column compute_ema(const std::vector<double>& v, std::size_t p);

// Same over a column whose defined part starts somewhere inside (MACD signal).
Column compute_ema(const Column& v, std::size_t p);

} // namespace ind
