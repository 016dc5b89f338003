#pragma once
#include <vector>
#include "indicators/column.hpp"

namespace ind {

// Wilder RSI. Rows [0, p-1] undefined. No movement in the window -> 50,
// zero average loss -> 100. Always within [0, 100].
Column compute_rsi(const std::vector<double>& closes, std::size_t p = 14);

} // namespace ind
