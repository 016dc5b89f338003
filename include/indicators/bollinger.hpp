#pragma once
#include <vector>
#include "indicators/column.hpp"

namespace ind {

struct BB { Column mid, upper, lower; };

// p-period SMA +/- k sample standard deviations of v over the same window.
BB compute_bb(const std::vector<double>& v, std::size_t p = 20, double k = 2.0);

// (upper - lower) / mid where defined
Column bb_width(const BB& bb);

} // namespace ind
