#pragma once
#include <vector>
#include "indicators/column.hpp"

namespace ind {

struct VolumeStats {
    Column ma;                // trailing mean volume
    Column ratio;             // volume / ma
    std::vector<bool> spike;  // ratio > spike_factor
};

VolumeStats compute_volume(const std::vector<double>& volume, std::size_t p = 20, double spike_factor = 2.0);

} // namespace ind
