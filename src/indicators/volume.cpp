#include "indicators/volume.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

VolumeStats compute_volume(const std::vector<double>& v, std::size_t p, double spike_factor){
    VolumeStats s{compute_sma(v, p), Column(v.size()), std::vector<bool>(v.size(), false)};
    for (std::size_t i = 0; i < v.size(); ++i){
        if (!s.ma[i] || *s.ma[i] <= 0.0) continue;
        s.ratio[i] = v[i] / *s.ma[i];
        s.spike[i] = *s.ratio[i] > spike_factor;
    }
    return s;
}

} // namespace ind
