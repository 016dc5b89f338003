#include "indicators/bollinger.hpp"
#include "indicators/sma_ema.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

BB compute_bb(const std::vector<double>& v, std::size_t p, double k){
    BB bb{compute_sma(v, p), Column(v.size()), Column(v.size())};
    if (p < 2) return bb;
    for (std::size_t i = p - 1; i < v.size(); ++i){
        const double mid = *bb.mid[i];
        double var = 0.0;
        for (std::size_t j = i + 1 - p; j <= i; ++j){ const double d = v[j] - mid; var += d*d; }
        const double sd = std::sqrt(std::max(0.0, var / static_cast<double>(p - 1)));
        bb.upper[i] = mid + k*sd;
        bb.lower[i] = mid - k*sd;
    }
    return bb;
}

Column bb_width(const BB& bb){
    Column out(bb.mid.size());
    for (std::size_t i = 0; i < out.size(); ++i){
        if (bb.mid[i] && bb.upper[i] && bb.lower[i] && *bb.mid[i] != 0.0)
            out[i] = (*bb.upper[i] - *bb.lower[i]) / *bb.mid[i];
    }
    return out;
}

} // namespace ind
