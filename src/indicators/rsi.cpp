#include "indicators/rsi.hpp"
#include <algorithm>

namespace ind {

static double rsi_value(double avg_gain, double avg_loss){
    if (avg_gain == 0.0 && avg_loss == 0.0) return 50.0;
    if (avg_loss == 0.0) return 100.0;
    const double rs  = avg_gain / avg_loss;
    const double rsi = 100.0 - (100.0 / (1.0 + rs));
    return std::clamp(rsi, 0.0, 100.0);
}

Column compute_rsi(const std::vector<double>& c, std::size_t p){
    Column out(c.size());
    if (p == 0 || c.size() <= p) return out;

    double g = 0.0, l = 0.0;
    for (std::size_t i = 1; i <= p; ++i){
        const double d = c[i] - c[i-1];
        if (d >= 0) g += d; else l -= d;
    }
    const double n = static_cast<double>(p);
    double ag = g / n, al = l / n;
    out[p] = rsi_value(ag, al);

    for (std::size_t i = p + 1; i < c.size(); ++i){
        const double d = c[i] - c[i-1];
        const double up = d > 0 ? d : 0.0;
        const double dn = d < 0 ? -d : 0.0;
        ag = (ag * (n - 1.0) + up) / n;
        al = (al * (n - 1.0) + dn) / n;
        out[i] = rsi_value(ag, al);
    }
    return out;
}

} // namespace ind
