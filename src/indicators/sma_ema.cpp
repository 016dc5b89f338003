#include "indicators/sma_ema.hpp"

namespace ind {

Column compute_sma(const std::vector<double>& v, std::size_t p){
    Column out(v.size());
    if (p == 0 || v.size() < p) return out;
    double s = 0.0;
    for (std::size_t i = 0; i < v.size(); ++i){
        s += v[i];
        if (i >= p) s -= v[i - p];
        if (i + 1 >= p) out[i] = s / static_cast<double>(p);
    }
    return out;
}

static void ema_from(const std::vector<double>& v, std::size_t first, std::size_t p, Column& out){
    if (p == 0 || v.size() < first + p) return;
    const double k = 2.0 / (static_cast<double>(p) + 1.0);
    double e = 0.0;
    for (std::size_t i = first; i < first + p; ++i) e += v[i];
    e /= static_cast<double>(p);
    out[first + p - 1] = e;
    for (std::size_t i = first + p; i < v.size(); ++i){
        e = v[i] * k + e * (1.0 - k);
        out[i] = e;
    }
}

Column compute_ema(const std::vector<double>& v, std::size_t p){
    Column out(v.size());
    ema_from(v, 0, p, out);
    return out;
}

Column compute_ema(const Column& v, std::size_t p){
    Column out(v.size());
    std::size_t first = 0;
    while (first < v.size() && !v[first]) ++first;
    if (first == v.size()) return out;
    // defined tail is contiguous for every column the engine produces
    std::vector<double> dense(v.size(), 0.0);
    std::size_t end = first;
    while (end < v.size() && v[end]){ dense[end] = *v[end]; ++end; }
    dense.resize(end);
    ema_from(dense, first, p, out);
    return out;
}

} // namespace ind
