#include "forecast/features.hpp"
#include <cmath>
#include <stdexcept>

namespace forecast {

std::size_t feature_count(const FeatureConfig& cfg){
    return cfg.window + 6;
}

std::optional<std::vector<double>> features_at(const std::vector<double>& closes,
                                               const ind::IndicatorFrame& f,
                                               std::size_t t, const FeatureConfig& cfg){
    if (cfg.window == 0 || t >= closes.size() || t >= f.size() || t + 1 < cfg.window) return std::nullopt;
    if (f.ma.size() < 2) throw std::invalid_argument("features_at: frame needs two MA windows");

    const double c = closes[t];
    if (!(c > 0.0)) return std::nullopt;

    const auto& ms = f.ma[0][t];
    const auto& ml = f.ma[1][t];
    const auto& rsi = f.rsi[t];
    const auto& macd = f.macd[t];
    const auto& sig = f.macd_signal[t];
    const auto& up = f.bb_upper[t];
    const auto& mid = f.bb_mid[t];
    const auto& lo = f.bb_lower[t];
    if (!ms || !ml || !rsi || !macd || !sig || !up || !mid || !lo || *mid == 0.0) return std::nullopt;

    std::vector<double> x;
    x.reserve(feature_count(cfg));
    for (std::size_t i = t + 1 - cfg.window; i <= t; ++i) x.push_back(closes[i] / c - 1.0);
    x.push_back(*ms / c - 1.0);
    x.push_back(*ml / c - 1.0);
    x.push_back(*rsi / 100.0);
    x.push_back(*macd / c);
    x.push_back(*sig / c);
    x.push_back((*up - *lo) / *mid);
    for (double v : x) if (!std::isfinite(v)) return std::nullopt;
    return x;
}

Dataset build_dataset(const std::vector<double>& closes, const ind::IndicatorFrame& f, const FeatureConfig& cfg){
    Dataset d;
    for (std::size_t t = 0; t + 1 < closes.size(); ++t){
        auto x = features_at(closes, f, t, cfg);
        if (!x) continue;
        d.x.push_back(std::move(*x));
        d.y.push_back(closes[t+1] / closes[t] - 1.0);
    }
    return d;
}

} // namespace forecast
