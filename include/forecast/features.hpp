#pragma once
#include <optional>
#include <vector>
#include "forecast/model.hpp"
#include "indicators/indicator_frame.hpp"

namespace forecast {

struct FeatureConfig {
    std::size_t window{30};   // trailing closes per example
};

// Feature vector at index t, all prices relative to closes[t]:
//   closes[t-window+1..t] / c - 1, short MA / c - 1, long MA / c - 1,
//   RSI / 100, MACD / c, MACD signal / c, Bollinger width.
// nullopt while t is inside any warm-up or closes[t] <= 0.
std::optional<std::vector<double>> features_at(const std::vector<double>& closes,
                                               const ind::IndicatorFrame& frame,
                                               std::size_t t, const FeatureConfig& cfg);

std::size_t feature_count(const FeatureConfig& cfg);

// Every complete example; label = closes[t+1] / closes[t] - 1.
Dataset build_dataset(const std::vector<double>& closes, const ind::IndicatorFrame& frame,
                      const FeatureConfig& cfg);

} // namespace forecast
