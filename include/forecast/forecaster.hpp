#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "forecast/bagged_trees.hpp"
#include "forecast/features.hpp"
#include "indicators/indicator_frame.hpp"

namespace forecast {

struct ForecastConfig {
    std::size_t horizon{730};       // steps (periods) past the last candle
    std::size_t min_examples{200};  // fewer complete examples -> InsufficientDataError
    FeatureConfig features;
    BaggingConfig model;            // model.seed makes the run reproducible
};

struct ForecastPoint {
    std::int64_t time_ms{};
    double predicted_close{};
    std::size_t step{};   // 1-based; later steps rest on earlier predictions
    double spread{};      // ensemble std-dev in price units
};

// Immutable once returned. Accuracy degrades with `step`: every step feeds
// on the previous step's prediction.
struct ForecastResult {
    core::SeriesKey key;
    std::vector<ForecastPoint> points;
    std::string model;
    std::uint64_t seed{};
    std::size_t training_examples{};

    std::size_t horizon() const { return points.size(); }
};

class Forecaster {
public:
    // Default regressor: BaggedTreesRegressor(cfg.model)
    explicit Forecaster(ForecastConfig cfg = {}, std::shared_ptr<const IRegressor> regressor = nullptr);

    // Trains on every complete example of (series, frame) and extrapolates
    // `horizon_steps` periods autoregressively. frame must be computed from series.
    ForecastResult forecast(const core::CandleSeries& series, const ind::IndicatorFrame& frame,
                            std::size_t horizon_steps) const;
    ForecastResult forecast(const core::CandleSeries& series, const ind::IndicatorFrame& frame) const {
        return forecast(series, frame, cfg_.horizon);
    }

    const ForecastConfig& config() const { return cfg_; }

private:
    ForecastConfig cfg_;
    std::shared_ptr<const IRegressor> regressor_;
};

} // namespace forecast
