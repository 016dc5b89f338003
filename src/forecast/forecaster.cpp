#include "forecast/forecaster.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace forecast {

Forecaster::Forecaster(ForecastConfig cfg, std::shared_ptr<const IRegressor> regressor)
    : cfg_(cfg), regressor_(std::move(regressor)) {
    if (!regressor_) regressor_ = std::make_shared<BaggedTreesRegressor>(cfg_.model);
}

ForecastResult Forecaster::forecast(const core::CandleSeries& series, const ind::IndicatorFrame& frame,
                                    std::size_t horizon_steps) const {
    if (frame.size() != series.size())
        throw core::Error(core::ErrorKind::Internal,
                          fmt::format("frame has {} rows for {} candles", frame.size(), series.size()));

    if (series.empty())
        throw core::InsufficientDataError(series.key.name() + ": empty series");

    const auto closes = series.closes();
    const Dataset ds = build_dataset(closes, frame, cfg_.features);
    if (ds.size() < cfg_.min_examples)
        throw core::InsufficientDataError(fmt::format("{}: {} complete examples, at least {} required",
                                                      series.key.name(), ds.size(), cfg_.min_examples));

    spdlog::info("Training {} on {} examples x {} features for {}", regressor_->id(), ds.size(),
                 ds.features(), series.key.name());
    const auto model = regressor_->train(ds);

    ForecastResult res;
    res.key = series.key;
    res.model = regressor_->id();
    res.seed = cfg_.model.seed;
    res.training_examples = ds.size();
    res.points.reserve(horizon_steps);

    // synthetic continuation of the series, one candle per predicted step
    core::CandleSeries ext = series;
    std::vector<double> ext_closes = closes;
    ind::IndicatorFrame ext_frame = frame;
    const std::int64_t period = core::period_ms(series.timeframe);
    const double last_volume = series.candles.back().volume;

    for (std::size_t step = 1; step <= horizon_steps; ++step){
        const std::size_t t = ext_closes.size() - 1;
        const auto x = features_at(ext_closes, ext_frame, t, cfg_.features);
        if (!x)
            throw core::InsufficientDataError(fmt::format("{}: features undefined at step {}", series.key.name(), step));

        const double c = ext_closes[t];
        const double price = c * (1.0 + model->predict(*x));
        if (!std::isfinite(price) || price <= 0.0)
            throw core::Error(core::ErrorKind::Internal, fmt::format("non-positive prediction {} at step {}", price, step));

        ForecastPoint p;
        p.time_ms = series.last_time() + static_cast<std::int64_t>(step) * period;
        p.predicted_close = price;
        p.step = step;
        p.spread = model->spread(*x) * c;
        res.points.push_back(p);

        core::Candle syn;
        syn.open_time_ms = p.time_ms;
        syn.open = c;
        syn.close = price;
        syn.high = std::max(c, price);
        syn.low = std::min(c, price);
        syn.volume = last_volume;
        ext.candles.push_back(syn);
        ext_closes.push_back(price);
        ext_frame = ind::compute(ext, frame.cfg);
    }

    if (!res.points.empty())
        spdlog::info("Forecast for {}: {} steps, last {:.2f} -> {:.2f} (+/- {:.2f})", series.key.name(),
                     res.horizon(), closes.back(), res.points.back().predicted_close, res.points.back().spread);
    return res;
}

} // namespace forecast
