#include <catch2/catch.hpp>
#include "forecast/forecaster.hpp"
#include "forecast/features.hpp"
#include "forecast/bagged_trees.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

using namespace fixtures;

static forecast::ForecastConfig small_config(std::size_t horizon = 5){
    forecast::ForecastConfig cfg;
    cfg.horizon = horizon;
    cfg.model.trees = 8;
    cfg.model.tree.max_depth = 6;
    return cfg;
}

// always predicts "no change"
class FlatRegressor : public forecast::IRegressor {
public:
    std::string id() const override { return "flat"; }
    std::unique_ptr<forecast::IModel> train(const forecast::Dataset&) const override {
        struct Zero : forecast::IModel {
            double predict(const std::vector<double>&) const override { return 0.0; }
        };
        return std::make_unique<Zero>();
    }
};

TEST_CASE("a complete example needs every indicator out of warm-up", "[forecast]"){
    const auto s = series(noisy(100));
    const auto f = ind::compute(s, {});
    const auto closes = s.closes();
    forecast::FeatureConfig fc;

    CHECK_FALSE(forecast::features_at(closes, f, 48, fc));
    const auto x = forecast::features_at(closes, f, 49, fc);
    REQUIRE(x);
    CHECK(x->size() == forecast::feature_count(fc));
    CHECK(x->at(fc.window - 1) == Approx(0.0).margin(1e-12));   // close[t] / close[t] - 1

    const auto ds = forecast::build_dataset(closes, f, fc);
    CHECK(ds.size() == 50);
    CHECK(ds.y.front() == Approx(closes[50] / closes[49] - 1.0));
}

TEST_CASE("50 examples are not enough to train", "[forecast]"){
    const auto s = series(noisy(100));
    const auto f = ind::compute(s, {});
    forecast::Forecaster fc(small_config());
    CHECK_THROWS_AS(fc.forecast(s, f), core::InsufficientDataError);
}

TEST_CASE("an empty series cannot be forecast", "[forecast]"){
    forecast::Forecaster fc(small_config());
    CHECK_THROWS_AS(fc.forecast(core::CandleSeries{}, ind::IndicatorFrame{}), core::InsufficientDataError);
}

TEST_CASE("the frame must belong to the series", "[forecast]"){
    const auto s = series(noisy(300));
    const auto f = ind::compute(series(noisy(299)), {});
    forecast::Forecaster fc(small_config());
    try {
        fc.forecast(s, f);
        FAIL("expected an error");
    } catch (const core::Error& e) {
        CHECK(e.kind() == core::ErrorKind::Internal);
    }
}

TEST_CASE("forecast points continue the series", "[forecast]"){
    const auto s = series(noisy(320));
    const auto f = ind::compute(s, {});
    forecast::Forecaster fc(small_config(7));
    const auto r = fc.forecast(s, f);

    CHECK(r.key == s.key);
    CHECK(r.model == "bagged_trees");
    CHECK(r.seed == 42);
    CHECK(r.training_examples == 270);
    REQUIRE(r.horizon() == 7);
    for (std::size_t i = 0; i < r.points.size(); ++i){
        const auto& p = r.points[i];
        CHECK(p.step == i + 1);
        CHECK(p.time_ms == s.last_time() + static_cast<std::int64_t>(i + 1) * kDay);
        CHECK(p.predicted_close > 0.0);
        CHECK(p.spread >= 0.0);
    }
}

TEST_CASE("the same seed gives bit-identical forecasts", "[forecast]"){
    const auto s = series(noisy(320));
    const auto f = ind::compute(s, {});

    const auto a = forecast::Forecaster(small_config()).forecast(s, f);
    const auto b = forecast::Forecaster(small_config()).forecast(s, f);
    REQUIRE(a.points.size() == b.points.size());
    for (std::size_t i = 0; i < a.points.size(); ++i){
        CHECK(a.points[i].predicted_close == b.points[i].predicted_close);
        CHECK(a.points[i].spread == b.points[i].spread);
    }
}

TEST_CASE("the regression technique is swappable", "[forecast]"){
    const auto s = series(noisy(320));
    const auto f = ind::compute(s, {});
    forecast::Forecaster fc(small_config(4), std::make_shared<FlatRegressor>());
    const auto r = fc.forecast(s, f);

    CHECK(r.model == "flat");
    REQUIRE(r.horizon() == 4);
    for (auto& p : r.points){
        CHECK(p.predicted_close == Approx(s.candles.back().close));
        CHECK(p.spread == 0.0);
    }
}

TEST_CASE("a regression tree learns a step", "[forecast]"){
    forecast::Dataset d;
    for (int i = 0; i < 100; ++i){
        d.x.push_back({static_cast<double>(i)});
        d.y.push_back(i < 50 ? 1.0 : 5.0);
    }
    std::vector<std::size_t> rows(100);
    for (std::size_t i = 0; i < rows.size(); ++i) rows[i] = i;

    std::mt19937_64 rng(1);
    forecast::RegressionTree t;
    t.fit(d, rows, {}, 1.0, rng);
    CHECK(t.predict({10.0}) == Approx(1.0));
    CHECK(t.predict({90.0}) == Approx(5.0));
    CHECK(t.node_count() == 3);
}

TEST_CASE("bagged trees reject an empty dataset", "[forecast]"){
    forecast::BaggedTreesRegressor reg;
    CHECK_THROWS_AS(reg.train(forecast::Dataset{}), std::invalid_argument);
}

TEST_CASE("bagged trees average their members", "[forecast]"){
    forecast::Dataset d;
    for (int i = 0; i < 200; ++i){
        const double x = static_cast<double>(i) / 10.0;
        d.x.push_back({x});
        d.y.push_back(2.0 * x);
    }
    forecast::BaggingConfig cfg;
    cfg.trees = 20;
    const auto m = forecast::BaggedTreesRegressor(cfg).train(d);
    CHECK(m->predict({5.0}) == Approx(10.0).margin(0.5));
    CHECK(m->spread({5.0}) >= 0.0);
}
