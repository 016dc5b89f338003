#include <catch2/catch.hpp>
#include <fstream>
#include "pipeline/config.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

using nlohmann::json;
using namespace fixtures;

TEST_CASE("missing keys take defaults", "[config]"){
    const auto c = pipeline::parse_config(json::object());
    CHECK(c.key.symbol == "BTC/USDT");
    CHECK(c.key.exchange == "binance");
    CHECK(c.analysis.timeframe == core::Timeframe::D1);
    CHECK(c.analysis.start_ms == 0);
    CHECK(c.analysis.end_ms == 0);
    CHECK(c.analysis.csv_path == "data/crypto_data.csv");
    CHECK(c.analysis.forecast.horizon == 730);
    CHECK(c.analysis.forecast.min_examples == 200);
    CHECK(c.analysis.forecast.model.seed == 42);
    CHECK(c.log.level == "info");
}

TEST_CASE("a full configuration", "[config]"){
    const auto j = json::parse(R"({
        "symbol": "ETH/USDT", "exchange": "binance", "timeframe": "4h",
        "start_date": "2023-01-01", "end_date": "now",
        "csv_file_path": "cache/eth.csv", "output_dir": "/tmp/coincast_out",
        "log_file": "logs/coincast.log", "log_level": "debug",
        "fetch": {"page_limit": 500, "min_interval_ms": 1200, "max_retries": 5, "backoff_ms": 250, "timeout_ms": 3000},
        "indicators": {"ma_windows": [10, 30, 100], "rsi_period": 7},
        "forecast": {"horizon": 30, "window": 20, "trees": 50, "max_depth": 8,
                     "min_samples_leaf": 3, "min_examples": 100, "seed": 7}
    })");
    const auto c = pipeline::parse_config(j, "/etc/coincast");

    CHECK(c.key.symbol == "ETH/USDT");
    CHECK(c.analysis.timeframe == core::Timeframe::H4);
    CHECK(c.analysis.start_ms == kT0);
    CHECK(c.analysis.end_ms == 0);
    CHECK(c.analysis.csv_path == "/etc/coincast/cache/eth.csv");
    CHECK(c.analysis.output_dir == "/tmp/coincast_out");
    CHECK(c.log.file == "/etc/coincast/logs/coincast.log");
    CHECK(c.log.level == "debug");
    CHECK(c.analysis.fetch.page_limit == 500);
    CHECK(c.analysis.fetch.min_interval_ms == 1200);
    CHECK(c.analysis.fetch.max_retries == 5);
    CHECK(c.analysis.fetch.backoff_ms == 250);
    CHECK(c.binance.timeout_ms == 3000);
    CHECK(c.analysis.indicators.ma_windows == std::vector<std::size_t>{10, 30, 100});
    CHECK(c.analysis.indicators.rsi_period == 7);
    CHECK(c.analysis.forecast.horizon == 30);
    CHECK(c.analysis.forecast.features.window == 20);
    CHECK(c.analysis.forecast.model.trees == 50);
    CHECK(c.analysis.forecast.model.tree.max_depth == 8);
    CHECK(c.analysis.forecast.model.tree.min_samples_leaf == 3);
    CHECK(c.analysis.forecast.min_examples == 100);
    CHECK(c.analysis.forecast.model.seed == 7);
}

TEST_CASE("bad values raise ConfigError", "[config]"){
    CHECK_THROWS_AS(pipeline::parse_config(json::array()), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"timeframe", "2d"}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"start_date", "01/02/2023"}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"start_date", "2024-01-01"}, {"end_date", "2023-01-01"}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"symbol", 5}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"symbol", ""}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"fetch", {{"page_limit", 0}}}}), core::ConfigError);
    CHECK_THROWS_AS(pipeline::parse_config({{"indicators", {{"ma_windows", {20}}}}}), core::ConfigError);
}

TEST_CASE("loading from disk", "[config]"){
    TempDir dir;
    SECTION("relative paths follow the file"){
        const auto path = dir.path / "config.json";
        std::ofstream(path) << R"({"symbol": "SOL/USDT", "csv_file_path": "data/c.csv"})";
        const auto c = pipeline::load_config(path);
        CHECK(c.key.symbol == "SOL/USDT");
        CHECK(c.analysis.csv_path == (dir.path / "data" / "c.csv").lexically_normal().string());
    }
    SECTION("missing file"){
        CHECK_THROWS_AS(pipeline::load_config(dir.path / "nope.json"), core::ConfigError);
    }
    SECTION("malformed json"){
        const auto path = dir.path / "broken.json";
        std::ofstream(path) << "{ \"symbol\": ";
        CHECK_THROWS_AS(pipeline::load_config(path), core::ConfigError);
    }
}

TEST_CASE("date range resolution", "[config]"){
    pipeline::AnalysisConfig a;
    const std::int64_t now = kT0 + 1000 * kDay;

    auto r = pipeline::resolve_range(a, now);
    CHECK(r.until == now);
    CHECK(r.since == now - 365 * kDay);

    a.start_ms = kT0;
    a.end_ms = kT0 + 10 * kDay;
    r = pipeline::resolve_range(a, now);
    CHECK(r.since == kT0);
    CHECK(r.until == kT0 + 10 * kDay);

    a.start_ms = now + kDay;
    a.end_ms = 0;
    CHECK_THROWS_AS(pipeline::resolve_range(a, now), core::ConfigError);
}
