#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "core/logging.hpp"
#include "data/exchange_client.hpp"
#include "data/binance_provider.hpp"
#include "indicators/indicator_frame.hpp"
#include "forecast/forecaster.hpp"

namespace pipeline {

// Everything one analysis run needs; passed by value, never global.
struct AnalysisConfig {
    std::int64_t start_ms{0};   // 0 -> one year before end
    std::int64_t end_ms{0};     // 0 -> now
    std::string csv_path{"data/crypto_data.csv"};
    std::string output_dir{"analysis_results"};
    core::Timeframe timeframe{core::Timeframe::D1};
    bool export_report{true};

    data::FetchOptions fetch;
    ind::IndicatorConfig indicators;
    forecast::ForecastConfig forecast;
};

// [since, until] actually used for a run
struct DateRange { std::int64_t since{0}; std::int64_t until{0}; };
DateRange resolve_range(const AnalysisConfig& cfg, std::int64_t now_ms);

struct AppConfig {
    core::SeriesKey key;
    AnalysisConfig analysis;
    core::LogConfig log;
    data::BinanceConfig binance;
};

// Relative paths resolve against base_dir. Throws core::ConfigError.
AppConfig parse_config(const nlohmann::json& j, const std::filesystem::path& base_dir = {});
AppConfig load_config(const std::filesystem::path& path);

} // namespace pipeline
