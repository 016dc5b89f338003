#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "indicators/indicator_frame.hpp"
#include "indicators/summary.hpp"
#include "forecast/forecaster.hpp"

namespace report {

// "<dir>/<BASE>_<QUOTE>_<exchange>_<what>.<ext>"
std::filesystem::path path_for(const std::filesystem::path& dir, const core::SeriesKey& key,
                               const std::string& what, const std::string& ext);

// time,open,high,low,close,volume,ma_20,...,rsi,macd,...,volume_spike; undefined cells empty
std::filesystem::path write_indicators_csv(const std::filesystem::path& dir, const core::CandleSeries& series,
                                           const ind::IndicatorFrame& frame);

// time,step,predicted_close,spread
std::filesystem::path write_forecast_csv(const std::filesystem::path& dir, const forecast::ForecastResult& fc);

nlohmann::json summary_json(const core::SeriesKey& key, const ind::SummaryStats& s,
                            const std::optional<forecast::ForecastResult>& fc);

std::filesystem::path write_summary_json(const std::filesystem::path& dir, const core::SeriesKey& key,
                                         const ind::SummaryStats& s,
                                         const std::optional<forecast::ForecastResult>& fc);

// All of the above; returns the files written. Throws core::StoreError.
std::vector<std::string> export_all(const std::filesystem::path& dir, const core::CandleSeries& series,
                                    const ind::IndicatorFrame& frame, const ind::SummaryStats& summary,
                                    const std::optional<forecast::ForecastResult>& fc);

} // namespace report
