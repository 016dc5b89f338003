#include "report/report.hpp"
#include "core/errors.hpp"
#include "core/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace report {

static std::ofstream open_out(const fs::path& path){
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) throw core::StoreError(fmt::format("cannot create '{}': {}", path.parent_path().string(), ec.message()));
    std::ofstream f(path, std::ios::trunc);
    if (!f.good()) throw core::StoreError("cannot open '" + path.string() + "' for writing");
    return f;
}

static void finish(std::ofstream& f, const fs::path& path){
    f.flush();
    if (!f.good()) throw core::StoreError("write to '" + path.string() + "' failed");
}

static std::string cell(const std::optional<double>& v){
    return v ? fmt::format("{}", *v) : std::string{};
}

fs::path path_for(const fs::path& dir, const core::SeriesKey& key, const std::string& what, const std::string& ext){
    const auto quote = key.quote();
    const auto pair = quote.empty() ? key.base() : key.base() + "_" + quote;
    return dir / fmt::format("{}_{}_{}.{}", pair, key.exchange, what, ext);
}

fs::path write_indicators_csv(const fs::path& dir, const core::CandleSeries& series, const ind::IndicatorFrame& frame){
    if (frame.size() != series.size())
        throw core::Error(core::ErrorKind::Internal, "indicator frame does not match the series");
    const auto path = path_for(dir, series.key, "indicators", "csv");
    auto f = open_out(path);

    f << "time,open,high,low,close,volume";
    for (auto w : frame.cfg.ma_windows) f << ",ma_" << w;
    f << ",rsi,macd,macd_signal,macd_hist,bb_upper,bb_mid,bb_lower,volume_ma,volume_ratio,volume_spike\n";

    for (std::size_t i = 0; i < series.size(); ++i){
        const auto& c = series.candles[i];
        const auto r = frame.row(i);
        f << core::format_utc(c.open_time_ms) << ',' << fmt::format("{},{},{},{},{}", c.open, c.high, c.low, c.close, c.volume);
        for (auto& m : r.ma) f << ',' << cell(m);
        f << ',' << cell(r.rsi) << ',' << cell(r.macd) << ',' << cell(r.macd_signal) << ',' << cell(r.macd_hist)
          << ',' << cell(r.bb_upper) << ',' << cell(r.bb_mid) << ',' << cell(r.bb_lower)
          << ',' << cell(r.volume_ma) << ',' << cell(r.volume_ratio) << ',' << (r.volume_spike ? 1 : 0) << '\n';
    }
    finish(f, path);
    return path;
}

fs::path write_forecast_csv(const fs::path& dir, const forecast::ForecastResult& fc){
    const auto path = path_for(dir, fc.key, "forecast", "csv");
    auto f = open_out(path);
    f << "time,step,predicted_close,spread\n";
    for (auto& p : fc.points)
        f << fmt::format("{},{},{:.8f},{:.8f}\n", core::format_utc(p.time_ms), p.step, p.predicted_close, p.spread);
    finish(f, path);
    return path;
}

json summary_json(const core::SeriesKey& key, const ind::SummaryStats& s,
                  const std::optional<forecast::ForecastResult>& fc){
    json j;
    j["symbol"] = key.symbol;
    j["exchange"] = key.exchange;
    j["current_price"] = s.current_price;
    j["all_time_high"] = s.all_time_high;
    j["all_time_low"] = s.all_time_low;
    j["mean_return_pct"] = s.mean_return_pct;
    j["volatility_pct"] = s.volatility_pct;
    j["last_volume"] = s.last_volume;
    j["trend"] = core::to_string(s.trend);
    if (fc && !fc->points.empty()){
        const auto& last = fc->points.back();
        j["forecast"] = {
            {"model", fc->model},
            {"seed", fc->seed},
            {"training_examples", fc->training_examples},
            {"horizon", fc->horizon()},
            {"final_time", core::format_utc(last.time_ms)},
            {"final_price", last.predicted_close},
            {"final_spread", last.spread},
        };
    } else {
        j["forecast"] = nullptr;
    }
    return j;
}

fs::path write_summary_json(const fs::path& dir, const core::SeriesKey& key, const ind::SummaryStats& s,
                            const std::optional<forecast::ForecastResult>& fc){
    const auto path = path_for(dir, key, "summary", "json");
    auto f = open_out(path);
    f << summary_json(key, s, fc).dump(2) << '\n';
    finish(f, path);
    return path;
}

std::vector<std::string> export_all(const fs::path& dir, const core::CandleSeries& series,
                                    const ind::IndicatorFrame& frame, const ind::SummaryStats& summary,
                                    const std::optional<forecast::ForecastResult>& fc){
    std::vector<std::string> out;
    out.push_back(write_indicators_csv(dir, series, frame).string());
    if (fc) out.push_back(write_forecast_csv(dir, *fc).string());
    out.push_back(write_summary_json(dir, series.key, summary, fc).string());
    spdlog::info("Results for {} saved to '{}'", series.key.name(), dir.string());
    return out;
}

} // namespace report
