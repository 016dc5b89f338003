#include "pipeline/config.hpp"
#include "core/errors.hpp"
#include "core/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace pipeline {

static constexpr std::int64_t kYearMs = 365LL * 24 * 60 * 60 * 1000;

DateRange resolve_range(const AnalysisConfig& cfg, std::int64_t now_ms){
    DateRange r;
    r.until = cfg.end_ms > 0 ? cfg.end_ms : now_ms;
    r.since = cfg.start_ms > 0 ? cfg.start_ms : r.until - kYearMs;
    if (r.since > r.until)
        throw core::ConfigError(fmt::format("start {} is after end {}", core::format_date(r.since), core::format_date(r.until)));
    return r;
}

static std::int64_t parse_date_field(const json& j, const char* key, bool allow_now){
    if (!j.contains(key) || j.at(key).is_null()) return 0;
    if (!j.at(key).is_string()) throw core::ConfigError(std::string(key) + " must be a string");
    const auto s = j.at(key).get<std::string>();
    if (s.empty() || (allow_now && s == "now")) return 0;
    auto t = core::parse_utc(s);
    if (!t) throw core::ConfigError(std::string(key) + ": invalid date '" + s + "' (expected YYYY-MM-DD)");
    return *t;
}

static std::string resolve_path(const std::string& p, const fs::path& base){
    if (p.empty() || base.empty()) return p;
    fs::path fp(p);
    return fp.is_absolute() ? p : (base / fp).lexically_normal().string();
}

AppConfig parse_config(const json& j, const fs::path& base_dir){
    if (!j.is_object()) throw core::ConfigError("configuration must be a json object");
    AppConfig c;
    try {
        c.key.symbol   = j.value("symbol", c.key.symbol);
        c.key.exchange = j.value("exchange", c.key.exchange);
        if (c.key.symbol.empty()) throw core::ConfigError("symbol is empty");

        auto& a = c.analysis;
        const auto tf = j.value("timeframe", std::string{"1d"});
        auto parsed_tf = core::parse_timeframe(tf);
        if (!parsed_tf) throw core::ConfigError("unknown timeframe '" + tf + "'");
        a.timeframe = *parsed_tf;

        a.start_ms = parse_date_field(j, "start_date", false);
        a.end_ms   = parse_date_field(j, "end_date", true);
        if (a.start_ms > 0 && a.end_ms > 0 && a.start_ms > a.end_ms)
            throw core::ConfigError("start_date is after end_date");

        a.csv_path      = resolve_path(j.value("csv_file_path", a.csv_path), base_dir);
        a.output_dir    = resolve_path(j.value("output_dir", a.output_dir), base_dir);
        a.export_report = j.value("export_report", a.export_report);

        if (j.contains("fetch")){
            const auto& f = j.at("fetch");
            a.fetch.page_limit      = f.value("page_limit", a.fetch.page_limit);
            a.fetch.min_interval_ms = f.value("min_interval_ms", a.fetch.min_interval_ms);
            a.fetch.max_retries     = f.value("max_retries", a.fetch.max_retries);
            a.fetch.backoff_ms      = f.value("backoff_ms", a.fetch.backoff_ms);
            c.binance.timeout_ms    = f.value("timeout_ms", c.binance.timeout_ms);
            c.binance.base_url      = f.value("base_url", c.binance.base_url);
            if (a.fetch.page_limit <= 0) throw core::ConfigError("fetch.page_limit must be positive");
        }
        if (j.contains("indicators")){
            const auto& i = j.at("indicators");
            a.indicators.ma_windows   = i.value("ma_windows", a.indicators.ma_windows);
            a.indicators.rsi_period   = i.value("rsi_period", a.indicators.rsi_period);
            a.indicators.bb_period    = i.value("bb_period", a.indicators.bb_period);
            a.indicators.bb_k         = i.value("bb_k", a.indicators.bb_k);
            a.indicators.volume_period = i.value("volume_period", a.indicators.volume_period);
            a.indicators.spike_factor = i.value("spike_factor", a.indicators.spike_factor);
            if (a.indicators.ma_windows.size() < 2) throw core::ConfigError("indicators.ma_windows needs at least two windows");
        }
        if (j.contains("forecast")){
            const auto& f = j.at("forecast");
            auto& fc = a.forecast;
            fc.horizon                   = f.value("horizon", fc.horizon);
            fc.min_examples              = f.value("min_examples", fc.min_examples);
            fc.features.window           = f.value("window", fc.features.window);
            fc.model.trees               = f.value("trees", fc.model.trees);
            fc.model.tree.max_depth      = f.value("max_depth", fc.model.tree.max_depth);
            fc.model.tree.min_samples_leaf = f.value("min_samples_leaf", fc.model.tree.min_samples_leaf);
            fc.model.max_features        = f.value("max_features", fc.model.max_features);
            fc.model.seed                = f.value("seed", fc.model.seed);
            if (fc.features.window == 0) throw core::ConfigError("forecast.window must be positive");
        }

        c.log.file  = resolve_path(j.value("log_file", c.log.file), base_dir);
        c.log.level = j.value("log_level", c.log.level);
    } catch (const json::exception& e) {
        throw core::ConfigError(std::string("bad configuration value: ") + e.what());
    }
    return c;
}

AppConfig load_config(const fs::path& path){
    std::ifstream f(path);
    if (!f.good()) throw core::ConfigError("cannot open configuration '" + path.string() + "'");
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw core::ConfigError("'" + path.string() + "': " + e.what());
    }
    auto c = parse_config(j, path.has_parent_path() ? path.parent_path() : fs::path{});
    spdlog::info("Configuration loaded successfully from '{}'", path.string());
    return c;
}

} // namespace pipeline
