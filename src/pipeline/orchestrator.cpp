#include "pipeline/orchestrator.hpp"
#include "core/time.hpp"
#include "data/exchange_client.hpp"
#include "strategy/trend_detector.hpp"
#include "report/report.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace pipeline {

const char* to_string(Stage s){
    switch (s){
        case Stage::Fetch:      return "fetch";
        case Stage::Merge:      return "merge";
        case Stage::Indicators: return "indicators";
        case Stage::Trend:      return "trend";
        case Stage::Forecast:   return "forecast";
        case Stage::Report:     return "report";
    }
    return "?";
}

// Open time of the first period in [since, until] the cache does not hold.
// Without a hole this is the newest cached candle in range, which is fetched
// again because the venue may still revise it.
static std::int64_t resume_from(const core::CandleSeries& cached, const DateRange& range, core::Timeframe tf){
    const auto step = core::period_ms(tf);
    std::int64_t expected = range.since;
    std::int64_t newest = -1;
    for (const auto& c : cached.candles){
        if (c.open_time_ms + step <= range.since) continue;
        if (c.open_time_ms > range.until) break;
        if (c.open_time_ms > expected) return expected;
        expected = std::max(expected, c.open_time_ms + step);
        newest = c.open_time_ms;
    }
    return newest < 0 ? range.since : newest;
}

Orchestrator::Orchestrator(std::vector<std::shared_ptr<data::IOhlcvProvider>> providers){
    for (auto& p : providers) add_provider(std::move(p));
}

void Orchestrator::add_provider(std::shared_ptr<data::IOhlcvProvider> p){
    if (!p) return;
    std::lock_guard<std::mutex> lk(mtx_);
    const auto id = p->id();
    providers_[id] = std::move(p);
}

std::shared_ptr<data::IOhlcvProvider> Orchestrator::provider_for(const std::string& exchange) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = providers_.find(exchange);
    if (it == providers_.end()) throw core::ProviderError("unsupported exchange '" + exchange + "'");
    return it->second;
}

std::shared_ptr<data::CandleStore> Orchestrator::store(const std::string& csv_path){
    std::lock_guard<std::mutex> lk(mtx_);
    auto& s = stores_[csv_path];
    if (!s) s = std::make_shared<data::CandleStore>(csv_path);
    return s;
}

bool Orchestrator::busy(const core::SeriesKey& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_flight_.count(key.name()) > 0;
}

Orchestrator::Claim Orchestrator::claim(const core::SeriesKey& key){
    std::lock_guard<std::mutex> lk(mtx_);
    auto name = key.name();
    if (!in_flight_.insert(name).second)
        throw core::BusyError(name + " is already being processed");
    return Claim(this, std::move(name));
}

void Orchestrator::release(const std::string& name){
    std::lock_guard<std::mutex> lk(mtx_);
    in_flight_.erase(name);
}

AnalysisResult Orchestrator::run(const core::SeriesKey& key, const AnalysisConfig& cfg, const Callbacks& cb,
                                 RunMode mode, const std::atomic<bool>* cancel){
    Claim held = claim(key);
    return execute(key, cfg, cb, mode, cancel);
}

std::future<AnalysisResult> Orchestrator::run_async(core::SeriesKey key, AnalysisConfig cfg, Callbacks cb,
                                                    RunMode mode, std::shared_ptr<std::atomic<bool>> cancel){
    Claim c = claim(key);
    return std::async(std::launch::async,
        [this, key = std::move(key), cfg = std::move(cfg), cb = std::move(cb), mode,
         cancel = std::move(cancel), c = std::move(c)]() mutable {
            // released when the task returns, not when the future goes away
            Claim held(std::move(c));
            return execute(key, cfg, cb, mode, cancel.get());
        });
}

AnalysisResult Orchestrator::execute(const core::SeriesKey& key, const AnalysisConfig& cfg, const Callbacks& cb,
                                     RunMode mode, const std::atomic<bool>* cancel){
    AnalysisResult res;
    res.key = key;
    res.series.key = key;
    res.series.timeframe = cfg.timeframe;
    const auto name = key.name();
    Stage stage = Stage::Fetch;

    auto progress = [&](Stage s, double pct, std::string msg){
        if (cb.on_progress) cb.on_progress(Progress{s, pct, std::move(msg)});
    };
    auto record = [&](Stage s, core::ErrorKind k, const std::string& msg){
        spdlog::warn("{} failed at {} stage: {}: {}", name, to_string(s), core::to_string(k), msg);
        res.failures.push_back(StageFailure{s, k, name, msg});
    };
    auto enter = [&](Stage next){
        stage = next;
        if (cancel && cancel->load())
            throw core::CancelledError(fmt::format("cancelled before the {} stage", to_string(next)));
    };
    auto absorb = [&](std::vector<core::Warning>& w){
        res.warnings.insert(res.warnings.end(), std::make_move_iterator(w.begin()), std::make_move_iterator(w.end()));
    };

    try {
        const auto range = resolve_range(cfg, core::now_ms());
        auto st = store(cfg.csv_path);

        if (mode != RunMode::AnalyzeCached){
            enter(Stage::Fetch);
            data::LoadReport lr;
            const auto cached = st->load(key, &lr);
            absorb(lr.warnings);
            const std::int64_t from = resume_from(cached, range, cfg.timeframe);
            progress(Stage::Fetch, 0.0, fmt::format("Fetching {} from {} to {}", name,
                                                    core::format_date(from), core::format_date(range.until)));

            data::FetchHooks hooks;
            hooks.cancel = cancel;
            hooks.on_page = [&](const std::vector<core::Candle>& page){
                st->merge(key, page, cfg.timeframe);
                res.fetched += page.size();
            };
            hooks.on_progress = [&](double f){
                progress(Stage::Fetch, f * 100.0, fmt::format("{} candles received", res.fetched));
            };

            try {
                data::ExchangeClient client(provider_for(key.exchange), cfg.fetch);
                auto fr = client.fetch(key, cfg.timeframe, from, range.until, hooks);
                absorb(fr.report.warnings);
            } catch (const core::StoreError&) {
                stage = Stage::Merge;
                throw;
            } catch (const core::Error& e) {
                const bool fetch_failure = e.kind() == core::ErrorKind::Network || e.kind() == core::ErrorKind::Provider;
                if (!fetch_failure || st->load(key).empty()) throw;
                record(Stage::Fetch, e.kind(), e.what());
                spdlog::warn("Continuing {} with cached data", name);
            }
            progress(Stage::Merge, 100.0, fmt::format("{} candles merged into the cache", res.fetched));
        }

        enter(Stage::Merge);
        data::LoadReport lr;
        const auto all = st->load(key, &lr);
        absorb(lr.warnings);
        for (auto& c : all.candles)
            if (c.open_time_ms >= range.since && c.open_time_ms <= range.until) res.series.candles.push_back(c);
        if (res.series.empty())
            throw core::InsufficientDataError(fmt::format("no data for {} between {} and {}", name,
                                                          core::format_date(range.since), core::format_date(range.until)));
        if (mode == RunMode::FetchOnly){
            spdlog::info("{}: {} candles cached", name, res.series.size());
        } else {
            enter(Stage::Indicators);
            progress(stage, -1.0, "Calculating indicators");
            res.frame = ind::compute(res.series, cfg.indicators);

            enter(Stage::Trend);
            res.trend = strategy::classify(*res.frame, res.frame->size() - 1);
            res.summary = ind::summarize(res.series, *res.frame);
            spdlog::info("Current trend for {}: {}", name, core::to_string(*res.trend));

            enter(Stage::Forecast);
            progress(stage, -1.0, "Training forecast model");
            try {
                res.forecast = forecast::Forecaster(cfg.forecast).forecast(res.series, *res.frame);
            } catch (const core::Error& e) {
                record(Stage::Forecast, e.kind(), e.what());
            } catch (const std::invalid_argument& e) {
                record(Stage::Forecast, core::ErrorKind::Internal, e.what());
            }

            if (cfg.export_report){
                enter(Stage::Report);
                try {
                    res.exported = report::export_all(cfg.output_dir, res.series, *res.frame, *res.summary, res.forecast);
                } catch (const core::Error& e) {
                    record(Stage::Report, e.kind(), e.what());
                }
            }
        }
    } catch (const core::Error& e) {
        res.aborted = true;
        record(stage, e.kind(), e.what());
    } catch (const std::exception& e) {
        res.aborted = true;
        record(stage, core::ErrorKind::Internal, e.what());
    }

    if (res.aborted){
        spdlog::error("Run for {} aborted at the {} stage", name, to_string(stage));
        if (cb.on_failure) cb.on_failure(res.failures.back());
    } else {
        progress(stage, 100.0, "Done");
        if (cb.on_success) cb.on_success(res);
    }
    return res;
}

} // namespace pipeline
