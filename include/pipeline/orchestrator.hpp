#pragma once
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "data/provider.hpp"
#include "data/candle_store.hpp"
#include "indicators/indicator_frame.hpp"
#include "indicators/summary.hpp"
#include "forecast/forecaster.hpp"
#include "pipeline/config.hpp"

namespace pipeline {

enum class Stage { Fetch, Merge, Indicators, Trend, Forecast, Report };
const char* to_string(Stage s);

enum class RunMode { FetchAndAnalyze, FetchOnly, AnalyzeCached };

struct Progress {
    Stage stage{Stage::Fetch};
    double percent{-1.0};   // < 0: indeterminate
    std::string message;
};

struct StageFailure {
    Stage stage{Stage::Fetch};
    core::ErrorKind kind{core::ErrorKind::Internal};
    std::string key;        // "BTC/USDT@binance"
    std::string message;
};

struct AnalysisResult {
    core::SeriesKey key;
    core::CandleSeries series;                       // analysed range
    std::optional<ind::IndicatorFrame> frame;
    std::optional<core::TrendLabel> trend;
    std::optional<ind::SummaryStats> summary;
    std::optional<forecast::ForecastResult> forecast;

    std::vector<StageFailure> failures;              // recoverable and fatal
    std::vector<core::Warning> warnings;             // dropped candles, corrupt rows
    std::size_t fetched{0};                          // candles merged by this run
    std::vector<std::string> exported;               // report files written
    bool aborted{false};                             // a fatal failure stopped the run

    bool ok() const { return !aborted; }
};

struct Callbacks {
    std::function<void(const Progress&)> on_progress;
    std::function<void(const AnalysisResult&)> on_success;
    std::function<void(const StageFailure&)> on_failure;  // terminal failure only
};

// Sequences fetch -> merge -> indicators -> trend -> forecast (-> report) for
// one key. Runs of different keys may overlap and share only the candle
// stores; a second run of a key that is still in flight raises core::BusyError.
// Must outlive every future returned by run_async().
class Orchestrator {
public:
    explicit Orchestrator(std::vector<std::shared_ptr<data::IOhlcvProvider>> providers = {});

    void add_provider(std::shared_ptr<data::IOhlcvProvider> p);

    // Blocking run on the caller's thread.
    AnalysisResult run(const core::SeriesKey& key, const AnalysisConfig& cfg, const Callbacks& cb = {},
                       RunMode mode = RunMode::FetchAndAnalyze, const std::atomic<bool>* cancel = nullptr);

    // Background run. BusyError is raised here, before the worker starts.
    std::future<AnalysisResult> run_async(core::SeriesKey key, AnalysisConfig cfg, Callbacks cb = {},
                                          RunMode mode = RunMode::FetchAndAnalyze,
                                          std::shared_ptr<std::atomic<bool>> cancel = nullptr);

    // One store per cache path, shared by every run that names it.
    std::shared_ptr<data::CandleStore> store(const std::string& csv_path);

    bool busy(const core::SeriesKey& key) const;

private:
    class Claim {
    public:
        Claim(Orchestrator* o, std::string name) : o_(o), name_(std::move(name)) {}
        Claim(Claim&& other) noexcept : o_(other.o_), name_(std::move(other.name_)) { other.o_ = nullptr; }
        Claim(const Claim&) = delete;
        Claim& operator=(const Claim&) = delete;
        Claim& operator=(Claim&&) = delete;
        ~Claim() { if (o_) o_->release(name_); }
    private:
        Orchestrator* o_;
        std::string name_;
    };

    Claim claim(const core::SeriesKey& key);
    void release(const std::string& name);

    AnalysisResult execute(const core::SeriesKey& key, const AnalysisConfig& cfg, const Callbacks& cb,
                           RunMode mode, const std::atomic<bool>* cancel);
    std::shared_ptr<data::IOhlcvProvider> provider_for(const std::string& exchange) const;

    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<data::IOhlcvProvider>> providers_;
    std::map<std::string, std::shared_ptr<data::CandleStore>> stores_;
    std::set<std::string> in_flight_;
};

} // namespace pipeline
