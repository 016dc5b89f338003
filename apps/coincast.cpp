#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <cstdlib>
#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/time.hpp"
#include "data/binance_provider.hpp"
#include "pipeline/config.hpp"
#include "pipeline/orchestrator.hpp"

static void usage(){
    std::cout <<
        "Usage: coincast [-c config.json] [-s SYMBOL] <command> [args]\n"
        "  fetch              download and cache candles\n"
        "  analyze            analyse cached candles\n"
        "  run                fetch, then analyse (default)\n"
        "  clear              delete the cached candles of the symbol\n"
        "  search SYMBOL      check that a pair is listed, e.g. ETH/USDT\n"
        "  top [QUOTE] [N]    most traded pairs by 24h quote volume\n";
}

static void print_result(const pipeline::AnalysisResult& r){
    std::cout << fmt::format("\n{} : {} candles", r.key.name(), r.series.size());
    if (!r.series.empty())
        std::cout << fmt::format(" ({} .. {})", core::format_date(r.series.first_time()),
                                 core::format_date(r.series.last_time()));
    std::cout << "\n";
    if (r.summary){
        const auto& s = *r.summary;
        std::cout << fmt::format("  Current price:   {:.2f}\n", s.current_price)
                  << fmt::format("  All time high:   {:.2f}\n", s.all_time_high)
                  << fmt::format("  All time low:    {:.2f}\n", s.all_time_low)
                  << fmt::format("  Mean return:     {:.3f} %\n", s.mean_return_pct)
                  << fmt::format("  Volatility:      {:.3f} %\n", s.volatility_pct)
                  << fmt::format("  Trend:           {}\n", core::to_string(s.trend));
    }
    if (r.forecast && !r.forecast->points.empty()){
        const auto& f = *r.forecast;
        const auto& last = f.points.back();
        std::cout << fmt::format("  Forecast ({}, {} steps, {} examples): {} -> {:.2f} (+/- {:.2f})\n",
                                 f.model, f.horizon(), f.training_examples,
                                 core::format_date(last.time_ms), last.predicted_close, last.spread);
    }
    if (!r.warnings.empty())
        std::cout << fmt::format("  {} warnings (dropped candles / corrupt cache rows)\n", r.warnings.size());
    for (auto& f : r.failures)
        std::cout << fmt::format("  {}: {}: {}\n", pipeline::to_string(f.stage), core::to_string(f.kind), f.message);
    for (auto& p : r.exported)
        std::cout << "  wrote " << p << "\n";
}

int main(int argc, char** argv){
    std::string config_path = "config.json";
    bool config_given = false;
    std::string symbol_override;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i + 1 < argc){ config_path = argv[++i]; config_given = true; }
        else if ((a == "-s" || a == "--symbol") && i + 1 < argc) symbol_override = argv[++i];
        else if (a == "-h" || a == "--help"){ usage(); return 0; }
        else args.push_back(a);
    }
    const std::string cmd = args.empty() ? "run" : args[0];

    pipeline::AppConfig cfg;
    try {
        // built-in defaults when there is no config.json in the working directory
        if (config_given || std::filesystem::exists(config_path)) cfg = pipeline::load_config(config_path);
    } catch (const core::ConfigError& e) {
        std::cerr << "config: " << core::to_string(e.kind()) << ": " << e.what() << "\n";
        return 2;
    }
    if (!symbol_override.empty()) cfg.key.symbol = symbol_override;
    core::setup_logging(cfg.log);

    auto binance = std::make_shared<data::BinanceProvider>(cfg.binance);

    try {
        if (cmd == "search"){
            if (args.size() < 2){ usage(); return 1; }
            const bool found = binance->symbol_exists(args[1]);
            std::cout << args[1] << (found ? " is listed on binance\n" : " was not found on binance\n");
            return found ? 0 : 3;
        }
        if (cmd == "top"){
            const std::string quote = args.size() >= 2 ? args[1] : "USDT";
            const std::size_t n = args.size() >= 3 ? static_cast<std::size_t>(std::max(1, std::atoi(args[2].c_str()))) : 15;
            int rank = 0;
            for (auto& s : binance->top_symbols(quote, n)) std::cout << fmt::format("{:>3}. {}\n", ++rank, s);
            return 0;
        }
    } catch (const core::Error& e) {
        std::cerr << cmd << ": " << core::to_string(e.kind()) << ": " << e.what() << "\n";
        return 4;
    }

    std::vector<std::shared_ptr<data::IOhlcvProvider>> providers{binance};
    pipeline::Orchestrator orch(providers);

    if (cmd == "clear"){
        try {
            orch.store(cfg.analysis.csv_path)->clear(cfg.key);
        } catch (const core::Error& e) {
            std::cerr << "clear: " << core::to_string(e.kind()) << ": " << e.what() << "\n";
            return 4;
        }
        return 0;
    }

    pipeline::RunMode mode;
    if (cmd == "run") mode = pipeline::RunMode::FetchAndAnalyze;
    else if (cmd == "fetch") mode = pipeline::RunMode::FetchOnly;
    else if (cmd == "analyze") mode = pipeline::RunMode::AnalyzeCached;
    else { usage(); return 1; }

    pipeline::Callbacks cb;
    cb.on_progress = [](const pipeline::Progress& p){
        if (p.percent < 0.0) spdlog::info("[{}] {}", pipeline::to_string(p.stage), p.message);
        else spdlog::info("[{}] {:.0f}% {}", pipeline::to_string(p.stage), p.percent, p.message);
    };
    cb.on_failure = [](const pipeline::StageFailure& f){
        std::cerr << fmt::format("{} {}: {}: {}\n", f.key, pipeline::to_string(f.stage), core::to_string(f.kind), f.message);
    };

    try {
        auto fut = orch.run_async(cfg.key, cfg.analysis, cb, mode);
        const auto result = fut.get();
        print_result(result);
        return result.ok() ? 0 : 5;
    } catch (const core::Error& e) {
        std::cerr << cfg.key.name() << ": " << core::to_string(e.kind()) << ": " << e.what() << "\n";
        return 5;
    }
}
