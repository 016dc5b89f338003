#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "data/provider.hpp"

namespace data {

struct FetchOptions {
    int page_limit{1000};
    int min_interval_ms{-1};  // < 0: use the provider's rate limit
    int max_retries{3};       // NetworkError retries per page
    int backoff_ms{500};      // first retry delay, doubled each attempt
};

struct FetchReport {
    std::size_t pages{0};
    std::size_t received{0};  // raw candles returned by the provider
    std::size_t dropped{0};   // failed validation
    std::size_t retries{0};
    std::vector<core::Warning> warnings;
};

struct FetchResult {
    core::CandleSeries series;
    FetchReport report;
};

struct FetchHooks {
    // Receives every validated, non-empty page before the next call is made.
    std::function<void(const std::vector<core::Candle>&)> on_page;
    // Fraction of [since, until] covered so far, 0..1
    std::function<void(double)> on_progress;
    // Checked before every provider call; set -> core::CancelledError
    const std::atomic<bool>* cancel{nullptr};
};

class ExchangeClient {
public:
    explicit ExchangeClient(std::shared_ptr<IOhlcvProvider> provider, FetchOptions opt = {});

    // Candles of `key` with open time in [since_ms, until_ms], paginated and
    // throttled. Invalid candles are dropped with a DataIntegrity warning.
    FetchResult fetch(const core::SeriesKey& key, core::Timeframe tf,
                      std::int64_t since_ms, std::int64_t until_ms,
                      const FetchHooks& hooks = {});

    const IOhlcvProvider& provider() const { return *provider_; }

private:
    std::vector<core::Candle> call_with_retry(const std::string& symbol, core::Timeframe tf,
                                              std::int64_t since_ms, FetchReport& report,
                                              const std::atomic<bool>* cancel);
    void throttle();

    std::shared_ptr<IOhlcvProvider> provider_;
    FetchOptions opt_;
    std::chrono::steady_clock::time_point last_call_{};
    bool called_{false};
};

} // namespace data
