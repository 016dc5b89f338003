#include "data/exchange_client.hpp"
#include "core/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <thread>
#include <limits>

namespace data {

ExchangeClient::ExchangeClient(std::shared_ptr<IOhlcvProvider> provider, FetchOptions opt)
    : provider_(std::move(provider)), opt_(opt) {
    if (!provider_) throw core::ProviderError("ExchangeClient: no provider");
    if (opt_.page_limit <= 0) opt_.page_limit = 1000;
    if (opt_.max_retries < 0) opt_.max_retries = 0;
}

void ExchangeClient::throttle(){
    using namespace std::chrono;
    const int gap = opt_.min_interval_ms >= 0 ? opt_.min_interval_ms : provider_->rate_limit_ms();
    if (called_ && gap > 0){
        const auto next = last_call_ + milliseconds(gap);
        const auto now = steady_clock::now();
        if (next > now) std::this_thread::sleep_for(next - now);
    }
    last_call_ = steady_clock::now();
    called_ = true;
}

std::vector<core::Candle> ExchangeClient::call_with_retry(const std::string& symbol, core::Timeframe tf,
                                                          std::int64_t since_ms, FetchReport& report,
                                                          const std::atomic<bool>* cancel){
    for (int attempt = 0;; ++attempt){
        if (cancel && cancel->load()) throw core::CancelledError("fetch cancelled");
        throttle();
        try {
            return provider_->fetch_ohlcv(symbol, tf, since_ms, opt_.page_limit);
        } catch (const core::NetworkError& e) {
            if (attempt >= opt_.max_retries){
                spdlog::error("{} {}: giving up after {} retries: {}", provider_->id(), symbol, attempt, e.what());
                throw;
            }
            const auto delay = std::chrono::milliseconds(static_cast<std::int64_t>(opt_.backoff_ms) << attempt);
            spdlog::warn("{} {}: {} (retry {}/{} in {} ms)", provider_->id(), symbol, e.what(),
                         attempt + 1, opt_.max_retries, delay.count());
            ++report.retries;
            std::this_thread::sleep_for(delay);
        }
        // ProviderError is not retried
    }
}

FetchResult ExchangeClient::fetch(const core::SeriesKey& key, core::Timeframe tf,
                                  std::int64_t since_ms, std::int64_t until_ms,
                                  const FetchHooks& hooks){
    if (key.exchange != provider_->id())
        throw core::ProviderError(fmt::format("exchange '{}' is served by '{}'", key.exchange, provider_->id()));

    FetchResult res;
    res.series.key = key;
    res.series.timeframe = tf;
    auto& rep = res.report;

    const std::int64_t step = core::period_ms(tf);
    std::int64_t since = since_ms;
    std::int64_t last_kept = std::numeric_limits<std::int64_t>::min();

    spdlog::info("Fetching {} on {} from {} to {}", key.symbol, key.exchange,
                 core::format_date(since_ms), core::format_date(until_ms));

    while (since <= until_ms){
        auto page = call_with_retry(key.symbol, tf, since, rep, hooks.cancel);
        ++rep.pages;
        if (page.empty()){
            if (res.series.empty()) spdlog::warn("No data found for {} on {}.", key.symbol, key.exchange);
            break;
        }
        rep.received += page.size();

        std::int64_t page_last = since;
        std::vector<core::Candle> good; good.reserve(page.size());
        for (auto& c : page){
            page_last = std::max(page_last, c.open_time_ms);
            if (!core::is_valid(c)){
                ++rep.dropped;
                auto msg = fmt::format("{} {}: dropped invalid candle at {} (O={} H={} L={} C={} V={})",
                                       key.exchange, key.symbol, core::format_utc(c.open_time_ms),
                                       c.open, c.high, c.low, c.close, c.volume);
                spdlog::warn("{}", msg);
                rep.warnings.push_back({core::ErrorKind::DataIntegrity, std::move(msg)});
                continue;
            }
            // outside the requested range, or repeated by an overlapping page
            if (c.open_time_ms < since || c.open_time_ms > until_ms || c.open_time_ms <= last_kept) continue;
            last_kept = c.open_time_ms;
            good.push_back(c);
        }

        if (!good.empty()){
            if (hooks.on_page) hooks.on_page(good);
            res.series.candles.insert(res.series.candles.end(), good.begin(), good.end());
        }

        // page_last >= since, so every page moves the cursor forward
        since = page_last + step;

        if (hooks.on_progress && until_ms > since_ms){
            const double f = static_cast<double>(std::min(since, until_ms) - since_ms) / static_cast<double>(until_ms - since_ms);
            hooks.on_progress(std::clamp(f, 0.0, 1.0));
        }
    }

    spdlog::info("Fetched {} candles for {} in {} pages ({} dropped, {} retries)",
                 res.series.size(), key.name(), rep.pages, rep.dropped, rep.retries);
    return res;
}

} // namespace data
