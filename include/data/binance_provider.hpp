#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "data/provider.hpp"

namespace data {

// --- Basic config
struct BinanceConfig {
    std::string base_url{"https://api.binance.com"};
    int timeout_ms{10000};
    int rate_limit_ms{250};   // klines weight 2, 1200/min budget
};

// Public (unsigned) Binance spot market-data endpoints.
class BinanceProvider final : public IOhlcvProvider {
public:
    explicit BinanceProvider(BinanceConfig cfg = {});

    std::string id() const override { return "binance"; }
    int rate_limit_ms() const override { return cfg_.rate_limit_ms; }

    // GET /api/v3/klines
    std::vector<core::Candle> fetch_ohlcv(const std::string& symbol, core::Timeframe tf,
                                          std::int64_t since_ms, int limit) override;

    // GET /api/v3/exchangeInfo?symbol=...   ("ETH/USDT")
    bool symbol_exists(const std::string& symbol);

    // GET /api/v3/ticker/24hr, ranked by quote volume
    std::vector<std::string> top_symbols(const std::string& quote = "USDT", std::size_t limit = 15);

private:
    // helper: unsigned http GET, throws on failure
    nlohmann::json http_get(const std::string& path, const std::string& query = "");

    BinanceConfig cfg_;
};

} // namespace data
