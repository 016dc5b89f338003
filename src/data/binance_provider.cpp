#include "data/binance_provider.hpp"
#include "data/binance_codec.hpp"
#include "core/errors.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <sstream>

using json = nlohmann::json;

namespace data {

BinanceProvider::BinanceProvider(BinanceConfig cfg) : cfg_(std::move(cfg)) {}

json BinanceProvider::http_get(const std::string& path, const std::string& query){
    const std::string url = cfg_.base_url + path + (query.empty() ? "" : "?" + query);
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Timeout{cfg_.timeout_ms},
                               cpr::VerifySsl{true});

    if (r.error.code != cpr::ErrorCode::OK)
        throw core::NetworkError("GET " + path + ": " + r.error.message);
    if (r.status_code >= 400 || r.status_code == 0){
        spdlog::warn("GET {} : {} {}", path, r.status_code, r.text.substr(0, 200));
        binance::raise_http_error(static_cast<int>(r.status_code), r.text, "GET " + path);
    }
    try {
        return json::parse(r.text.empty() ? "null" : r.text);
    } catch (const json::parse_error& e) {
        throw core::ProviderError("GET " + path + ": malformed json: " + e.what());
    }
}

std::vector<core::Candle> BinanceProvider::fetch_ohlcv(const std::string& symbol, core::Timeframe tf,
                                                       std::int64_t since_ms, int limit){
    std::ostringstream q;
    q << "symbol=" << binance::to_exchange_symbol(symbol)
      << "&interval=" << core::to_string(tf)
      << "&startTime=" << since_ms
      << "&limit=" << limit;
    auto j = http_get("/api/v3/klines", q.str());
    auto out = binance::parse_klines(j);
    spdlog::debug("klines {} {} since {} -> {}", symbol, core::to_string(tf), since_ms, out.size());
    return out;
}

bool BinanceProvider::symbol_exists(const std::string& symbol){
    try {
        auto j = http_get("/api/v3/exchangeInfo", "symbol=" + binance::to_exchange_symbol(symbol));
        return binance::has_trading_symbol(j, binance::to_exchange_symbol(symbol));
    } catch (const core::ProviderError& e) {
        // unknown symbols come back as HTTP 400 {"code":-1121}
        spdlog::info("symbol {} not listed: {}", symbol, e.what());
        return false;
    }
}

std::vector<std::string> BinanceProvider::top_symbols(const std::string& quote, std::size_t limit){
    auto j = http_get("/api/v3/ticker/24hr");
    return binance::rank_by_quote_volume(j, quote, limit);
}

} // namespace data
