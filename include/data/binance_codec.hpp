#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace data::binance {

// "BTC/USDT" -> "BTCUSDT"
std::string to_exchange_symbol(const std::string& symbol);

// GET /api/v3/klines body -> candles. Unparseable numbers become NaN so the
// client's validation drops them; a body that is not an array of arrays
// throws core::ProviderError.
std::vector<core::Candle> parse_klines(const nlohmann::json& j);

// Maps a failed HTTP exchange to the error taxonomy. status 0 / 418 / 429 / 5xx
// -> NetworkError, other >= 400 -> ProviderError (with {code,msg} if present).
[[noreturn]] void raise_http_error(int status, const std::string& body, const std::string& what);

// GET /api/v3/exchangeInfo body: is `exchange_symbol` listed and trading?
bool has_trading_symbol(const nlohmann::json& exchange_info, const std::string& exchange_symbol);

// GET /api/v3/ticker/24hr body -> "BASE/QUOTE" symbols ranked by quote volume
std::vector<std::string> rank_by_quote_volume(const nlohmann::json& tickers,
                                              const std::string& quote, std::size_t limit);

} // namespace data::binance
