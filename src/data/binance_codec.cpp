#include "data/binance_codec.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <utility>
#include <fmt/format.h>

using json = nlohmann::json;

namespace data::binance {

static double to_d(const json& v){
    if (v.is_number()) return v.get<double>();
    if (v.is_string()){
        const auto& s = v.get_ref<const std::string&>();
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && *end == '\0') return d;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

std::string to_exchange_symbol(const std::string& symbol){
    std::string out; out.reserve(symbol.size());
    for (char c : symbol) if (c != '/' && c != '-' && c != '_') out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return out;
}

std::vector<core::Candle> parse_klines(const json& j){
    if (!j.is_array()) throw core::ProviderError("unexpected klines payload: " + j.dump().substr(0, 200));
    std::vector<core::Candle> out; out.reserve(j.size());
    for (auto& k : j){
        // [openTime, open, high, low, close, volume, closeTime, ...]
        if (!k.is_array() || k.size() < 6 || !k[0].is_number_integer())
            throw core::ProviderError("unexpected kline row: " + k.dump().substr(0, 200));
        core::Candle c;
        c.open_time_ms = k[0].get<std::int64_t>();
        c.open   = to_d(k[1]);
        c.high   = to_d(k[2]);
        c.low    = to_d(k[3]);
        c.close  = to_d(k[4]);
        c.volume = to_d(k[5]);
        out.push_back(c);
    }
    return out;
}

void raise_http_error(int status, const std::string& body, const std::string& what){
    if (status == 0 || status == 418 || status == 429 || status >= 500)
        throw core::NetworkError(fmt::format("{}: HTTP {} {}", what, status, body.substr(0, 200)));

    std::string msg = body.substr(0, 200);
    try {
        auto j = json::parse(body);
        if (j.is_object() && j.contains("msg"))
            msg = fmt::format("{} (code {})", j.value("msg", std::string{}), j.value("code", 0));
    } catch (const json::exception&) {
        // not json, keep raw text
    }
    throw core::ProviderError(fmt::format("{}: HTTP {} {}", what, status, msg));
}

bool has_trading_symbol(const json& info, const std::string& exchange_symbol){
    if (!info.is_object() || !info.contains("symbols") || !info["symbols"].is_array()) return false;
    for (auto& s : info["symbols"]){
        if (s.value("symbol", std::string{}) == exchange_symbol)
            return s.value("status", std::string{"TRADING"}) == "TRADING";
    }
    return false;
}

std::vector<std::string> rank_by_quote_volume(const json& tickers, const std::string& quote, std::size_t limit){
    std::vector<std::pair<std::string, double>> v;
    if (!tickers.is_array()) return {};
    for (auto& t : tickers){
        const auto sym = t.value("symbol", std::string{});
        if (sym.size() <= quote.size() || sym.compare(sym.size() - quote.size(), quote.size(), quote) != 0) continue;
        const double qv = t.contains("quoteVolume") ? to_d(t["quoteVolume"]) : 0.0;
        if (!(qv > 0.0)) continue;
        v.emplace_back(sym.substr(0, sym.size() - quote.size()) + "/" + quote, qv);
    }
    std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){ return a.second > b.second; });
    std::vector<std::string> out;
    for (std::size_t i = 0; i < v.size() && i < limit; ++i) out.push_back(v[i].first);
    return out;
}

} // namespace data::binance
