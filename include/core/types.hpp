#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cmath>

namespace core {

// Candle period
enum class Timeframe { M1, M3, M5, M15, M30, H1, H4, D1, W1 };

const char* to_string(Timeframe tf);                          // "1m" ... "1w"
std::optional<Timeframe> parse_timeframe(const std::string& s);
std::int64_t period_ms(Timeframe tf);

// One logical data stream, e.g. {"BTC/USDT", "binance"}
struct SeriesKey {
    std::string symbol{"BTC/USDT"};
    std::string exchange{"binance"};

    std::string base() const {
        auto p = symbol.find('/');
        return p == std::string::npos ? symbol : symbol.substr(0, p);
    }
    std::string quote() const {
        auto p = symbol.find('/');
        return p == std::string::npos ? std::string{} : symbol.substr(p + 1);
    }
    std::string name() const { return symbol + "@" + exchange; }

    bool operator==(const SeriesKey& o) const { return symbol == o.symbol && exchange == o.exchange; }
    bool operator!=(const SeriesKey& o) const { return !(*this == o); }
};

// OHLCV candle
struct Candle {
    std::int64_t open_time_ms{}; // period open time (ms, UTC)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

// high >= max(open, close), low <= min(open, close), volume >= 0, all finite
inline bool is_valid(const Candle& c) {
    if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
        !std::isfinite(c.close) || !std::isfinite(c.volume))
        return false;
    return c.high >= std::max(c.open, c.close)
        && c.low <= std::min(c.open, c.close)
        && c.volume >= 0.0;
}

// Ordered, unique-by-timestamp candles of one key.
struct CandleSeries {
    SeriesKey key;
    Timeframe timeframe{Timeframe::D1};
    std::vector<Candle> candles;

    bool empty() const { return candles.empty(); }
    std::size_t size() const { return candles.size(); }
    std::int64_t first_time() const { return candles.empty() ? 0 : candles.front().open_time_ms; }
    std::int64_t last_time() const { return candles.empty() ? 0 : candles.back().open_time_ms; }

    std::vector<double> closes() const {
        std::vector<double> v; v.reserve(candles.size());
        for (auto& c : candles) v.push_back(c.close);
        return v;
    }
    std::vector<double> volumes() const {
        std::vector<double> v; v.reserve(candles.size());
        for (auto& c : candles) v.push_back(c.volume);
        return v;
    }
};

// Trend label
enum class TrendLabel { Bullish, Bearish, Neutral };

inline const char* to_string(TrendLabel t) {
    switch (t) {
        case TrendLabel::Bullish: return "Bullish";
        case TrendLabel::Bearish: return "Bearish";
        default:                  return "Neutral";
    }
}

} // namespace core
