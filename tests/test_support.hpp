#pragma once
#include <chrono>
#include <cmath>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "core/types.hpp"
#include "core/errors.hpp"
#include "data/provider.hpp"

namespace fixtures {

constexpr std::int64_t kDay = 86'400'000;
constexpr std::int64_t kT0  = 1'672'531'200'000;   // 2023-01-01 00:00:00 UTC

inline core::Candle candle(std::int64_t t, double close, double volume = 100.0){
    core::Candle c;
    c.open_time_ms = t;
    c.open = close;
    c.close = close;
    c.high = close * 1.01;
    c.low = close * 0.99;
    c.volume = volume;
    return c;
}

inline std::vector<core::Candle> daily(const std::vector<double>& closes, std::int64_t t0 = kT0){
    std::vector<core::Candle> out;
    for (std::size_t i = 0; i < closes.size(); ++i)
        out.push_back(candle(t0 + static_cast<std::int64_t>(i) * kDay, closes[i]));
    return out;
}

inline core::CandleSeries series(const std::vector<double>& closes, core::SeriesKey key = {}){
    core::CandleSeries s;
    s.key = key;
    s.candles = daily(closes);
    return s;
}

// from -> to with a constant growth rate
inline std::vector<double> geometric(std::size_t n, double from, double to){
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = from * std::pow(to / from, static_cast<double>(i) / static_cast<double>(n - 1));
    return v;
}

inline std::vector<double> constant(std::size_t n, double x){ return std::vector<double>(n, x); }

// trend + two cycles + seeded noise, strictly positive
inline std::vector<double> noisy(std::size_t n, std::uint64_t seed = 7){
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> eps(0.0, 1.0);
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i){
        const double x = static_cast<double>(i);
        v[i] = 20000.0 + 15.0 * x + 1500.0 * std::sin(x / 17.0) + 600.0 * std::sin(x / 5.0) + 150.0 * eps(rng);
    }
    return v;
}

enum class Fail { Network, Provider };

// In-memory venue: serves `data` page by page and replays scripted failures.
class FakeProvider : public data::IOhlcvProvider {
public:
    explicit FakeProvider(std::vector<core::Candle> data, std::string id = "binance")
        : data_(std::move(data)), id_(std::move(id)) {}

    std::string id() const override { return id_; }
    int rate_limit_ms() const override { return rate_ms; }

    std::vector<core::Candle> fetch_ohlcv(const std::string&, core::Timeframe, std::int64_t since_ms,
                                          int limit) override {
        std::function<void(std::size_t)> hook;
        std::size_t n = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            calls_.push_back(since_ms);
            call_times_.push_back(std::chrono::steady_clock::now());
            n = calls_.size();
            hook = on_call;
        }
        if (hook) hook(n);

        std::lock_guard<std::mutex> lk(mtx_);
        if (always_fail || !failures.empty()){
            Fail f = always_fail ? *always_fail : failures.front();
            if (!always_fail) failures.pop_front();
            if (f == Fail::Network) throw core::NetworkError("connection refused");
            throw core::ProviderError("HTTP 400 Invalid symbol. (code -1121)");
        }
        std::vector<core::Candle> out;
        for (auto& c : data_){
            if (c.open_time_ms < since_ms) continue;
            if (static_cast<int>(out.size()) >= limit) break;
            out.push_back(c);
        }
        return out;
    }

    std::vector<std::int64_t> calls() const { std::lock_guard<std::mutex> lk(mtx_); return calls_; }
    std::vector<std::chrono::steady_clock::time_point> call_times() const {
        std::lock_guard<std::mutex> lk(mtx_); return call_times_;
    }
    void set_always_fail(std::optional<Fail> f){ std::lock_guard<std::mutex> lk(mtx_); always_fail = f; }

    int rate_ms{0};
    std::deque<Fail> failures;
    std::optional<Fail> always_fail;
    std::function<void(std::size_t)> on_call;   // called with the 1-based call number

private:
    std::vector<core::Candle> data_;
    std::string id_;
    mutable std::mutex mtx_;
    std::vector<std::int64_t> calls_;
    std::vector<std::chrono::steady_clock::time_point> call_times_;
};

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    std::filesystem::path path;
    TempDir(){
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               fmt::format("coincast_test_{}_{}", rd(), std::chrono::steady_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(path);
    }
    ~TempDir(){
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

} // namespace fixtures
