#include <catch2/catch.hpp>
#include <fstream>
#include <sstream>
#include <thread>
#include "data/candle_store.hpp"
#include "test_support.hpp"

using namespace fixtures;
using data::CandleStore;

static const core::SeriesKey kKey{"BTC/USDT", "binance"};

static std::string slurp(const std::filesystem::path& p){
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static bool same(const std::vector<core::Candle>& a, const std::vector<core::Candle>& b){
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i){
        if (a[i].open_time_ms != b[i].open_time_ms || a[i].open != b[i].open || a[i].high != b[i].high ||
            a[i].low != b[i].low || a[i].close != b[i].close || a[i].volume != b[i].volume)
            return false;
    }
    return true;
}

TEST_CASE("cache file name is derived from the key", "[store]"){
    CandleStore store("data/crypto_data.csv");
    CHECK(store.file_for(kKey) == std::filesystem::path("data/crypto_data_BTC-USDT_binance.csv"));
}

TEST_CASE("merging the same page twice keeps one row per timestamp", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    const auto page = daily(geometric(1000, 10000.0, 40000.0));

    auto once = store.merge(kKey, page);
    auto twice = store.merge(kKey, page);
    CHECK(once.size() == 1000);
    CHECK(twice.size() == 1000);
    CHECK(same(once.candles, twice.candles));
    CHECK(store.load(kKey).size() == 1000);
}

TEST_CASE("merge is idempotent on disk", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    const auto page = daily(noisy(120));

    store.merge(kKey, page);
    const auto first = slurp(store.file_for(kKey));
    store.merge(kKey, page);
    CHECK(slurp(store.file_for(kKey)) == first);
}

TEST_CASE("merging disjoint pages commutes", "[store]"){
    TempDir dir;
    const auto all = daily(noisy(200));
    const std::vector<core::Candle> a(all.begin(), all.begin() + 100);
    const std::vector<core::Candle> b(all.begin() + 100, all.end());

    CandleStore ab(dir.path / "ab.csv");
    ab.merge(kKey, a);
    ab.merge(kKey, b);

    CandleStore ba(dir.path / "ba.csv");
    ba.merge(kKey, b);
    ba.merge(kKey, a);

    CHECK(same(ab.load(kKey).candles, ba.load(kKey).candles));
    CHECK(same(ab.load(kKey).candles, all));
    CHECK(slurp(ab.file_for(kKey)) == slurp(ba.file_for(kKey)));
}

TEST_CASE("the most recent fetch wins on equal timestamps", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    store.merge(kKey, {candle(kT0, 100.0), candle(kT0 + kDay, 110.0)});
    auto s = store.merge(kKey, {candle(kT0 + kDay, 120.0), candle(kT0 + 2 * kDay, 130.0)});

    REQUIRE(s.size() == 3);
    CHECK(s.candles[1].close == 120.0);
    CHECK(s.candles[2].close == 130.0);
}

TEST_CASE("invalid incoming candles never reach the cache", "[store]"){
    auto bad = candle(kT0 + kDay, 100.0);
    bad.low = 200.0;
    auto merged = CandleStore::merge_candles({candle(kT0, 100.0)}, {bad, candle(kT0 + 2 * kDay, 90.0)});
    REQUIRE(merged.size() == 2);
    CHECK(merged[1].open_time_ms == kT0 + 2 * kDay);
}

TEST_CASE("the file survives a restart", "[store]"){
    TempDir dir;
    const auto page = daily(noisy(64));
    {
        CandleStore store(dir.path / "candles.csv");
        store.merge(kKey, page);
    }
    CandleStore reopened(dir.path / "candles.csv");
    data::LoadReport rep;
    auto s = reopened.load(kKey, &rep);
    CHECK(rep.skipped == 0);
    CHECK(rep.rows == 64);
    CHECK(same(s.candles, page));
}

TEST_CASE("keys are stored separately", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    const core::SeriesKey eth{"ETH/USDT", "binance"};
    store.merge(kKey, daily(constant(10, 100.0)));
    store.merge(eth, daily(constant(5, 10.0)));

    CHECK(store.load(kKey).size() == 10);
    CHECK(store.load(eth).size() == 5);
    CHECK(store.file_for(kKey) != store.file_for(eth));
}

TEST_CASE("corrupt cache rows are skipped one by one", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    {
        std::ofstream f(store.file_for(kKey));
        f << "timestamp,open,high,low,close,volume,symbol,exchange\n"
          << kT0 << ",100,101,99,100,10,BTC/USDT,binance\n"
          << "this is not a row\n"
          << kT0 + kDay << ",100,abc,99,100,10,BTC/USDT,binance\n"
          << kT0 + 2 * kDay << ",100,101,99,100,10,ETH/USDT,binance\n"
          << kT0 + 3 * kDay << ",100,99,98,100,10,BTC/USDT,binance\n"
          << "2023-01-05 00:00:00,100,101,99,100,10,BTC/USDT,binance\n"
          << kT0 + 2 * kDay << ",100,101,99,100,10,BTC/USDT,binance\n"
          << "\n"
          << kT0 + 5 * kDay << ",100,101,99,100,10,BTC/USDT,binance\n";
    }
    data::LoadReport rep;
    auto s = store.load(kKey, &rep);

    REQUIRE(s.size() == 3);
    CHECK(s.candles[0].open_time_ms == kT0);
    CHECK(s.candles[1].open_time_ms == kT0 + 4 * kDay);
    CHECK(s.candles[2].open_time_ms == kT0 + 5 * kDay);
    CHECK(rep.skipped == 5);
    REQUIRE(rep.warnings.size() == 5);
    for (auto& w : rep.warnings) CHECK(w.kind == core::ErrorKind::CacheCorruption);
}

TEST_CASE("a merge after a corrupt load rewrites a clean file", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    {
        std::ofstream f(store.file_for(kKey));
        f << "timestamp,open,high,low,close,volume,symbol,exchange\n"
          << kT0 << ",100,101,99,100,10,BTC/USDT,binance\n"
          << "garbage\n";
    }
    store.merge(kKey, {candle(kT0 + kDay, 100.0)});

    CandleStore reopened(dir.path / "candles.csv");
    data::LoadReport rep;
    CHECK(reopened.load(kKey, &rep).size() == 2);
    CHECK(rep.skipped == 0);
}

TEST_CASE("clear removes the file and the cached series", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    store.merge(kKey, daily(constant(10, 100.0)));
    REQUIRE(std::filesystem::exists(store.file_for(kKey)));

    store.clear(kKey);
    CHECK_FALSE(std::filesystem::exists(store.file_for(kKey)));
    CHECK(store.load(kKey).empty());
}

TEST_CASE("concurrent merges on one key queue up", "[store]"){
    TempDir dir;
    CandleStore store(dir.path / "candles.csv");
    const auto all = daily(noisy(400));

    std::vector<std::thread> workers;
    for (std::size_t w = 0; w < 8; ++w){
        workers.emplace_back([&, w]{
            std::vector<core::Candle> page(all.begin() + static_cast<std::ptrdiff_t>(w * 50),
                                           all.begin() + static_cast<std::ptrdiff_t>((w + 1) * 50));
            store.merge(kKey, page);
        });
    }
    for (auto& t : workers) t.join();

    CHECK(same(store.load(kKey).candles, all));
    CandleStore reopened(dir.path / "candles.csv");
    CHECK(reopened.load(kKey).size() == 400);
}
