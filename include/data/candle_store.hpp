#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"
#include "core/errors.hpp"

namespace data {

struct LoadReport {
    std::size_t rows{0};      // data rows read from disk
    std::size_t skipped{0};   // malformed / out-of-order / foreign rows
    std::vector<core::Warning> warnings;
};

// Durable per-key candle cache backed by CSV files.
//
// Layout: csv_path "data/crypto_data.csv" and key {"BTC/USDT","binance"} give
// "data/crypto_data_BTC-USDT_binance.csv". Columns:
//   timestamp,open,high,low,close,volume,symbol,exchange
//
// merge() on one key serializes behind that key's mutex (a second caller
// waits); different keys never contend. A merge rewrites the file through a
// temp file + rename and only then publishes the new series in memory, so it
// is applied completely or not at all.
class CandleStore {
public:
    explicit CandleStore(std::filesystem::path csv_path);

    // Authoritative series (empty if nothing cached). First access reads disk.
    core::CandleSeries load(const core::SeriesKey& key, LoadReport* report = nullptr);

    // Merge `incoming` into the key's series; incoming wins on equal timestamps.
    core::CandleSeries merge(const core::SeriesKey& key, const std::vector<core::Candle>& incoming,
                             core::Timeframe tf = core::Timeframe::D1);

    // Explicit cache clear: removes the file and the in-memory copy.
    void clear(const core::SeriesKey& key);

    std::filesystem::path file_for(const core::SeriesKey& key) const;

    // Pure merge rule used by merge(); exposed for tests and offline tools.
    static std::vector<core::Candle> merge_candles(const std::vector<core::Candle>& base,
                                                   const std::vector<core::Candle>& incoming);

private:
    struct Slot {
        std::mutex mtx;
        bool loaded{false};
        core::CandleSeries series;
    };

    std::shared_ptr<Slot> slot(const core::SeriesKey& key);
    void ensure_loaded(Slot& s, const core::SeriesKey& key, LoadReport* report);
    core::CandleSeries read_file(const core::SeriesKey& key, LoadReport& report) const;
    void write_file(const core::CandleSeries& series) const;

    std::filesystem::path csv_path_;
    std::mutex slots_mtx_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace data
