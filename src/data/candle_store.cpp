#include "data/candle_store.hpp"
#include "core/time.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace data {

static const char* kHeader = "timestamp,open,high,low,close,volume,symbol,exchange";

static std::string trim(const std::string& s){
    const auto b = s.find_first_not_of(" \t\r\n\"");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n\"");
    return s.substr(b, e - b + 1);
}

static bool parse_double(const std::string& s, double& out){
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size();
}

// epoch ms, or "YYYY-MM-DD[ HH:MM:SS]" as the older tool wrote it
static bool parse_time(const std::string& s, std::int64_t& out){
    if (s.empty()) return false;
    if (s.find('-', 1) != std::string::npos){
        auto t = core::parse_utc(s);
        if (!t) return false;
        out = *t;
        return true;
    }
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

CandleStore::CandleStore(fs::path csv_path) : csv_path_(std::move(csv_path)) {}

fs::path CandleStore::file_for(const core::SeriesKey& key) const {
    std::string sym = key.symbol;
    std::replace(sym.begin(), sym.end(), '/', '-');
    const auto stem = csv_path_.stem().string();
    const auto ext = csv_path_.has_extension() ? csv_path_.extension().string() : std::string(".csv");
    return csv_path_.parent_path() / fmt::format("{}_{}_{}{}", stem.empty() ? "candles" : stem, sym, key.exchange, ext);
}

std::shared_ptr<CandleStore::Slot> CandleStore::slot(const core::SeriesKey& key){
    std::lock_guard<std::mutex> lk(slots_mtx_);
    auto& s = slots_[key.name()];
    if (!s) s = std::make_shared<Slot>();
    return s;
}

std::vector<core::Candle> CandleStore::merge_candles(const std::vector<core::Candle>& base,
                                                     const std::vector<core::Candle>& incoming){
    std::map<std::int64_t, core::Candle> m;
    for (auto& c : base) m[c.open_time_ms] = c;
    for (auto& c : incoming){
        if (!core::is_valid(c)) continue;
        m[c.open_time_ms] = c;   // most recent fetch wins
    }
    std::vector<core::Candle> out; out.reserve(m.size());
    for (auto& [t, c] : m) out.push_back(c);
    return out;
}

core::CandleSeries CandleStore::read_file(const core::SeriesKey& key, LoadReport& rep) const {
    core::CandleSeries out;
    out.key = key;
    const auto path = file_for(key);
    std::ifstream f(path);
    if (!f.good()) return out;   // nothing cached yet

    auto skip = [&](std::size_t line_no, const std::string& why){
        ++rep.skipped;
        auto msg = fmt::format("{}:{}: {}", path.string(), line_no, why);
        spdlog::warn("cache row skipped: {}", msg);
        rep.warnings.push_back({core::ErrorKind::CacheCorruption, std::move(msg)});
    };

    std::string line;
    std::size_t line_no = 0;
    std::int64_t last = std::numeric_limits<std::int64_t>::min();
    while (std::getline(f, line)){
        ++line_no;
        if (trim(line).empty()) continue;

        std::vector<std::string> cols;
        std::stringstream ss(line);
        std::string x;
        while (std::getline(ss, x, ',')) cols.push_back(trim(x));

        if (line_no == 1 && !cols.empty() && (cols[0] == "timestamp" || cols[0] == "date")) continue;
        ++rep.rows;

        if (cols.size() < 6){ skip(line_no, "too few columns"); continue; }
        core::Candle c;
        if (!parse_time(cols[0], c.open_time_ms)){ skip(line_no, "bad timestamp '" + cols[0] + "'"); continue; }
        if (!parse_double(cols[1], c.open) || !parse_double(cols[2], c.high) || !parse_double(cols[3], c.low) ||
            !parse_double(cols[4], c.close) || !parse_double(cols[5], c.volume)){
            skip(line_no, "bad number"); continue;
        }
        if (cols.size() >= 8 && (cols[6] != key.symbol || cols[7] != key.exchange)){
            skip(line_no, "row belongs to " + cols[6] + "@" + cols[7]); continue;
        }
        if (!core::is_valid(c)){ skip(line_no, "candle violates OHLC invariants"); continue; }
        if (c.open_time_ms <= last){ skip(line_no, "out of order timestamp " + cols[0]); continue; }
        last = c.open_time_ms;
        out.candles.push_back(c);
    }
    spdlog::info("Loaded {} candles for {} from '{}' ({} rows skipped)",
                 out.size(), key.name(), path.string(), rep.skipped);
    return out;
}

void CandleStore::write_file(const core::CandleSeries& series) const {
    const auto path = file_for(series.key);
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) throw core::StoreError(fmt::format("cannot create '{}': {}", path.parent_path().string(), ec.message()));

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.good()) throw core::StoreError("cannot open '" + tmp.string() + "' for writing");
        f << kHeader << '\n';
        for (auto& c : series.candles){
            f << fmt::format("{},{},{},{},{},{},{},{}\n", c.open_time_ms, c.open, c.high, c.low, c.close,
                             c.volume, series.key.symbol, series.key.exchange);
        }
        f.flush();
        if (!f.good()){
            f.close();
            fs::remove(tmp, ec);
            throw core::StoreError("write to '" + tmp.string() + "' failed");
        }
    }
    fs::rename(tmp, path, ec);
    if (ec){
        std::error_code ec2;
        fs::remove(tmp, ec2);
        throw core::StoreError(fmt::format("cannot replace '{}': {}", path.string(), ec.message()));
    }
}

void CandleStore::ensure_loaded(Slot& s, const core::SeriesKey& key, LoadReport* report){
    if (s.loaded) return;
    LoadReport local;
    s.series = read_file(key, report ? *report : local);
    s.loaded = true;
}

core::CandleSeries CandleStore::load(const core::SeriesKey& key, LoadReport* report){
    auto s = slot(key);
    std::lock_guard<std::mutex> lk(s->mtx);
    ensure_loaded(*s, key, report);
    return s->series;
}

core::CandleSeries CandleStore::merge(const core::SeriesKey& key, const std::vector<core::Candle>& incoming,
                                      core::Timeframe tf){
    auto s = slot(key);
    std::lock_guard<std::mutex> lk(s->mtx);
    ensure_loaded(*s, key, nullptr);

    core::CandleSeries next;
    next.key = key;
    next.timeframe = tf;
    next.candles = merge_candles(s->series.candles, incoming);

    write_file(next);          // throws before anything is published
    const auto before = s->series.size();
    s->series = std::move(next);
    spdlog::debug("merged {} candles into {}: {} -> {}", incoming.size(), key.name(), before, s->series.size());
    return s->series;
}

void CandleStore::clear(const core::SeriesKey& key){
    auto s = slot(key);
    std::lock_guard<std::mutex> lk(s->mtx);
    std::error_code ec;
    fs::remove(file_for(key), ec);
    if (ec) throw core::StoreError(fmt::format("cannot remove '{}': {}", file_for(key).string(), ec.message()));
    s->series = core::CandleSeries{};
    s->series.key = key;
    s->loaded = true;
    spdlog::info("Cleared cache for {}", key.name());
}

} // namespace data
