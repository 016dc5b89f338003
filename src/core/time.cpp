#include "core/time.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>

namespace core {

std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::optional<std::int64_t> parse_utc(const std::string& s){
    int Y=0, M=0, D=0, h=0, mi=0, sec=0, used=0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &Y, &M, &D, &used) != 3) return std::nullopt;
    if (static_cast<std::size_t>(used) != s.size()) {
        // time part: " HH:MM:SS" or "THH:MM:SS"
        const char sep = s[static_cast<std::size_t>(used)];
        if (sep != ' ' && sep != 'T') return std::nullopt;
        int used2 = 0;
        if (std::sscanf(s.c_str() + used + 1, "%2d:%2d:%2d%n", &h, &mi, &sec, &used2) != 3) return std::nullopt;
        if (static_cast<std::size_t>(used + 1 + used2) != s.size()) return std::nullopt;
    }
    if (M<1 || M>12 || D<1 || D>31 || h<0 || h>23 || mi<0 || mi>59 || sec<0 || sec>60) return std::nullopt;

    tm t{};
    t.tm_year = Y - 1900; t.tm_mon = M - 1; t.tm_mday = D;
    t.tm_hour = h; t.tm_min = mi; t.tm_sec = sec;
    #ifdef _WIN32
    time_t tt = _mkgmtime(&t);
    #else
    time_t tt = timegm(&t);
    #endif
    if (tt == static_cast<time_t>(-1)) return std::nullopt;
    // timegm normalizes Feb 30 etc; reject those
    if (t.tm_mday != D || t.tm_mon != M - 1) return std::nullopt;
    return static_cast<std::int64_t>(tt) * 1000;
}

static tm to_tm(std::int64_t ms){
    time_t t = static_cast<time_t>(ms / 1000);
    tm out{};
    #ifdef _WIN32
    gmtime_s(&out, &t);
    #else
    gmtime_r(&t, &out);
    #endif
    return out;
}

std::string format_utc(std::int64_t ms){
    const tm t = to_tm(ms);
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                       t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min, t.tm_sec);
}

std::string format_date(std::int64_t ms){
    const tm t = to_tm(ms);
    return fmt::format("{:04d}-{:02d}-{:02d}", t.tm_year + 1900, t.tm_mon + 1, t.tm_mday);
}

} // namespace core
