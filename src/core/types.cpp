#include "core/types.hpp"
#include "core/errors.hpp"

namespace core {

const char* to_string(Timeframe tf){
    switch(tf){
        case Timeframe::M1: return "1m"; case Timeframe::M3: return "3m"; case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m"; case Timeframe::M30: return "30m"; case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h"; case Timeframe::D1: return "1d"; case Timeframe::W1: return "1w";
    }
    return "1d";
}

std::optional<Timeframe> parse_timeframe(const std::string& s){
    static const Timeframe all[] = {Timeframe::M1,Timeframe::M3,Timeframe::M5,Timeframe::M15,Timeframe::M30,
                                    Timeframe::H1,Timeframe::H4,Timeframe::D1,Timeframe::W1};
    for (auto tf : all) if (s == to_string(tf)) return tf;
    return std::nullopt;
}

std::int64_t period_ms(Timeframe tf){
    constexpr std::int64_t m = 60'000;
    switch(tf){
        case Timeframe::M1: return m;       case Timeframe::M3: return 3*m;   case Timeframe::M5: return 5*m;
        case Timeframe::M15: return 15*m;   case Timeframe::M30: return 30*m; case Timeframe::H1: return 60*m;
        case Timeframe::H4: return 240*m;   case Timeframe::D1: return 1440*m; case Timeframe::W1: return 7*1440*m;
    }
    return 1440*m;
}

const char* to_string(ErrorKind k){
    switch(k){
        case ErrorKind::Network:          return "NetworkError";
        case ErrorKind::Provider:         return "ProviderError";
        case ErrorKind::DataIntegrity:    return "DataIntegrityWarning";
        case ErrorKind::CacheCorruption:  return "CacheCorruption";
        case ErrorKind::InsufficientData: return "InsufficientDataError";
        case ErrorKind::Busy:             return "Busy";
        case ErrorKind::Cancelled:        return "Cancelled";
        case ErrorKind::Config:           return "ConfigError";
        case ErrorKind::Store:            return "StoreError";
        default:                          return "InternalError";
    }
}

} // namespace core
