#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

// Paginated OHLCV source. Returns up to `limit` candles whose open time is
// at or after `since_ms`, ascending. An empty result means no more data.
// Throws core::NetworkError on transport failure and core::ProviderError on
// an error response from the venue.
class IOhlcvProvider {
public:
    virtual ~IOhlcvProvider() = default;

    // Exchange name matched against SeriesKey::exchange ("binance")
    virtual std::string id() const = 0;

    // Minimum spacing between two calls the venue tolerates
    virtual int rate_limit_ms() const { return 0; }

    virtual std::vector<core::Candle> fetch_ohlcv(const std::string& symbol,
                                                  core::Timeframe tf,
                                                  std::int64_t since_ms,
                                                  int limit) = 0;
};

} // namespace data
