#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "core/types.hpp"
#include "indicators/column.hpp"

namespace ind {

struct IndicatorConfig {
    std::vector<std::size_t> ma_windows{20, 50, 200};  // [0] short, [1] long for the trend rules
    std::size_t rsi_period{14};
    std::size_t macd_fast{12};
    std::size_t macd_slow{26};
    std::size_t macd_signal{9};
    std::size_t bb_period{20};
    double bb_k{2.0};
    std::size_t volume_period{20};
    double spike_factor{2.0};
};

// One aligned row; empty optionals are warm-up (undefined), never zero.
struct IndicatorRow {
    std::int64_t time_ms{};
    std::vector<std::optional<double>> ma;   // parallel to IndicatorConfig::ma_windows
    std::optional<double> rsi;
    std::optional<double> macd, macd_signal, macd_hist;
    std::optional<double> bb_upper, bb_mid, bb_lower;
    std::optional<double> volume_ma, volume_ratio;
    bool volume_spike{false};
};

// Column-wise indicator table, one entry per candle of the source series.
struct IndicatorFrame {
    IndicatorConfig cfg;
    std::vector<std::int64_t> time;
    std::vector<Column> ma;
    Column rsi;
    Column macd, macd_signal, macd_hist;
    Column bb_upper, bb_mid, bb_lower;
    Column volume_ma, volume_ratio;
    std::vector<bool> volume_spike;

    std::size_t size() const { return time.size(); }
    bool empty() const { return time.empty(); }
    IndicatorRow row(std::size_t i) const;
};

// Pure function of the series; no state survives between calls.
IndicatorFrame compute(const core::CandleSeries& series, const IndicatorConfig& cfg = {});

} // namespace ind
