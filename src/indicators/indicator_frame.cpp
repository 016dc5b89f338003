#include "indicators/indicator_frame.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/rsi.hpp"
#include "indicators/macd.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/volume.hpp"
#include <stdexcept>

namespace ind {

IndicatorRow IndicatorFrame::row(std::size_t i) const {
    if (i >= size()) throw std::out_of_range("IndicatorFrame::row");
    IndicatorRow r;
    r.time_ms = time[i];
    for (auto& c : ma) r.ma.push_back(c[i]);
    r.rsi = rsi[i];
    r.macd = macd[i]; r.macd_signal = macd_signal[i]; r.macd_hist = macd_hist[i];
    r.bb_upper = bb_upper[i]; r.bb_mid = bb_mid[i]; r.bb_lower = bb_lower[i];
    r.volume_ma = volume_ma[i]; r.volume_ratio = volume_ratio[i];
    r.volume_spike = volume_spike[i];
    return r;
}

IndicatorFrame compute(const core::CandleSeries& series, const IndicatorConfig& cfg){
    IndicatorFrame f;
    f.cfg = cfg;
    f.time.reserve(series.size());
    for (auto& c : series.candles) f.time.push_back(c.open_time_ms);

    const auto closes = series.closes();
    for (auto w : cfg.ma_windows) f.ma.push_back(compute_sma(closes, w));

    f.rsi = compute_rsi(closes, cfg.rsi_period);

    auto m = compute_macd(closes, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal);
    f.macd = std::move(m.line); f.macd_signal = std::move(m.signal); f.macd_hist = std::move(m.hist);

    auto bb = compute_bb(closes, cfg.bb_period, cfg.bb_k);
    f.bb_upper = std::move(bb.upper); f.bb_mid = std::move(bb.mid); f.bb_lower = std::move(bb.lower);

    auto vs = compute_volume(series.volumes(), cfg.volume_period, cfg.spike_factor);
    f.volume_ma = std::move(vs.ma); f.volume_ratio = std::move(vs.ratio); f.volume_spike = std::move(vs.spike);
    return f;
}

} // namespace ind
