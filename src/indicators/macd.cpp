#include "indicators/macd.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

Macd compute_macd(const std::vector<double>& c, std::size_t fast, std::size_t slow, std::size_t signal){
    const auto ef = compute_ema(c, fast);
    const auto es = compute_ema(c, slow);
    Macd m{Column(c.size()), Column(), Column(c.size())};
    for (std::size_t i = 0; i < c.size(); ++i)
        if (ef[i] && es[i]) m.line[i] = *ef[i] - *es[i];
    m.signal = compute_ema(m.line, signal);
    for (std::size_t i = 0; i < c.size(); ++i)
        if (m.line[i] && m.signal[i]) m.hist[i] = *m.line[i] - *m.signal[i];
    return m;
}

} // namespace ind
