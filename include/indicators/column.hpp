#pragma once
#include <optional>
#include <vector>

namespace ind {

// One value per candle; empty during an indicator's warm-up.
using Column = std::vector<std::optional<double>>;

inline std::size_t count_defined(const Column& c){
    std::size_t n = 0;
    for (auto& v : c) if (v) ++n;
    return n;
}

} // namespace ind
