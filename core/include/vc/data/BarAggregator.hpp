#pragma once
#include "vc/data/PriceBar.hpp"
#include <cstdint>

namespace vc {

// Merges `factor` consecutive bars into one synthetic bar:
// open=first, close=last, high=max, low=min, volume=sum,
// timestamp=the middle bar's timestamp. The tail group may be shorter.
// factor < 2 returns the input unchanged.
BarSeries aggregateBars(const PriceBar* bars, std::size_t count,
                        std::uint32_t factor);

inline BarSeries aggregateBars(const BarSeries& bars, std::uint32_t factor) {
    return aggregateBars(bars.data(), bars.size(), factor);
}

} // namespace vc
