#include "vc/data/BarAggregator.hpp"
#include <algorithm>

namespace vc {

BarSeries aggregateBars(const PriceBar* bars, std::size_t count,
                        std::uint32_t factor) {
    if (factor < 2) return BarSeries(bars, bars + count);

    BarSeries result;
    std::size_t groupCount = (count + factor - 1) / factor;
    result.reserve(groupCount);

    for (std::size_t g = 0; g < groupCount; ++g) {
        std::size_t start = g * factor;
        std::size_t end = std::min(start + factor, count);

        const PriceBar& first = bars[start];
        const PriceBar& last = bars[end - 1];

        PriceBar out;
        out.timestamp = bars[start + (end - start) / 2].timestamp;
        out.open = first.open;
        out.close = last.close;
        out.high = first.high;
        out.low = first.low;
        out.volume = 0.0;

        for (std::size_t i = start; i < end; ++i) {
            if (bars[i].high > out.high) out.high = bars[i].high;
            if (bars[i].low < out.low) out.low = bars[i].low;
            out.volume += bars[i].volume;
        }
        result.push_back(out);
    }

    return result;
}

} // namespace vc
