#include "vc/data/PriceBar.hpp"
#include <algorithm>

namespace vc {

static bool byTime(const PriceBar& a, const PriceBar& b) {
    return a.timestamp < b.timestamp;
}

void normalizeBars(BarSeries& bars) {
    std::stable_sort(bars.begin(), bars.end(), byTime);
    auto last = std::unique(bars.begin(), bars.end(),
        [](const PriceBar& a, const PriceBar& b) {
            return a.timestamp == b.timestamp;
        });
    bars.erase(last, bars.end());
}

std::size_t mergeBarSeries(BarSeries& bars, const BarSeries& incoming) {
    if (incoming.empty()) return 0;
    std::size_t before = bars.size();

    // Existing bars go first so the stable sort keeps them on duplicates.
    bars.insert(bars.end(), incoming.begin(), incoming.end());
    normalizeBars(bars);
    return bars.size() - before;
}

std::size_t lowerBoundIndex(const BarSeries& bars, TimeMs t) {
    auto it = std::lower_bound(bars.begin(), bars.end(), t,
        [](const PriceBar& b, TimeMs v) { return b.timestamp < v; });
    return static_cast<std::size_t>(it - bars.begin());
}

std::size_t upperBoundIndex(const BarSeries& bars, TimeMs t) {
    auto it = std::upper_bound(bars.begin(), bars.end(), t,
        [](TimeMs v, const PriceBar& b) { return v < b.timestamp; });
    return static_cast<std::size_t>(it - bars.begin());
}

} // namespace vc
