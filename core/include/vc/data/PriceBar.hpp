#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vc {

// Epoch milliseconds, UTC.
using TimeMs = std::int64_t;

constexpr TimeMs kMinuteMs = 60 * 1000;
constexpr TimeMs kHourMs = 60 * kMinuteMs;
constexpr TimeMs kDayMs = 24 * kHourMs;
constexpr TimeMs kWeekMs = 7 * kDayMs;

// Furthest representable instant either side of the epoch (about 275,000 years).
// Differences of two in-range times cannot overflow TimeMs.
constexpr TimeMs kMaxTimeMs = 8640000000000000LL;

struct PriceBar {
    TimeMs timestamp{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

using BarSeries = std::vector<PriceBar>;

// Sorts ascending by timestamp and drops later duplicates (first occurrence wins).
void normalizeBars(BarSeries& bars);

// Merges `incoming` into `bars`. Existing timestamps are kept.
// Returns the number of bars actually added.
std::size_t mergeBarSeries(BarSeries& bars, const BarSeries& incoming);

// Index of the first bar with timestamp >= t.
std::size_t lowerBoundIndex(const BarSeries& bars, TimeMs t);
// Index one past the last bar with timestamp <= t.
std::size_t upperBoundIndex(const BarSeries& bars, TimeMs t);

} // namespace vc
