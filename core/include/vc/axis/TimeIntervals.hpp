#pragma once
#include "vc/data/PriceBar.hpp"
#include "vc/viewport/Timeframe.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vc {

enum class IntervalUnit : std::uint8_t { Minute, Hour, Day, Week, Month, Year };

struct TimeInterval {
  std::string name;        // "15m", "1D", "3M", ...
  IntervalUnit unit{IntervalUnit::Day};
  int count{1};
  TimeMs approxMs{0};      // nominal length, months=30d years=365d
  std::string majorStep;   // the coarser unit its major ticks mark
};

// Label-step ladder, finest first: 1m .. 10Y.
const std::vector<TimeInterval>& timeIntervalLadder();

// nullptr when `name` is not on the ladder.
const TimeInterval* findInterval(const std::string& name);

TimeLevel levelForInterval(const TimeInterval& iv);

// Floors `t` to the interval's calendar boundary (UTC): minute/hour steps to
// multiples within the day, 1W to Monday, 1M to the 1st, 3M to the quarter,
// multi-day and multi-year steps to epoch/year multiples.
TimeMs alignToTimeBoundary(TimeMs t, const TimeInterval& iv);

// Calendar-aware step forward.
TimeMs addInterval(TimeMs t, const TimeInterval& iv);

} // namespace vc
