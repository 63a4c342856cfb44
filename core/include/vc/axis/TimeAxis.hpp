#pragma once
#include "vc/axis/AxisTick.hpp"
#include "vc/axis/TimeIntervals.hpp"
#include "vc/data/PriceBar.hpp"
#include "vc/viewport/Timeframe.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vc {

// Trading session marks, minutes after midnight UTC.
struct MarketSession {
  int openMinute{9 * 60 + 30};
  int breakStartMinute{11 * 60 + 30};
  int breakEndMinute{13 * 60};
  int closeMinute{15 * 60};
};

struct TimeAxisConfig {
  int minTicks{5};
  int maxTicks{9};
  double pixelsPerTick{100.0};   // target = width / pixelsPerTick, clamped to the band
  MarketSession session;
  std::size_t maxSeparators{400};
};

enum class SeparatorType : std::uint8_t { Day, Month, Quarter, Year, Decade };

struct TimeSeparator {
  TimeMs timestamp{0};
  double pixel{0};
  SeparatorType type{SeparatorType::Day};
  std::string label;
};

struct TimeAxisResult {
  std::vector<AxisTick> ticks;
  std::vector<TimeSeparator> separators;
  std::string granularity;   // chosen label step, e.g. "5D"
  std::string majorStep;     // unit marked by major ticks, e.g. "1W"
  TimeLevel level{TimeLevel::Day};
  int targetTicks{0};
  std::size_t generatedTicks{0};   // before thinning
};

int targetTickCount(double width, const TimeAxisConfig& cfg);

TimeAxisResult computeTimeAxis(TimeMs start, TimeMs end, double width,
                               const TimeAxisConfig& cfg = TimeAxisConfig{});

// Uses the first and last bar as the visible window.
TimeAxisResult computeTimeAxis(const BarSeries& visibleBars, double width,
                               const TimeAxisConfig& cfg = TimeAxisConfig{});

// Semantic major-tick rules, one row per ladder step.
bool isMajorTimeTick(TimeMs t, const TimeInterval& iv, const MarketSession& session);

// Session open/close marks for intraday steps; Jan 1 for coarser steps.
bool isKeyTimeBoundary(TimeMs t, const TimeInterval& iv, const MarketSession& session);

// Label text for a tick. `duration` is the visible span.
std::string formatTimeLabel(TimeMs t, TimeLevel level, bool major, TimeMs duration);

// Coarser boundary markers for the given level inside [start, end].
std::vector<TimeSeparator> computeSeparators(TimeMs start, TimeMs end, TimeLevel level,
                                             std::size_t maxCount = 400);

} // namespace vc
