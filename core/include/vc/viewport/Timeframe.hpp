#pragma once
#include "vc/data/PriceBar.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vc {

enum class TimeLevel : std::uint8_t { Minute = 0, Hour, Day, Month, Year };

const char* timeLevelName(TimeLevel level);

struct TimeframePreset {
  std::string name;         // "1D", "5D", "1M", ...
  int tradingDays{0};       // weekdays covered; 0 = calendar rule
  TimeMs calendarSpan{0};   // used for YTD/ALL fallbacks and zoom reference
  std::string interval;     // bar interval suggested for the preset
  TimeLevel level{TimeLevel::Day};
};

const std::vector<TimeframePreset>& timeframePresets();

// nullptr when `name` is not a preset.
const TimeframePreset* findTimeframe(const std::string& name);

// Start time reached by walking back `tradingDays` weekdays from `end`.
TimeMs tradingDaysBack(TimeMs end, int tradingDays);

// Midnight Jan 1 (UTC) of the year containing `t`.
TimeMs startOfYear(TimeMs t);

// Axis level implied by a visible span.
TimeLevel levelForSpan(TimeMs span);

} // namespace vc
