#include "vc/viewport/Timeframe.hpp"
#include "vc/axis/TimeFormat.hpp"

namespace vc {

const char* timeLevelName(TimeLevel level) {
  switch (level) {
    case TimeLevel::Minute: return "minute";
    case TimeLevel::Hour:   return "hour";
    case TimeLevel::Day:    return "day";
    case TimeLevel::Month:  return "month";
    case TimeLevel::Year:   return "year";
  }
  return "day";
}

const std::vector<TimeframePreset>& timeframePresets() {
  static const std::vector<TimeframePreset> kPresets = {
    {"1D",  1,    kDayMs,        "5m",  TimeLevel::Minute},
    {"5D",  5,    5 * kDayMs,    "15m", TimeLevel::Hour},
    {"1M",  21,   30 * kDayMs,   "1h",  TimeLevel::Day},
    {"3M",  63,   90 * kDayMs,   "4h",  TimeLevel::Day},
    {"6M",  126,  180 * kDayMs,  "1D",  TimeLevel::Month},
    {"1Y",  252,  365 * kDayMs,  "1D",  TimeLevel::Month},
    {"YTD", 0,    365 * kDayMs,  "1D",  TimeLevel::Month},
    {"5Y",  1260, 5 * 365 * kDayMs, "1W", TimeLevel::Year},
    {"ALL", 0,    10 * 365 * kDayMs, "1M", TimeLevel::Year},
  };
  return kPresets;
}

const TimeframePreset* findTimeframe(const std::string& name) {
  for (const auto& p : timeframePresets()) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

TimeMs tradingDaysBack(TimeMs end, int tradingDays) {
  TimeMs t = end;
  int counted = 0;
  while (counted < tradingDays) {
    t -= kDayMs;
    if (isWeekday(toCivil(t))) ++counted;
  }
  return t;
}

TimeMs startOfYear(TimeMs t) {
  return fromCivil(toCivil(t).year, 1, 1);
}

TimeLevel levelForSpan(TimeMs span) {
  if (span <= kDayMs) return TimeLevel::Minute;
  if (span <= 7 * kDayMs) return TimeLevel::Hour;
  if (span <= 90 * kDayMs) return TimeLevel::Day;
  if (span <= 365 * kDayMs) return TimeLevel::Month;
  return TimeLevel::Year;
}

} // namespace vc
